#include <doctest/doctest.h>
#include <string>
#include <vector>
#include "aclink/parser.hpp"

using namespace aclink;
using aclink::parser::json;

namespace {

TypeRegistry registry() {
    TypeRegistry reg;
    reg.register_fixed_types();
    reg.add_general("battery", 120, "/modem/unpacker/battery", "/vehicle/battery", "BatteryStatus");
    return reg;
}

} // namespace

TEST_CASE("Messages render with their type and fields") {
    NavStatus nav;
    nav.latitude = 55.0;
    nav.longitude = -3.0;
    nav.depth = 5.0f;
    const json j = parser::to_json(Message(nav));
    CHECK(j["type"] == "nav");
    CHECK(j["latitude"].get<double>() == 55.0);
    CHECK(j["longitude"].get<double>() == -3.0);
    CHECK(j["depth"].get<double>() == 5.0);

    const json a = parser::to_json(Message(Ack{42}));
    CHECK(a["type"] == "ack");
    CHECK(a["acked_id"].get<int>() == 42);

    GeneralMessage g;
    g.type = "battery";
    g.payload = {0x0C, 0x80};
    const json gj = parser::to_json(Message(g));
    CHECK(gj["type"] == "battery");
    CHECK(gj["hex"] == "0c80");
    CHECK(gj["length"].get<int>() == 2);
}

TEST_CASE("Header and telemetry render as objects") {
    const json h = parser::to_json(Header(5, 42, 1000.0));
    CHECK(h["type_id"].get<int>() == 5);
    CHECK(h["message_id"].get<int>() == 42);
    CHECK(h["sent_at"].get<double>() == 1000.0);

    Telemetry t;
    t.sent_at = 1000.0;
    t.received_at = 1000.0;
    t.length = 13;
    t.receive_count = 3;
    const json tj = parser::to_json(t);
    CHECK(tj["throughput"].is_null());
    CHECK_FALSE(tj.contains("node"));
    CHECK(tj["receive_count"].get<int>() == 3);

    t.transit = 2.0;
    t.throughput = 6.5;
    CHECK(parser::to_json(t)["throughput"].get<double>() == 6.5);

    t.node = "auv1";
    CHECK(parser::to_json(t)["node"] == "auv1");
}

TEST_CASE("Registry entries describe their kind") {
    const TypeRegistry reg = registry();
    const json nav = parser::to_json(*reg.find_by_name("nav"));
    CHECK(nav["kind"] == "fixed");
    CHECK(nav["id"].get<int>() == 5);
    CHECK(nav["body_length"].get<int>() == 40);

    CHECK(parser::to_json(*reg.find_by_name("string_image"))["body_length"].is_null());

    const json battery = parser::to_json(*reg.find_by_name("battery"));
    CHECK(battery["kind"] == "general");
    CHECK(battery["publish_topic"] == "/modem/unpacker/battery");
    CHECK(battery["subscribe_topic"] == "/vehicle/battery");
    CHECK(battery["message_type"] == "BatteryStatus");

    CHECK_FALSE(parser::to_json(*reg.find_by_name("ros_message")).contains("publish_topic"));
}

TEST_CASE("from_json builds every message kind") {
    const TypeRegistry reg = registry();
    std::string err;
    Message m;

    REQUIRE(parser::from_json(reg, json::parse(R"({"type":"position_request","x":1,"y":2,"z":3,"roll":0,"pitch":0,"yaw":1.5})"), m, err) == Status::Ok);
    REQUIRE(std::holds_alternative<PositionRequest>(m));
    CHECK(std::get<PositionRequest>(m).pose.z == 3.0f);

    REQUIRE(parser::from_json(reg, json::parse(R"({"type":"ack","acked_id":65535})"), m, err) == Status::Ok);
    CHECK(std::get<Ack>(m).acked_id == 65535);

    REQUIRE(parser::from_json(reg, json::parse(R"({"type":"string_image","text":"hi"})"), m, err) == Status::Ok);
    CHECK(std::get<StringImage>(m).payload == (std::vector<uint8_t>{'h', 'i'}));

    REQUIRE(parser::from_json(reg, json::parse(R"({"type":"battery","hex":"0C 80"})"), m, err) == Status::Ok);
    const auto& g = std::get<GeneralMessage>(m);
    CHECK(g.type == "battery");
    CHECK(g.payload == (std::vector<uint8_t>{0x0C, 0x80}));
}

TEST_CASE("from_json reports what is wrong") {
    const TypeRegistry reg = registry();
    std::string err;
    Message m = Ack{7};

    CHECK(parser::from_json(reg, json::parse(R"({"type":"nav","latitude":1})"), m, err) == Status::EncodeError);
    CHECK(err == "missing:longitude");

    CHECK(parser::from_json(reg, json::parse(R"({"type":"position_request","x":"one"})"), m, err) == Status::EncodeError);
    CHECK(err == "missing:x");

    CHECK(parser::from_json(reg, json::parse(R"({"type":"sonar_ping"})"), m, err) == Status::UnknownType);
    CHECK(err == "unknown_type:sonar_ping");

    CHECK(parser::from_json(reg, json::parse(R"({"x":1})"), m, err) == Status::UnknownType);
    CHECK(parser::from_json(reg, json::parse(R"({"type":"ack","acked_id":70000})"), m, err) == Status::EncodeError);
    CHECK(parser::from_json(reg, json::parse(R"({"type":"battery","hex":"abc"})"), m, err) == Status::EncodeError);
    CHECK(err == "bad_hex");
    CHECK(parser::from_json(reg, json::parse("[]"), m, err) == Status::EncodeError);

    CHECK(m == Message(Ack{7}));
}

TEST_CASE("from_values fills fields in wire order") {
    const TypeRegistry reg = registry();
    std::string err;
    Message m;

    REQUIRE(parser::from_values(*reg.find_by_name("nav"), {55.0, -3.0, 10, 20, 5, 0.01, 0.02, 1.57}, "", m, err) == Status::Ok);
    const auto& nav = std::get<NavStatus>(m);
    CHECK(nav.latitude == 55.0);
    CHECK(nav.east == 20.0f);
    CHECK(nav.yaw == 1.57f);

    CHECK(parser::from_values(*reg.find_by_name("body_request"), {1, 2, 3}, "", m, err) == Status::EncodeError);
    CHECK(err == "values:expected=6 got=3");

    CHECK(parser::from_values(*reg.find_by_name("ack"), {1.5}, "", m, err) == Status::EncodeError);
    CHECK(parser::from_values(*reg.find_by_name("ack"), {-1}, "", m, err) == Status::EncodeError);
    REQUIRE(parser::from_values(*reg.find_by_name("ack"), {300}, "", m, err) == Status::Ok);
    CHECK(std::get<Ack>(m).acked_id == 300);

    REQUIRE(parser::from_values(*reg.find_by_name("ros_message"), {}, "abc", m, err) == Status::Ok);
    CHECK(std::get<GeneralMessage>(m).type == "ros_message");
    CHECK(std::get<GeneralMessage>(m).payload.size() == 3);
}

TEST_CASE("Field names follow the body layout") {
    const TypeRegistry reg = registry();
    const auto pose = parser::field_names(*reg.find_by_name("position_request"));
    REQUIRE(pose.size() == 6);
    CHECK(std::string(pose[5]) == "yaw");

    const auto nav = parser::field_names(*reg.find_by_name("nav"));
    REQUIRE(nav.size() == 8);
    CHECK(std::string(nav[2]) == "north");

    CHECK(parser::field_names(*reg.find_by_name("string_image")).empty());
    CHECK(parser::field_names(*reg.find_by_name("battery")).empty());
}

TEST_CASE("Hex helpers") {
    const std::vector<uint8_t> bytes = {0x00, 0x0A, 0xFF, 0x5C};
    CHECK(parser::to_hex(bytes) == "000aff5c");

    std::vector<uint8_t> out;
    REQUIRE(parser::from_hex("00 0A ff 5c", out));
    CHECK(out == bytes);

    out = {0x01};
    CHECK_FALSE(parser::from_hex("abc", out));
    CHECK_FALSE(parser::from_hex("zz", out));
    CHECK(out == (std::vector<uint8_t>{0x01}));

    REQUIRE(parser::from_hex("", out));
    CHECK(out.empty());
}
