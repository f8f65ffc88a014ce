#include <doctest/doctest.h>
#include <string>
#include "aclink/message_type.hpp"

using namespace aclink;

TEST_CASE("Built-in table registers every fixed and general type") {
    TypeRegistry reg;
    REQUIRE(reg.register_fixed_types() == Status::Ok);
    CHECK(reg.size() == 7);

    struct Row { const char* name; uint8_t id; bool general; };
    const Row rows[] = {
        {"position_request", 1,   false},
        {"body_request",     2,   false},
        {"nav",              5,   false},
        {"string_image",     10,  false},
        {"ack",              32,  false},
        {"ros_message",      100, true},
        {"ros_service",      101, true},
    };
    for (const auto& r : rows) {
        const MessageType* t = nullptr;
        REQUIRE(reg.resolve_by_name(r.name, t) == Status::Ok);
        CHECK(t->id == r.id);
        CHECK(t->is_general() == r.general);
    }
}

TEST_CASE("Fixed layouts have the documented body lengths") {
    TypeRegistry reg;
    reg.register_fixed_types();

    CHECK(reg.find_by_name("position_request")->fixed_body_len() == 24);
    CHECK(reg.find_by_name("body_request")->fixed_body_len() == 24);
    CHECK(reg.find_by_name("nav")->fixed_body_len() == 40);
    CHECK(reg.find_by_name("ack")->fixed_body_len() == 2);

    CHECK(reg.find_by_name("nav")->has_fixed_length() == true);
    CHECK(reg.find_by_name("string_image")->has_fixed_length() == false);
    CHECK(reg.find_by_name("ros_message")->has_fixed_length() == false);
}

TEST_CASE("Name and id resolve to each other for every registered type") {
    TypeRegistry reg;
    reg.register_fixed_types();
    REQUIRE(reg.add_general("battery", 120, "/out/battery", "/in/battery", "BatteryStatus") == Status::Ok);

    for (const auto& t : reg) {
        const MessageType* by_name = nullptr;
        const MessageType* by_id = nullptr;
        REQUIRE(reg.resolve_by_name(t.name.c_str(), by_name) == Status::Ok);
        REQUIRE(reg.resolve_by_id(by_name->id, by_id) == Status::Ok);
        CHECK(by_id->name == t.name);
    }
}

TEST_CASE("Unregistered lookups report UnknownType") {
    TypeRegistry reg;
    reg.register_fixed_types();

    const MessageType* t = reg.find_by_id(5);
    REQUIRE(t != nullptr);
    CHECK(reg.resolve_by_id(77, t) == Status::UnknownType);
    CHECK(t == nullptr);
    CHECK(reg.resolve_by_name("sonar_ping", t) == Status::UnknownType);
    CHECK(reg.resolve_by_id(0, t) == Status::UnknownType);
    CHECK(reg.find_by_name(nullptr) == nullptr);
}

TEST_CASE("Collisions with existing ids or names are DuplicateIdentifier") {
    TypeRegistry reg;
    reg.register_fixed_types();

    // id of nav
    CHECK(reg.add_general("sidescan", 5, nullptr, nullptr, nullptr) == Status::DuplicateIdentifier);
    // name of nav
    CHECK(reg.add_general("nav", 150, nullptr, nullptr, nullptr) == Status::DuplicateIdentifier);

    REQUIRE(reg.add_general("sidescan", 150, nullptr, nullptr, nullptr) == Status::Ok);
    CHECK(reg.add_general("sidescan", 151, nullptr, nullptr, nullptr) == Status::DuplicateIdentifier);
    CHECK(reg.add_general("other", 150, nullptr, nullptr, nullptr) == Status::DuplicateIdentifier);

    // failed adds leave the registry alone
    CHECK(reg.size() == 8);
    CHECK(reg.find_by_id(151) == nullptr);
}

TEST_CASE("Registering the built-in table twice fails on the first entry") {
    TypeRegistry reg;
    REQUIRE(reg.register_fixed_types() == Status::Ok);
    CHECK(reg.register_fixed_types() == Status::DuplicateIdentifier);
    CHECK(reg.size() == 7);
}

TEST_CASE("Malformed descriptors are InvalidDescriptor") {
    TypeRegistry reg;

    CHECK(reg.add_general("zero", 0, nullptr, nullptr, nullptr) == Status::InvalidDescriptor);
    CHECK(reg.add_general("", 40, nullptr, nullptr, nullptr) == Status::InvalidDescriptor);
    CHECK(reg.add_general(nullptr, 40, nullptr, nullptr, nullptr) == Status::InvalidDescriptor);

    const std::string long_name(ACLINK_NAME_MAX + 1, 'n');
    CHECK(reg.add_general(long_name.c_str(), 40, nullptr, nullptr, nullptr) == Status::InvalidDescriptor);

    const std::string long_topic(ACLINK_TOPIC_MAX + 1, 't');
    CHECK(reg.add_general("topic", 40, long_topic.c_str(), nullptr, nullptr) == Status::InvalidDescriptor);

    Layout empty;
    CHECK(reg.add_fixed("empty", 41, empty) == Status::InvalidDescriptor);

    Layout bytes_first;
    bytes_first.push_back(FieldKind::Bytes);
    bytes_first.push_back(FieldKind::UInt16);
    CHECK(reg.add_fixed("bytes_first", 42, bytes_first) == Status::InvalidDescriptor);

    // a well-formed layout under an id no body codec knows
    Layout depth;
    depth.push_back(FieldKind::Float32);
    CHECK(reg.add_fixed("depth", 43, depth) == Status::InvalidDescriptor);
    CHECK(reg.find_by_id(43) == nullptr);

    CHECK(reg.empty());
}

TEST_CASE("General types are found by their topic bindings") {
    TypeRegistry reg;
    reg.register_fixed_types();
    REQUIRE(reg.add_general("battery", 120, "/modem/unpacker/battery", "/vehicle/battery", "BatteryStatus") == Status::Ok);

    const MessageType* out = reg.find_by_subscribe_topic("/vehicle/battery");
    REQUIRE(out != nullptr);
    CHECK(out->id == 120);
    CHECK(out->message_type == "BatteryStatus");

    const MessageType* in = reg.find_by_publish_topic("/modem/unpacker/battery");
    REQUIRE(in != nullptr);
    CHECK(in->name == "battery");

    CHECK(reg.find_by_subscribe_topic("/modem/unpacker/battery") == nullptr);
    CHECK(reg.find_by_publish_topic("") == nullptr);
    // built-in general types have no bindings
    CHECK(reg.find_by_subscribe_topic(nullptr) == nullptr);
}

TEST_CASE("Registry capacity is bounded") {
    TypeRegistry reg;
    size_t added = 0;
    for (unsigned id = 1; id <= 255; ++id) {
        const std::string name = "t" + std::to_string(id);
        if (reg.add_general(name.c_str(), static_cast<uint8_t>(id), nullptr, nullptr, nullptr) != Status::Ok) break;
        ++added;
    }
    CHECK(added == ACLINK_TYPES_MAX);
    CHECK(reg.add_general("overflow", 255, nullptr, nullptr, nullptr) == Status::InvalidDescriptor);
}

TEST_CASE("Fixed ids with a body codec can be registered under a new name") {
    TypeRegistry reg;
    Layout ack;
    ack.push_back(FieldKind::UInt16);
    REQUIRE(reg.add_fixed("receipt", type_id::ACK, ack) == Status::Ok);
    CHECK(reg.find_by_name("receipt")->fixed_body_len() == 2);

    CHECK(type_id::has_fixed_body(type_id::NAV));
    CHECK_FALSE(type_id::has_fixed_body(type_id::ROS_MESSAGE));
    CHECK_FALSE(type_id::has_fixed_body(0));
}
