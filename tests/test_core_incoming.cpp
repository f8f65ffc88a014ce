#include <doctest/doctest.h>
#include <string>
#include <thread>
#include <vector>
#include "test_support.hpp"

using namespace aclink;
using namespace aclink_test;

namespace {

std::vector<uint8_t> body_of(const TypeRegistry& reg, const char* type, const Message& m) {
    std::vector<uint8_t> out;
    std::string detail;
    REQUIRE(encode_body(*reg.find_by_name(type), m, 9000, out, detail) == Status::Ok);
    return out;
}

NavStatus sample_nav() {
    NavStatus n;
    n.latitude = 55.0; n.longitude = -3.0;
    n.north = 10.0f; n.east = 20.0f; n.depth = 5.0f;
    n.roll = 0.01f; n.pitch = 0.02f; n.yaw = 1.57f;
    return n;
}

} // namespace

TEST_CASE("nav envelope decodes and reaches on_nav with its header") {
    CoreFixture f;
    f.clock.set(1002.0);
    const NavStatus nav = sample_nav();
    const auto env = envelope(5, 42, 1000.0, body_of(f.reg, "nav", nav));

    const ReceiveOutcome o = f.core.receive(env, 7);
    CHECK(o.state == ReceiveState::Dispatched);
    CHECK(o.status == Status::Ok);
    REQUIRE(o.type_id.has_value());
    CHECK(*o.type_id == 5);
    REQUIRE(o.message_id.has_value());
    CHECK(*o.message_id == 42);

    const auto got = f.consumer.deliveries();
    REQUIRE(got.size() == 1);
    CHECK(got[0].callback == "nav");
    CHECK(got[0].header == Header(5, 42, 1000.0));
    const auto* n = std::get_if<NavStatus>(&got[0].message);
    REQUIRE(n != nullptr);
    CHECK(n->latitude == 55.0);
    CHECK(n->longitude == -3.0);
    CHECK(n->north == 10.0f);
    CHECK(n->east == 20.0f);
    CHECK(n->depth == 5.0f);
    CHECK(n->roll == 0.01f);
    CHECK(n->pitch == 0.02f);
    CHECK(n->yaw == 1.57f);

    // nav is not ack-requiring
    CHECK(f.modem.sent_count() == 0);
    CHECK(f.core.stats().messages_received == 1);
}

TEST_CASE("Telemetry carries transit and throughput") {
    CoreFixture f;
    f.clock.set(1002.0);
    const auto env = envelope(5, 42, 1000.0, body_of(f.reg, "nav", sample_nav()));
    f.core.receive(env, 7);

    const auto tm = f.log.telemetry_records();
    REQUIRE(tm.size() == 1);
    CHECK(tm[0].sent_at == 1000.0);
    CHECK(tm[0].received_at == 1002.0);
    CHECK(tm[0].length == 51);
    CHECK(tm[0].transit == doctest::Approx(2.0));
    REQUIRE(tm[0].throughput.has_value());
    CHECK(*tm[0].throughput == doctest::Approx(25.5));
    CHECK(tm[0].receive_count == 1);
    CHECK(tm[0].type_id == 5);
    CHECK(tm[0].message_id == 42);
    CHECK(tm[0].source == 7);
}

TEST_CASE("Zero transit leaves throughput undefined") {
    CoreFixture f;   // clock at 1000.0
    const auto env = envelope(32, 1, 1000.0, {0x00, 0x05});
    f.core.receive(env, 5);

    const auto tm = f.log.telemetry_records();
    REQUIRE(tm.size() == 1);
    CHECK(tm[0].transit == 0.0);
    CHECK_FALSE(tm[0].throughput.has_value());
    CHECK(f.log.count("clock_skew") == 0);
}

TEST_CASE("Negative transit is a clock_skew warning, not a drop") {
    CoreFixture f;   // clock at 1000.0
    const auto env = envelope(32, 1, 1010.0, {0x00, 0x05});
    const ReceiveOutcome o = f.core.receive(env, 5);

    CHECK(o.state == ReceiveState::Dispatched);
    CHECK(f.log.count("clock_skew") == 1);
    const auto tm = f.log.telemetry_records();
    REQUIRE(tm.size() == 1);
    CHECK(tm[0].transit == doctest::Approx(-10.0));
    CHECK_FALSE(tm[0].throughput.has_value());
    CHECK(f.consumer.count() == 1);
}

TEST_CASE("Ack-requiring types produce exactly one ack carrying the original id") {
    CoreFixture f;
    PositionRequest req;
    req.pose = Pose{1.0f, 2.0f, 3.0f, 0.0f, 0.0f, 1.5708f};
    const auto env = envelope(1, 0x1234, 999.0, body_of(f.reg, "position_request", req));

    const ReceiveOutcome o = f.core.receive(env, 3);
    CHECK(o.state == ReceiveState::Acked);
    REQUIRE(f.consumer.count() == 1);
    CHECK(f.consumer.deliveries()[0].callback == "position_request");

    const auto frames = f.modem.sent();
    REQUIRE(frames.size() == 1);
    CHECK(frames[0].address == 5);
    REQUIRE(frames[0].bytes.size() == HEADER_LEN + 2);

    Header h;
    REQUIRE(h.unpack(frames[0].bytes.data(), frames[0].bytes.size()) == Status::Ok);
    CHECK(h.type_id == 32);
    CHECK(h.message_id == 0);                  // our own outgoing id
    CHECK(frames[0].bytes[HEADER_LEN] == 0x12);
    CHECK(frames[0].bytes[HEADER_LEN + 1] == 0x34);

    CHECK(f.core.stats().acks_sent == 1);
    CHECK(f.core.stats().messages_sent == 1);
}

TEST_CASE("body_request is acked, other types are not") {
    CoreFixture f;
    f.core.receive(envelope(2, 9, 1000.0, body_of(f.reg, "body_request", BodyRequest{})), 5);
    CHECK(f.modem.sent_count() == 1);

    StringImage img;
    img.payload = {'a', 'b'};
    f.core.receive(envelope(10, 10, 1000.0, body_of(f.reg, "string_image", img)), 5);
    f.core.receive(envelope(32, 11, 1000.0, {0x00, 0x01}), 5);
    f.core.receive(envelope(120, 12, 1000.0, {0x01}), 5);
    CHECK(f.modem.sent_count() == 1);
    CHECK(f.consumer.count() == 4);
}

TEST_CASE("An empty ack policy sends no acks") {
    TypeRegistry reg = make_registry();
    transport::MemoryTransport modem;
    RecordingConsumer consumer;
    NullLog log;
    FixedClock clock(1000.0);
    Core core(reg, AckPolicy{}, modem, consumer, log, clock);

    const ReceiveOutcome o = core.receive(envelope(1, 1, 1000.0, body_of(reg, "position_request", PositionRequest{})), 5);
    CHECK(o.state == ReceiveState::Dispatched);
    CHECK(modem.sent_count() == 0);
}

TEST_CASE("Failed ack send keeps the envelope dispatched") {
    CoreFixture f;
    f.modem.fail_with(transport::TxResult::Error);
    const ReceiveOutcome o = f.core.receive(envelope(1, 1, 1000.0, body_of(f.reg, "position_request", PositionRequest{})), 5);
    CHECK(o.state == ReceiveState::Dispatched);
    CHECK(o.status == Status::Ok);
    CHECK(f.consumer.count() == 1);
    CHECK(f.log.count("ack_failed") == 1);
    CHECK(f.core.stats().acks_sent == 0);
}

TEST_CASE("Received ack surfaces to on_ack and logs delivery") {
    CoreFixture f;
    const ReceiveOutcome o = f.core.receive(envelope(32, 77, 1000.0, {0x00, 0x2A}), 5);
    CHECK(o.state == ReceiveState::Dispatched);

    const auto got = f.consumer.deliveries();
    REQUIRE(got.size() == 1);
    CHECK(got[0].callback == "ack");
    CHECK(std::get<Ack>(got[0].message).acked_id == 42);
    CHECK(f.log.last_line("delivered") == "level=info event=delivered message_id=42");
}

TEST_CASE("Unknown type is dropped without touching the incoming counter") {
    CoreFixture f;
    const auto unknown = envelope(77, 3, 1000.0, {});
    const ReceiveOutcome o = f.core.receive(unknown, 5);

    CHECK(o.state == ReceiveState::Dropped);
    CHECK(o.status == Status::UnknownType);
    CHECK(*o.type_id == 77);
    CHECK(f.consumer.count() == 0);
    CHECK(f.core.stats().messages_received == 0);
    CHECK(f.core.stats().messages_dropped == 1);
    CHECK(f.log.telemetry_records().empty());
    CHECK(f.log.last_line("unknown_type") ==
          "level=warn event=unknown_type reason=unknown_type type_id=77 message_id=3 length=11 body_length=0 source=5");

    // the next valid envelope goes through normally
    const ReceiveOutcome next = f.core.receive(envelope(32, 4, 1000.0, {0x00, 0x01}), 5);
    CHECK(next.state == ReceiveState::Dispatched);
    CHECK(f.core.stats().messages_received == 1);
    CHECK(f.consumer.count() == 1);
}

TEST_CASE("Five-byte envelope is HeaderTooShort and nothing is dispatched") {
    CoreFixture f;
    const std::vector<uint8_t> five = {0x05, 0x00, 0x2A, 0x40, 0x8F};
    const ReceiveOutcome o = f.core.receive(five, 5);

    CHECK(o.state == ReceiveState::Dropped);
    CHECK(o.status == Status::HeaderTooShort);
    CHECK_FALSE(o.type_id.has_value());
    CHECK_FALSE(o.message_id.has_value());
    CHECK(f.consumer.count() == 0);
    CHECK(f.modem.sent_count() == 0);
    CHECK(f.core.stats().messages_received == 0);
    CHECK(f.log.count("header_too_short") == 1);

    CHECK(f.core.receive(nullptr, 0, 5).status == Status::HeaderTooShort);
}

TEST_CASE("Body length mismatch is dropped after telemetry") {
    CoreFixture f;
    std::vector<uint8_t> body = body_of(f.reg, "nav", sample_nav());
    body.pop_back();
    const ReceiveOutcome o = f.core.receive(envelope(5, 8, 1000.0, body), 5);

    CHECK(o.state == ReceiveState::Dropped);
    CHECK(o.status == Status::BodyLengthMismatch);
    CHECK(f.consumer.count() == 0);
    CHECK(f.core.stats().messages_received == 1);
    CHECK(f.core.stats().messages_dropped == 1);
    CHECK(f.log.telemetry_records().size() == 1);
    CHECK(f.log.last_line("body_length_mismatch").find("body_length=39") != std::string::npos);
}

TEST_CASE("Malformed ack-requiring envelope is not acked") {
    CoreFixture f;
    const ReceiveOutcome o = f.core.receive(envelope(1, 8, 1000.0, {0x01, 0x02}), 5);
    CHECK(o.status == Status::BodyLengthMismatch);
    CHECK(f.modem.sent_count() == 0);
}

TEST_CASE("General types reach on_general keyed by publish topic or name") {
    CoreFixture f;
    f.core.receive(envelope(120, 1, 1000.0, {0x0C, 0x80}), 5);
    f.core.receive(envelope(101, 2, 1000.0, {0xFF}), 5);

    const auto got = f.consumer.deliveries();
    REQUIRE(got.size() == 2);
    CHECK(got[0].callback == "general");
    CHECK(got[0].topic == "/modem/unpacker/battery");
    const auto& g = std::get<GeneralMessage>(got[0].message);
    CHECK(g.type == "battery");
    CHECK(g.payload == (std::vector<uint8_t>{0x0C, 0x80}));

    CHECK(got[1].topic == "ros_service");
}

TEST_CASE("Envelopes delivered by the transport run through receive") {
    CoreFixture f;
    REQUIRE(f.modem.deliver(envelope(32, 5, 1000.0, {0x00, 0x09}), 5));
    CHECK(f.consumer.count() == 1);
    CHECK(f.core.stats().messages_received == 1);
}

TEST_CASE("Destroyed core unsubscribes from the transport") {
    TypeRegistry reg = make_registry();
    transport::MemoryTransport modem;
    RecordingConsumer consumer;
    RecordingLog log;
    FixedClock clock(1000.0);
    {
        Core core(reg, AckPolicy::defaults(), modem, consumer, log, clock);
    }
    CHECK_FALSE(modem.deliver(envelope(32, 5, 1000.0, {0x00, 0x09}), 5));
}

TEST_CASE("Receive state names are stable") {
    CHECK(std::string(to_string(ReceiveState::Received)) == "received");
    CHECK(std::string(to_string(ReceiveState::HeaderParsed)) == "header_parsed");
    CHECK(std::string(to_string(ReceiveState::TypeResolved)) == "type_resolved");
    CHECK(std::string(to_string(ReceiveState::BodyDecoded)) == "body_decoded");
    CHECK(std::string(to_string(ReceiveState::Dispatched)) == "dispatched");
    CHECK(std::string(to_string(ReceiveState::Acked)) == "acked");
    CHECK(std::string(to_string(ReceiveState::Dropped)) == "dropped");
}

TEST_CASE("Concurrent receives count every envelope once") {
    CoreFixture f;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 250;
    const auto ack_env = envelope(32, 1, 1000.0, {0x00, 0x01});
    const auto req_env = envelope(1, 2, 1000.0, body_of(f.reg, "position_request", PositionRequest{}));

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&f, &ack_env, &req_env, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                f.core.receive((i + t) % 2 ? ack_env : req_env, 5);
            }
        });
    }
    for (auto& w : workers) w.join();

    const Stats s = f.core.stats();
    CHECK(s.messages_received == static_cast<uint64_t>(kThreads * kPerThread));
    CHECK(s.messages_dropped == 0);
    CHECK(s.acks_sent == static_cast<uint64_t>(kThreads * kPerThread / 2));
    CHECK(f.consumer.count() == static_cast<size_t>(kThreads * kPerThread));
}

TEST_CASE("Telemetry names the receiving node when one is configured") {
    TypeRegistry reg = make_registry();
    transport::MemoryTransport modem;
    RecordingConsumer consumer;
    RecordingLog log;
    FixedClock clock(1000.0);
    Config cfg;
    cfg.node_name = "auv1";
    Core core(reg, AckPolicy::defaults(), modem, consumer, log, clock, cfg);
    CHECK(core.node_name() == "auv1");

    core.receive(envelope(32, 1, 999.0, {0x00, 0x01}), 5);
    const auto tm = log.telemetry_records();
    REQUIRE(tm.size() == 1);
    CHECK(tm[0].node == "auv1");

    // the plain constructor leaves telemetry unnamed
    CoreFixture f;
    f.core.receive(envelope(32, 1, 999.0, {0x00, 0x01}), 5);
    CHECK(f.log.telemetry_records()[0].node.empty());
}
