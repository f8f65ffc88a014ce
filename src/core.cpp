// -----------------------------------------------------------------------------
// core.cpp - Implementation of aclink Core
//
// API & field descriptions:
//   see include/aclink/core.hpp
//
// Usage tests:
//   see tests/test_core_outgoing.cpp, tests/test_core_incoming.cpp
//
// NOTE: This file is about *how* envelopes move through the pipelines: the
// guard order, when counters move, and what gets logged at each drop. The
// external contract lives in the header.
// -----------------------------------------------------------------------------
#include "aclink/core.hpp"

#include <cmath>

namespace aclink {

namespace {

// Routes one decoded message to the matching consumer callback.
struct Dispatcher {
  IConsumer& consumer;
  const MessageType& type;
  const Header& header;

  void operator()(const PositionRequest& m) const { consumer.on_position_request(m, header); }
  void operator()(const BodyRequest& m)     const { consumer.on_body_request(m, header); }
  void operator()(const NavStatus& m)       const { consumer.on_nav(m, header); }
  void operator()(const StringImage& m)     const { consumer.on_string_image(m, header); }
  void operator()(const Ack& m)             const { consumer.on_ack(m, header); }

  void operator()(const GeneralMessage& m) const {
    // types without an incoming binding are keyed by name
    const char* topic = type.publish_topic.empty() ? type.name.c_str()
                                                   : type.publish_topic.c_str();
    consumer.on_general(topic, m, header);
  }
};

uint64_t u64(size_t v) { return static_cast<uint64_t>(v); }

} // namespace

const char* to_string(ReceiveState s) {
  switch (s) {
    case ReceiveState::Received:     return "received";
    case ReceiveState::HeaderParsed: return "header_parsed";
    case ReceiveState::TypeResolved: return "type_resolved";
    case ReceiveState::BodyDecoded:  return "body_decoded";
    case ReceiveState::Dispatched:   return "dispatched";
    case ReceiveState::Acked:        return "acked";
    case ReceiveState::Dropped:      return "dropped";
  }
  return "dropped";
}

// ---------- public ----------

Core::Core(const TypeRegistry& registry,
           const AckPolicy& ack_policy,
           transport::ITransport& transport,
           IConsumer& consumer,
           ILogSink& log,
           const IClock& clock,
           uint16_t target_address,
           size_t max_envelope_len)
: registry_(registry),
  ack_policy_(ack_policy),
  transport_(transport),
  consumer_(consumer),
  log_(log),
  clock_(clock),
  target_address_(target_address),
  max_envelope_len_(max_envelope_len) {
  transport_.subscribe(&Core::on_transport_rx, this);   // inbound envelopes land in receive()
}

Core::Core(const TypeRegistry& registry,
           const AckPolicy& ack_policy,
           transport::ITransport& transport,
           IConsumer& consumer,
           ILogSink& log,
           const IClock& clock,
           const Config& cfg)
: registry_(registry),
  ack_policy_(ack_policy),
  transport_(transport),
  consumer_(consumer),
  log_(log),
  clock_(clock),
  target_address_(cfg.target_address),
  max_envelope_len_(cfg.max_envelope_len),
  node_name_(cfg.node_name) {
  transport_.subscribe(&Core::on_transport_rx, this);
}

// subscribe() waits out in-flight deliveries, so none can reach a dead Core.
Core::~Core() {
  transport_.subscribe(nullptr, nullptr);
}

Status Core::send(const char* type_name, const Message& msg, uint16_t* assigned_id) {
  const MessageType* t = nullptr;
  if (registry_.resolve_by_name(type_name, t) != Status::Ok) {
    log_.write(Level::Warn, "send_rejected",
               { field("reason", to_string(Status::UnknownType)),
                 field("type", type_name) });
    return Status::UnknownType;
  }
  return send_resolved(*t, msg, assigned_id);
}

Status Core::send(const Message& msg, uint16_t* assigned_id) {
  return send(natural_type_name(msg), msg, assigned_id);
}

Status Core::send_general(const char* subscribe_topic, const uint8_t* data, size_t len,
                          uint16_t* assigned_id) {
  const MessageType* t = registry_.find_by_subscribe_topic(subscribe_topic);
  if (!t) {
    log_.write(Level::Warn, "send_rejected",
               { field("reason", to_string(Status::UnknownType)),
                 field("topic", subscribe_topic) });
    return Status::UnknownType;
  }

  GeneralMessage g;
  g.type = t->name;
  if (data && len > 0) g.payload.assign(data, data + len);
  return send_resolved(*t, Message(std::move(g)), assigned_id);
}

// -----------------------------------------------------------------------------
// receive() - one envelope, start to finish.
// PRE:    data points to len readable bytes
// POLICY: header, type, telemetry, body, dispatch, ack; the first failure
//         ends the envelope in Dropped and later envelopes are unaffected
// OUT:    outcome with the last state reached
// -----------------------------------------------------------------------------
ReceiveOutcome Core::receive(const uint8_t* data, size_t len, uint16_t source) {
  ReceiveOutcome o;

  Header h;
  if (h.unpack(data, len) != Status::Ok) {
    return drop(o, Status::HeaderTooShort, len, source);
  }
  o.state      = ReceiveState::HeaderParsed;
  o.type_id    = h.type_id;
  o.message_id = h.message_id;

  const MessageType* t = nullptr;
  if (registry_.resolve_by_id(h.type_id, t) != Status::Ok) {
    // POLICY: unknown types do not count as received
    return drop(o, Status::UnknownType, len, source);
  }
  o.state = ReceiveState::TypeResolved;

  // telemetry: transit may be negative (skewed clocks); throughput only for
  // a positive, finite result
  Telemetry tm;
  tm.node        = node_name_;
  tm.sent_at     = h.sent_at;
  tm.received_at = clock_.now();
  tm.length      = len;
  tm.transit     = tm.received_at - tm.sent_at;
  tm.type_id     = h.type_id;
  tm.message_id  = h.message_id;
  tm.source      = source;
  if (tm.transit > 0.0) {
    const double rate = static_cast<double>(len) / tm.transit;
    if (std::isfinite(rate)) tm.throughput = rate;
  }
  if (!(tm.transit >= 0.0)) {
    log_.write(Level::Warn, "clock_skew",
               { field("type_id", u64(h.type_id)),
                 field("message_id", u64(h.message_id)),
                 field("source", u64(source)),
                 field("transit", tm.transit) });
  }
  tm.receive_count = received_.fetch_add(1, std::memory_order_relaxed) + 1;
  log_.telemetry(tm);

  Message msg;
  const Status ds = decode_body(*t, data + HEADER_LEN, len - HEADER_LEN, msg);
  if (ds != Status::Ok) {
    return drop(o, ds, len, source);
  }
  o.state = ReceiveState::BodyDecoded;

  dispatch(*t, msg, h);
  o.state = ReceiveState::Dispatched;

  log_.write(Level::Info, "received",
             { field("type", t->name.c_str()),
               field("message_id", u64(h.message_id)),
               field("source", u64(source)),
               field("length", u64(len)) });

  if (const Ack* a = std::get_if<Ack>(&msg)) {
    log_.write(Level::Info, "delivered", { field("message_id", u64(a->acked_id)) });
  }

  // POLICY: ack after dispatch; confirms receipt, not downstream success
  if (ack_policy_.requires_ack(t->name)) {
    const Status as = send_ack(h.message_id);
    if (as == Status::Ok) {
      o.state = ReceiveState::Acked;
    } else {
      log_.write(Level::Error, "ack_failed",
                 { field("reason", to_string(as)),
                   field("message_id", u64(h.message_id)) });
    }
  }
  return o;
}

ReceiveOutcome Core::receive(const std::vector<uint8_t>& envelope, uint16_t source) {
  return receive(envelope.data(), envelope.size(), source);
}

Stats Core::stats() const {
  Stats s;
  s.messages_sent     = sent_.load(std::memory_order_relaxed);
  s.messages_received = received_.load(std::memory_order_relaxed);
  s.messages_dropped  = dropped_.load(std::memory_order_relaxed);
  s.acks_sent         = acks_.load(std::memory_order_relaxed);
  return s;
}

// ---------- private ----------

Status Core::send_ack(uint16_t acked_id) {
  const MessageType* t = nullptr;
  const Status rs = registry_.resolve_by_name(type_name::ACK, t);
  if (rs != Status::Ok) return rs;

  const Status s = send_resolved(*t, Message(Ack{acked_id}), nullptr);
  if (s == Status::Ok) acks_.fetch_add(1, std::memory_order_relaxed);
  return s;
}

// -----------------------------------------------------------------------------
// send_resolved() - the outgoing pipeline once the type is known.
// PRE:    t comes from registry_
// POLICY: every check that can fail runs before the counter moves; the id is
//         consumed exactly once for each call that gets past them
// OUT:    assigned_id set whenever an id was taken
// -----------------------------------------------------------------------------
Status Core::send_resolved(const MessageType& t, const Message& msg, uint16_t* assigned_id) {
  std::vector<uint8_t> envelope;
  envelope.resize(HEADER_LEN);          // header written in place once the id is known

  std::string detail;
  const Status es = encode_body(t, msg, max_envelope_len_, envelope, detail);
  if (es != Status::Ok) {
    log_.write(Level::Warn, "send_rejected",
               { field("reason", to_string(es)),
                 field("type", t.name.c_str()),
                 field("detail", detail) });
    return es;
  }

  if (envelope.size() > max_envelope_len_) {
    log_.write(Level::Warn, "send_rejected",
               { field("reason", to_string(Status::EnvelopeTooLarge)),
                 field("type", t.name.c_str()),
                 field("length", u64(envelope.size())),
                 field("max", u64(max_envelope_len_)) });
    return Status::EnvelopeTooLarge;
  }

  // ids wrap at 16 bits; the counter itself keeps counting
  const uint16_t id = static_cast<uint16_t>(sent_.fetch_add(1, std::memory_order_relaxed));
  if (assigned_id) *assigned_id = id;

  Header(t.id, id, clock_.now()).pack(envelope.data());

  const transport::TxResult tx = transport_.publish(envelope.data(), envelope.size(), target_address_);
  if (tx != transport::TxResult::Ok) {
    log_.write(Level::Error, "transport_error",
               { field("transport", transport_.name()),
                 field("result", transport::to_string(tx)),
                 field("type", t.name.c_str()),
                 field("message_id", u64(id)) });
    return Status::TransportError;
  }

  log_.write(Level::Info, "sent",
             { field("type", t.name.c_str()),
               field("message_id", u64(id)),
               field("address", u64(target_address_)),
               field("length", u64(envelope.size())) });
  return Status::Ok;
}

void Core::dispatch(const MessageType& t, const Message& msg, const Header& h) {
  std::visit(Dispatcher{consumer_, t, h}, msg);
}

ReceiveOutcome Core::drop(ReceiveOutcome o, Status why, size_t len, uint16_t source) {
  dropped_.fetch_add(1, std::memory_order_relaxed);

  LogFields fs;
  fs.push_back(field("reason", to_string(why)));
  if (o.type_id)    fs.push_back(field("type_id", u64(*o.type_id)));
  if (o.message_id) fs.push_back(field("message_id", u64(*o.message_id)));
  fs.push_back(field("length", u64(len)));
  if (len >= HEADER_LEN) fs.push_back(field("body_length", u64(len - HEADER_LEN)));
  fs.push_back(field("source", u64(source)));
  log_.write(Level::Warn, to_string(why), fs);

  o.state  = ReceiveState::Dropped;
  o.status = why;
  return o;
}

void Core::on_transport_rx(void* user, const uint8_t* data, size_t len, uint16_t source) {
  if (!user) return;
  static_cast<Core*>(user)->receive(data, len, source);
}

} // namespace aclink
