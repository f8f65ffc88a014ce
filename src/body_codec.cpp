// -----------------------------------------------------------------------------
// body_codec.cpp - per-type body encode/decode for aclink envelopes
//
// Fixed types are matched to their Message alternative by wire id. A custom
// fixed type registered through the API without a matching alternative can
// be resolved but not decoded (Status::UnknownType).
// -----------------------------------------------------------------------------
#include "aclink/body_codec.hpp"
#include "aclink/byte_order.hpp"

namespace aclink {

namespace {

// ---------- helpers ----------

void put_pose(std::vector<uint8_t>& b, const Pose& p) {
  wire::put_f32(b, p.x);
  wire::put_f32(b, p.y);
  wire::put_f32(b, p.z);
  wire::put_f32(b, p.roll);
  wire::put_f32(b, p.pitch);
  wire::put_f32(b, p.yaw);
}

Pose get_pose(const uint8_t* p) {
  Pose out;
  out.x     = wire::get_f32(p + 0);
  out.y     = wire::get_f32(p + 4);
  out.z     = wire::get_f32(p + 8);
  out.roll  = wire::get_f32(p + 12);
  out.pitch = wire::get_f32(p + 16);
  out.yaw   = wire::get_f32(p + 20);
  return out;
}

/// Wire id an alternative belongs to; 0 for GeneralMessage (any general type).
struct ExpectedId {
  uint8_t operator()(const PositionRequest&) const { return type_id::POSITION_REQUEST; }
  uint8_t operator()(const BodyRequest&)     const { return type_id::BODY_REQUEST; }
  uint8_t operator()(const NavStatus&)       const { return type_id::NAV; }
  uint8_t operator()(const StringImage&)     const { return type_id::STRING_IMAGE; }
  uint8_t operator()(const Ack&)             const { return type_id::ACK; }
  uint8_t operator()(const GeneralMessage&)  const { return 0; }
};

struct NaturalName {
  const char* operator()(const PositionRequest&) const { return type_name::POSITION_REQUEST; }
  const char* operator()(const BodyRequest&)     const { return type_name::BODY_REQUEST; }
  const char* operator()(const NavStatus&)       const { return type_name::NAV; }
  const char* operator()(const StringImage&)     const { return type_name::STRING_IMAGE; }
  const char* operator()(const Ack&)             const { return type_name::ACK; }
  const char* operator()(const GeneralMessage& g) const { return g.type.c_str(); }
};

// Writes the body of one alternative. Size checks happen before this runs.
struct BodyWriter {
  std::vector<uint8_t>& out;

  void operator()(const PositionRequest& m) const { put_pose(out, m.pose); }
  void operator()(const BodyRequest& m)     const { put_pose(out, m.pose); }

  void operator()(const NavStatus& m) const {
    wire::put_f64(out, m.latitude);
    wire::put_f64(out, m.longitude);
    wire::put_f32(out, m.north);
    wire::put_f32(out, m.east);
    wire::put_f32(out, m.depth);
    wire::put_f32(out, m.roll);
    wire::put_f32(out, m.pitch);
    wire::put_f32(out, m.yaw);
  }

  void operator()(const StringImage& m) const {
    out.insert(out.end(), m.payload.begin(), m.payload.end());
  }

  void operator()(const Ack& m) const { wire::put_u16(out, m.acked_id); }

  void operator()(const GeneralMessage& m) const {
    out.insert(out.end(), m.payload.begin(), m.payload.end());
  }
};

size_t variable_payload_len(const Message& msg) {
  if (auto* s = std::get_if<StringImage>(&msg))    return s->payload.size();
  if (auto* g = std::get_if<GeneralMessage>(&msg)) return g->payload.size();
  return 0;
}

} // namespace

// ---------- public ----------

const char* natural_type_name(const Message& m) {
  return std::visit(NaturalName{}, m);
}

// -----------------------------------------------------------------------------
// encode_body()
//   PRE:    t resolved from the registry
//   POLICY: general types take only a GeneralMessage of the same name (or
//           unnamed), fixed types only their own alternative; variable bodies
//           must stay under max_envelope_len
//   OUT:    body appended to out on Status::Ok only
// -----------------------------------------------------------------------------
Status encode_body(const MessageType& t, const Message& msg,
                   size_t max_envelope_len,
                   std::vector<uint8_t>& out, std::string& detail) {
  const uint8_t want = std::visit(ExpectedId{}, msg);

  if (t.is_general()) {
    if (want != 0) {
      detail = std::string("expected:general got:") + natural_type_name(msg);
      return Status::EncodeError;
    }
    // an unnamed payload takes the type it is sent under
    const GeneralMessage& g = std::get<GeneralMessage>(msg);
    if (!g.type.empty() && g.type != t.name) {
      detail = std::string("expected:") + t.name.c_str() + " got:" + g.type.c_str();
      return Status::EncodeError;
    }
  } else if (want != t.id) {
    detail = std::string("expected:") + t.name.c_str() + " got:" + natural_type_name(msg);
    return Status::EncodeError;
  }

  const size_t var_len = variable_payload_len(msg);
  if (t.is_general() || want == type_id::STRING_IMAGE) {
    if (var_len >= max_envelope_len) {
      detail = "body_len:" + std::to_string(var_len) +
               " max:" + std::to_string(max_envelope_len);
      return Status::EnvelopeTooLarge;
    }
  }

  std::vector<uint8_t> body;
  body.reserve(t.has_fixed_length() ? t.fixed_body_len() : var_len);
  std::visit(BodyWriter{body}, msg);

  // a fixed alternative written against a registry layout of another size
  // means the descriptor and the message disagree
  if (t.has_fixed_length() && body.size() != t.fixed_body_len()) {
    detail = "layout_len:" + std::to_string(t.fixed_body_len()) +
             " body_len:" + std::to_string(body.size());
    return Status::EncodeError;
  }

  out.insert(out.end(), body.begin(), body.end());
  return Status::Ok;
}

// -----------------------------------------------------------------------------
// decode_body()
//   PRE:    data points to len readable bytes (data may be null when len == 0)
//   POLICY: exact length for fixed-length types; general and blob types copy
//   OUT:    out replaced on Status::Ok only
// -----------------------------------------------------------------------------
Status decode_body(const MessageType& t, const uint8_t* data, size_t len, Message& out) {
  if (t.is_general()) {
    GeneralMessage g;
    g.type = t.name;
    if (len > 0) g.payload.assign(data, data + len);
    out = std::move(g);
    return Status::Ok;
  }

  if (t.has_fixed_length() && len != t.fixed_body_len()) {
    return Status::BodyLengthMismatch;
  }

  switch (t.id) {
    case type_id::POSITION_REQUEST: {
      if (len != 24) return Status::BodyLengthMismatch;
      out = PositionRequest{ get_pose(data) };
      return Status::Ok;
    }
    case type_id::BODY_REQUEST: {
      if (len != 24) return Status::BodyLengthMismatch;
      out = BodyRequest{ get_pose(data) };
      return Status::Ok;
    }
    case type_id::NAV: {
      if (len != 40) return Status::BodyLengthMismatch;
      NavStatus n;
      n.latitude  = wire::get_f64(data + 0);
      n.longitude = wire::get_f64(data + 8);
      n.north     = wire::get_f32(data + 16);
      n.east      = wire::get_f32(data + 20);
      n.depth     = wire::get_f32(data + 24);
      n.roll      = wire::get_f32(data + 28);
      n.pitch     = wire::get_f32(data + 32);
      n.yaw       = wire::get_f32(data + 36);
      out = n;
      return Status::Ok;
    }
    case type_id::STRING_IMAGE: {
      StringImage s;
      if (len > 0) s.payload.assign(data, data + len);
      out = std::move(s);
      return Status::Ok;
    }
    case type_id::ACK: {
      if (len != 2) return Status::BodyLengthMismatch;
      out = Ack{ wire::get_u16(data) };
      return Status::Ok;
    }
    default:
      return Status::UnknownType;
  }
}

} // namespace aclink
