/**
 * @file parser.cpp
 * @brief JSON conversion helpers for aclink messages.
 *
 * @details
 *   - Serializing Message, Header, Telemetry and MessageType into
 *     nlohmann::json objects (@c to_json).
 *   - Building Message objects from JSON (@c from_json) or from positional
 *     CLI values (@c from_values).
 *   - Hex helpers for byte bodies and whole envelopes.
 *
 * Error handling:
 *   - Input is checked with is_number()/is_string() before every read, so
 *     nlohmann never throws from here. Failures return a Status plus a
 *     short reason ("missing:yaw", "bad_hex").
 */
#include "aclink/parser.hpp"

#include <cmath>

namespace aclink {
namespace parser {

namespace {

// ---------- to_json ----------

void put_pose(json& j, const Pose& p) {
  j["x"] = p.x;
  j["y"] = p.y;
  j["z"] = p.z;
  j["roll"] = p.roll;
  j["pitch"] = p.pitch;
  j["yaw"] = p.yaw;
}

struct ToJson {
  json operator()(const PositionRequest& m) const {
    json j;
    j["type"] = type_name::POSITION_REQUEST;
    put_pose(j, m.pose);
    return j;
  }
  json operator()(const BodyRequest& m) const {
    json j;
    j["type"] = type_name::BODY_REQUEST;
    put_pose(j, m.pose);
    return j;
  }
  json operator()(const NavStatus& m) const {
    json j;
    j["type"] = type_name::NAV;
    j["latitude"] = m.latitude;
    j["longitude"] = m.longitude;
    j["north"] = m.north;
    j["east"] = m.east;
    j["depth"] = m.depth;
    j["roll"] = m.roll;
    j["pitch"] = m.pitch;
    j["yaw"] = m.yaw;
    return j;
  }
  json operator()(const StringImage& m) const {
    json j;
    j["type"] = type_name::STRING_IMAGE;
    j["length"] = m.payload.size();
    j["hex"] = to_hex(m.payload);
    return j;
  }
  json operator()(const Ack& m) const {
    json j;
    j["type"] = type_name::ACK;
    j["acked_id"] = m.acked_id;
    return j;
  }
  json operator()(const GeneralMessage& m) const {
    json j;
    j["type"] = m.type.c_str();
    j["length"] = m.payload.size();
    j["hex"] = to_hex(m.payload);
    return j;
  }
};

// ---------- from_json ----------

Status read_f32(const json& j, const char* key, float& out, std::string& err) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) {
    err = std::string("missing:") + key;
    return Status::EncodeError;
  }
  out = it->get<float>();
  return Status::Ok;
}

Status read_f64(const json& j, const char* key, double& out, std::string& err) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) {
    err = std::string("missing:") + key;
    return Status::EncodeError;
  }
  out = it->get<double>();
  return Status::Ok;
}

Status read_pose(const json& j, Pose& p, std::string& err) {
  Status s = read_f32(j, "x", p.x, err);
  if (s == Status::Ok) s = read_f32(j, "y", p.y, err);
  if (s == Status::Ok) s = read_f32(j, "z", p.z, err);
  if (s == Status::Ok) s = read_f32(j, "roll", p.roll, err);
  if (s == Status::Ok) s = read_f32(j, "pitch", p.pitch, err);
  if (s == Status::Ok) s = read_f32(j, "yaw", p.yaw, err);
  return s;
}

// byte body from "hex" or "text"
Status read_bytes(const json& j, std::vector<uint8_t>& out, std::string& err) {
  auto hex = j.find("hex");
  if (hex != j.end()) {
    if (!hex->is_string() || !from_hex(hex->get<std::string>(), out)) {
      err = "bad_hex";
      return Status::EncodeError;
    }
    return Status::Ok;
  }
  auto text = j.find("text");
  if (text != j.end()) {
    if (!text->is_string()) {
      err = "bad_text";
      return Status::EncodeError;
    }
    const std::string s = text->get<std::string>();
    out.assign(s.begin(), s.end());
    return Status::Ok;
  }
  err = "missing:hex";
  return Status::EncodeError;
}

Status need_values(const std::vector<double>& values, size_t n, std::string& err) {
  if (values.size() != n) {
    err = "values:expected=" + std::to_string(n) + " got=" + std::to_string(values.size());
    return Status::EncodeError;
  }
  return Status::Ok;
}

Pose pose_from(const std::vector<double>& v) {
  Pose p;
  p.x = static_cast<float>(v[0]);
  p.y = static_cast<float>(v[1]);
  p.z = static_cast<float>(v[2]);
  p.roll = static_cast<float>(v[3]);
  p.pitch = static_cast<float>(v[4]);
  p.yaw = static_cast<float>(v[5]);
  return p;
}

int hex_digit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

// ---------- public ----------

json to_json(const Message& msg) {
  return std::visit(ToJson{}, msg);
}

json to_json(const Header& h) {
  json j;
  j["type_id"] = h.type_id;
  j["message_id"] = h.message_id;
  j["sent_at"] = h.sent_at;
  return j;
}

// throughput stays null when undefined
json to_json(const Telemetry& t) {
  json j;
  if (!t.node.empty()) j["node"] = t.node;
  j["type_id"] = t.type_id;
  j["message_id"] = t.message_id;
  j["source"] = t.source;
  j["sent_at"] = t.sent_at;
  j["received_at"] = t.received_at;
  j["length"] = t.length;
  j["transit"] = t.transit;
  j["throughput"] = t.throughput ? json(*t.throughput) : json(nullptr);
  j["receive_count"] = t.receive_count;
  return j;
}

json to_json(const MessageType& t) {
  json j;
  j["name"] = t.name.c_str();
  j["id"] = t.id;
  j["kind"] = t.is_general() ? "general" : "fixed";
  if (t.is_general()) {
    if (!t.publish_topic.empty())   j["publish_topic"] = t.publish_topic.c_str();
    if (!t.subscribe_topic.empty()) j["subscribe_topic"] = t.subscribe_topic.c_str();
    if (!t.message_type.empty())    j["message_type"] = t.message_type.c_str();
  } else if (t.has_fixed_length()) {
    j["body_length"] = t.fixed_body_len();
  } else {
    j["body_length"] = nullptr;
  }
  return j;
}

Status from_json(const TypeRegistry& reg, const json& j, Message& out, std::string& err) {
  if (!j.is_object()) {
    err = "not_an_object";
    return Status::EncodeError;
  }
  auto type = j.find("type");
  if (type == j.end() || !type->is_string()) {
    err = "missing:type";
    return Status::UnknownType;
  }
  const std::string name = type->get<std::string>();
  const MessageType* t = reg.find_by_name(name.c_str());
  if (!t) {
    err = "unknown_type:" + name;
    return Status::UnknownType;
  }

  if (t->is_general()) {
    GeneralMessage g;
    g.type = t->name;
    const Status s = read_bytes(j, g.payload, err);
    if (s != Status::Ok) return s;
    out = std::move(g);
    return Status::Ok;
  }

  switch (t->id) {
    case type_id::POSITION_REQUEST: {
      PositionRequest m;
      const Status s = read_pose(j, m.pose, err);
      if (s == Status::Ok) out = m;
      return s;
    }
    case type_id::BODY_REQUEST: {
      BodyRequest m;
      const Status s = read_pose(j, m.pose, err);
      if (s == Status::Ok) out = m;
      return s;
    }
    case type_id::NAV: {
      NavStatus m;
      Status s = read_f64(j, "latitude", m.latitude, err);
      if (s == Status::Ok) s = read_f64(j, "longitude", m.longitude, err);
      if (s == Status::Ok) s = read_f32(j, "north", m.north, err);
      if (s == Status::Ok) s = read_f32(j, "east", m.east, err);
      if (s == Status::Ok) s = read_f32(j, "depth", m.depth, err);
      if (s == Status::Ok) s = read_f32(j, "roll", m.roll, err);
      if (s == Status::Ok) s = read_f32(j, "pitch", m.pitch, err);
      if (s == Status::Ok) s = read_f32(j, "yaw", m.yaw, err);
      if (s == Status::Ok) out = m;
      return s;
    }
    case type_id::STRING_IMAGE: {
      StringImage m;
      const Status s = read_bytes(j, m.payload, err);
      if (s == Status::Ok) out = std::move(m);
      return s;
    }
    case type_id::ACK: {
      auto it = j.find("acked_id");
      if (it == j.end() || !it->is_number_unsigned() || it->get<uint64_t>() > 0xFFFF) {
        err = "missing:acked_id";
        return Status::EncodeError;
      }
      out = Ack{ static_cast<uint16_t>(it->get<uint64_t>()) };
      return Status::Ok;
    }
    default:
      err = "no_message_for:" + name;
      return Status::UnknownType;
  }
}

Status from_values(const MessageType& t, const std::vector<double>& values,
                   const std::string& text, Message& out, std::string& err) {
  if (t.is_general()) {
    GeneralMessage g;
    g.type = t.name;
    g.payload.assign(text.begin(), text.end());
    out = std::move(g);
    return Status::Ok;
  }

  switch (t.id) {
    case type_id::POSITION_REQUEST: {
      const Status s = need_values(values, 6, err);
      if (s == Status::Ok) out = PositionRequest{ pose_from(values) };
      return s;
    }
    case type_id::BODY_REQUEST: {
      const Status s = need_values(values, 6, err);
      if (s == Status::Ok) out = BodyRequest{ pose_from(values) };
      return s;
    }
    case type_id::NAV: {
      const Status s = need_values(values, 8, err);
      if (s != Status::Ok) return s;
      NavStatus m;
      m.latitude  = values[0];
      m.longitude = values[1];
      m.north = static_cast<float>(values[2]);
      m.east  = static_cast<float>(values[3]);
      m.depth = static_cast<float>(values[4]);
      m.roll  = static_cast<float>(values[5]);
      m.pitch = static_cast<float>(values[6]);
      m.yaw   = static_cast<float>(values[7]);
      out = m;
      return Status::Ok;
    }
    case type_id::STRING_IMAGE: {
      StringImage m;
      m.payload.assign(text.begin(), text.end());
      out = std::move(m);
      return Status::Ok;
    }
    case type_id::ACK: {
      const Status s = need_values(values, 1, err);
      if (s != Status::Ok) return s;
      if (!(values[0] >= 0.0) || values[0] > 65535.0 || std::floor(values[0]) != values[0]) {
        err = "bad_value:acked_id";
        return Status::EncodeError;
      }
      out = Ack{ static_cast<uint16_t>(values[0]) };
      return Status::Ok;
    }
    default:
      err = std::string("no_message_for:") + t.name.c_str();
      return Status::UnknownType;
  }
}

std::vector<const char*> field_names(const MessageType& t) {
  if (t.is_general()) return {};
  switch (t.id) {
    case type_id::POSITION_REQUEST:
    case type_id::BODY_REQUEST:
      return { "x", "y", "z", "roll", "pitch", "yaw" };
    case type_id::NAV:
      return { "latitude", "longitude", "north", "east", "depth", "roll", "pitch", "yaw" };
    case type_id::ACK:
      return { "acked_id" };
    default:
      return {};
  }
}

std::string to_hex(const uint8_t* data, size_t len) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out += digits[(data[i] >> 4) & 0x0F];
    out += digits[data[i] & 0x0F];
  }
  return out;
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
  return to_hex(bytes.data(), bytes.size());
}

bool from_hex(const std::string& hex, std::vector<uint8_t>& out) {
  std::vector<uint8_t> bytes;
  int hi = -1;
  for (char c : hex) {
    if (c == ' ') continue;
    const int d = hex_digit(c);
    if (d < 0) return false;
    if (hi < 0) {
      hi = d;
    } else {
      bytes.push_back(static_cast<uint8_t>((hi << 4) | d));
      hi = -1;
    }
  }
  if (hi >= 0) return false;   // odd digit count
  out = std::move(bytes);
  return true;
}

} // namespace parser
} // namespace aclink
