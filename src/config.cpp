// -----------------------------------------------------------------------------
// config.cpp - JSON config loading and registry construction
//
// Parsing uses nlohmann::json in non-throwing mode (parse(..., false)) and
// checks every value's type before reading it, so nothing here throws.
// -----------------------------------------------------------------------------
#include "aclink/config.hpp"
#include "aclink/header.hpp"

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace aclink {

namespace {

// ---------- helpers ----------

Status bad_value(const char* key, std::string& err) {
  err = std::string("bad_value:") + key;
  return Status::ConfigError;
}

// Unsigned integer in [lo, hi]. Absent key leaves `out` alone.
template <typename T>
Status read_uint(const json& obj, const char* key, uint64_t lo, uint64_t hi,
                 T& out, std::string& err) {
  auto it = obj.find(key);
  if (it == obj.end()) return Status::Ok;
  if (!it->is_number_unsigned()) return bad_value(key, err);
  const uint64_t v = it->get<uint64_t>();
  if (v < lo || v > hi) return bad_value(key, err);
  out = static_cast<T>(v);
  return Status::Ok;
}

Status read_number(const json& obj, const char* key, double& out, std::string& err) {
  auto it = obj.find(key);
  if (it == obj.end()) return Status::Ok;
  if (!it->is_number()) return bad_value(key, err);
  out = it->get<double>();
  return Status::Ok;
}

Status read_string(const json& obj, const char* key, std::string& out, std::string& err) {
  auto it = obj.find(key);
  if (it == obj.end()) return Status::Ok;
  if (!it->is_string()) return bad_value(key, err);
  out = it->get<std::string>();
  return Status::Ok;
}

Status read_names(const json& obj, const char* key, std::vector<std::string>& out,
                  std::string& err) {
  auto it = obj.find(key);
  if (it == obj.end()) return Status::Ok;
  if (!it->is_array()) return bad_value(key, err);
  std::vector<std::string> names;
  for (const auto& e : *it) {
    if (!e.is_string()) return bad_value(key, err);
    names.push_back(e.get<std::string>());
  }
  out = std::move(names);
  return Status::Ok;
}

// Scalars shared by the top level and "packer_config".
Status read_scalars(const json& obj, Config& cfg, std::string& err) {
  Status s = read_string(obj, "node_name", cfg.node_name, err);
  if (s == Status::Ok) s = read_uint(obj, "target_address", 0, 0xFFFF, cfg.target_address, err);
  if (s == Status::Ok) s = read_names(obj, "requiring_ack", cfg.requiring_ack, err);
  if (s == Status::Ok) s = read_uint(obj, "retries", 0, 0xFFFFFFFFull, cfg.retries, err);
  if (s == Status::Ok) s = read_number(obj, "retry_delay", cfg.retry_delay, err);
  // the envelope must at least hold a header
  if (s == Status::Ok) s = read_uint(obj, "max_envelope_len", HEADER_LEN + 1, 1u << 20,
                                     cfg.max_envelope_len, err);
  return s;
}

// list of {name, id, <topic_key>, message_type}
Status read_bindings(const json& obj, const char* key, const char* topic_key,
                     std::vector<GeneralBinding>& out, std::string& err) {
  auto it = obj.find(key);
  if (it == obj.end()) return Status::Ok;
  if (!it->is_array()) return bad_value(key, err);

  std::vector<GeneralBinding> list;
  size_t index = 0;
  for (const auto& e : *it) {
    const std::string where = std::string(key) + "[" + std::to_string(index++) + "]";
    if (!e.is_object()) { err = "bad_value:" + where; return Status::ConfigError; }

    GeneralBinding b;
    auto name = e.find("name");
    if (name == e.end() || !name->is_string() || name->get<std::string>().empty()) {
      err = "bad_value:" + where + ".name";
      return Status::ConfigError;
    }
    b.name = name->get<std::string>();

    auto id = e.find("id");
    if (id == e.end() || !id->is_number_unsigned() ||
        id->get<uint64_t>() < 1 || id->get<uint64_t>() > 255) {
      err = "bad_value:" + where + ".id";
      return Status::ConfigError;
    }
    b.id = static_cast<uint8_t>(id->get<uint64_t>());

    auto topic = e.find(topic_key);
    if (topic != e.end()) {
      if (!topic->is_string()) { err = "bad_value:" + where + "." + topic_key; return Status::ConfigError; }
      b.topic = topic->get<std::string>();
    }

    auto mt = e.find("message_type");
    if (mt != e.end()) {
      if (!mt->is_string()) { err = "bad_value:" + where + ".message_type"; return Status::ConfigError; }
      b.message_type = mt->get<std::string>();
    }
    list.push_back(std::move(b));
  }
  out = std::move(list);
  return Status::Ok;
}

} // namespace

// ---------- loading ----------

Status load_config_string(const std::string& text, Config& out, std::string& err) {
  const json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) {
    err = "parse_error";
    return Status::ConfigError;
  }
  if (!j.is_object()) {
    err = "bad_value:root";
    return Status::ConfigError;
  }

  Config cfg = out;
  Status s = read_scalars(j, cfg, err);
  if (s != Status::Ok) return s;

  auto packer = j.find("packer_config");
  if (packer != j.end()) {
    if (!packer->is_object()) return bad_value("packer_config", err);
    s = read_scalars(*packer, cfg, err);
    if (s != Status::Ok) return s;
  }

  s = read_bindings(j, "general_messages_outgoing", "subscribe_topic",
                    cfg.general_messages_outgoing, err);
  if (s != Status::Ok) return s;
  s = read_bindings(j, "general_messages_incoming", "publish_topic",
                    cfg.general_messages_incoming, err);
  if (s != Status::Ok) return s;

  out = std::move(cfg);
  return Status::Ok;
}

Status load_config_file(const std::string& path, Config& out, std::string& err) {
  std::ifstream in(path);
  if (!in) {
    err = "open_failed:" + path;
    return Status::ConfigError;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return load_config_string(ss.str(), out, err);
}

// ---------- registry ----------

// -----------------------------------------------------------------------------
// build_registry()
//   PRE:    reg is empty
//   POLICY: built-in table first; outgoing + incoming entries sharing name and
//           id merge into one descriptor; a subscribe or publish topic may be
//           bound only once; first failure stops the build
//   OUT:    err names the offending entry on failure
// -----------------------------------------------------------------------------
Status build_registry(const Config& cfg, TypeRegistry& reg, std::string& err) {
  Status s = reg.register_fixed_types();
  if (s != Status::Ok) {
    err = "builtin_types";
    return s;
  }

  struct Pending {
    const GeneralBinding* out{nullptr};
    const GeneralBinding* in{nullptr};
  };
  std::vector<Pending> pending;

  auto find_pending = [&pending](const std::string& name) -> Pending* {
    for (auto& p : pending) {
      const GeneralBinding* b = p.out ? p.out : p.in;
      if (b->name == name) return &p;
    }
    return nullptr;
  };

  for (const auto& b : cfg.general_messages_outgoing) {
    if (find_pending(b.name)) {
      err = "duplicate_name:" + b.name;
      return Status::DuplicateIdentifier;
    }
    pending.push_back(Pending{&b, nullptr});
  }
  for (const auto& b : cfg.general_messages_incoming) {
    Pending* p = find_pending(b.name);
    if (!p) {
      pending.push_back(Pending{nullptr, &b});
      continue;
    }
    if (p->in || p->out->id != b.id) {
      err = "duplicate_name:" + b.name;
      return Status::DuplicateIdentifier;
    }
    p->in = &b;
  }

  // a topic routes to exactly one type in each direction
  for (size_t i = 0; i < pending.size(); ++i) {
    for (size_t k = i + 1; k < pending.size(); ++k) {
      const Pending& a = pending[i];
      const Pending& b = pending[k];
      if (a.out && b.out && !a.out->topic.empty() && a.out->topic == b.out->topic) {
        err = "duplicate_topic:" + a.out->topic;
        return Status::DuplicateIdentifier;
      }
      if (a.in && b.in && !a.in->topic.empty() && a.in->topic == b.in->topic) {
        err = "duplicate_topic:" + a.in->topic;
        return Status::DuplicateIdentifier;
      }
    }
  }

  for (const auto& p : pending) {
    const GeneralBinding* b = p.out ? p.out : p.in;
    const std::string& mt = (p.out && !p.out->message_type.empty())
                              ? p.out->message_type
                              : (p.in ? p.in->message_type : b->message_type);
    s = reg.add_general(b->name.c_str(), b->id,
                        p.in  ? p.in->topic.c_str()  : nullptr,
                        p.out ? p.out->topic.c_str() : nullptr,
                        mt.c_str());
    if (s != Status::Ok) {
      err = std::string(to_string(s)) + ":" + b->name + " id=" + std::to_string(b->id);
      return s;
    }
  }
  return Status::Ok;
}

Status build_ack_policy(const Config& cfg, const TypeRegistry& reg,
                        AckPolicy& policy, std::string& err) {
  AckPolicy p;
  for (const auto& name : cfg.requiring_ack) {
    if (!reg.find_by_name(name.c_str())) {
      err = "unknown_type:" + name;
      return Status::ConfigError;
    }
    if (!p.add(name.c_str())) {
      err = "requiring_ack_full";
      return Status::ConfigError;
    }
  }
  policy = p;
  return Status::Ok;
}

} // namespace aclink
