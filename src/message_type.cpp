// -----------------------------------------------------------------------------
// message_type.cpp - Type Registry implementation
//
// API & table of built-in types:
//   see include/aclink/message_type.hpp
//
// The registry is a fixed-capacity ETL vector plus a 256-entry id index, so
// resolve_by_id() is one array read on the receive path. Name lookups are a
// linear scan; the table is small.
// -----------------------------------------------------------------------------
#include "aclink/message_type.hpp"

#include <string.h>

namespace aclink {

size_t field_width(FieldKind k) {
  switch (k) {
    case FieldKind::Float32: return 4;
    case FieldKind::Float64: return 8;
    case FieldKind::UInt16:  return 2;
    case FieldKind::Bytes:   return 0;
  }
  return 0;
}

bool MessageType::has_fixed_length() const {
  for (auto f : layout) {
    if (f == FieldKind::Bytes) return false;
  }
  return !is_general();
}

size_t MessageType::fixed_body_len() const {
  size_t n = 0;
  for (auto f : layout) n += field_width(f);
  return n;
}

// ---------- registry ----------

TypeRegistry::TypeRegistry() {
  memset(slot_by_id_, 0, sizeof(slot_by_id_));
}

// -----------------------------------------------------------------------------
// valid_layout() - a fixed layout needs at least one field and Bytes may only
// appear as the final field (there is no length prefix on the wire).
// -----------------------------------------------------------------------------
bool TypeRegistry::valid_layout(const Layout& layout) {
  if (layout.empty()) return false;
  for (size_t i = 0; i + 1 < layout.size(); ++i) {
    if (layout[i] == FieldKind::Bytes) return false;
  }
  return true;
}

Status TypeRegistry::add(const MessageType& t) {
  if (t.id == 0 || t.name.empty()) return Status::InvalidDescriptor;
  if (t.kind == TypeKind::Fixed) {
    if (!valid_layout(t.layout)) return Status::InvalidDescriptor;
    // fixed bodies decode by id; anything else would resolve and then fail
    if (!type_id::has_fixed_body(t.id)) return Status::InvalidDescriptor;
  }

  // bijection: neither side of the mapping may already be taken
  if (slot_by_id_[t.id] != 0) return Status::DuplicateIdentifier;
  if (find_by_name(t.name.c_str()) != nullptr) return Status::DuplicateIdentifier;

  if (types_.full()) return Status::InvalidDescriptor;

  types_.push_back(t);
  slot_by_id_[t.id] = static_cast<uint8_t>(types_.size());
  return Status::Ok;
}

Status TypeRegistry::add_fixed(const char* name, uint8_t id, const Layout& layout) {
  if (!name || strlen(name) > ACLINK_NAME_MAX) return Status::InvalidDescriptor;

  MessageType t;
  t.name   = name;
  t.id     = id;
  t.kind   = TypeKind::Fixed;
  t.layout = layout;
  return add(t);
}

Status TypeRegistry::add_general(const char* name, uint8_t id,
                                 const char* publish_topic,
                                 const char* subscribe_topic,
                                 const char* message_type) {
  if (!name || strlen(name) > ACLINK_NAME_MAX) return Status::InvalidDescriptor;

  // topics longer than the fixed capacity would be silently cut; refuse them
  const char* topics[3] = { publish_topic, subscribe_topic, message_type };
  for (const char* s : topics) {
    if (s && strlen(s) > ACLINK_TOPIC_MAX) return Status::InvalidDescriptor;
  }

  MessageType t;
  t.name = name;
  t.id   = id;
  t.kind = TypeKind::General;
  if (publish_topic)   t.publish_topic   = publish_topic;
  if (subscribe_topic) t.subscribe_topic = subscribe_topic;
  if (message_type)    t.message_type    = message_type;
  return add(t);
}

// -----------------------------------------------------------------------------
// register_fixed_types() - the built-in table. Stops at the first failure so
// a caller that registered something earlier sees the conflict.
// -----------------------------------------------------------------------------
Status TypeRegistry::register_fixed_types() {
  Layout pose;
  for (int i = 0; i < 6; ++i) pose.push_back(FieldKind::Float32);

  Layout nav;
  nav.push_back(FieldKind::Float64);     // latitude
  nav.push_back(FieldKind::Float64);     // longitude
  for (int i = 0; i < 6; ++i) nav.push_back(FieldKind::Float32);

  Layout blob;
  blob.push_back(FieldKind::Bytes);

  Layout ack;
  ack.push_back(FieldKind::UInt16);

  Status s = add_fixed(type_name::POSITION_REQUEST, type_id::POSITION_REQUEST, pose);
  if (s == Status::Ok) s = add_fixed(type_name::BODY_REQUEST, type_id::BODY_REQUEST, pose);
  if (s == Status::Ok) s = add_fixed(type_name::NAV,          type_id::NAV,          nav);
  if (s == Status::Ok) s = add_fixed(type_name::STRING_IMAGE, type_id::STRING_IMAGE, blob);
  if (s == Status::Ok) s = add_fixed(type_name::ACK,          type_id::ACK,          ack);
  if (s == Status::Ok) s = add_general(type_name::ROS_MESSAGE, type_id::ROS_MESSAGE, nullptr, nullptr, nullptr);
  if (s == Status::Ok) s = add_general(type_name::ROS_SERVICE, type_id::ROS_SERVICE, nullptr, nullptr, nullptr);
  return s;
}

const MessageType* TypeRegistry::find_by_id(uint8_t id) const {
  const uint8_t slot = slot_by_id_[id];
  if (slot == 0) return nullptr;
  return &types_[slot - 1];
}

const MessageType* TypeRegistry::find_by_name(const char* name) const {
  if (!name) return nullptr;
  for (const auto& t : types_) {
    if (t.name == name) return &t;
  }
  return nullptr;
}

const MessageType* TypeRegistry::find_by_subscribe_topic(const char* topic) const {
  if (!topic || !*topic) return nullptr;
  for (const auto& t : types_) {
    if (t.is_general() && t.subscribe_topic == topic) return &t;
  }
  return nullptr;
}

const MessageType* TypeRegistry::find_by_publish_topic(const char* topic) const {
  if (!topic || !*topic) return nullptr;
  for (const auto& t : types_) {
    if (t.is_general() && t.publish_topic == topic) return &t;
  }
  return nullptr;
}

Status TypeRegistry::resolve_by_id(uint8_t id, const MessageType*& out) const {
  out = find_by_id(id);
  return out ? Status::Ok : Status::UnknownType;
}

Status TypeRegistry::resolve_by_name(const char* name, const MessageType*& out) const {
  out = find_by_name(name);
  return out ? Status::Ok : Status::UnknownType;
}

} // namespace aclink
