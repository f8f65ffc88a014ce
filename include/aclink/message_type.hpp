/**
 * @page aclink_message_type aclink Type Registry
 * @file message_type.hpp
 * @brief MessageType descriptors and the bidirectional name <-> id registry.
 *
 * @details
 * Every envelope on the acoustic link starts with a one-byte type id. The
 * registry is the single place that knows what that byte means:
 *
 * | Name               | Id  | Kind    | Body layout                          |
 * |--------------------|-----|---------|--------------------------------------|
 * | position_request   | 1   | Fixed   | f32 x6 (x, y, z, roll, pitch, yaw)   |
 * | body_request       | 2   | Fixed   | f32 x6 (x, y, z, roll, pitch, yaw)   |
 * | nav                | 5   | Fixed   | f64 x2 (lat, lon) + f32 x6           |
 * | string_image       | 10  | Fixed   | raw bytes                            |
 * | ack                | 32  | Fixed   | u16 (acknowledged message id)        |
 * | ros_message        | 100 | General | opaque                               |
 * | ros_service        | 101 | General | opaque                               |
 *
 * Configuration may append more General types (name, id, topic binding). The
 * fixed table is always registered first so configured entries can never
 * shadow it.
 *
 * ### Invariants
 * - Ids are 1..255; id 0 is never assigned.
 * - Name <-> id is a bijection. add() refuses a second entry with either the
 *   same id or the same name (`Status::DuplicateIdentifier`).
 * - The registry is filled at startup and then only read. Core keeps it by
 *   `const&`, so concurrent readers need no locking.
 *
 * ### Usage
 * @code
 * aclink::TypeRegistry reg;
 * reg.register_fixed_types();
 * reg.add_general("battery", 120, "/modem/unpacker/battery", "", "BatteryStatus");
 *
 * const aclink::MessageType* t = nullptr;
 * if (reg.resolve_by_id(5, t) == aclink::Status::Ok) {
 *   // t->name == "nav", t->fixed_body_len() == 40
 * }
 * @endcode
 *
 * @author Leo
 */
#ifndef ACLINK_MESSAGE_TYPE_HPP
#define ACLINK_MESSAGE_TYPE_HPP

#include <stdint.h>
#include <stddef.h>
#include "etl/string.h"
#include "etl/vector.h"
#include "status.hpp"

namespace aclink {

static constexpr size_t ACLINK_NAME_MAX   = 32;  ///< longest type name
static constexpr size_t ACLINK_TOPIC_MAX  = 96;  ///< longest external topic / message type string
static constexpr size_t ACLINK_LAYOUT_MAX = 8;   ///< most fields in one fixed layout
static constexpr size_t ACLINK_TYPES_MAX  = 64;  ///< registry capacity (fixed + general)

using TypeName = etl::string<ACLINK_NAME_MAX>;
using TopicStr = etl::string<ACLINK_TOPIC_MAX>;

/// Wire ids of the built-in types.
namespace type_id {
  static constexpr uint8_t POSITION_REQUEST = 1;
  static constexpr uint8_t BODY_REQUEST     = 2;
  static constexpr uint8_t NAV              = 5;
  static constexpr uint8_t STRING_IMAGE     = 10;
  static constexpr uint8_t ACK              = 32;
  static constexpr uint8_t ROS_MESSAGE      = 100;
  static constexpr uint8_t ROS_SERVICE      = 101;

  /// Fixed ids that have a Message alternative and so can be decoded.
  inline bool has_fixed_body(uint8_t id) {
    return id == POSITION_REQUEST || id == BODY_REQUEST || id == NAV ||
           id == STRING_IMAGE || id == ACK;
  }
}

/// Names of the built-in types.
namespace type_name {
  static constexpr const char* POSITION_REQUEST = "position_request";
  static constexpr const char* BODY_REQUEST     = "body_request";
  static constexpr const char* NAV              = "nav";
  static constexpr const char* STRING_IMAGE     = "string_image";
  static constexpr const char* ACK              = "ack";
  static constexpr const char* ROS_MESSAGE      = "ros_message";
  static constexpr const char* ROS_SERVICE      = "ros_service";
}

/// One field of a fixed binary layout. Widths are fixed except Bytes.
enum class FieldKind : uint8_t {
  Float32 = 0,
  Float64,
  UInt16,
  Bytes,     ///< variable-length tail; only valid as the last field
};

/// Wire width of a field kind, 0 for Bytes.
size_t field_width(FieldKind k);

using Layout = etl::vector<FieldKind, ACLINK_LAYOUT_MAX>;

enum class TypeKind : uint8_t {
  Fixed = 0,   ///< decoded by aclink against `layout`
  General,     ///< body forwarded opaquely to its topic binding
};

/**
 * @struct MessageType
 * @brief Descriptor for one registered envelope type.
 *
 * Fixed types carry a layout. General types carry topic bindings instead:
 * `publish_topic` is where received bodies are forwarded, `subscribe_topic`
 * is where outgoing application payloads come from. Either may be empty.
 */
struct MessageType {
  TypeName name{};
  uint8_t  id{0};
  TypeKind kind{TypeKind::Fixed};
  Layout   layout{};
  TopicStr publish_topic{};     ///< incoming binding (general only)
  TopicStr subscribe_topic{};   ///< outgoing binding (general only)
  TopicStr message_type{};      ///< external message type label (general only, informational)

  bool is_general() const { return kind == TypeKind::General; }

  /// True when every field has a fixed width (no Bytes tail).
  bool has_fixed_length() const;

  /// Sum of the field widths. Only meaningful when has_fixed_length().
  size_t fixed_body_len() const;
};

class TypeRegistry {
public:
  using Storage = etl::vector<MessageType, ACLINK_TYPES_MAX>;

  TypeRegistry();

  /**
   * @brief Register a descriptor.
   * @retval Status::Ok                  added
   * @retval Status::DuplicateIdentifier id or name already present
   * @retval Status::InvalidDescriptor   id 0, empty name, fixed type without a
   *                                     layout, Bytes not last, fixed id with no
   *                                     body codec, or registry full
   */
  Status add(const MessageType& t);

  /// Register a fixed-layout type.
  Status add_fixed(const char* name, uint8_t id, const Layout& layout);

  /// Register a general (opaque) type with optional topic bindings.
  Status add_general(const char* name, uint8_t id,
                     const char* publish_topic,
                     const char* subscribe_topic,
                     const char* message_type);

  /// Register the built-in table. Must run before any general type is added.
  Status register_fixed_types();

  /// Lookup by wire id. nullptr if absent.
  const MessageType* find_by_id(uint8_t id) const;

  /// Lookup by name. nullptr if absent.
  const MessageType* find_by_name(const char* name) const;

  /// General type whose outgoing binding is `topic`. nullptr if none.
  const MessageType* find_by_subscribe_topic(const char* topic) const;

  /// General type whose incoming binding is `topic`. nullptr if none.
  const MessageType* find_by_publish_topic(const char* topic) const;

  /// Status-returning forms used by the pipelines.
  Status resolve_by_id(uint8_t id, const MessageType*& out) const;
  Status resolve_by_name(const char* name, const MessageType*& out) const;

  size_t size() const { return types_.size(); }
  bool   empty() const { return types_.empty(); }

  Storage::const_iterator begin() const { return types_.begin(); }
  Storage::const_iterator end()   const { return types_.end(); }

private:
  static bool valid_layout(const Layout& layout);

  Storage types_;
  uint8_t slot_by_id_[256];   ///< index+1 into types_, 0 = free
};

} // namespace aclink

#endif // ACLINK_MESSAGE_TYPE_HPP
