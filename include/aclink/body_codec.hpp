/**
 * @file body_codec.hpp
 * @brief aclink application messages and the per-type body encoder/decoder.
 *
 * @details
 * An application message is one alternative of the closed `Message` variant.
 * Each fixed MessageType maps to exactly one alternative:
 *
 * | Type             | Alternative      | Body bytes |
 * |------------------|------------------|------------|
 * | position_request | PositionRequest  | 24         |
 * | body_request     | BodyRequest      | 24         |
 * | nav              | NavStatus        | 40         |
 * | string_image     | StringImage      | any (< max envelope len) |
 * | ack              | Ack              | 2          |
 * | general types    | GeneralMessage   | opaque     |
 *
 * Handlers are selected with std::visit, so adding an alternative without a
 * handler fails to compile instead of falling through at runtime.
 *
 * Byte order and float handling: see byte_order.hpp.
 *
 * @author Leo
 */
#ifndef ACLINK_BODY_CODEC_HPP
#define ACLINK_BODY_CODEC_HPP

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <variant>
#include <vector>
#include "message_type.hpp"
#include "status.hpp"

namespace aclink {

/// Six-axis pose target (metres, radians).
struct Pose {
  float x{0}, y{0}, z{0};
  float roll{0}, pitch{0}, yaw{0};

  bool operator==(const Pose& o) const {
    return x == o.x && y == o.y && z == o.z &&
           roll == o.roll && pitch == o.pitch && yaw == o.yaw;
  }
};

struct PositionRequest {
  Pose pose{};
  bool operator==(const PositionRequest& o) const { return pose == o.pose; }
};

struct BodyRequest {
  Pose pose{};
  bool operator==(const BodyRequest& o) const { return pose == o.pose; }
};

/// Navigation fix plus local position and attitude.
struct NavStatus {
  double latitude{0.0};
  double longitude{0.0};
  float  north{0}, east{0}, depth{0};
  float  roll{0}, pitch{0}, yaw{0};

  bool operator==(const NavStatus& o) const {
    return latitude == o.latitude && longitude == o.longitude &&
           north == o.north && east == o.east && depth == o.depth &&
           roll == o.roll && pitch == o.pitch && yaw == o.yaw;
  }
};

struct StringImage {
  std::vector<uint8_t> payload;
  bool operator==(const StringImage& o) const { return payload == o.payload; }
};

struct Ack {
  uint16_t acked_id{0};
  bool operator==(const Ack& o) const { return acked_id == o.acked_id; }
};

/// Opaque body of a general type. `type` names the registry entry.
struct GeneralMessage {
  TypeName type{};
  std::vector<uint8_t> payload;
  bool operator==(const GeneralMessage& o) const {
    return type == o.type && payload == o.payload;
  }
};

using Message = std::variant<PositionRequest, BodyRequest, NavStatus,
                             StringImage, Ack, GeneralMessage>;

/**
 * @brief Registry name a message would normally be sent under.
 * GeneralMessage returns its own `type` (may be empty).
 */
const char* natural_type_name(const Message& m);

/**
 * @brief Encode the body of `msg` as type `t`, appending to `out`.
 *
 * @param max_envelope_len  admission limit for variable-length bodies
 * @param detail            on failure, a short reason ("expected:nav got:ack")
 *
 * @retval Status::Ok
 * @retval Status::EncodeError       alternative does not belong to `t`
 * @retval Status::EnvelopeTooLarge  string_image body >= max_envelope_len
 *
 * `out` is untouched on failure.
 */
Status encode_body(const MessageType& t, const Message& msg,
                   size_t max_envelope_len,
                   std::vector<uint8_t>& out, std::string& detail);

/**
 * @brief Decode `len` body bytes of type `t` into `out`.
 *
 * @retval Status::Ok
 * @retval Status::BodyLengthMismatch  fixed-length type and len != expected
 * @retval Status::UnknownType         fixed type without a message alternative
 */
Status decode_body(const MessageType& t, const uint8_t* data, size_t len, Message& out);

} // namespace aclink

#endif // ACLINK_BODY_CODEC_HPP
