/**
 * @file header.hpp
 * @brief aclink Header - the 11-byte envelope header shared by every message.
 *
 * @details
 * Layout on the wire (big-endian, no padding):
 *
 *   [0]      type_id     (uint8)
 *   [1..2]   message_id  (uint16, high byte first)
 *   [3..10]  sent_at     (IEEE-754 float64, seconds on the sender's clock)
 *
 * The header carries no length field. The body runs to the end of the
 * envelope; its expected size comes from the registered MessageType.
 *
 * Usage:
 * @code
 * aclink::Header h(5, 42, 1000.0);
 * uint8_t raw[aclink::HEADER_LEN];
 * h.pack(raw);
 *
 * aclink::Header back;
 * if (back.unpack(raw, sizeof(raw)) == aclink::Status::Ok) {
 *   // back == h
 * }
 * @endcode
 *
 * @author Leo
 */
#ifndef ACLINK_HEADER_HPP
#define ACLINK_HEADER_HPP

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>
#include "status.hpp"

namespace aclink {

static constexpr size_t HEADER_LEN = 11;

struct Header {
  uint8_t  type_id{0};
  uint16_t message_id{0};
  double   sent_at{0.0};

  Header() = default;
  Header(uint8_t type, uint16_t id, double t) : type_id(type), message_id(id), sent_at(t) {}

  /// Write exactly HEADER_LEN bytes to out.
  void pack(uint8_t* out) const;

  /// Append HEADER_LEN bytes to the end of out.
  void append_to(std::vector<uint8_t>& out) const;

  /**
   * @brief Parse the first HEADER_LEN bytes of in.
   * Fields are left untouched and Status::HeaderTooShort returned when
   * len < HEADER_LEN. Bytes past the header are ignored.
   */
  Status unpack(const uint8_t* in, size_t len);

  /// "type=5 id=42 sent_at=1000.000000"
  std::string to_string() const;

  bool operator==(const Header& o) const {
    return type_id == o.type_id && message_id == o.message_id && sent_at == o.sent_at;
  }
  bool operator!=(const Header& o) const { return !(*this == o); }
};

/// Build the header bytes for one envelope.
std::vector<uint8_t> encode_header(uint8_t type_id, uint16_t message_id, double sent_at);

/// Free-function form of Header::unpack().
Status decode_header(const uint8_t* data, size_t len, Header& out);

} // namespace aclink

#endif // ACLINK_HEADER_HPP
