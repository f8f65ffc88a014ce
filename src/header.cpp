// -----------------------------------------------------------------------------
// @file header.cpp
// @brief Packing and unpacking of the 11-byte aclink envelope header.
//
// Byte order is big-endian for every field, see byte_order.hpp. The header is
// a plain value: nothing here allocates except append_to() and to_string().
//
// @author Leo
// -----------------------------------------------------------------------------
#include "aclink/header.hpp"
#include "aclink/byte_order.hpp"

#include <cstdio>

namespace aclink {

// =============================================================================
// Packing & Unpacking
// =============================================================================

void Header::pack(uint8_t* out) const {
  std::vector<uint8_t> tmp;
  tmp.reserve(HEADER_LEN);
  append_to(tmp);
  for (size_t i = 0; i < HEADER_LEN; ++i) out[i] = tmp[i];
}

void Header::append_to(std::vector<uint8_t>& out) const {
  wire::put_u8(out, type_id);
  wire::put_u16(out, message_id);
  wire::put_f64(out, sent_at);
}

// PRE: in points to at least len readable bytes
// OUT: fields set only on Status::Ok
Status Header::unpack(const uint8_t* in, size_t len) {
  if (!in || len < HEADER_LEN) return Status::HeaderTooShort;

  type_id    = in[0];
  message_id = wire::get_u16(in + 1);
  sent_at    = wire::get_f64(in + 3);
  return Status::Ok;
}

std::string Header::to_string() const {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "type=%u id=%u sent_at=%.6f",
                static_cast<unsigned>(type_id),
                static_cast<unsigned>(message_id),
                sent_at);
  return std::string(buf);
}

// =============================================================================
// Free helpers
// =============================================================================

std::vector<uint8_t> encode_header(uint8_t type_id, uint16_t message_id, double sent_at) {
  std::vector<uint8_t> out;
  out.reserve(HEADER_LEN);
  Header(type_id, message_id, sent_at).append_to(out);
  return out;
}

Status decode_header(const uint8_t* data, size_t len, Header& out) {
  return out.unpack(data, len);
}

} // namespace aclink
