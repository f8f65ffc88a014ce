// -----------------------------------------------------------------------------
// status.cpp - string table for aclink::Status
//
// The strings are part of the log/CLI contract. Do not rename them; add new
// ones at the end of the switch when the enum grows.
// -----------------------------------------------------------------------------
#include "aclink/status.hpp"

namespace aclink {

const char* to_string(Status s) {
  switch (s) {
    case Status::Ok:                  return "ok";
    case Status::DuplicateIdentifier: return "duplicate_identifier";
    case Status::InvalidDescriptor:   return "invalid_descriptor";
    case Status::UnknownType:         return "unknown_type";
    case Status::HeaderTooShort:      return "header_too_short";
    case Status::BodyLengthMismatch:  return "body_length_mismatch";
    case Status::EnvelopeTooLarge:    return "envelope_too_large";
    case Status::EncodeError:         return "encode_error";
    case Status::TransportError:      return "transport_error";
    case Status::ConfigError:         return "config_error";
  }
  return "unknown_status";
}

} // namespace aclink
