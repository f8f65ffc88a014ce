/**
 * @file status.hpp
 * @brief aclink Status - result codes shared by the registry, codecs and pipelines.
 *
 * @details
 * Every fallible operation in aclink returns a `Status`. Nothing throws across
 * the library surface. Callers branch on the enum; logs and CLI output use the
 * stable snake_case string from `to_string()` as the `reason=` value, so scripts
 * can grep for it.
 *
 * | Status               | Raised by                        | Severity            |
 * |----------------------|----------------------------------|---------------------|
 * | DuplicateIdentifier  | TypeRegistry::add()              | fatal at startup    |
 * | InvalidDescriptor    | TypeRegistry::add()              | fatal at startup    |
 * | UnknownType          | resolve, send, receive           | envelope dropped    |
 * | HeaderTooShort       | header decode, receive           | envelope dropped    |
 * | BodyLengthMismatch   | body decode, receive             | envelope dropped    |
 * | EnvelopeTooLarge     | body encode, send                | send rejected       |
 * | EncodeError          | body encode, send                | send rejected       |
 * | TransportError       | send (after id assignment)       | reported to caller  |
 * | ConfigError          | config loading                   | fatal at startup    |
 *
 * @author Leo
 */
#ifndef ACLINK_STATUS_HPP
#define ACLINK_STATUS_HPP

#include <stdint.h>

namespace aclink {

enum class Status : uint8_t {
  Ok = 0,
  DuplicateIdentifier,
  InvalidDescriptor,
  UnknownType,
  HeaderTooShort,
  BodyLengthMismatch,
  EnvelopeTooLarge,
  EncodeError,
  TransportError,
  ConfigError,
};

/// Stable, script-friendly name for a status ("ok", "unknown_type", ...).
const char* to_string(Status s);

/// True for startup-time failures that must stop the process.
inline bool is_fatal(Status s) {
  return s == Status::DuplicateIdentifier ||
         s == Status::InvalidDescriptor   ||
         s == Status::ConfigError;
}

} // namespace aclink

#endif // ACLINK_STATUS_HPP
