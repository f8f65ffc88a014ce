/**
 * @file parser.hpp
 * @brief JSON views of aclink messages, headers, telemetry and registry entries.
 *
 * @details
 * The wire format is binary; these helpers exist for the CLI, for logs that
 * need a readable body, and for tests. Field names follow the message structs:
 *
 * | Type             | JSON fields                                                  |
 * |------------------|--------------------------------------------------------------|
 * | position_request | x, y, z, roll, pitch, yaw                                    |
 * | body_request     | x, y, z, roll, pitch, yaw                                    |
 * | nav              | latitude, longitude, north, east, depth, roll, pitch, yaw    |
 * | string_image     | hex (or text when building)                                  |
 * | ack              | acked_id                                                     |
 * | general types    | hex (or text when building)                                  |
 *
 * Every object carries "type" with the registry name.
 *
 * Nothing here throws. Input JSON is type-checked before it is read and bad
 * input comes back as a Status with a short reason in `err`.
 *
 * @author Leo
 */
#ifndef ACLINK_PARSER_HPP
#define ACLINK_PARSER_HPP

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "body_codec.hpp"
#include "header.hpp"
#include "log.hpp"
#include "message_type.hpp"
#include "status.hpp"

namespace aclink {
namespace parser {

using json = nlohmann::json;

json to_json(const Message& msg);
json to_json(const Header& h);
json to_json(const Telemetry& t);
json to_json(const MessageType& t);

/**
 * @brief Build a Message from a JSON object with a "type" field.
 *
 * @retval Status::Ok
 * @retval Status::UnknownType   "type" missing or not registered
 * @retval Status::EncodeError   a field is missing or has the wrong JSON type
 */
Status from_json(const TypeRegistry& reg, const json& j, Message& out, std::string& err);

/**
 * @brief Build a Message of type `t` from positional numbers or a text body.
 *
 * `values` fill the numeric fields in table order. `text` is the payload of
 * string_image and general types.
 */
Status from_values(const MessageType& t, const std::vector<double>& values,
                   const std::string& text, Message& out, std::string& err);

/// Field names of a fixed type in wire order; empty for byte-bodied types.
std::vector<const char*> field_names(const MessageType& t);

/// Lowercase hex, no separators.
std::string to_hex(const uint8_t* data, size_t len);
std::string to_hex(const std::vector<uint8_t>& bytes);

/// Accepts upper or lower case, ignores spaces. false on odd length or bad digit.
bool from_hex(const std::string& hex, std::vector<uint8_t>& out);

} // namespace parser
} // namespace aclink

#endif // ACLINK_PARSER_HPP
