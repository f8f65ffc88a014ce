/**
 * @file config.hpp
 * @brief aclink node configuration: defaults, JSON loading, registry build.
 *
 * @details
 * A config file is a JSON object. Scalars may sit at the top level or inside
 * a "packer_config" object (the latter wins). Unknown keys are ignored and
 * missing keys keep their defaults.
 *
 * @code{.json}
 * {
 *   "packer_config": {
 *     "node_name": "auv1",
 *     "target_address": 5,
 *     "requiring_ack": ["position_request", "body_request"],
 *     "retries": 3,
 *     "retry_delay": 30,
 *     "max_envelope_len": 9000
 *   },
 *   "general_messages_outgoing": [
 *     { "name": "battery", "id": 120, "subscribe_topic": "/battery", "message_type": "BatteryStatus" }
 *   ],
 *   "general_messages_incoming": [
 *     { "name": "battery", "id": 120, "publish_topic": "/modem/unpacker/battery", "message_type": "BatteryStatus" }
 *   ]
 * }
 * @endcode
 *
 * `retries` and `retry_delay` are carried for a future retry layer and are
 * not consumed by Core.
 *
 * Errors come back as Status::ConfigError with a short reason in `err`
 * ("bad_value:target_address", "parse_error:...", "open_failed:/path").
 *
 * @author Leo
 */
#ifndef ACLINK_CONFIG_HPP
#define ACLINK_CONFIG_HPP

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>
#include "ack_policy.hpp"
#include "message_type.hpp"
#include "status.hpp"

namespace aclink {

static constexpr uint16_t DEFAULT_TARGET_ADDRESS   = 5;
static constexpr size_t   DEFAULT_MAX_ENVELOPE_LEN = 9000;

/// One configured general type, from either the outgoing or incoming list.
struct GeneralBinding {
  std::string name;
  uint8_t     id{0};
  std::string topic;          ///< subscribe_topic (outgoing) or publish_topic (incoming)
  std::string message_type;
};

struct Config {
  std::string node_name;      ///< tags telemetry when several nodes share a sink
  uint16_t    target_address{DEFAULT_TARGET_ADDRESS};
  std::vector<std::string> requiring_ack{type_name::POSITION_REQUEST, type_name::BODY_REQUEST};
  uint32_t    retries{3};
  double      retry_delay{30.0};
  size_t      max_envelope_len{DEFAULT_MAX_ENVELOPE_LEN};
  std::vector<GeneralBinding> general_messages_outgoing;
  std::vector<GeneralBinding> general_messages_incoming;
};

/// Overlay the JSON in `text` onto `out`. `out` is untouched on failure.
Status load_config_string(const std::string& text, Config& out, std::string& err);

/// Read `path` and call load_config_string().
Status load_config_file(const std::string& path, Config& out, std::string& err);

/**
 * @brief Register the built-in table, then every configured general type.
 *
 * An outgoing and an incoming entry with the same name and id become one
 * registry entry carrying both topics. Same name with different ids, a topic
 * bound by two types, or any collision with the built-in table, is
 * Status::DuplicateIdentifier.
 */
Status build_registry(const Config& cfg, TypeRegistry& reg, std::string& err);

/// Fill `policy` from cfg.requiring_ack. Every name must resolve in `reg`.
Status build_ack_policy(const Config& cfg, const TypeRegistry& reg,
                        AckPolicy& policy, std::string& err);

} // namespace aclink

#endif // ACLINK_CONFIG_HPP
