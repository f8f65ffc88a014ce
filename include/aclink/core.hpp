/**
 * @file core.hpp
 * @brief aclink Core - outgoing and incoming envelope pipelines for one node.
 *
 * @details
 * ## Field Brief
 * The acoustic modem moves a few hundred bytes per minute, sometimes out of
 * order, sometimes from a vehicle whose clock drifted overnight. **Core** is
 * the piece that turns typed application messages into compact envelopes and
 * back again. It knows nothing about modems, sockets or ROS topics: it sees a
 * transport that moves opaque bytes and a consumer that wants decoded
 * messages.
 *
 * ---
 *
 * @par What This File Provides
 * - `aclink::Core`, which:
 *   - Encodes and sends messages via `send()` / `send_general()`, assigning
 *     a 16-bit message id from its outgoing counter.
 *   - Accepts envelopes via `receive()` (or from the transport's subscription)
 *     and walks them through the receive state machine.
 *   - Answers ack-requiring types with an automatic `ack` envelope.
 *   - Keeps sent/received/dropped counters, readable with `stats()`.
 * - `ReceiveOutcome` and `ReceiveState` for callers and tests.
 *
 * ---
 *
 * @par Receive State Machine
 * ```
 *   Received ─► HeaderParsed ─► TypeResolved ─► BodyDecoded ─► Dispatched ─► (Acked)
 *       │             │               │
 *       └─────────────┴───────────────┴──────────► Dropped
 * ```
 * - `< 11` bytes: Dropped with `HeaderTooShort`, nothing dispatched.
 * - Unregistered type id: Dropped with `UnknownType`. The incoming counter
 *   is not touched and the next envelope is processed normally.
 * - Body length wrong for the type: Dropped with `BodyLengthMismatch`,
 *   after telemetry has been emitted.
 * - Acks are sent after dispatch. An ack confirms receipt, not processing.
 *
 * ---
 *
 * @par Concurrency
 * `send()` and `receive()` may be called from several threads at once. The
 * registry and ack policy are read-only. Counters are `std::atomic` and the
 * outgoing id is taken with one fetch_add, so concurrent sends never share an
 * id. Nothing blocks, nothing is buffered between calls.
 *
 * ---
 *
 * @par Failure Model
 * Nothing here is fatal. Every reject and drop is logged through the
 * `ILogSink` with type id, message id and byte lengths when known, and
 * reported to the caller as a `Status`.
 *
 * ---
 *
 * @par Minimal Usage Example
 * @code
 * aclink::TypeRegistry reg;
 * reg.register_fixed_types();
 * aclink::Core core(reg, aclink::AckPolicy::defaults(), modem, consumer, log, clock);
 *
 * aclink::NavStatus nav;
 * nav.latitude = 55.0; nav.longitude = -3.0;
 * core.send(nav);                       // type "nav", id 0, to address 5
 *
 * // inbound bytes from the modem:
 * auto outcome = core.receive(buf, len, 5);
 * @endcode
 *
 * @author Leo
 */
#ifndef ACLINK_CORE_HPP
#define ACLINK_CORE_HPP

#include <stdint.h>
#include <stddef.h>
#include <atomic>
#include <optional>
#include <string>
#include <vector>
#include "ack_policy.hpp"
#include "body_codec.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "consumer.hpp"
#include "header.hpp"
#include "log.hpp"
#include "message_type.hpp"
#include "status.hpp"
#include "transport/transport_base.hpp"

namespace aclink {

enum class ReceiveState : uint8_t {
  Received = 0,
  HeaderParsed,
  TypeResolved,
  BodyDecoded,
  Dispatched,
  Acked,
  Dropped,
};

const char* to_string(ReceiveState s);

/// Where one envelope ended up. type_id / message_id are set once the header parsed.
struct ReceiveOutcome {
  ReceiveState state{ReceiveState::Received};
  Status       status{Status::Ok};
  std::optional<uint8_t>  type_id;
  std::optional<uint16_t> message_id;

  bool dropped() const { return state == ReceiveState::Dropped; }
};

struct Stats {
  uint64_t messages_sent{0};      ///< ids assigned, acks included
  uint64_t messages_received{0};  ///< envelopes whose type resolved
  uint64_t messages_dropped{0};   ///< envelopes that ended in Dropped
  uint64_t acks_sent{0};
};

class Core {
public:
  Core(const TypeRegistry& registry,
       const AckPolicy& ack_policy,
       transport::ITransport& transport,
       IConsumer& consumer,
       ILogSink& log,
       const IClock& clock,
       uint16_t target_address = DEFAULT_TARGET_ADDRESS,
       size_t max_envelope_len = DEFAULT_MAX_ENVELOPE_LEN);

  /// Address, size limit and node name taken from cfg.
  Core(const TypeRegistry& registry,
       const AckPolicy& ack_policy,
       transport::ITransport& transport,
       IConsumer& consumer,
       ILogSink& log,
       const IClock& clock,
       const Config& cfg);

  /// Unsubscribes from the transport. Must not run inside a transport handler.
  ~Core();

  Core(const Core&) = delete;
  Core& operator=(const Core&) = delete;

  // --- outgoing ---

  /**
   * @brief Encode `msg` as `type_name` and publish it to the target address.
   *
   * @param assigned_id  if non-null, receives the message id (set whenever an
   *                     id was consumed, including on TransportError)
   *
   * @retval Status::Ok
   * @retval Status::UnknownType       name not registered
   * @retval Status::EncodeError       msg does not match the type
   * @retval Status::EnvelopeTooLarge  header + body over the size limit
   * @retval Status::TransportError    id consumed, transport refused
   *
   * The outgoing counter moves only on Ok and TransportError.
   */
  Status send(const char* type_name, const Message& msg, uint16_t* assigned_id = nullptr);

  /// send() under the message's own type name (GeneralMessage uses its `type`).
  Status send(const Message& msg, uint16_t* assigned_id = nullptr);

  /// Send an opaque payload through the general type bound to `subscribe_topic`.
  Status send_general(const char* subscribe_topic, const uint8_t* data, size_t len,
                      uint16_t* assigned_id = nullptr);

  // --- incoming ---

  /// Run one envelope from `source` through the receive state machine.
  ReceiveOutcome receive(const uint8_t* data, size_t len, uint16_t source);
  ReceiveOutcome receive(const std::vector<uint8_t>& envelope, uint16_t source);

  // --- introspection ---

  Stats stats() const;
  uint16_t target_address() const { return target_address_; }
  size_t max_envelope_len() const { return max_envelope_len_; }
  const std::string& node_name() const { return node_name_; }

private:
  Status send_ack(uint16_t acked_id);
  Status send_resolved(const MessageType& t, const Message& msg, uint16_t* assigned_id);
  void dispatch(const MessageType& t, const Message& msg, const Header& h);
  ReceiveOutcome drop(ReceiveOutcome o, Status why, size_t len, uint16_t source);

  static void on_transport_rx(void* user, const uint8_t* data, size_t len, uint16_t source);

  const TypeRegistry&    registry_;
  const AckPolicy        ack_policy_;
  transport::ITransport& transport_;
  IConsumer&             consumer_;
  ILogSink&              log_;
  const IClock&          clock_;
  uint16_t               target_address_;
  size_t                 max_envelope_len_;
  std::string            node_name_;

  std::atomic<uint64_t> sent_{0};
  std::atomic<uint64_t> received_{0};
  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> acks_{0};
};

} // namespace aclink

#endif // ACLINK_CORE_HPP
