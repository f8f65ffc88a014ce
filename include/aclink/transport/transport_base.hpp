#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal, Core-agnostic transport interface for aclink wrappers.
 *
 * Header-only on purpose. The modem driver, a pub/sub bridge or a test
 * double implements this; Core only sees opaque envelopes and addresses.
 */

#include <cstddef>
#include <cstdint>

namespace aclink::transport {

// Return codes kept simple.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };

inline const char* to_string(TxResult r) {
  switch (r) {
    case TxResult::Ok:    return "ok";
    case TxResult::Busy:  return "busy";
    case TxResult::Error: return "error";
  }
  return "error";
}

/// Inbound delivery callback: one complete envelope from `source`.
using RxHandler = void (*)(void* user, const uint8_t* data, std::size_t len, uint16_t source);

/**
 * @brief Transport trait every wrapper can rely on.
 *
 * Contract:
 *  - publish(data,len,dest) hands one envelope to the link; never blocks for long.
 *  - subscribe(h,user) registers the single inbound handler (nullptr clears it).
 *    The handler may be invoked from any thread, concurrently. When
 *    subscribe() returns, no call into the previous handler is still running,
 *    so `user` may be destroyed right after subscribe(nullptr, nullptr).
 *  - name() is a short identifier for logs/diagnostics.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual TxResult    publish(const uint8_t* data, std::size_t len, uint16_t destination) = 0;
  virtual void        subscribe(RxHandler handler, void* user) = 0;
  virtual const char* name() const = 0;
};

} // namespace aclink::transport
