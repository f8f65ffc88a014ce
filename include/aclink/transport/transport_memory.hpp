#pragma once
/**
 * @file transport_memory.hpp
 * @brief In-process ITransport: records published envelopes, injects inbound ones.
 *
 * Used by the CLI to capture outgoing acks and by the tests as a loopback.
 */

#include <condition_variable>
#include <mutex>
#include <vector>
#include "transport_base.hpp"

namespace aclink::transport {

struct Frame {
  std::vector<uint8_t> bytes;
  uint16_t address{0};
};

class MemoryTransport : public ITransport {
public:
  TxResult publish(const uint8_t* data, std::size_t len, uint16_t destination) override {
    std::lock_guard<std::mutex> lock(mu_);
    if (next_result_ != TxResult::Ok) return next_result_;
    Frame f;
    f.bytes.assign(data, data + len);
    f.address = destination;
    sent_.push_back(std::move(f));
    return TxResult::Ok;
  }

  /// Returns once no delivery is still running the previous handler.
  /// Must not be called from inside the handler.
  void subscribe(RxHandler handler, void* user) override {
    std::unique_lock<std::mutex> lock(mu_);
    handler_ = handler;
    user_ = user;
    idle_.wait(lock, [this]() { return in_flight_ == 0; });
  }

  const char* name() const override { return "memory"; }

  /// Push one envelope to the subscribed handler. false if nobody listens.
  bool deliver(const std::vector<uint8_t>& bytes, uint16_t source) {
    RxHandler h = nullptr;
    void* u = nullptr;
    {
      std::lock_guard<std::mutex> lock(mu_);
      h = handler_;
      u = user_;
      if (!h) return false;
      ++in_flight_;
    }
    h(u, bytes.data(), bytes.size(), source);
    {
      std::lock_guard<std::mutex> lock(mu_);
      --in_flight_;
    }
    idle_.notify_all();
    return true;
  }

  /// Every later publish() returns r without recording (Ok restores normal use).
  void fail_with(TxResult r) {
    std::lock_guard<std::mutex> lock(mu_);
    next_result_ = r;
  }

  std::vector<Frame> sent() const {
    std::lock_guard<std::mutex> lock(mu_);
    return sent_;
  }

  std::size_t sent_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return sent_.size();
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mu_);
    sent_.clear();
  }

private:
  mutable std::mutex mu_;
  std::condition_variable idle_;
  std::size_t in_flight_{0};
  std::vector<Frame> sent_;
  RxHandler handler_{nullptr};
  void* user_{nullptr};
  TxResult next_result_{TxResult::Ok};
};

} // namespace aclink::transport
