/**
 * @file log.hpp
 * @brief aclink observability sink: structured log lines and receive telemetry.
 *
 * @details
 * Core never prints. Every drop, reject, send and receipt goes through an
 * `ILogSink` as an event name plus ordered key/value fields. The default
 * `StderrLog` renders them in the same one-line key=value shape the CLI uses
 * for its own status output:
 *
 * @code
 * level=warn event=unknown_type type_id=77 message_id=3 length=11
 * level=info event=sent type=nav message_id=12 address=5 length=51
 * telemetry type_id=5 message_id=42 source=5 sent_at=1000.000000 received_at=1002.000000 length=51 transit=2.000000 throughput=25.500000 receive_count=1
 * @endcode
 *
 * Sinks must tolerate concurrent calls when Core is driven from several
 * threads. StderrLog serializes writes with a mutex.
 *
 * @author Leo
 */
#ifndef ACLINK_LOG_HPP
#define ACLINK_LOG_HPP

#include <stdint.h>
#include <stddef.h>
#include <atomic>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace aclink {

enum class Level : uint8_t { Debug = 0, Info, Warn, Error };

const char* to_string(Level l);

struct LogField {
  const char* key;
  std::string value;
};

using LogFields = std::vector<LogField>;

inline LogField field(const char* key, const std::string& v) { return LogField{key, v}; }
inline LogField field(const char* key, const char* v)        { return LogField{key, v ? v : ""}; }
LogField field(const char* key, uint64_t v);
LogField field(const char* key, double v);

/**
 * @struct Telemetry
 * @brief Per-receipt record emitted after the type resolves.
 *
 * `transit` may be negative under clock skew. `throughput` (bytes/second) is
 * only set when transit > 0.
 */
struct Telemetry {
  std::string node;           ///< receiving node, empty when unnamed
  double   sent_at{0.0};
  double   received_at{0.0};
  size_t   length{0};
  double   transit{0.0};
  std::optional<double> throughput;
  uint64_t receive_count{0};
  uint8_t  type_id{0};
  uint16_t message_id{0};
  uint16_t source{0};
};

class ILogSink {
public:
  virtual ~ILogSink() = default;
  virtual void write(Level level, const char* event, const LogFields& fields) = 0;
  virtual void telemetry(const Telemetry& t) = 0;
};

/// One key=value line per record on a stream (std::cerr by default).
class StderrLog : public ILogSink {
public:
  explicit StderrLog(Level min_level = Level::Info);
  StderrLog(std::ostream& os, Level min_level);

  void write(Level level, const char* event, const LogFields& fields) override;
  void telemetry(const Telemetry& t) override;

  /// Safe to call while other threads are logging.
  void set_min_level(Level l) { min_level_.store(l, std::memory_order_relaxed); }
  Level min_level() const { return min_level_.load(std::memory_order_relaxed); }

  /// Render a log record without writing it.
  static std::string format(Level level, const char* event, const LogFields& fields);
  static std::string format(const Telemetry& t);

private:
  std::ostream* os_;
  std::atomic<Level> min_level_;
  std::mutex mu_;
};

/// Discards everything.
class NullLog : public ILogSink {
public:
  void write(Level, const char*, const LogFields&) override {}
  void telemetry(const Telemetry&) override {}
};

} // namespace aclink

#endif // ACLINK_LOG_HPP
