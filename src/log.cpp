// -----------------------------------------------------------------------------
// log.cpp - key=value rendering for StderrLog
// -----------------------------------------------------------------------------
#include "aclink/log.hpp"

#include <cstdio>
#include <iostream>

namespace aclink {

const char* to_string(Level l) {
  switch (l) {
    case Level::Debug: return "debug";
    case Level::Info:  return "info";
    case Level::Warn:  return "warn";
    case Level::Error: return "error";
  }
  return "info";
}

LogField field(const char* key, uint64_t v) {
  return LogField{key, std::to_string(v)};
}

LogField field(const char* key, double v) {
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%.6f", v);
  return LogField{key, buf};
}

// ---------- StderrLog ----------

StderrLog::StderrLog(Level min_level) : os_(&std::cerr), min_level_(min_level) {}

StderrLog::StderrLog(std::ostream& os, Level min_level) : os_(&os), min_level_(min_level) {}

std::string StderrLog::format(Level level, const char* event, const LogFields& fields) {
  std::string line = "level=";
  line += to_string(level);
  line += " event=";
  line += event ? event : "";
  for (const auto& f : fields) {
    line += ' ';
    line += f.key;
    line += '=';
    line += f.value;
  }
  return line;
}

std::string StderrLog::format(const Telemetry& t) {
  LogFields fs;
  if (!t.node.empty()) fs.push_back(field("node", t.node));
  fs.push_back(field("type_id", static_cast<uint64_t>(t.type_id)));
  fs.push_back(field("message_id", static_cast<uint64_t>(t.message_id)));
  fs.push_back(field("source", static_cast<uint64_t>(t.source)));
  fs.push_back(field("sent_at", t.sent_at));
  fs.push_back(field("received_at", t.received_at));
  fs.push_back(field("length", static_cast<uint64_t>(t.length)));
  fs.push_back(field("transit", t.transit));
  if (t.throughput) fs.push_back(field("throughput", *t.throughput));
  else              fs.push_back(field("throughput", "undefined"));
  fs.push_back(field("receive_count", t.receive_count));

  std::string line = "telemetry";
  for (const auto& f : fs) {
    line += ' ';
    line += f.key;
    line += '=';
    line += f.value;
  }
  return line;
}

void StderrLog::write(Level level, const char* event, const LogFields& fields) {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(min_level())) return;
  const std::string line = format(level, event, fields);
  std::lock_guard<std::mutex> lock(mu_);
  (*os_) << line << "\n";
}

// Telemetry is informational; it follows the Info threshold.
void StderrLog::telemetry(const Telemetry& t) {
  if (static_cast<uint8_t>(Level::Info) < static_cast<uint8_t>(min_level())) return;
  const std::string line = format(t);
  std::lock_guard<std::mutex> lock(mu_);
  (*os_) << line << "\n";
}

} // namespace aclink
