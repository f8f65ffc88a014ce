/**
 * @file cli_app.cpp
 * @brief aclink CLI - one-shot encoder/decoder around aclink::Core.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11): global --config/--format, subcommands
 *    encode, decode and types.
 *  - Build the registry and ack policy from the config file (or defaults).
 *  - encode: run one message through Core::send() and print the envelope.
 *  - decode: run one envelope through Core::receive() and print what the
 *    consumer saw, the telemetry record and any ack Core sent back.
 *  - types: list the registry.
 *
 * Examples:
 * @code
 *   aclink-cli encode --type position_request --values 1 2 3 0 0 1.5708
 *   aclink-cli encode --type string_image --text "hello"
 *   aclink-cli encode --type ack --ack-id 42
 *   aclink-cli encode --json '{"type":"ack","acked_id":7}'
 *   aclink-cli --format json decode --hex 05002a408f400000000000... --now 1002
 *   aclink-cli --config node.json types
 * @endcode
 *
 * Exit codes: 0 ok, 1 message rejected or envelope dropped, 2 bad input or
 * config. Errors go to the error stream as "status=error reason=...".
 */

#include "cli_app.hpp"

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "aclink/config.hpp"
#include "aclink/core.hpp"
#include "aclink/parser.hpp"
#include "aclink/transport/transport_memory.hpp"

namespace aclink {
namespace cli {

using json = nlohmann::json;

namespace {

// ---------- small utilities ----------

bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

int fail(std::ostream& err, const char* reason, const std::string& detail, int code) {
  err << "status=error reason=" << reason;
  if (!detail.empty()) err << " detail=" << detail;
  err << "\n";
  return code;
}

// Consumer that records every callback as JSON.
class JsonConsumer : public IConsumer {
public:
  json messages = json::array();

  void on_position_request(const PositionRequest& m, const Header& h) override { add(m, h, nullptr); }
  void on_body_request(const BodyRequest& m, const Header& h) override { add(m, h, nullptr); }
  void on_nav(const NavStatus& m, const Header& h) override { add(m, h, nullptr); }
  void on_string_image(const StringImage& m, const Header& h) override { add(m, h, nullptr); }
  void on_ack(const Ack& m, const Header& h) override { add(m, h, nullptr); }
  void on_general(const char* topic, const GeneralMessage& m, const Header& h) override { add(m, h, topic); }

private:
  void add(const Message& m, const Header& h, const char* topic) {
    json j;
    j["header"] = parser::to_json(h);
    j["message"] = parser::to_json(m);
    if (topic) j["topic"] = topic;
    messages.push_back(j);
  }
};

// Forwards log lines to stderr and keeps telemetry for the report.
class CliLog : public ILogSink {
public:
  CliLog(std::ostream& err, Level min) : stderr_(err, min) {}
  json telemetry_records = json::array();

  void write(Level level, const char* event, const LogFields& fields) override {
    stderr_.write(level, event, fields);
  }
  void telemetry(const Telemetry& t) override {
    telemetry_records.push_back(parser::to_json(t));
  }

private:
  StderrLog stderr_;
};

json frames_json(const std::vector<transport::Frame>& frames) {
  json arr = json::array();
  for (const auto& f : frames) {
    json j;
    j["address"] = f.address;
    j["length"] = f.bytes.size();
    j["hex"] = parser::to_hex(f.bytes);
    arr.push_back(j);
  }
  return arr;
}

} // namespace

// ---------- run ----------

int run(int argc, const char* const* argv, std::ostream& out, std::ostream& err_out) {
  std::string opt_config;
  std::string opt_format = "pretty";   // pretty|json|raw
  bool opt_no_color = false;
  bool opt_verbose = false;

  CLI::App app{"aclink acoustic link envelope tool"};
  app.require_subcommand(1);
  app.add_option("--config", opt_config, "JSON config file (general types, ack policy, limits)");
  app.add_option("--format", opt_format, "Output format: pretty|json|raw")->check(CLI::IsMember({"pretty","json","raw"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_flag("-v,--verbose", opt_verbose, "Log info-level events to stderr");

  // encode
  std::string enc_type;
  std::vector<double> enc_values;
  std::string enc_text;
  int enc_ack_id = -1;
  std::string enc_json;
  double enc_now = -1.0;
  auto* encode = app.add_subcommand("encode", "Encode one message into an envelope");
  encode->add_option("--type", enc_type, "Registry type name");
  encode->add_option("--values", enc_values, "Numeric fields in wire order");
  encode->add_option("--text", enc_text, "Body for string_image and general types");
  encode->add_option("--ack-id", enc_ack_id, "Acknowledged message id (type ack)")->check(CLI::Range(0, 65535));
  encode->add_option("--json", enc_json, "Message as JSON object with a \"type\" field");
  encode->add_option("--now", enc_now, "Header timestamp in seconds (default: wall clock)");

  // decode
  std::string dec_hex;
  double dec_now = -1.0;
  uint16_t dec_source = DEFAULT_TARGET_ADDRESS;
  auto* decode = app.add_subcommand("decode", "Run one envelope through the receive pipeline");
  decode->add_option("--hex", dec_hex, "Envelope bytes as hex")->required();
  decode->add_option("--now", dec_now, "Receive time in seconds (default: wall clock)");
  decode->add_option("--source", dec_source, "Source address")->capture_default_str();

  // types
  auto* types = app.add_subcommand("types", "List registered message types");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e, out, err_out);
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && &out == &std::cout && is_tty_stdout() && opt_format == "pretty";

  // config + registry
  Config cfg;
  std::string err;
  if (!opt_config.empty()) {
    if (load_config_file(opt_config, cfg, err) != Status::Ok) {
      return fail(err_out, to_string(Status::ConfigError), err, 2);
    }
  }
  TypeRegistry reg;
  Status s = build_registry(cfg, reg, err);
  if (s != Status::Ok) return fail(err_out, to_string(s), err, 2);
  AckPolicy policy;
  s = build_ack_policy(cfg, reg, policy, err);
  if (s != Status::Ok) return fail(err_out, to_string(s), err, 2);

  CliLog log(err_out, opt_verbose ? Level::Info : Level::Warn);
  JsonConsumer consumer;
  transport::MemoryTransport modem;
  SystemClock wall;

  if (*types) {
    json arr = json::array();
    for (const auto& t : reg) arr.push_back(parser::to_json(t));
    if (opt_format == "pretty") {
      char line[64];
      for (const auto& t : reg) {
        std::snprintf(line, sizeof(line), "%3u  %-20s %s\n", static_cast<unsigned>(t.id),
                      t.name.c_str(), t.is_general() ? "general" : "fixed");
        out << line;
      }
    } else {
      out << arr.dump(opt_format == "json" ? 2 : -1) << "\n";
    }
    return 0;
  }

  if (*encode) {
    Message msg;
    if (!enc_json.empty()) {
      const json j = json::parse(enc_json, nullptr, false);
      if (j.is_discarded()) return fail(err_out, "parse_error", "--json", 2);
      s = parser::from_json(reg, j, msg, err);
      if (s != Status::Ok) return fail(err_out, to_string(s), err, 2);
      enc_type = natural_type_name(msg);
    } else {
      if (enc_type.empty()) return fail(err_out, "missing_option", "--type", 2);
      const MessageType* t = reg.find_by_name(enc_type.c_str());
      if (!t) return fail(err_out, to_string(Status::UnknownType), enc_type, 2);
      if (enc_ack_id >= 0) enc_values.assign(1, static_cast<double>(enc_ack_id));
      s = parser::from_values(*t, enc_values, enc_text, msg, err);
      if (s != Status::Ok) return fail(err_out, to_string(s), err, 2);
    }

    FixedClock clock(enc_now >= 0.0 ? enc_now : wall.now());
    Core core(reg, policy, modem, consumer, log, clock, cfg);
    uint16_t id = 0;
    s = core.send(enc_type.c_str(), msg, &id);
    if (s != Status::Ok) return fail(err_out, to_string(s), "", is_fatal(s) ? 2 : 1);

    const auto frames = modem.sent();
    if (opt_format == "raw") {
      out << parser::to_hex(frames.front().bytes) << "\n";
    } else if (opt_format == "json") {
      json j;
      j["type"] = enc_type;
      j["message_id"] = id;
      j["message"] = parser::to_json(msg);
      j["envelope"] = frames_json(frames).front();
      out << j.dump(2) << "\n";
    } else {
      out << ansi.bold("envelope") << "  " << enc_type << " id=" << id
                << " to=" << frames.front().address
                << " len=" << frames.front().bytes.size() << "\n";
      out << "  " << parser::to_hex(frames.front().bytes) << "\n";
    }
    return 0;
  }

  if (*decode) {
    std::vector<uint8_t> bytes;
    if (!parser::from_hex(dec_hex, bytes)) return fail(err_out, "bad_hex", "--hex", 2);

    FixedClock clock(dec_now >= 0.0 ? dec_now : wall.now());
    Core core(reg, policy, modem, consumer, log, clock, cfg);
    const ReceiveOutcome o = core.receive(bytes, dec_source);

    json j;
    j["state"] = to_string(o.state);
    j["status"] = to_string(o.status);
    if (o.type_id)    j["type_id"] = *o.type_id;
    if (o.message_id) j["message_id"] = *o.message_id;
    j["messages"] = consumer.messages;
    j["telemetry"] = log.telemetry_records;
    j["acks"] = frames_json(modem.sent());

    if (opt_format == "pretty") {
      out << ansi.bold("state") << "  " << to_string(o.state);
      if (o.dropped()) out << "  " << ansi.red(to_string(o.status));
      out << "\n";
      for (const auto& m : consumer.messages) {
        out << "  " << m["message"].dump() << "\n";
        out << "  " << ansi.dim(m["header"].dump()) << "\n";
      }
      for (const auto& t : log.telemetry_records) {
        out << "  " << ansi.dim("telemetry ") << t.dump() << "\n";
      }
      for (const auto& f : modem.sent()) {
        out << "  " << ansi.bold("ack") << " -> " << f.address << "  "
                  << parser::to_hex(f.bytes) << "\n";
      }
    } else {
      out << j.dump(opt_format == "json" ? 2 : -1) << "\n";
    }
    return o.dropped() ? 1 : 0;
  }

  return 0;
}

} // namespace cli
} // namespace aclink
