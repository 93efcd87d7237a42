/**
 * @file main.cpp
 * @brief beacon-cli - run one Beacon Link device from a Linux terminal.
 *
 * Responsibilities:
 *  - Load config (XDG), ensure a device id exists, apply CLI11 overrides.
 *  - Run a Session over the UDP beacon bridge, ticking every few ms.
 *  - Read stdin lines: plain text is sent to the connected peer, lines
 *    starting with '/' are commands (/peers, /connect <id>, /disconnect,
 *    /history, /quit).
 *  - Print joins, leaves and messages as they happen.
 *
 * One-shot modes (no network): --show-peers and --show-activity print what
 * the store remembers and exit.
 *
 * Notes:
 *  - Diagnostics go to stderr as key=value lines (see beacon/log.hpp); the
 *    conversation goes to stdout.
 *  - --connect <id> invites that peer as soon as discovery sees it.
 */

#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include <poll.h>
#include <unistd.h> // isatty, read

#include "CLI/CLI11.hpp"

#include "beacon/bridge/udp_beacon_bridge.hpp"
#include "beacon/clock.hpp"
#include "beacon/config.hpp"
#include "beacon/envelope.hpp"
#include "beacon/log.hpp"
#include "beacon/paths.hpp"
#include "beacon/peer_store.hpp"
#include "beacon/session.hpp"
#include "line_framer.hpp"

using namespace beacon;

// ---------- small utilities ----------

static volatile std::sig_atomic_t g_stop = 0;
static void on_signal(int) { g_stop = 1; }

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

static std::string clock_hms(uint64_t epoch_ms) {
  std::time_t t = static_cast<std::time_t>(epoch_ms / 1000);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[16];
  std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
  return buf;
}

static void print_peer(const Peer& p, const Ansi& ansi) {
  std::cout << "  " << ansi.bold(p.peer_id) << "  " << p.display_name
            << "  " << to_string(p.status)
            << "  signal=" << static_cast<unsigned>(p.signal_strength);
  if (p.is_emergency) std::cout << "  " << ansi.red("[emergency]");
  std::cout << "\n";
}

// ---------- notifications ----------

class ConsoleSink : public INotificationSink {
public:
  explicit ConsoleSink(const Ansi& ansi) : ansi_(ansi) {}

  void notify_peer_joined(const Peer& p) override {
    std::cout << ansi_.dim("+ ") << p.display_name << ansi_.dim(" (" + p.peer_id + ") nearby");
    if (p.is_emergency) std::cout << " " << ansi_.red("[emergency]");
    std::cout << std::endl;
  }
  void notify_peer_left(const Peer& p) override {
    std::cout << ansi_.dim("- " + p.display_name + " (" + p.peer_id + ") out of range") << std::endl;
  }
  void notify_message(const Message& m) override {
    std::cout << ansi_.dim("[" + clock_hms(m.timestamp_ms) + "] ")
              << ansi_.bold(m.sender_name) << ": " << m.text << std::endl;
  }

private:
  Ansi ansi_;
};

// ---------- interactive commands ----------

static void handle_line(Session& session, const std::string& line, const Ansi& ansi) {
  if (line.empty()) return;
  if (line[0] != '/') {
    if (!session.send_message(line)) {
      std::cout << ansi.red("! not delivered (no active connection)") << std::endl;
    }
    return;
  }

  std::string cmd = line.substr(1), arg;
  auto sp = cmd.find(' ');
  if (sp != std::string::npos) { arg = cmd.substr(sp + 1); cmd.resize(sp); }

  if (cmd == "quit" || cmd == "q") {
    g_stop = 1;
  } else if (cmd == "peers") {
    auto peers = session.peers();
    std::cout << ansi.bold("peers nearby: ") << peers.size()
              << ansi.dim("  (connection " + std::string(to_string(session.connection_state())) + ")") << "\n";
    for (const auto& p : peers) print_peer(p, ansi);
    std::cout.flush();
  } else if (cmd == "connect") {
    if (arg.empty()) { std::cout << "usage: /connect <peer-id>" << std::endl; return; }
    Error e = session.connect(arg);
    if (e != Error::None) std::cout << ansi.red(std::string("! connect: ") + to_reason(e)) << std::endl;
  } else if (cmd == "disconnect") {
    session.disconnect();
  } else if (cmd == "history") {
    for (const auto& m : session.history()) {
      std::cout << ansi.dim("[" + clock_hms(m.timestamp_ms) + "] ")
                << (m.direction == Message::Direction::Outbound ? "> " : "< ")
                << m.sender_name << ": " << m.text;
      if (m.delivery == Message::Delivery::Failed) std::cout << " " << ansi.red("(failed)");
      std::cout << "\n";
    }
    std::cout.flush();
  } else {
    std::cout << "commands: /peers /connect <id> /disconnect /history /quit" << std::endl;
  }
}

// ---------- main ----------

int main(int argc, char** argv) {
  CLI::App app{"Beacon Link: offline peer discovery and chat over the local network"};

  std::string opt_config;
  std::string opt_name, opt_device_id, opt_type, opt_bind, opt_broadcast, opt_data_dir;
  std::string opt_log_level, opt_connect;
  uint16_t opt_tcp_port = 0, opt_udp_port = 0;
  bool opt_emergency = false, opt_no_color = false;
  bool opt_show_peers = false;
  size_t opt_show_activity = 0;
  uint32_t opt_tick_ms = 20;

  app.add_option("--config", opt_config, "Config file (default: $XDG_CONFIG_HOME/beacon/config.json)");
  app.add_option("--name", opt_name, "Display name announced to peers");
  app.add_option("--device-id", opt_device_id, "Override the persisted device id");
  app.add_option("--type", opt_type, "Device type announced to peers");
  app.add_flag("--emergency", opt_emergency, "Announce this device as an emergency responder");
  app.add_option("--tcp-port", opt_tcp_port, "Message socket port")->check(CLI::Range(1, 65535));
  app.add_option("--udp-port", opt_udp_port, "Discovery beacon port")->check(CLI::Range(1, 65535));
  app.add_option("--bind", opt_bind, "Address the host socket binds to");
  app.add_option("--broadcast", opt_broadcast, "Beacon broadcast address");
  app.add_option("--data-dir", opt_data_dir, "Override data directory (peers.json, activity.json)");
  app.add_option("--log-level", opt_log_level, "Diagnostics on stderr")
      ->check(CLI::IsMember({"debug", "info", "warn", "error", "off"}));
  app.add_option("--connect", opt_connect, "Invite this peer id as soon as it is discovered");
  app.add_option("--tick-ms", opt_tick_ms, "Loop period in ms")->capture_default_str()
      ->check(CLI::Range(uint32_t{1}, uint32_t{1000}));
  app.add_flag("--show-peers", opt_show_peers, "Print remembered peers and exit");
  app.add_option("--show-activity", opt_show_activity, "Print the N newest activity records and exit");
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout();

  // ---- config: file, generated id, then command-line overrides ----
  const std::filesystem::path cfg_path = opt_config.empty() ? default_config_path()
                                                            : std::filesystem::path(opt_config);
  SessionConfig cfg;
  if (!load_config(cfg_path, cfg)) {
    std::cerr << "status=error reason=bad_config path=" << cfg_path.string() << "\n";
    return 2;
  }
  if (opt_device_id.empty() && !ensure_device_id(cfg_path, cfg)) {
    std::cerr << "status=warn reason=device_id_not_saved path=" << cfg_path.string() << "\n";
  }

  if (!opt_name.empty())      cfg.device_name = opt_name;
  if (!opt_device_id.empty()) cfg.device_id = opt_device_id;
  if (!opt_type.empty())      cfg.device_type = opt_type;
  if (opt_emergency)          cfg.emergency = true;
  if (opt_tcp_port)           cfg.tcp_port = opt_tcp_port;
  if (opt_udp_port)           cfg.udp_port = opt_udp_port;
  if (!opt_bind.empty())      cfg.bind_address = opt_bind;
  if (!opt_broadcast.empty()) cfg.broadcast_address = opt_broadcast;
  if (!opt_data_dir.empty())  cfg.data_dir = opt_data_dir;
  if (!opt_log_level.empty()) log::parse_level(opt_log_level, cfg.log_level);
  log::set_level(cfg.log_level);

  JsonPeerStore store(cfg.data_dir.empty() ? data_dir() : std::filesystem::path(cfg.data_dir));
  store.open();

  if (opt_show_peers) {
    auto peers = store.load_peers();
    std::cout << ansi.bold("remembered peers: ") << peers.size() << "\n";
    for (const auto& p : peers) {
      print_peer(p, ansi);
      std::cout << ansi.dim("    last seen " + envelope::format_iso8601(p.last_seen_ms)) << "\n";
    }
    return 0;
  }
  if (opt_show_activity > 0) {
    for (const auto& r : store.load_recent_activity(opt_show_activity)) {
      std::cout << envelope::format_iso8601(r.timestamp_ms) << "  "
                << r.event << "  " << r.peer_id;
      if (!r.details.empty()) std::cout << "  " << ansi.dim(r.details);
      std::cout << "\n";
    }
    return 0;
  }

  // ---- run ----
  bridge::UdpBeaconBridge::Settings bs;
  bs.port               = cfg.udp_port;
  bs.peer_port          = cfg.udp_port;
  bs.broadcast_address  = cfg.broadcast_address;
  bs.beacon_interval_ms = cfg.beacon_interval_ms;
  bs.peer_expiry_ms     = cfg.peer_expiry_ms;
  bs.device_id          = cfg.device_id;
  bs.device_name        = cfg.device_name;
  bs.device_type        = cfg.device_type;
  bs.emergency          = cfg.emergency;
  bridge::UdpBeaconBridge bridge(bs);

  ConsoleSink sink(ansi);
  Session session(bridge, session_options(cfg), &store, &sink);

  Error err = session.initialize();
  if (err != Error::None) {
    std::cerr << "status=error reason=" << to_reason(err) << "\n";
    return 1;
  }
  err = session.start_discovery();
  if (err != Error::None) {
    std::cerr << "status=error reason=" << to_reason(err) << "\n";
    return 1;
  }

  session.bus().subscribe_connection([&](const ConnectionEvent& ev) {
    switch (ev.kind) {
      case ConnectionEvent::Kind::SocketUp:
        std::cout << ansi.bold("* connected") << ansi.dim(" to " + ev.remote_address) << std::endl;
        break;
      case ConnectionEvent::Kind::SocketDown:
        std::cout << ansi.dim("* disconnected") << std::endl;
        break;
      case ConnectionEvent::Kind::Failed:
        std::cout << ansi.red(std::string("* connection failed: ") + to_reason(ev.error)) << std::endl;
        break;
    }
  });

  std::cout << "ID: " << ansi.bold(cfg.device_id) << "  name: " << cfg.device_name
            << ansi.dim("  (type /help for commands)") << std::endl;

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  line_framer stdin_lines;
  std::vector<std::string> lines;
  bool stdin_open = true;
  bool invited = opt_connect.empty();

  while (!g_stop) {
    session.tick(steady_clock_ms());

    if (!invited) {
      for (const auto& p : session.peers()) {
        if (p.peer_id != opt_connect) continue;
        invited = true;
        Error e = session.connect(opt_connect);
        if (e != Error::None) std::cout << ansi.red(std::string("! connect: ") + to_reason(e)) << std::endl;
      }
    }

    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    int pr = ::poll(&pfd, stdin_open ? 1 : 0, static_cast<int>(opt_tick_ms));
    if (pr < 0 && errno != EINTR) {
      std::cerr << "status=error reason=poll detail=" << std::strerror(errno) << "\n";
      break;
    }
    if (pr <= 0 || !(pfd.revents & (POLLIN | POLLHUP))) continue;

    char buf[1024];
    ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
    if (n <= 0) {
      std::string tail;
      if (stdin_lines.flush(tail)) handle_line(session, tail, ansi);
      stdin_open = false;                  // keep running for inbound traffic
      continue;
    }
    lines.clear();
    stdin_lines.feed(buf, static_cast<size_t>(n), lines);
    for (const auto& l : lines) handle_line(session, l, ansi);
  }

  session.dispose();
  return 0;
}
