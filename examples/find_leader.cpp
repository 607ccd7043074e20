#include <lf/errors.hpp>
#include <lf/log.hpp>
#include <lf/make_finder.hpp>
#include <lf/watch_finder.hpp>

#include <csignal>
#include <iostream>
#include <thread>

namespace {
bool interrupt = false;
extern "C" void signal_handler(int sig) {
  interrupt = true;
}

void usage(char const* argv0) {
  std::cerr << "Usage: " << argv0 << " [options] <address>\n"
            << "  <address> is http[s]://host[:port] or zk://host:port[,host:port...][/election/path]\n"
            << "Options:\n"
            << "  --watch                  keep running, print the leader each time it changes (zk:// only)\n"
            << "  --election-path=PATH     the election directory\n"
            << "  --poll-interval-ms=N     delay between refresh cycles\n"
            << "  --watch-timeout-ms=N     refresh even if the leader node did not change\n"
            << "  --max-staleness-ms=N     fail queries when the leader is older than this, 0 disables\n"
            << "  --connect-timeout-ms=N   how long to wait for the ensemble\n"
            << "  --session-timeout-ms=N   the ZooKeeper session timeout\n"
            << "  --http-timeout-ms=N      timeout for the HTTP probe\n"
            << "  --log-level=LEVEL        trace, debug, info, notice, warning, error, ...\n";
}

/// Return true and set @a value if @a arg is --name=value.
bool match_option(std::string const& arg, char const* name, std::string& value) {
  std::string prefix = std::string("--") + name + "=";
  if (arg.compare(0, prefix.size(), prefix) != 0) {
    return false;
  }
  value = arg.substr(prefix.size());
  return true;
}

std::chrono::milliseconds parse_milliseconds(std::string const& name, std::string const& value) {
  std::size_t end = 0;
  long long ms = 0;
  try {
    ms = std::stoll(value, &end);
  } catch (std::exception const&) {
    end = 0;
  }
  if (end == 0 or end != value.size()) {
    throw lf::configuration_error("invalid value <" + value + "> for --" + name);
  }
  return std::chrono::milliseconds(ms);
}
} // anonymous namespace

int main(int argc, char* argv[]) try {
  lf::finder_config config;
  bool watch = false;
  std::string address;
  lf::severity level = lf::severity::warning;

  for (int i = 1; i != argc; ++i) {
    std::string arg = argv[i];
    std::string value;
    if (arg == "--help" or arg == "-h") {
      usage(argv[0]);
      return 0;
    } else if (arg == "--watch") {
      watch = true;
    } else if (match_option(arg, "election-path", value)) {
      config.election_path = value;
    } else if (match_option(arg, "poll-interval-ms", value)) {
      config.poll_interval = parse_milliseconds("poll-interval-ms", value);
    } else if (match_option(arg, "watch-timeout-ms", value)) {
      config.watch_timeout = parse_milliseconds("watch-timeout-ms", value);
    } else if (match_option(arg, "max-staleness-ms", value)) {
      config.max_staleness = parse_milliseconds("max-staleness-ms", value);
    } else if (match_option(arg, "connect-timeout-ms", value)) {
      config.connect_timeout = parse_milliseconds("connect-timeout-ms", value);
    } else if (match_option(arg, "session-timeout-ms", value)) {
      config.session_timeout = parse_milliseconds("session-timeout-ms", value);
    } else if (match_option(arg, "http-timeout-ms", value)) {
      config.http_timeout = parse_milliseconds("http-timeout-ms", value);
    } else if (match_option(arg, "log-level", value)) {
      level = lf::parse_severity(value);
    } else if (arg.compare(0, 2, "--") == 0 or not address.empty()) {
      usage(argv[0]);
      return 1;
    } else {
      address = arg;
    }
  }
  if (address.empty()) {
    usage(argv[0]);
    return 1;
  }

  lf::log::instance().add_sink(lf::make_ostream_sink(std::clog));
  lf::log::instance().min_severity(level);

  auto finder = lf::make_finder(address, config);
  if (not watch) {
    // ... a coordination-mode finder needs a moment to run its first refresh ...
    using namespace std::chrono_literals;
    auto deadline = std::chrono::steady_clock::now() + config.connect_timeout;
    while (true) {
      try {
        std::cout << finder->leader_url() << std::endl;
        return 0;
      } catch (lf::resolution_error const& ex) {
        auto* w = dynamic_cast<lf::watch_finder*>(finder.get());
        if (w == nullptr or w->has_leader() or std::chrono::steady_clock::now() >= deadline) {
          throw;
        }
      }
      std::this_thread::sleep_for(20ms);
    }
  }

  auto* observer = dynamic_cast<lf::watch_finder*>(finder.get());
  if (observer == nullptr) {
    std::cerr << "--watch requires a zk:// address" << std::endl;
    return 1;
  }
  auto token = observer->subscribe([](std::string const& url) { std::cout << url << std::endl; });

  // ... block here until a signal is received ...
  std::signal(SIGINT, &signal_handler);
  std::signal(SIGTERM, &signal_handler);
  using namespace std::chrono_literals;
  while (not interrupt) {
    std::this_thread::sleep_for(20ms);
  }

  observer->unsubscribe(token);
  observer->shutdown();
  return 0;
} catch (lf::finder_error const& ex) {
  std::cerr << argv[0] << ": " << ex.what() << std::endl;
  return 1;
} catch (std::exception const& ex) {
  std::cerr << "std::exception raised: " << ex.what() << std::endl;
  return 1;
}
