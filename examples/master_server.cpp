/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "config/tool_definitions.hpp"
#include "coordinator/coordinator.hpp"
#include "coordinator/http_server.hpp"
#include "coordinator/http_worker_transport.hpp"
#include "logging/logger.hpp"

#include <asio.hpp>
#include <csignal>
#include <cstdlib>
#include <getopt.h>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace tfc;
using namespace std;

void print_usage(const char *program_name) {
  cout << "Usage: " << program_name << " [options]" << endl;
  cout << endl;
  cout << "Options:" << endl;
  cout << "  --host <addr>               Listen address (default: 0.0.0.0)" << endl;
  cout << "  --port <N>                  Listen port (default: 8000)" << endl;
  cout << "  --threads <N>               HTTP handler threads (default: 16)" << endl;
  cout << "  --heartbeat-timeout <sec>   Evict workers silent for longer (default: 60)" << endl;
  cout << "  --sweep-interval <sec>      Health sweep period (default: 5)" << endl;
  cout << "  --timeout-per-query <sec>   Deadline of a proxied worker call (default: 600)"
       << endl;
  cout << "  --idle-timeout <sec>        Release instances unused for longer (default: off)"
       << endl;
  cout << "  --tools-config <file>       Tool definition file to declare tools up front" << endl;
  cout << "  --no-verify                 Accept registrations without probing /health" << endl;
  cout << "  --log-file <file>           Log to a file instead of the console" << endl;
  cout << "  --log-level <level>         trace|debug|info|warn|error (default: info)" << endl;
  cout << "  -h, --help                  Show this help message" << endl;
  cout << endl;
  cout << "Environment (TFC_* variables, also read from ./.env) is applied first." << endl;
}

static bool parse_seconds(const char *arg, const char *flag, chrono::milliseconds &out) {
  try {
    double seconds = stod(arg);
    if (seconds < 0) {
      cerr << "Invalid " << flag << " value: " << arg << endl;
      return false;
    }
    out = chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
    return true;
  } catch (const exception &) {
    cerr << flag << " requires a number of seconds" << endl;
    return false;
  }
}

bool parse_arguments(int argc, char *argv[], CoordinatorConfig &cfg) {
  int c;

  static struct option long_options[] = {{"host", required_argument, 0, 'H'},
                                         {"port", required_argument, 0, 'p'},
                                         {"threads", required_argument, 0, 't'},
                                         {"heartbeat-timeout", required_argument, 0, 'b'},
                                         {"sweep-interval", required_argument, 0, 's'},
                                         {"timeout-per-query", required_argument, 0, 'q'},
                                         {"idle-timeout", required_argument, 0, 'i'},
                                         {"tools-config", required_argument, 0, 'c'},
                                         {"no-verify", no_argument, 0, 'n'},
                                         {"log-file", required_argument, 0, 'f'},
                                         {"log-level", required_argument, 0, 'l'},
                                         {"help", no_argument, 0, 'h'},
                                         {0, 0, 0, 0}};

  optind = 1;

  while ((c = getopt_long(argc, argv, "h", long_options, nullptr)) != -1) {
    switch (c) {
    case 'H':
      cfg.host = optarg;
      break;
    case 'p':
      try {
        cfg.port = stoi(optarg);
      } catch (const exception &) {
        cerr << "--port requires a valid number argument" << endl;
        return false;
      }
      if (cfg.port <= 0 || cfg.port > 65535) {
        cerr << "Invalid port number: " << optarg << endl;
        return false;
      }
      break;
    case 't':
      try {
        int threads = stoi(optarg);
        if (threads <= 0) {
          cerr << "Invalid threads value: " << optarg << endl;
          return false;
        }
        cfg.http_threads = static_cast<size_t>(threads);
      } catch (const exception &) {
        cerr << "--threads requires a valid number argument" << endl;
        return false;
      }
      break;
    case 'b':
      if (!parse_seconds(optarg, "--heartbeat-timeout", cfg.heartbeat_timeout))
        return false;
      break;
    case 's':
      if (!parse_seconds(optarg, "--sweep-interval", cfg.sweep_interval))
        return false;
      break;
    case 'q':
      if (!parse_seconds(optarg, "--timeout-per-query", cfg.worker_call_timeout))
        return false;
      break;
    case 'i':
      if (!parse_seconds(optarg, "--idle-timeout", cfg.instance_idle_timeout))
        return false;
      break;
    case 'c':
      cfg.tools_config = optarg;
      break;
    case 'n':
      cfg.verify_worker_on_register = false;
      break;
    case 'f':
      cfg.log_file = optarg;
      break;
    case 'l':
      cfg.log_level = optarg;
      break;
    case 'h':
      print_usage(argv[0]);
      return false;
    case '?':
      return false;
    default:
      return false;
    }
  }

  if (optind < argc) {
    cerr << "Unexpected argument: " << argv[optind] << endl;
    print_usage(argv[0]);
    return false;
  }

  try {
    cfg.validate();
  } catch (const invalid_argument &e) {
    cerr << e.what() << endl;
    return false;
  }

  return true;
}

int main(int argc, char *argv[]) {
  CoordinatorConfig cfg;
  try {
    cfg.load_from_env();
  } catch (const invalid_argument &e) {
    cerr << "Invalid environment configuration: " << e.what() << endl;
    return 1;
  }

  if (!parse_arguments(argc, argv, cfg)) {
    return 1;
  }

  GlobalLogger::set_level(parse_log_level(cfg.log_level));

  vector<string> declared_tools;
  if (!cfg.tools_config.empty()) {
    try {
      nlohmann::json document = load_tool_definitions(cfg.tools_config);
      declared_tools = extract_tool_names(document);
      GlobalLogger::info("Declared {} tools from {}", declared_tools.size(), cfg.tools_config);
      for (const auto &[tool, timeout] : tool_timeouts(document)) {
        cfg.tool_timeouts.emplace(tool, timeout);
      }
    } catch (const exception &e) {
      cerr << "Failed to load tool definitions: " << e.what() << endl;
      return 1;
    }
  }

  cfg.print_config();

  try {
    Coordinator coordinator(cfg, make_unique<HttpWorkerTransport>());
    coordinator.declare_tools(declared_tools);

    MasterHttpServer server(coordinator, cfg.host, cfg.port, cfg.http_threads);
    server.start();
    coordinator.start();

    asio::io_context signal_context;
    asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&](const error_code &, int signal_number) {
      coordinator.logger().info("Received signal {}, shutting down", signal_number);
    });
    signal_context.run();

    coordinator.stop();
    server.stop();
  } catch (const exception &e) {
    cerr << "Master server error: " << e.what() << endl;
    return 1;
  }

  return 0;
}
