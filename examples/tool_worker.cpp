/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "config/tool_definitions.hpp"
#include "worker/tool_factory.hpp"
#include "worker/worker_agent.hpp"

#include <asio.hpp>
#include <csignal>
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
  cout << "  --port <N>                  Listen port, 0 for any (default: 8001)" << endl;
  cout << "  --master <url>              Master URL (default: http://127.0.0.1:8000)" << endl;
  cout << "  --worker-id <id>            Fixed worker id (default: assigned by master)" << endl;
  cout << "  --advertise-url <url>       URL the master should call back" << endl;
  cout << "  --heartbeat-interval <sec>  Heartbeat period (default: 30)" << endl;
  cout << "  --tools-config <file>       Tool definition file (default: all builtin tools)"
       << endl;
  cout << "  --threads <N>               HTTP handler threads (default: 8)" << endl;
  cout << "  --log-file <file>           Log to a file instead of the console" << endl;
  cout << "  --log-level <level>         trace|debug|info|warn|error (default: info)" << endl;
  cout << "  -h, --help                  Show this help message" << endl;
}

bool parse_arguments(int argc, char *argv[], WorkerConfig &cfg) {
  int c;

  static struct option long_options[] = {{"host", required_argument, 0, 'H'},
                                         {"port", required_argument, 0, 'p'},
                                         {"master", required_argument, 0, 'm'},
                                         {"worker-id", required_argument, 0, 'w'},
                                         {"advertise-url", required_argument, 0, 'a'},
                                         {"heartbeat-interval", required_argument, 0, 'b'},
                                         {"tools-config", required_argument, 0, 'c'},
                                         {"threads", required_argument, 0, 't'},
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
      if (cfg.port < 0 || cfg.port > 65535) {
        cerr << "Invalid port number: " << optarg << endl;
        return false;
      }
      break;
    case 'm':
      cfg.master_url = optarg;
      break;
    case 'w':
      cfg.worker_id = optarg;
      break;
    case 'a':
      cfg.advertise_url = optarg;
      break;
    case 'b':
      try {
        double seconds = stod(optarg);
        if (seconds <= 0) {
          cerr << "Invalid heartbeat interval: " << optarg << endl;
          return false;
        }
        cfg.heartbeat_interval = chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
      } catch (const exception &) {
        cerr << "--heartbeat-interval requires a number of seconds" << endl;
        return false;
      }
      break;
    case 'c':
      cfg.tools_config = optarg;
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

  return true;
}

int main(int argc, char *argv[]) {
  WorkerConfig cfg;
  try {
    cfg.load_from_env();
  } catch (const invalid_argument &e) {
    cerr << "Invalid environment configuration: " << e.what() << endl;
    return 1;
  }

  if (!parse_arguments(argc, argv, cfg)) {
    return 1;
  }

  cfg.print_config();
  GlobalLogger::set_level(parse_log_level(cfg.log_level));

  ToolFactory factory;
  factory.register_defaults();

  vector<unique_ptr<Tool>> tools;
  try {
    if (cfg.tools_config.empty()) {
      for (const auto &class_name : factory.available()) {
        ToolDefinition def;
        def.class_name = class_name;
        tools.push_back(factory.create(def));
      }
    } else {
      for (const auto &def : parse_tool_definitions(load_tool_definitions(cfg.tools_config))) {
        if (!factory.has(def.class_name)) {
          GlobalLogger::warn("Skipping unknown tool class: {}", def.class_name);
          continue;
        }
        tools.push_back(factory.create(def));
      }
    }
  } catch (const exception &e) {
    cerr << "Failed to load tools: " << e.what() << endl;
    return 1;
  }

  try {
    auto master = make_unique<HttpMasterLink>(cfg.master_url, cfg.master_timeout);
    WorkerAgent agent(cfg, std::move(tools), std::move(master));
    agent.start();

    asio::io_context signal_context;
    asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&](const error_code &, int signal_number) {
      agent.logger().info("Received signal {}, shutting down", signal_number);
    });
    signal_context.run();

    agent.stop();
  } catch (const exception &e) {
    cerr << "Worker error: " << e.what() << endl;
    return 1;
  }

  return 0;
}
