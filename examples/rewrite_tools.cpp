/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "config/tool_definitions.hpp"

#include <getopt.h>
#include <iostream>
#include <optional>
#include <string>

using namespace tfc;
using namespace std;

struct Config {
  string input;
  string output;
  string master_url;
  optional<double> timeout_per_query;
  optional<string> proxy_class;
};

void print_usage(const char *program_name) {
  cout << "Usage: " << program_name << " [options] <input.json> <output.json>" << endl;
  cout << endl;
  cout << "Points every tool of a tool definition file at the coordinator." << endl;
  cout << endl;
  cout << "Options:" << endl;
  cout << "  --master <url>              Coordinator URL (required)" << endl;
  cout << "  --timeout-per-query <sec>   Set config.timeout_per_query on every tool" << endl;
  cout << "  --proxy-class <name>        Replace class_name with this proxy class" << endl;
  cout << "  -h, --help                  Show this help message" << endl;
}

bool parse_arguments(int argc, char *argv[], Config &cfg) {
  int c;

  static struct option long_options[] = {{"master", required_argument, 0, 'm'},
                                         {"timeout-per-query", required_argument, 0, 'q'},
                                         {"proxy-class", required_argument, 0, 'p'},
                                         {"help", no_argument, 0, 'h'},
                                         {0, 0, 0, 0}};

  optind = 1;

  while ((c = getopt_long(argc, argv, "h", long_options, nullptr)) != -1) {
    switch (c) {
    case 'm':
      cfg.master_url = optarg;
      break;
    case 'q':
      try {
        cfg.timeout_per_query = stod(optarg);
      } catch (const exception &) {
        cerr << "--timeout-per-query requires a number of seconds" << endl;
        return false;
      }
      break;
    case 'p':
      cfg.proxy_class = string(optarg);
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

  if (argc - optind != 2) {
    cerr << "Expected <input.json> and <output.json>" << endl;
    print_usage(argv[0]);
    return false;
  }
  cfg.input = argv[optind];
  cfg.output = argv[optind + 1];

  if (cfg.master_url.empty()) {
    cerr << "Missing required option: --master" << endl;
    return false;
  }
  return true;
}

int main(int argc, char *argv[]) {
  Config cfg;
  if (!parse_arguments(argc, argv, cfg)) {
    return 1;
  }

  try {
    nlohmann::json document = load_tool_definitions(cfg.input);
    nlohmann::json rewritten =
        rewrite_for_master(document, cfg.master_url, cfg.timeout_per_query, cfg.proxy_class);
    save_tool_definitions(rewritten, cfg.output);

    cout << "Rewrote " << cfg.input << " -> " << cfg.output << endl;
    for (const auto &tool : rewritten["tools"]) {
      cout << "  - " << tool["class_name"].get<string>() << " -> "
           << tool["config"]["mcp_server_url"].get<string>() << endl;
    }
  } catch (const exception &e) {
    cerr << "Error: " << e.what() << endl;
    return 1;
  }

  return 0;
}
