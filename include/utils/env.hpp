#pragma once

#include "parser.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <string>
#include <unordered_map>

namespace tfc {

/**
 * Reads settings from a .env file first and the process environment second.
 * Values found in the file are also exported to the environment.
 */
class EnvLoader {
public:
  EnvLoader(std::string file_path = "./.env") { load_env_file(file_path); }

  /**
   * Load environment variables from a .env file
   * @param file_path Path to the .env file (default: "./.env")
   * @return true if file was loaded successfully, false otherwise
   */
  bool load_env_file(const std::string &file_path = "./.env") {
    std::ifstream file(file_path);
    if (!file.is_open()) {
      // a missing .env is the common case for deployed workers
      return false;
    }

    std::string line;

    while (std::getline(file, line)) {
      if (line.empty() || line[0] == '#') {
        continue;
      }

      size_t equals_pos = line.find('=');
      if (equals_pos == std::string::npos) {
        continue;
      }

      std::string key = line.substr(0, equals_pos);
      std::string value = line.substr(equals_pos + 1);

      key.erase(0, key.find_first_not_of(" \t"));
      key.erase(key.find_last_not_of(" \t") + 1);

      if (value.size() >= 2) {
        if ((value.front() == '"' && value.back() == '"') ||
            (value.front() == '\'' && value.back() == '\'')) {
          value = value.substr(1, value.length() - 2);
        }
      }

      env_vars_[key] = value;
      setenv(key.c_str(), value.c_str(), 1);
    }

    return true;
  }

  template <typename T = std::string> T get(const std::string &env_var, const T &default_value) {
    auto it = env_vars_.find(env_var);
    if (it != env_vars_.end()) {
      return from_str<T>(it->second);
    }

    const char *env_value = std::getenv(env_var.c_str());
    if (env_value) {
      return from_str<T>(std::string(env_value));
    }
    return default_value;
  }

private:
  std::unordered_map<std::string, std::string> env_vars_;
};

class Env {
public:
  static EnvLoader &instance() {
    static EnvLoader instance;
    return instance;
  }

  template <typename T = std::string>
  static T get(const std::string &env_var, const T &default_value) {
    return instance().get<T>(env_var, default_value);
  }

  // Durations are written in (fractional) seconds.
  static std::chrono::milliseconds get_seconds(const std::string &env_var,
                                               std::chrono::milliseconds default_value) {
    double seconds = get<double>(env_var, static_cast<double>(default_value.count()) / 1000.0);
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
  }
};
} // namespace tfc
