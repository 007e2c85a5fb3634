#pragma once

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace tfc {

template <typename T>
T from_str(const std::string &str) {
  if constexpr (std::is_same_v<T, std::string>) {
    return str;
  } else if constexpr (std::is_same_v<T, bool>) {
    std::string lowered = str;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
      return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
      return false;
    }
    throw std::invalid_argument("Cannot convert '" + str + "' to bool");
  } else if constexpr (std::is_arithmetic_v<T>) {
    std::istringstream iss(str);
    T value;
    if (iss >> value && iss.eof()) {
      return value;
    }
    throw std::invalid_argument("Cannot convert '" + str + "' to numeric type");
  } else {
    static_assert(std::is_same_v<T, std::string> || std::is_arithmetic_v<T>,
                  "from_str only supports string and arithmetic types");
    return T{};
  }
}

}  // namespace tfc
