/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "utils/host_info.hpp"

#include <asio.hpp>

namespace tfc {

std::string local_hostname() {
  std::error_code ec;
  std::string name = asio::ip::host_name(ec);
  return ec ? std::string("localhost") : name;
}

std::string external_ip(const std::string &target_host, unsigned short target_port) {
  std::error_code ec;
  asio::io_context io_context;
  asio::ip::udp::socket socket(io_context);

  asio::ip::address address = asio::ip::make_address(target_host, ec);
  if (ec) {
    return "127.0.0.1";
  }
  socket.open(address.is_v6() ? asio::ip::udp::v6() : asio::ip::udp::v4(), ec);
  if (ec) {
    return "127.0.0.1";
  }
  socket.connect(asio::ip::udp::endpoint(address, target_port), ec);
  if (ec) {
    return "127.0.0.1";
  }
  asio::ip::udp::endpoint local = socket.local_endpoint(ec);
  if (ec) {
    return "127.0.0.1";
  }
  return local.address().to_string();
}

} // namespace tfc
