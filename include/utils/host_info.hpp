/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <string>

namespace tfc {

std::string local_hostname();

/**
 * @brief Address of the interface that routes to the outside world.
 *
 * Connects a UDP socket (no packet is sent) and reads its local endpoint. Falls back to
 * 127.0.0.1 when there is no route.
 */
std::string external_ip(const std::string &target_host = "8.8.8.8", unsigned short target_port = 80);

} // namespace tfc
