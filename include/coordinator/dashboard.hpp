/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "registry/worker_registry.hpp"

#include <string>

namespace tfc {

std::string html_escape(const std::string &text);

/**
 * @brief Renders the read-only HTML status page served at GET /.
 *
 * Summary counters, one card per worker and one row per known tool with its number of live
 * workers. The page reloads itself every refresh_seconds.
 */
std::string render_dashboard(const RegistrySnapshot &snapshot, const std::string &host, int port,
                             int refresh_seconds = 10);

} // namespace tfc
