/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "coordinator/dashboard.hpp"

#include <fmt/format.h>

namespace tfc {

static constexpr const char *DASHBOARD_STYLE = R"(
body { font-family: -apple-system, "Segoe UI", Roboto, sans-serif; margin: 0; background: #f4f6fa; color: #222; }
header { background: #2d3e50; color: #fff; padding: 16px 24px; }
header h1 { margin: 0; font-size: 22px; }
header p { margin: 4px 0 0; font-size: 13px; opacity: 0.8; }
main { padding: 24px; }
.stats { display: flex; gap: 16px; margin-bottom: 24px; }
.stat { background: #fff; border-radius: 6px; padding: 16px 20px; flex: 1; box-shadow: 0 1px 3px rgba(0,0,0,0.1); }
.stat .value { font-size: 28px; font-weight: bold; }
.stat .label { font-size: 13px; color: #666; }
.workers { display: grid; grid-template-columns: repeat(auto-fill, minmax(340px, 1fr)); gap: 16px; }
.worker-card { background: #fff; border-radius: 6px; padding: 16px; border-left: 5px solid #aaa; box-shadow: 0 1px 3px rgba(0,0,0,0.1); }
.worker-card.status-online { border-left-color: #2ecc71; }
.worker-card.status-offline { border-left-color: #e74c3c; }
.worker-header { display: flex; justify-content: space-between; align-items: center; }
.worker-header h3 { margin: 0; font-family: monospace; }
.worker-info p { margin: 4px 0; font-size: 13px; }
.tool-item { display: flex; justify-content: space-between; background: #fff; padding: 10px 16px; margin-bottom: 6px; border-radius: 4px; }
.tool-available .tool-workers { color: #27ae60; }
.tool-unavailable .tool-workers { color: #c0392b; }
.empty { color: #888; font-style: italic; }
)";

std::string html_escape(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&#39;";
      break;
    default:
      out += c;
    }
  }
  return out;
}

static std::string render_worker_card(const WorkerRecord &record, SteadyTime now) {
  bool online = record.status == WorkerStatus::ONLINE;
  long long seconds_ago =
      std::chrono::duration_cast<std::chrono::seconds>(now - record.last_heartbeat_at).count();
  if (seconds_ago < 0) {
    seconds_ago = 0;
  }

  std::string tools;
  for (const auto &tool : record.supported_tools) {
    if (!tools.empty()) {
      tools += ", ";
    }
    tools += tool;
  }

  return fmt::format(R"(
<div class="worker-card {status_class}">
  <div class="worker-header">
    <h3>{id}</h3>
    <span class="status-badge">{status}</span>
  </div>
  <div class="worker-info">
    <p><strong>URL:</strong> <code>{url}</code></p>
    <p><strong>Tools:</strong> <span class="tools-list">{tools}</span></p>
    <p><strong>Active instances:</strong> <span class="instance-count">{instances}</span></p>
    <p><strong>Last heartbeat:</strong> {seconds_ago}s ago</p>
    <p><strong>Host:</strong> {hostname} ({ip})</p>
    <p><strong>Registered:</strong> {registered_at}</p>
  </div>
</div>)",
                     fmt::arg("status_class", online ? "status-online" : "status-offline"),
                     fmt::arg("id", html_escape(record.worker_id)),
                     fmt::arg("status", to_string(record.status)),
                     fmt::arg("url", html_escape(record.base_url)),
                     fmt::arg("tools", html_escape(tools)),
                     fmt::arg("instances", record.active_instance_count),
                     fmt::arg("seconds_ago", seconds_ago),
                     fmt::arg("hostname", html_escape(record.host_info.hostname.empty()
                                                          ? "N/A"
                                                          : record.host_info.hostname)),
                     fmt::arg("ip", html_escape(record.host_info.ip.empty() ? "N/A"
                                                                             : record.host_info.ip)),
                     fmt::arg("registered_at", format_wall_time(record.registered_at)));
}

std::string render_dashboard(const RegistrySnapshot &snapshot, const std::string &host, int port,
                             int refresh_seconds) {
  std::string workers_html;
  for (const auto &record : snapshot.workers) {
    workers_html += render_worker_card(record, snapshot.taken_at);
  }
  if (workers_html.empty()) {
    workers_html = R"(<div class="empty">No workers registered</div>)";
  }

  std::string tools_html;
  for (const auto &tool : snapshot.known_tools) {
    size_t live = snapshot.live_workers_for(tool);
    tools_html += fmt::format(R"(
<div class="tool-item {cls}">
  <span class="tool-name">{name}</span>
  <span class="tool-workers">{count} worker(s) available</span>
</div>)",
                              fmt::arg("cls", live > 0 ? "tool-available" : "tool-unavailable"),
                              fmt::arg("name", html_escape(tool)), fmt::arg("count", live));
  }
  if (tools_html.empty()) {
    tools_html = R"(<div class="empty">No tools known yet</div>)";
  }

  return fmt::format(R"(<!DOCTYPE html>
<html>
<head>
<meta charset="utf-8">
<meta http-equiv="refresh" content="{refresh}">
<title>Tool Fleet Coordinator</title>
<style>{style}</style>
</head>
<body>
<header>
  <h1>Tool Fleet Coordinator</h1>
  <p>Master {host}:{port} &middot; updated {updated}</p>
</header>
<main>
  <section class="stats">
    <div class="stat"><div class="value">{online}/{total}</div><div class="label">Online workers</div></div>
    <div class="stat"><div class="value">{tools}</div><div class="label">Known tools</div></div>
    <div class="stat"><div class="value">{instances}</div><div class="label">Instance mappings</div></div>
  </section>
  <h2>Workers</h2>
  <section class="workers">{workers_html}</section>
  <h2>Tools</h2>
  <section class="tools">{tools_html}</section>
</main>
</body>
</html>
)",
                     fmt::arg("refresh", refresh_seconds), fmt::arg("style", DASHBOARD_STYLE),
                     fmt::arg("host", html_escape(host)), fmt::arg("port", port),
                     fmt::arg("updated", format_wall_time(snapshot.taken_wall)),
                     fmt::arg("online", snapshot.online_workers()),
                     fmt::arg("total", snapshot.workers.size()),
                     fmt::arg("tools", snapshot.known_tools.size()),
                     fmt::arg("instances", snapshot.instances.size()),
                     fmt::arg("workers_html", workers_html), fmt::arg("tools_html", tools_html));
}

} // namespace tfc
