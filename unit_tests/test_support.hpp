#pragma once

#include "common/errors.hpp"
#include "coordinator/worker_transport.hpp"
#include "registry/worker_record.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

namespace tfc {
namespace test_support {

class ManualClock {
public:
  SteadyTime now() const { return now_; }
  void advance(std::chrono::milliseconds delta) { now_ += delta; }
  std::function<SteadyTime()> source() {
    return [this] { return now_; };
  }

private:
  SteadyTime now_ = SteadyTime(std::chrono::hours(1));
};

inline WorkerRegistration make_registration(const std::string &id, const std::string &url,
                                            std::set<std::string> tools) {
  WorkerRegistration reg;
  reg.worker_id = id;
  reg.base_url = url;
  reg.supported_tools = std::move(tools);
  reg.host_info.hostname = "host-" + id;
  reg.host_info.ip = "10.0.0.1";
  return reg;
}

/**
 * Records every call and answers from a per-path script. Unscripted create calls succeed.
 */
class FakeWorkerTransport : public WorkerTransport {
public:
  struct Call {
    std::string base_url;
    std::string path;
    nlohmann::json body;
    std::chrono::milliseconds timeout;
  };

  using Responder = std::function<nlohmann::json(const Call &)>;

  nlohmann::json post(const std::string &base_url, const std::string &path,
                      const nlohmann::json &body, std::chrono::milliseconds timeout) override {
    Call call{base_url, path, body, timeout};
    Responder responder;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      calls_.push_back(call);
      auto it = responders_.find(path);
      if (it != responders_.end()) {
        responder = it->second;
      }
    }
    if (responder) {
      return responder(call);
    }
    if (path.size() >= 7 && path.compare(path.size() - 7, 7, "/create") == 0) {
      return nlohmann::json{{"success", true}, {"result", body.value("instance_id", "")}};
    }
    return nlohmann::json{{"success", true}, {"echo", body}, {"worker", base_url}};
  }

  bool check_health(const std::string &base_url, std::chrono::milliseconds) override {
    std::lock_guard<std::mutex> lock(mutex_);
    health_checked_.push_back(base_url);
    return unreachable_.count(base_url) == 0;
  }

  void on(const std::string &path, Responder responder) {
    std::lock_guard<std::mutex> lock(mutex_);
    responders_[path] = std::move(responder);
  }

  void set_unreachable(const std::string &base_url) {
    std::lock_guard<std::mutex> lock(mutex_);
    unreachable_.insert(base_url);
  }

  std::vector<Call> calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

  size_t count_calls(const std::string &path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto &call : calls_) {
      if (call.path == path) {
        ++n;
      }
    }
    return n;
  }

  std::vector<std::string> health_checked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return health_checked_;
  }

private:
  mutable std::mutex mutex_;
  std::vector<Call> calls_;
  std::vector<std::string> health_checked_;
  std::map<std::string, Responder> responders_;
  std::set<std::string> unreachable_;
};

} // namespace test_support
} // namespace tfc
