/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace tfc {

enum class ErrorCode {
  VALIDATION_ERROR,
  UNKNOWN_WORKER,
  NO_WORKER_AVAILABLE,
  INSTANCE_NOT_BOUND,
  INSTANCE_PENDING,
  WORKER_TIMEOUT,
  WORKER_UNREACHABLE,
  WORKER_ERROR,
  INTERNAL_ERROR
};

inline const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::VALIDATION_ERROR:
    return "VALIDATION_ERROR";
  case ErrorCode::UNKNOWN_WORKER:
    return "UNKNOWN_WORKER";
  case ErrorCode::NO_WORKER_AVAILABLE:
    return "NO_WORKER_AVAILABLE";
  case ErrorCode::INSTANCE_NOT_BOUND:
    return "INSTANCE_NOT_BOUND";
  case ErrorCode::INSTANCE_PENDING:
    return "INSTANCE_PENDING";
  case ErrorCode::WORKER_TIMEOUT:
    return "WORKER_TIMEOUT";
  case ErrorCode::WORKER_UNREACHABLE:
    return "WORKER_UNREACHABLE";
  case ErrorCode::WORKER_ERROR:
    return "WORKER_ERROR";
  case ErrorCode::INTERNAL_ERROR:
    return "INTERNAL_ERROR";
  default:
    return "UNKNOWN";
  }
}

/**
 * @brief Base class of every failure the coordinator reports to a caller.
 *
 * All of these are recoverable at the coordinator boundary: the HTTP layer turns them into a
 * structured failure with the status returned by http_status().
 */
class CoordinatorError : public std::runtime_error {
public:
  CoordinatorError(ErrorCode code, const std::string &message, bool retryable, int http_status)
      : std::runtime_error(message), code_(code), retryable_(retryable),
        http_status_(http_status) {}

  ErrorCode code() const { return code_; }
  bool retryable() const { return retryable_; }
  int http_status() const { return http_status_; }

  nlohmann::json to_json() const {
    return nlohmann::json{{"success", false},
                          {"error", what()},
                          {"code", error_code_name(code_)},
                          {"retryable", retryable_}};
  }

private:
  ErrorCode code_;
  bool retryable_;
  int http_status_;
};

class ValidationError : public CoordinatorError {
public:
  explicit ValidationError(const std::string &message)
      : CoordinatorError(ErrorCode::VALIDATION_ERROR, message, false, 400) {}
};

class UnknownWorker : public CoordinatorError {
public:
  explicit UnknownWorker(const std::string &worker_id)
      : CoordinatorError(ErrorCode::UNKNOWN_WORKER, "Worker not registered: " + worker_id, false,
                         404) {}
};

class NoWorkerAvailable : public CoordinatorError {
public:
  explicit NoWorkerAvailable(const std::string &tool_name)
      : CoordinatorError(ErrorCode::NO_WORKER_AVAILABLE,
                         "No healthy workers available for tool " + tool_name, true, 503) {}
};

class InstanceNotBound : public CoordinatorError {
public:
  explicit InstanceNotBound(const std::string &message)
      : CoordinatorError(ErrorCode::INSTANCE_NOT_BOUND, message, false, 404) {}
};

class InstancePending : public CoordinatorError {
public:
  explicit InstancePending(const std::string &instance_id)
      : CoordinatorError(ErrorCode::INSTANCE_PENDING,
                         "Instance " + instance_id + " is still being created", true, 409) {}
};

class WorkerTimeout : public CoordinatorError {
public:
  explicit WorkerTimeout(const std::string &message)
      : CoordinatorError(ErrorCode::WORKER_TIMEOUT, message, true, 504) {}
};

class WorkerUnreachable : public CoordinatorError {
public:
  explicit WorkerUnreachable(const std::string &message)
      : CoordinatorError(ErrorCode::WORKER_UNREACHABLE, message, true, 502) {}
};

class WorkerError : public CoordinatorError {
public:
  WorkerError(const std::string &message, int worker_status)
      : CoordinatorError(ErrorCode::WORKER_ERROR, message, false, 502),
        worker_status_(worker_status) {}

  int worker_status() const { return worker_status_; }

private:
  int worker_status_;
};

}  // namespace tfc
