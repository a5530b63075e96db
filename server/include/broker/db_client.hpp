/*
 * 설명: MariaDB 연결, 요청 기한 전파, 읽기 재시도 정책을 캡슐화한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/kv_store_it_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace broker {

using Deadline = std::chrono::steady_clock::time_point;

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
};

class StoreError : public std::runtime_error {
 public:
  StoreError(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  // 한 번만 시도한다. 결과를 알 수 없는 쓰기는 이 경로를 사용한다.
  void WithConnection(const std::function<void(MYSQL*)>& work, Deadline deadline) const;
  // 멱등 작업 전용. 재시도 가능한 오류는 기한이 남아 있는 동안 백오프 후 다시 시도한다.
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work, Deadline deadline) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  std::string Escape(MYSQL* conn, const std::string& value) const;

 private:
  MYSQL* Connect(Deadline deadline) const;
  bool IsRetryable(unsigned int code) const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
};

}  // namespace broker
