/*
 * 설명: MariaDB 연결과 기한 기반 타임아웃, 재시도 로직을 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/kv_store_it_test.cpp
 */
#include "broker/db_client.hpp"

#include <algorithm>
#include <random>
#include <thread>

#include <mariadb/errmsg.h>

namespace broker {
namespace {
constexpr std::size_t kMaxAttempts = 3;
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;
constexpr unsigned int kDeadlineExceeded = 0;

// 커넥터 타임아웃은 초 단위이므로 남은 시간을 올림한다.
unsigned int RemainingSeconds(Deadline deadline) {
  auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
  auto seconds = (remaining.count() + 999) / 1000;
  return static_cast<unsigned int>(std::max<long long>(1, seconds));
}

void CheckDeadline(Deadline deadline) {
  if (std::chrono::steady_clock::now() >= deadline) {
    throw StoreError("요청 기한 초과: 저장소 호출 전에 기한이 지났습니다", kDeadlineExceeded, true);
  }
}
}  // namespace

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {
  // 여러 워커 스레드가 mysql_init을 동시에 부르기 전에 라이브러리를 초기화한다.
  if (mysql_library_init(0, nullptr, nullptr) != 0) {
    throw StoreError("MariaDB 라이브러리 초기화 실패", 0, false);
  }
}

MYSQL* MariaDbClient::Connect(Deadline deadline) const {
  CheckDeadline(deadline);
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    throw StoreError("MariaDB 초기화 실패", 0, true);
  }
  unsigned int timeout_seconds = RemainingSeconds(deadline);
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout_seconds);
  mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &timeout_seconds);
  mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &timeout_seconds);
  if (!mysql_real_connect(conn, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    RaiseError(conn, "연결 실패");
  }
  // 커넥터 타임아웃은 초 단위로 올림되므로 연결 직후 기한을 다시 확인한다.
  if (std::chrono::steady_clock::now() >= deadline) {
    mysql_close(conn);
    throw StoreError("요청 기한 초과: 연결 중에 기한이 지났습니다", kDeadlineExceeded, true);
  }
  return conn;
}

void MariaDbClient::WithConnection(const std::function<void(MYSQL*)>& work, Deadline deadline) const {
  MYSQL* conn = nullptr;
  try {
    conn = Connect(deadline);
    work(conn);
    mysql_close(conn);
  } catch (...) {
    if (conn) {
      mysql_close(conn);
    }
    throw;
  }
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work, Deadline deadline) const {
  for (std::size_t attempt = 1; attempt <= kMaxAttempts; ++attempt) {
    try {
      WithConnection(work, deadline);
      return;
    } catch (const StoreError& ex) {
      if (ex.retryable && ex.code != kDeadlineExceeded && attempt < kMaxAttempts &&
          std::chrono::steady_clock::now() < deadline) {
        Backoff(attempt);
        continue;
      }
      throw;
    }
  }
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped;
  escaped.resize(value.size() * 2 + 1);
  auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  bool retryable = IsRetryable(code);
  std::string message = ctx + ": " + mysql_error(conn);
  throw StoreError(message, code, retryable);
}

bool MariaDbClient::IsRetryable(unsigned int code) const {
  return code == kDeadlock || code == kLockWaitTimeout || code == CR_SERVER_LOST || code == CR_SERVER_GONE_ERROR ||
         code == CR_CONN_HOST_ERROR || code == CR_SERVER_LOST_EXTENDED;
}

void MariaDbClient::Backoff(std::size_t attempt) const {
  std::size_t base_ms = 50 * (1u << (attempt - 1));
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<int> dist(0, 25);
  std::size_t delay_ms = base_ms + static_cast<std::size_t>(dist(gen));
  std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
}

}  // namespace broker
