/*
 * 설명: kv_store 테이블 위에 Put/PutIfAbsent/Get을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/kv_store_it_test.cpp
 */
#include "broker/kv_store.hpp"

#include <sstream>

namespace broker {
namespace {
constexpr unsigned int kDuplicateEntry = 1062;
}  // namespace

MariaDbKvStore::MariaDbKvStore(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

void MariaDbKvStore::EnsureSchema(Deadline deadline) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    const char* sql =
        "CREATE TABLE IF NOT EXISTS kv_store("
        "k VARCHAR(255) NOT NULL PRIMARY KEY, "
        "v TEXT NOT NULL, "
        "created_at DATETIME(6) NOT NULL DEFAULT CURRENT_TIMESTAMP(6)"
        ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;";
    if (mysql_query(conn, sql) != 0) {
      db_client_->RaiseError(conn, "스키마 생성 실패");
    }
  }, deadline);
}

void MariaDbKvStore::Ping(Deadline deadline) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    if (mysql_ping(conn) != 0) {
      db_client_->RaiseError(conn, "저장소 핑 실패");
    }
  }, deadline);
}

void MariaDbKvStore::Put(const std::string& key, const std::string& value, Deadline deadline) {
  db_client_->WithConnection([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO kv_store(k, v) VALUES('" << db_client_->Escape(conn, key) << "', '"
        << db_client_->Escape(conn, value) << "') ON DUPLICATE KEY UPDATE v=VALUES(v);";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      db_client_->RaiseError(conn, "키 저장 실패");
    }
  }, deadline);
}

PutOutcome MariaDbKvStore::PutIfAbsent(const std::string& key, const std::string& value, Deadline deadline) {
  PutOutcome outcome = PutOutcome::kCreated;
  db_client_->WithConnection([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO kv_store(k, v) VALUES('" << db_client_->Escape(conn, key) << "', '"
        << db_client_->Escape(conn, value) << "');";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      if (mysql_errno(conn) == kDuplicateEntry) {
        outcome = PutOutcome::kExists;
        return;
      }
      db_client_->RaiseError(conn, "키 생성 실패");
    }
  }, deadline);
  return outcome;
}

std::optional<std::string> MariaDbKvStore::Get(const std::string& key, Deadline deadline) {
  std::optional<std::string> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    result.reset();
    std::ostringstream oss;
    oss << "SELECT v FROM kv_store WHERE k='" << db_client_->Escape(conn, key) << "';";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      db_client_->RaiseError(conn, "키 조회 실패");
    }
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
      db_client_->RaiseError(conn, "조회 결과 없음");
    }
    MYSQL_ROW row = mysql_fetch_row(res);
    if (row && row[0]) {
      unsigned long* lengths = mysql_fetch_lengths(res);
      result = std::string(row[0], lengths ? lengths[0] : std::char_traits<char>::length(row[0]));
    }
    mysql_free_result(res);
  }, deadline);
  return result;
}

void MariaDbKvStore::ClearPrefix(const std::string& prefix, Deadline deadline) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "DELETE FROM kv_store WHERE k LIKE '" << db_client_->Escape(conn, prefix) << "%';";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      db_client_->RaiseError(conn, "키 삭제 실패");
    }
  }, deadline);
}

}  // namespace broker
