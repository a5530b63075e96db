/*
 * 설명: 브로커 서버 전체 수명주기와 의존 객체 그래프를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/broker_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include "broker/broker_service.hpp"
#include "broker/config.hpp"
#include "broker/db_client.hpp"
#include "broker/kv_store.hpp"
#include "broker/observability.hpp"

namespace broker {

class Listener;

class ServerApp {
 public:
  // 저장소에 연결할 수 없으면 StoreError를 던진다. 서버는 시작되지 않는다.
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<BrokerService> GetBrokerService() { return broker_service_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Listener> listener_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};

  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<MariaDbKvStore> kv_store_;
  std::shared_ptr<BrokerService> broker_service_;
};

}  // namespace broker
