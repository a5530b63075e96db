/*
 * 설명: 브로커 서버 수명주기와 리스닝 스레드를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/broker_flow_test.cpp
 */
#include "broker/app.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <iostream>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "broker/credential_validator.hpp"
#include "broker/http_session.hpp"
#include "broker/qos_policy.hpp"
#include "broker/room_registry.hpp"

namespace broker {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<BrokerService> broker_service, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config),
        broker_service_(std::move(broker_service)), observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->broker_service_,
                                          self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<BrokerService> broker_service_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)), signals_(ioc_, SIGINT, SIGTERM) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));

  DbConfig db_config{config.store_host, config.store_port, config.store_user, config.store_password,
                     config.store_name};
  db_client_ = std::make_shared<MariaDbClient>(db_config);
  kv_store_ = std::make_shared<MariaDbKvStore>(db_client_);
  auto startup_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config.store_timeout_ms);
  kv_store_->Ping(startup_deadline);
  kv_store_->EnsureSchema(startup_deadline);

  CredentialConfig credential_config;
  credential_config.secret = config.secret;
  credential_config.enforce_expiry = config.auth_enforce_expiry;
  auto validator = std::make_shared<CredentialValidator>(credential_config);
  auto registry = std::make_shared<RoomRegistry>(kv_store_, config.instance_id);
  auto policy = std::make_shared<QosPolicyEngine>();
  broker_service_ = std::make_shared<BrokerService>(validator, registry, policy);
  broker_service_->SetObservability(observability_);

  LogContext ctx;
  ctx.name = "store_connected";
  ctx.message = "instance=" + registry->InstanceId();
  observability_->Log(ctx);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, broker_service_, observability_);
    listener_->Run();
    signals_.async_wait([this](const boost::beast::error_code& ec, int /*signal*/) {
      if (ec) {
        return;
      }
      std::cout << "종료 신호 수신, 종료를 준비합니다\n";
      work_guard_.reset();
      listener_->Stop();
      ioc_.stop();
    });
    std::cout << "서버 시작: 포트 " << config_.port << "\n";
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
    Stop();
    throw;
  }
  Stop();
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  boost::beast::error_code ignored;
  signals_.cancel(ignored);
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

}  // namespace broker
