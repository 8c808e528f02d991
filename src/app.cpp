/*
 * 설명: 서버 수명주기와 리스닝 스레드, 만료 세션 정리 타이머를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/e2e/session_http_flow_test.cpp
 */
#include "dropguard/app.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "dropguard/db_client.hpp"
#include "dropguard/errors.hpp"
#include "dropguard/http_session.hpp"
#include "dropguard/mariadb_session_store.hpp"
#include "dropguard/memory_session_store.hpp"

namespace dropguard {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<SessionProtocol> protocol, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), protocol_(std::move(protocol)),
        observability_(std::move(observability)) {
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

  unsigned short Port() const {
    boost::beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->protocol_, self->observability_)
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
  std::shared_ptr<SessionProtocol> protocol_;
  std::shared_ptr<Observability> observability_;
};

std::shared_ptr<SessionStore> MakeSessionStore(const AppConfig& config) {
  if (config.session_store == "memory") {
    return std::make_shared<MemorySessionStore>();
  }
  if (config.session_store == "mariadb") {
    DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
    auto store = std::make_shared<MariaDbSessionStore>(std::make_shared<MariaDbClient>(db_config));
    store->EnsureSchema();
    return store;
  }
  throw std::invalid_argument("알 수 없는 SESSION_STORE: " + config.session_store);
}

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<SessionStore> store,
                     std::shared_ptr<Observability> observability)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)), purge_timer_(ioc_),
      observability_(std::move(observability)), store_(std::move(store)) {
  if (!observability_) {
    observability_ = std::make_shared<Observability>(ParseLogLevel(config_.log_level));
  }
  if (!store_) {
    store_ = MakeSessionStore(config_);
  }
  protocol_ = std::make_shared<SessionProtocol>(store_, config_.protocol, observability_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, protocol_, observability_);
    listener_->Run();
    SchedulePurge();
    observability_->LogEvent(LogLevel::kInfo, "server.start", std::nullopt,
                             "port=" + std::to_string(listener_->Port()) + " store=" + config_.session_store);
    RunWorkers();
    // workers_ 가 채워진 뒤에만 포트를 공개한다.
    bound_port_ = listener_->Port();
    RunEventLoop();
  } catch (const std::exception& ex) {
    observability_->LogEvent(LogLevel::kError, "server.failure", std::nullopt, ex.what());
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { RunEventLoop(); });
  }
}

// 핸들러에서 빠져나온 예외는 기록하고 이벤트 루프를 다시 돈다.
void ServerApp::RunEventLoop() {
  for (;;) {
    try {
      ioc_.run();
      return;
    } catch (const std::exception& ex) {
      observability_->LogEvent(LogLevel::kError, "server.handler_failure", std::nullopt, ex.what());
    }
  }
}

void ServerApp::SchedulePurge() {
  if (config_.purge_interval_seconds == 0) {
    return;
  }
  purge_timer_.expires_after(std::chrono::seconds(config_.purge_interval_seconds));
  purge_timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || !running_) {
      return;
    }
    try {
      auto removed = store_->PurgeExpired();
      if (removed > 0) {
        observability_->LogEvent(LogLevel::kDebug, "store.purge", std::nullopt,
                                 "removed=" + std::to_string(removed));
      }
    } catch (const StoreUnavailableError& ex) {
      observability_->LogEvent(LogLevel::kWarn, "store.purge_failed", std::nullopt, ex.what());
    }
    SchedulePurge();
  });
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
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

}  // namespace dropguard
