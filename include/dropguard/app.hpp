/*
 * 설명: HTTP 호스트 전체 수명주기(리스너, 저장소 선택, 만료 정리 타이머, 워커)를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/e2e/session_http_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include "dropguard/config.hpp"
#include "dropguard/observability.hpp"
#include "dropguard/session_protocol.hpp"
#include "dropguard/session_store.hpp"

namespace dropguard {

class Listener;

// SESSION_STORE 에 따라 저장소를 만든다. memory | mariadb 외의 값은 std::invalid_argument.
std::shared_ptr<SessionStore> MakeSessionStore(const AppConfig& config);

class ServerApp {
 public:
  // store 가 비어 있으면 설정으로 저장소를 만든다.
  explicit ServerApp(const AppConfig& config, std::shared_ptr<SessionStore> store = nullptr,
                     std::shared_ptr<Observability> observability = nullptr);
  ~ServerApp();

  // 블로킹. Stop() 이 불릴 때까지 반환하지 않는다.
  void Run();
  void Stop();

  // 리스너가 바인드되기 전에는 0. 설정 포트가 0 이면 실제 할당된 포트를 돌려준다.
  unsigned short BoundPort() const { return bound_port_.load(); }

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<SessionStore> GetStore() { return store_; }
  std::shared_ptr<SessionProtocol> GetProtocol() { return protocol_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();
  void RunEventLoop();
  void SchedulePurge();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::steady_timer purge_timer_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<SessionStore> store_;
  std::shared_ptr<SessionProtocol> protocol_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
  std::atomic<unsigned short> bound_port_{0};
};

}  // namespace dropguard
