/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/e2e/session_http_flow_test.cpp
 */
#include <iostream>
#include <stdexcept>

#include <boost/asio/signal_set.hpp>

#include "dropguard/app.hpp"
#include "dropguard/errors.hpp"

int main() {
  using namespace dropguard;
  try {
    AppConfig config = LoadConfigFromEnv();
    ServerApp app(config);

    boost::asio::signal_set signals(app.GetContext(), SIGINT, SIGTERM);
    signals.async_wait([&app](const boost::system::error_code& ec, int /*signal*/) {
      if (!ec) {
        app.GetObservability()->LogEvent(LogLevel::kInfo, "server.shutdown", std::nullopt, "signal received");
        app.GetContext().stop();
      }
    });

    app.Run();
  } catch (const std::invalid_argument& ex) {
    std::cerr << "설정 오류: " << ex.what() << "\n";
    return 2;
  } catch (const std::out_of_range& ex) {
    std::cerr << "설정 값 범위 오류: " << ex.what() << "\n";
    return 2;
  } catch (const StoreUnavailableError& ex) {
    std::cerr << "세션 저장소 연결 실패: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
