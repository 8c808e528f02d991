/*
 * 설명: HTTP 연결을 처리하고 세션 발급/검증/로그아웃 엔드포인트를 제공한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/e2e/session_http_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "dropguard/api_response.hpp"
#include "dropguard/config.hpp"
#include "dropguard/observability.hpp"
#include "dropguard/request_context.hpp"
#include "dropguard/session_protocol.hpp"

namespace dropguard {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<SessionProtocol> protocol, std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  // 세션 엔드포인트 분기. 경로가 맞지 않으면 false.
  bool RouteSessionRequest(const std::string& path, RequestContext& ctx, Response& res);
  void SendResponse(std::shared_ptr<Response> res);
  void WriteJson(Response& res, boost::beast::http::status status, const nlohmann::json& envelope);
  bool HasValidOpsToken() const;
  std::optional<std::string> RemoteIp();
  std::optional<std::string> UserAgent() const;

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<SessionProtocol> protocol_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
  std::optional<std::string> owner_id_;
};

}  // namespace dropguard
