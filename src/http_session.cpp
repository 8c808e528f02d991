/*
 * 설명: HTTP 요청을 세션 프로토콜 호출로 분기하고 오류를 상태 코드로 변환한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/e2e/session_http_flow_test.cpp
 */
#include "dropguard/http_session.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "dropguard/beast_cookie_jar.hpp"
#include "dropguard/errors.hpp"

namespace dropguard {

namespace {
const char* kServerName = "dropguard";

nlohmann::json RecordToPayload(const SessionRecord& record) {
  return nlohmann::json{{"ownerId", record.owner_id},
                        {"createdAt", ToUnixSeconds(record.created_at)},
                        {"lastActivityAt", ToUnixSeconds(record.last_activity_at)},
                        {"data", record.application_data}};
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<SessionProtocol> protocol, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), protocol_(std::move(protocol)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  owner_id_.reset();
  if (observability_) {
    observability_->IncrementRequest();
  }
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str.substr(0, target_str.find('?'));

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    WriteJson(*res, http::status::ok, MakeSuccessEnvelope(payload));
    return SendResponse(res);
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_ ? observability_->Snapshot() : MetricsSnapshot{};
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"sessions",
                         {{"logins", snapshot.logins},
                          {"rotations", snapshot.rotations},
                          {"rotationConflicts", snapshot.rotation_conflicts}}},
                        {"security",
                         {{"violations", snapshot.security_violations},
                          {"advisories", snapshot.security_advisories}}}};
    WriteJson(*res, http::status::ok, MakeSuccessEnvelope(data));
    return SendResponse(res);
  }

  BeastCookieJar cookies(req_, *res);
  RequestContext ctx{RemoteIp(), UserAgent(), cookies};
  try {
    if (!RouteSessionRequest(path, ctx, *res)) {
      WriteJson(*res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
    }
  } catch (const InvalidSessionError& ex) {
    if (ex.reason == InvalidSessionReason::kConcurrentRotation) {
      WriteJson(*res, http::status::conflict, MakeErrorEnvelope("rotation_conflict", ex.what()));
    } else {
      WriteJson(*res, http::status::unauthorized, MakeErrorEnvelope("invalid_session", ex.what()));
    }
  } catch (const SecurityViolationError& ex) {
    WriteJson(*res, http::status::forbidden,
              MakeErrorEnvelope("security_violation", ex.what(), nlohmann::json{{"warnings", ex.warnings}}));
  } catch (const SessionLimitError& ex) {
    WriteJson(*res, http::status::too_many_requests,
              MakeErrorEnvelope("session_limit", ex.what(), nlohmann::json{{"current", ex.current}, {"max", ex.max}}));
  } catch (const StoreUnavailableError& ex) {
    if (observability_) {
      observability_->LogEvent(LogLevel::kError, "store.unavailable", owner_id_, ex.what());
    }
    WriteJson(*res, http::status::service_unavailable,
              MakeErrorEnvelope("store_unavailable", "세션 저장소에 접근할 수 없습니다"));
  } catch (const nlohmann::json::exception&) {
    WriteJson(*res, http::status::bad_request, MakeErrorEnvelope("bad_request", "JSON 본문이 올바르지 않습니다"));
  } catch (const std::invalid_argument& ex) {
    WriteJson(*res, http::status::bad_request, MakeErrorEnvelope("bad_request", ex.what()));
  }
  SendResponse(res);
}

bool HttpSession::RouteSessionRequest(const std::string& path, RequestContext& ctx, Response& res) {
  using namespace boost::beast;

  if (req_.method() == http::verb::post && path == "/api/sessions") {
    // 자격 증명 확인은 상위 인증 서비스의 몫이다. 운영 토큰을 가진 호출자만 세션을 발급받는다.
    if (!HasValidOpsToken()) {
      WriteJson(res, http::status::unauthorized, MakeErrorEnvelope("unauthorized", "운영 토큰이 올바르지 않습니다"));
      return true;
    }
    auto body_json = nlohmann::json::parse(req_.body());
    if (!body_json.is_object() || !body_json.contains("ownerId") || !body_json["ownerId"].is_string()) {
      throw std::invalid_argument("ownerId 가 필요합니다");
    }
    nlohmann::json data = nlohmann::json::object();
    if (body_json.contains("data")) {
      if (!body_json["data"].is_object()) {
        throw std::invalid_argument("data 는 객체여야 합니다");
      }
      data = body_json["data"];
    }
    owner_id_ = body_json["ownerId"].get<std::string>();
    auto result = protocol_->Login(ctx, *owner_id_, data);
    nlohmann::json payload{{"ownerId", *owner_id_}, {"expiresIn", result.expires_in.count()}};
    WriteJson(res, http::status::created, MakeSuccessEnvelope(payload));
    return true;
  }

  if (req_.method() == http::verb::get && path == "/api/sessions/current") {
    auto presented = ctx.cookies.Get(protocol_->GetConfig().cookie_name);
    auto record = protocol_->Validate(ctx);
    owner_id_ = record.owner_id;
    auto payload = RecordToPayload(record);
    payload["rotated"] = presented.has_value() && *presented != record.session_id;
    WriteJson(res, http::status::ok, MakeSuccessEnvelope(payload));
    return true;
  }

  if (req_.method() == http::verb::put && path == "/api/sessions/current/data") {
    auto body_json = nlohmann::json::parse(req_.body());
    if (!body_json.is_object() || !body_json.contains("data") || !body_json["data"].is_object()) {
      throw std::invalid_argument("data 객체가 필요합니다");
    }
    if (!protocol_->UpdateApplicationData(ctx, body_json["data"])) {
      throw InvalidSessionError("Session not found or expired", InvalidSessionReason::kNotFound);
    }
    WriteJson(res, http::status::ok, MakeSuccessEnvelope(nlohmann::json{{"updated", true}}));
    return true;
  }

  if (req_.method() == http::verb::delete_ && path == "/api/sessions/current") {
    protocol_->Logout(ctx);
    WriteJson(res, http::status::ok, MakeSuccessEnvelope(nlohmann::json{{"loggedOut", true}, {"scope", "current"}}));
    return true;
  }

  if (req_.method() == http::verb::delete_ && path == "/api/sessions") {
    protocol_->LogoutAll(ctx);
    WriteJson(res, http::status::ok, MakeSuccessEnvelope(nlohmann::json{{"loggedOut", true}, {"scope", "all"}}));
    return true;
  }

  if (req_.method() == http::verb::get && path == "/api/sessions/count") {
    auto count = protocol_->GetActiveSessionCount(ctx);
    WriteJson(res, http::status::ok, MakeSuccessEnvelope(nlohmann::json{{"count", count}}));
    return true;
  }

  return false;
}

void HttpSession::WriteJson(Response& res, boost::beast::http::status status, const nlohmann::json& envelope) {
  res.result(status);
  res.body() = envelope.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  res.content_length(res.body().size());
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    auto status = static_cast<unsigned>(res->result_int());
    if (status >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    LogContext ctx;
    ctx.trace_id = trace_id_;
    ctx.owner_id = owner_id_;
    ctx.name = std::string(req_.method_string()) + " " + std::string(req_.target());
    ctx.latency_ms = static_cast<long>(latency);
    ctx.level = status >= 500 ? LogLevel::kError : LogLevel::kInfo;
    ctx.detail = std::to_string(status);
    observability_->Log(ctx);
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

bool HttpSession::HasValidOpsToken() const {
  auto header_it = req_.base().find("X-Ops-Token");
  std::string header_token = header_it == req_.base().end() ? std::string() : std::string(header_it->value());
  return !config_.ops_token.empty() && header_token == config_.ops_token;
}

std::optional<std::string> HttpSession::RemoteIp() {
  boost::beast::error_code ec;
  auto endpoint = stream_.socket().remote_endpoint(ec);
  if (ec) {
    return std::nullopt;
  }
  return endpoint.address().to_string();
}

std::optional<std::string> HttpSession::UserAgent() const {
  auto it = req_.find(boost::beast::http::field::user_agent);
  if (it == req_.end()) {
    return std::nullopt;
  }
  return std::string(it->value());
}

}  // namespace dropguard
