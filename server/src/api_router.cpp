/*
 * 설명: REST 경로 분기. 서비스 예외는 한 곳에서 상태 코드와 에러 엔벨로프로 바뀐다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/api_router_test.cpp
 */
#include "planner/api_router.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <utility>
#include <vector>

#include "planner/api_response.hpp"
#include "planner/errors.hpp"

namespace planner {

namespace http = boost::beast::http;

namespace {
constexpr const char* kAllowMethods = "GET, POST, PUT, DELETE, OPTIONS";
constexpr const char* kAllowHeaders = "Content-Type, Authorization";
constexpr const char* kSchedulesPrefix = "/api/schedules/";
constexpr const char* kUserSchedulesPrefix = "/api/schedules/user/";
constexpr const char* kCoursesPrefix = "/api/courses/";

bool StartsWith(const std::string& text, const std::string& prefix) {
  return text.size() > prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

std::string UrlDecode(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < text.size() && std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
               std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
      out.push_back(static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16)));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(UrlDecode(pair.substr(0, eq)), UrlDecode(pair.substr(eq + 1)));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::size_t ParseSizeParam(const std::unordered_map<std::string, std::string>& params, const std::string& key,
                           std::size_t fallback) {
  auto it = params.find(key);
  if (it == params.end() || it->second.empty()) {
    return fallback;
  }
  const auto& value = it->second;
  if (value.size() > 9 ||
      !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
    throw ValidationError(key + " 값이 올바르지 않습니다");
  }
  return static_cast<std::size_t>(std::stoul(value));
}

RowId ParseRowIdOrThrow(const std::string& text) {
  auto id = UserResolver::ParseUserId(text);
  if (!id) {
    throw ValidationError("id 형식이 올바르지 않습니다: " + text);
  }
  return *id;
}

nlohmann::json ParseBody(const HttpRequest& req) {
  auto body = nlohmann::json::parse(req.body(), nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    throw ValidationError("JSON 본문이 올바르지 않습니다");
  }
  return body;
}

std::optional<std::string> StringField(const nlohmann::json& body, const char* key) {
  auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    return std::nullopt;
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  if (it->is_number_integer()) {
    return it->dump();
  }
  throw ValidationError(std::string(key) + " 형식이 올바르지 않습니다");
}

std::vector<CourseInput> ParseCourses(const nlohmann::json& body) {
  auto it = body.find("courses");
  if (it == body.end() || !it->is_array()) {
    throw ValidationError("courses 배열이 필요합니다");
  }
  std::vector<CourseInput> courses;
  courses.reserve(it->size());
  for (const auto& item : *it) {
    courses.push_back(ParseCourseInput(item));
  }
  return courses;
}

nlohmann::json AuthUserJson(const AuthUser& user) {
  return {{"userId", user.user_id},
          {"email", user.email},
          {"name", user.name},
          {"studentId", user.student_id ? nlohmann::json(*user.student_id) : nlohmann::json(nullptr)},
          {"role", ToString(user.role)}};
}

std::string ParseBearer(const std::string& header_value) {
  const std::string prefix = "Bearer ";
  if (header_value.size() <= prefix.size()) {
    return "";
  }
  if (header_value.compare(0, prefix.size(), prefix) != 0) {
    return "";
  }
  return header_value.substr(prefix.size());
}
}  // namespace

ApiRouter::ApiRouter(std::shared_ptr<ScheduleService> schedules, std::shared_ptr<UserResolver> resolver,
                     std::shared_ptr<CatalogService> catalog, std::shared_ptr<AuthService> auth,
                     std::shared_ptr<RetryExecutor> executor, std::shared_ptr<Observability> observability,
                     std::string cors_origin)
    : schedules_(std::move(schedules)),
      resolver_(std::move(resolver)),
      catalog_(std::move(catalog)),
      auth_(std::move(auth)),
      executor_(std::move(executor)),
      observability_(std::move(observability)),
      cors_origin_(std::move(cors_origin)) {}

HttpResponse ApiRouter::Handle(const HttpRequest& req, const std::string& remote_ip) const {
  std::string target = std::string(req.target());
  std::string path = target;
  std::string query;
  auto qpos = target.find('?');
  if (qpos != std::string::npos) {
    path = target.substr(0, qpos);
    query = target.substr(qpos + 1);
  }

  try {
    return Dispatch(req, path, query, remote_ip);
  } catch (const ValidationError& e) {
    return MakeError(req, http::status::bad_request, "validation_error", e.what());
  } catch (const NotFoundError& e) {
    return MakeError(req, http::status::not_found, "not_found", e.what());
  } catch (const ConstraintViolation& e) {
    return MakeError(req, http::status::conflict, "conflict", e.what());
  } catch (const TransientConnectivityError& e) {
    return MakeError(req, http::status::service_unavailable, "db_unavailable", e.what());
  } catch (const ConnectionError& e) {
    return MakeError(req, http::status::service_unavailable, "db_unavailable", e.what());
  } catch (const StoreError& e) {
    return MakeError(req, http::status::internal_server_error, "persistence_error", e.what());
  } catch (const std::exception& e) {
    return MakeError(req, http::status::internal_server_error, "internal_error", e.what());
  }
}

HttpResponse ApiRouter::Dispatch(const HttpRequest& req, const std::string& path, const std::string& query,
                                 const std::string& remote_ip) const {
  const auto method = req.method();

  if (method == http::verb::options) {
    return MakeResponse(req, http::status::no_content, nullptr);
  }
  if (method == http::verb::get && path == "/api/health") {
    return HandleHealth(req);
  }
  if (method == http::verb::get && path == "/metrics") {
    return HandleMetrics(req);
  }
  if (method == http::verb::get && path == "/api/courses") {
    return HandleListCourses(req, query);
  }
  if (method == http::verb::get && StartsWith(path, kCoursesPrefix)) {
    return HandleGetCourse(req, path.substr(std::char_traits<char>::length(kCoursesPrefix)));
  }
  if (method == http::verb::post && path == "/api/auth/signup") {
    return HandleSignup(req);
  }
  if (method == http::verb::post && path == "/api/auth/login") {
    return HandleLogin(req, remote_ip);
  }
  if (method == http::verb::post && path == "/api/auth/logout") {
    return HandleLogout(req);
  }
  if (method == http::verb::post && path == "/api/users") {
    return HandleResolveUser(req);
  }
  if (method == http::verb::post && path == "/api/schedules") {
    return HandleCreateSchedule(req);
  }
  if (method == http::verb::get && StartsWith(path, kUserSchedulesPrefix)) {
    return HandleUserSchedules(req, UrlDecode(path.substr(std::char_traits<char>::length(kUserSchedulesPrefix))));
  }
  if (StartsWith(path, kSchedulesPrefix)) {
    auto id_text = path.substr(std::char_traits<char>::length(kSchedulesPrefix));
    if (method == http::verb::get) {
      return HandleScheduleDetails(req, id_text);
    }
    if (method == http::verb::put) {
      return HandleUpdateSchedule(req, id_text);
    }
    if (method == http::verb::delete_) {
      return HandleDeleteSchedule(req, id_text);
    }
  }
  return MakeError(req, http::status::not_found, "not_found", "지원되지 않는 경로입니다");
}

HttpResponse ApiRouter::HandleHealth(const HttpRequest& req) const {
  std::string database = "connected";
  try {
    executor_->WithSessionRetry("health.ping", [](StoreSession& session) { session.Ping(); });
  } catch (const StoreError& e) {
    database = std::string("disconnected: ") + e.what();
  }
  nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}, {"database", database}};
  return MakeResponse(req, http::status::ok, MakeSuccessEnvelope(payload));
}

HttpResponse ApiRouter::HandleMetrics(const HttpRequest& req) const {
  auto snapshot = observability_->Snapshot();
  nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                      {"db",
                       {{"connectAttempts", snapshot.connect_attempts},
                        {"reconnects", snapshot.reconnects},
                        {"retries", snapshot.retries},
                        {"transientFailures", snapshot.transient_failures}}}};
  return MakeResponse(req, http::status::ok, MakeSuccessEnvelope(data));
}

HttpResponse ApiRouter::HandleListCourses(const HttpRequest& req, const std::string& query) const {
  auto params = ParseQueryParams(query);
  auto q_it = params.find("q");
  std::string text = q_it == params.end() ? std::string() : q_it->second;
  auto page = ParseSizeParam(params, "page", 1);
  auto size = ParseSizeParam(params, "size", 20);
  auto result = catalog_->ListCourses(text, page, size);

  nlohmann::json entries = nlohmann::json::array();
  for (const auto& course : result.entries) {
    entries.push_back(ToJson(course));
  }
  nlohmann::json data{{"page", page}, {"size", size}, {"total", result.total}, {"entries", entries}};
  return MakeResponse(req, http::status::ok, MakeSuccessEnvelope(data));
}

HttpResponse ApiRouter::HandleGetCourse(const HttpRequest& req, const std::string& id_text) const {
  auto course = catalog_->GetCourse(ParseRowIdOrThrow(id_text));
  return MakeResponse(req, http::status::ok, MakeSuccessEnvelope(ToJson(course)));
}

HttpResponse ApiRouter::HandleSignup(const HttpRequest& req) const {
  auto body = ParseBody(req);
  auto user = auth_->Register(StringField(body, "email").value_or(""), StringField(body, "password").value_or(""),
                              StringField(body, "name").value_or(""), StringField(body, "studentId"));
  return MakeResponse(req, http::status::created, MakeSuccessEnvelope(AuthUserJson(user)));
}

HttpResponse ApiRouter::HandleLogin(const HttpRequest& req, const std::string& remote_ip) const {
  auto body = ParseBody(req);
  auto email = StringField(body, "email");
  auto password = StringField(body, "password");
  if (!email || !password) {
    throw ValidationError("email과 password가 필요합니다");
  }
  std::string error_code;
  std::string error_message;
  auto session = auth_->Login(*email, *password, remote_ip, error_code, error_message);
  if (!session) {
    auto status = error_code == "rate_limited" ? http::status::too_many_requests : http::status::unauthorized;
    return MakeError(req, status, error_code, error_message);
  }
  nlohmann::json data{{"token", session->token},
                      {"expiresAt", FormatTimestamp(session->expires_at)},
                      {"user", AuthUserJson(session->user)}};
  return MakeResponse(req, http::status::ok, MakeSuccessEnvelope(data));
}

HttpResponse ApiRouter::HandleLogout(const HttpRequest& req) const {
  auto session = ExtractAuthSession(req);
  if (!session) {
    return MakeError(req, http::status::unauthorized, "unauthorized", "인증이 필요합니다");
  }
  auth_->Logout(session->token);
  return MakeResponse(req, http::status::ok, MakeSuccessEnvelope({{"loggedOut", true}}));
}

HttpResponse ApiRouter::HandleResolveUser(const HttpRequest& req) const {
  auto body = ParseBody(req);
  auto hints = ParseUserHints(body);
  auto identifier = StringField(body, "userId");
  if (!identifier) {
    identifier = hints.email;
  }
  if (!identifier) {
    throw ValidationError("email 또는 userId가 필요합니다");
  }
  RowId user_id = resolver_->ResolveUser(*identifier, hints);
  return MakeResponse(req, http::status::ok, MakeSuccessEnvelope({{"userId", user_id}}));
}

HttpResponse ApiRouter::HandleCreateSchedule(const HttpRequest& req) const {
  auto body = ParseBody(req);
  auto identifier = StringField(body, "userId");
  if (!identifier) {
    throw ValidationError("userId가 필요합니다");
  }
  UserHints hints;
  auto user_it = body.find("user");
  if (user_it != body.end()) {
    hints = ParseUserHints(*user_it);
  }
  auto result = schedules_->CreateSchedule(*identifier, StringField(body, "scheduleName"), ParseCourses(body), hints);
  return MakeResponse(req, http::status::created, MakeSuccessEnvelope(ToJson(result)));
}

HttpResponse ApiRouter::HandleUserSchedules(const HttpRequest& req, const std::string& identifier) const {
  nlohmann::json entries = nlohmann::json::array();
  for (const auto& summary : schedules_->GetUserSchedules(identifier)) {
    entries.push_back(ToJson(summary));
  }
  return MakeResponse(req, http::status::ok, MakeSuccessEnvelope(entries));
}

HttpResponse ApiRouter::HandleScheduleDetails(const HttpRequest& req, const std::string& id_text) const {
  auto details = schedules_->GetScheduleDetails(ParseRowIdOrThrow(id_text));
  return MakeResponse(req, http::status::ok, MakeSuccessEnvelope(ToJson(details)));
}

HttpResponse ApiRouter::HandleUpdateSchedule(const HttpRequest& req, const std::string& id_text) const {
  RowId schedule_id = ParseRowIdOrThrow(id_text);
  auto body = ParseBody(req);
  auto result = schedules_->UpdateSchedule(schedule_id, ParseCourses(body), StringField(body, "scheduleName"));
  return MakeResponse(req, http::status::ok, MakeSuccessEnvelope(ToJson(result)));
}

HttpResponse ApiRouter::HandleDeleteSchedule(const HttpRequest& req, const std::string& id_text) const {
  RowId schedule_id = ParseRowIdOrThrow(id_text);
  schedules_->DeleteSchedule(schedule_id);
  return MakeResponse(req, http::status::ok, MakeSuccessEnvelope({{"deleted", true}, {"scheduleId", schedule_id}}));
}

HttpResponse ApiRouter::MakeResponse(const HttpRequest& req, http::status status,
                                     const nlohmann::json& envelope) const {
  HttpResponse res;
  res.version(req.version());
  res.result(status);
  res.set(http::field::server, "planner");
  res.set(http::field::content_type, "application/json; charset=utf-8");
  res.set(http::field::access_control_allow_origin, cors_origin_);
  res.set(http::field::access_control_allow_methods, kAllowMethods);
  res.set(http::field::access_control_allow_headers, kAllowHeaders);
  res.keep_alive(false);
  if (!envelope.is_null()) {
    // 대상 경로의 잘못된 UTF-8 바이트가 메시지에 섞여도 직렬화는 실패하지 않는다.
    res.body() = envelope.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  }
  res.prepare_payload();
  return res;
}

HttpResponse ApiRouter::MakeError(const HttpRequest& req, http::status status, const std::string& code,
                                  const std::string& message) const {
  return MakeResponse(req, status, MakeErrorEnvelope(code, message));
}

std::optional<AuthSession> ApiRouter::ExtractAuthSession(const HttpRequest& req) const {
  auto auth_it = req.find(http::field::authorization);
  if (auth_it == req.end()) {
    return std::nullopt;
  }
  auto token = ParseBearer(std::string(auth_it->value()));
  if (token.empty()) {
    return std::nullopt;
  }
  return auth_->ValidateToken(token);
}

}  // namespace planner
