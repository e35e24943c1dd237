/*
 * 설명: REST 경로 분기와 저장소 예외 → HTTP 상태 매핑. 소켓과 무관하게 요청 하나를 응답 하나로 바꾼다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/api_router_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "planner/auth.hpp"
#include "planner/catalog_service.hpp"
#include "planner/observability.hpp"
#include "planner/retry_executor.hpp"
#include "planner/schedule_service.hpp"
#include "planner/user_resolver.hpp"

namespace planner {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

class ApiRouter {
 public:
  ApiRouter(std::shared_ptr<ScheduleService> schedules, std::shared_ptr<UserResolver> resolver,
            std::shared_ptr<CatalogService> catalog, std::shared_ptr<AuthService> auth,
            std::shared_ptr<RetryExecutor> executor, std::shared_ptr<Observability> observability,
            std::string cors_origin);

  HttpResponse Handle(const HttpRequest& req, const std::string& remote_ip) const;

 private:
  HttpResponse Dispatch(const HttpRequest& req, const std::string& path, const std::string& query,
                        const std::string& remote_ip) const;

  HttpResponse HandleHealth(const HttpRequest& req) const;
  HttpResponse HandleMetrics(const HttpRequest& req) const;
  HttpResponse HandleListCourses(const HttpRequest& req, const std::string& query) const;
  HttpResponse HandleGetCourse(const HttpRequest& req, const std::string& id_text) const;
  HttpResponse HandleSignup(const HttpRequest& req) const;
  HttpResponse HandleLogin(const HttpRequest& req, const std::string& remote_ip) const;
  HttpResponse HandleLogout(const HttpRequest& req) const;
  HttpResponse HandleResolveUser(const HttpRequest& req) const;
  HttpResponse HandleCreateSchedule(const HttpRequest& req) const;
  HttpResponse HandleUserSchedules(const HttpRequest& req, const std::string& identifier) const;
  HttpResponse HandleScheduleDetails(const HttpRequest& req, const std::string& id_text) const;
  HttpResponse HandleUpdateSchedule(const HttpRequest& req, const std::string& id_text) const;
  HttpResponse HandleDeleteSchedule(const HttpRequest& req, const std::string& id_text) const;

  HttpResponse MakeResponse(const HttpRequest& req, boost::beast::http::status status,
                            const nlohmann::json& envelope) const;
  HttpResponse MakeError(const HttpRequest& req, boost::beast::http::status status, const std::string& code,
                         const std::string& message) const;
  std::optional<AuthSession> ExtractAuthSession(const HttpRequest& req) const;

  std::shared_ptr<ScheduleService> schedules_;
  std::shared_ptr<UserResolver> resolver_;
  std::shared_ptr<CatalogService> catalog_;
  std::shared_ptr<AuthService> auth_;
  std::shared_ptr<RetryExecutor> executor_;
  std::shared_ptr<Observability> observability_;
  std::string cors_origin_;
};

}  // namespace planner
