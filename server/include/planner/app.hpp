/*
 * 설명: 서버 전체 수명주기와 저장소/서비스 구성을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_schedule_it_test.cpp
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
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>

#include "planner/api_router.hpp"
#include "planner/auth.hpp"
#include "planner/catalog_service.hpp"
#include "planner/config.hpp"
#include "planner/connection_supervisor.hpp"
#include "planner/observability.hpp"
#include "planner/retry_executor.hpp"
#include "planner/schedule_service.hpp"
#include "planner/user_resolver.hpp"

namespace planner {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<ApiRouter> GetRouter() { return router_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void BootstrapSchema();
  void RunWorkers();
  void RequestStop();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::thread_pool blocking_pool_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<ConnectionSupervisor> supervisor_;
  std::shared_ptr<RetryExecutor> executor_;
  std::shared_ptr<UserResolver> resolver_;
  std::shared_ptr<ScheduleService> schedule_service_;
  std::shared_ptr<CatalogService> catalog_service_;
  std::shared_ptr<AuthService> auth_service_;
  std::shared_ptr<ApiRouter> router_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace planner
