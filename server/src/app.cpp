/*
 * 설명: 서버 수명주기, 리스닝 스레드, 환경설정 로딩을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/it/mariadb_schedule_it_test.cpp
 */
#include "planner/app.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "planner/errors.hpp"
#include "planner/http_session.hpp"
#include "planner/mariadb_store.hpp"

namespace planner {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<ApiRouter> router, boost::asio::thread_pool& blocking_pool,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc),
        acceptor_(boost::asio::make_strand(ioc)),
        router_(std::move(router)),
        blocking_pool_(blocking_pool),
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

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->router_, self->blocking_pool_,
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
  std::shared_ptr<ApiRouter> router_;
  boost::asio::thread_pool& blocking_pool_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config),
      ioc_(1),
      work_guard_(boost::asio::make_work_guard(ioc_)),
      blocking_pool_(std::max<std::size_t>(1, config.worker_threads)),
      signals_(ioc_, SIGINT, SIGTERM) {
  observability_ = std::make_shared<Observability>(config.log_level == "debug");
  auto db_config = ToDbConfig(config);
  auto policy = ToRetryPolicy(config);
  supervisor_ = std::make_shared<ConnectionSupervisor>(
      [db_config]() -> std::shared_ptr<StorePool> { return MariaDbPool::Open(db_config); }, policy, observability_,
      RealSleep(), std::chrono::seconds(config.db_acquire_timeout_seconds));
  executor_ = std::make_shared<RetryExecutor>(supervisor_, policy, observability_);
  resolver_ = std::make_shared<UserResolver>(executor_);
  schedule_service_ = std::make_shared<ScheduleService>(executor_, resolver_);
  catalog_service_ = std::make_shared<CatalogService>(executor_);
  auth_service_ = std::make_shared<AuthService>(ToAuthConfig(config), executor_);
  router_ = std::make_shared<ApiRouter>(schedule_service_, resolver_, catalog_service_, auth_service_, executor_,
                                        observability_, config.cors_allow_origin);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    if (config_.db_bootstrap_schema) {
      BootstrapSchema();
    }
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, router_, blocking_pool_, observability_);
    listener_->Run();
    signals_.async_wait([this](const boost::beast::error_code& ec, int /*signal*/) {
      if (!ec) {
        std::cout << "종료 신호 수신, 서버를 멈춥니다\n";
        RequestStop();
      }
    });
    std::cout << "서버 시작: 포트 " << config_.port << ", DB " << config_.db_host << ":" << config_.db_port << "/"
              << config_.db_name << "\n";
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::BootstrapSchema() {
  // DB가 깨어나는 중이어도 기동은 계속한다. 첫 요청이 다시 연결을 시도한다.
  try {
    executor_->WithSessionRetry("schema.bootstrap", [](StoreSession& session) { session.EnsureSchema(); });
  } catch (const TransientConnectivityError& ex) {
    std::cerr << "스키마 초기화 보류(DB 연결 불가): " << ex.what() << "\n";
  } catch (const ConnectionError& ex) {
    if (!ex.transient_cause) {
      throw;
    }
    std::cerr << "스키마 초기화 보류(DB 연결 불가): " << ex.what() << "\n";
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::RequestStop() {
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  RequestStop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  blocking_pool_.join();
  supervisor_->Shutdown();
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "planner_db");
  cfg.db_pool_size = static_cast<std::size_t>(std::stoul(get_env("DB_POOL_SIZE", "10")));
  cfg.db_connect_timeout_seconds = static_cast<unsigned int>(std::stoul(get_env("DB_CONNECT_TIMEOUT_SECONDS", "30")));
  cfg.db_query_timeout_seconds = static_cast<unsigned int>(std::stoul(get_env("DB_QUERY_TIMEOUT_SECONDS", "30")));
  cfg.db_acquire_timeout_seconds = static_cast<std::size_t>(std::stoul(get_env("DB_ACQUIRE_TIMEOUT_SECONDS", "120")));
  cfg.db_bootstrap_schema = get_env("DB_BOOTSTRAP_SCHEMA", "1") != "0";
  cfg.retry_max_attempts = static_cast<std::size_t>(std::stoul(get_env("RETRY_MAX_ATTEMPTS", "5")));
  cfg.retry_initial_delay_ms = static_cast<std::size_t>(std::stoul(get_env("RETRY_INITIAL_DELAY_MS", "2000")));
  cfg.retry_multiplier = std::stod(get_env("RETRY_MULTIPLIER", "2"));
  cfg.retry_max_delay_ms = static_cast<std::size_t>(std::stoul(get_env("RETRY_MAX_DELAY_MS", "30000")));
  cfg.worker_threads = static_cast<std::size_t>(std::stoul(get_env("WORKER_THREADS", "16")));
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.auth_token_ttl_seconds = static_cast<std::size_t>(std::stoul(get_env("AUTH_TOKEN_TTL_SECONDS", "3600")));
  cfg.login_rate_window_seconds = static_cast<std::size_t>(std::stoul(get_env("LOGIN_RATE_LIMIT_WINDOW", "60")));
  cfg.login_rate_limit_max = static_cast<std::size_t>(std::stoul(get_env("LOGIN_RATE_LIMIT_MAX", "5")));
  cfg.cors_allow_origin = get_env("CORS_ALLOW_ORIGIN", "*");
  return cfg;
}

DbConfig ToDbConfig(const AppConfig& config) {
  DbConfig db;
  db.host = config.db_host;
  db.port = config.db_port;
  db.user = config.db_user;
  db.password = config.db_password;
  db.database = config.db_name;
  db.pool_size = config.db_pool_size;
  db.connect_timeout_seconds = config.db_connect_timeout_seconds;
  db.query_timeout_seconds = config.db_query_timeout_seconds;
  return db;
}

RetryPolicy ToRetryPolicy(const AppConfig& config) {
  RetryPolicy policy;
  policy.max_attempts = config.retry_max_attempts;
  policy.initial_delay = std::chrono::milliseconds(config.retry_initial_delay_ms);
  policy.multiplier = config.retry_multiplier;
  policy.max_delay = std::chrono::milliseconds(config.retry_max_delay_ms);
  return policy;
}

AuthConfig ToAuthConfig(const AppConfig& config) {
  AuthConfig auth;
  auth.token_ttl = std::chrono::seconds(config.auth_token_ttl_seconds);
  auth.login_window = std::chrono::seconds(config.login_rate_window_seconds);
  auth.login_max_attempts = config.login_rate_limit_max;
  return auth;
}

}  // namespace planner
