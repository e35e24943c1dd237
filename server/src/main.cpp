/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다. SIGINT/SIGTERM은 ServerApp이 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "planner/app.hpp"

int main() {
  using namespace planner;
  AppConfig config = LoadConfigFromEnv();
  ServerApp app(config);
  app.Run();
  return 0;
}
