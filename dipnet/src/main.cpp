/*
 * 설명: 프로토콜 더블 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/e2e/client_flow_test.cpp
 */
#include <iostream>
#include <memory>

#include "dipnet/config.hpp"
#include "dipnet/fake_server.hpp"
#include "dipnet/fake_server_host.hpp"
#include "dipnet/observability.hpp"

int main() {
  using namespace dipnet;
  try {
    FakeServerConfig config = LoadFakeServerConfigFromEnv();
    auto observability = std::make_shared<Observability>(ParseLogLevel(config.log_level));

    FakeServerOptions options;
    options.accounts.pbkdf2_iterations = config.pbkdf2_iterations;
    options.resent_cache_size = config.resent_cache_size;
    auto server = std::make_shared<FakeServer>(options, observability);

    FakeServerHost host(config, server, observability);
    host.Run();
  } catch (const std::exception& ex) {
    std::cerr << "프로토콜 더블 실행 중 예외: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
