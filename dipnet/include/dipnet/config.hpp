/*
 * 설명: 클라이언트와 프로토콜 더블 서버의 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/unit/config_test.cpp, dipnet/tests/e2e/client_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace dipnet {

struct ClientConfig {
  std::string host{"localhost"};
  unsigned short port{8432};
  std::string target{"/"};
  std::size_t request_timeout_ms{30000};
  std::size_t connect_timeout_ms{10000};
  std::size_t handler_threads{2};
  std::string log_level{"info"};
};

struct FakeServerConfig {
  std::string host{"127.0.0.1"};
  unsigned short port{8433};
  std::size_t queue_limit_messages{256};
  std::size_t queue_limit_bytes{1024 * 1024};
  std::size_t pbkdf2_iterations{1000};
  std::size_t resent_cache_size{256};
  std::size_t worker_threads{2};
  std::string log_level{"info"};
};

ClientConfig LoadClientConfigFromEnv();
FakeServerConfig LoadFakeServerConfigFromEnv();

}  // namespace dipnet
