/*
 * 설명: 환경 변수에서 클라이언트/프로토콜 더블 설정을 읽는다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 */
#include "dipnet/config.hpp"

#include <cstdlib>

namespace dipnet {
namespace {

std::string GetEnv(const char* key, const char* def) {
  const char* val = std::getenv(key);
  return val ? std::string{val} : std::string{def};
}

std::size_t GetEnvSize(const char* key, const char* def) {
  return static_cast<std::size_t>(std::stoul(GetEnv(key, def)));
}

}  // namespace

ClientConfig LoadClientConfigFromEnv() {
  ClientConfig cfg;
  cfg.host = GetEnv("DIPNET_HOST", "localhost");
  cfg.port = static_cast<unsigned short>(std::stoi(GetEnv("DIPNET_PORT", "8432")));
  cfg.target = GetEnv("DIPNET_TARGET", "/");
  cfg.request_timeout_ms = GetEnvSize("DIPNET_REQUEST_TIMEOUT_MS", "30000");
  cfg.connect_timeout_ms = GetEnvSize("DIPNET_CONNECT_TIMEOUT_MS", "10000");
  cfg.handler_threads = GetEnvSize("DIPNET_HANDLER_THREADS", "2");
  cfg.log_level = GetEnv("DIPNET_LOG_LEVEL", "info");
  return cfg;
}

FakeServerConfig LoadFakeServerConfigFromEnv() {
  FakeServerConfig cfg;
  cfg.host = GetEnv("FAKE_SERVER_HOST", "127.0.0.1");
  cfg.port = static_cast<unsigned short>(std::stoi(GetEnv("FAKE_SERVER_PORT", "8433")));
  cfg.queue_limit_messages = GetEnvSize("FAKE_SERVER_QUEUE_LIMIT_MESSAGES", "256");
  cfg.queue_limit_bytes = GetEnvSize("FAKE_SERVER_QUEUE_LIMIT_BYTES", "1048576");
  cfg.pbkdf2_iterations = GetEnvSize("FAKE_SERVER_PBKDF2_ITERATIONS", "1000");
  cfg.resent_cache_size = GetEnvSize("FAKE_SERVER_RESENT_CACHE", "256");
  cfg.worker_threads = GetEnvSize("FAKE_SERVER_THREADS", "2");
  cfg.log_level = GetEnv("DIPNET_LOG_LEVEL", "info");
  return cfg;
}

}  // namespace dipnet
