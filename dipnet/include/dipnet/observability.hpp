/*
 * 설명: 구조화 로그와 프로토콜 계층 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/unit/correlator_test.cpp, dipnet/tests/unit/dispatcher_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace dipnet {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

// 알 수 없는 값은 info로 취급한다.
LogLevel ParseLogLevel(std::string_view value);
std::string_view ToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::string name;
  std::optional<std::string> request_id;
  std::optional<std::string> game_id;
  std::optional<std::string> detail;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t requests_sent{0};
  std::uint64_t responses_matched{0};
  std::uint64_t request_errors{0};
  std::uint64_t timeouts{0};
  std::uint64_t unmatched_responses{0};
  std::uint64_t notifications_dispatched{0};
  std::uint64_t parse_errors{0};
  std::uint64_t connections_active{0};
};

class Observability {
 public:
  explicit Observability(LogLevel level = LogLevel::kInfo) : level_(static_cast<int>(level)) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementResponse();
  void IncrementError();
  void IncrementTimeout();
  void IncrementUnmatched();
  void IncrementNotification();
  void IncrementParseError();
  void SetConnectionsActive(std::uint64_t count);
  MetricsSnapshot Snapshot() const;

  void SetLevel(LogLevel level);
  bool Enabled(LogLevel level) const;
  void Log(LogLevel level, const LogContext& ctx) const;
  void Log(const LogContext& ctx) const { Log(LogLevel::kInfo, ctx); }

 private:
  std::atomic<std::uint64_t> requests_sent_{0};
  std::atomic<std::uint64_t> responses_matched_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> timeouts_{0};
  std::atomic<std::uint64_t> unmatched_responses_{0};
  std::atomic<std::uint64_t> notifications_dispatched_{0};
  std::atomic<std::uint64_t> parse_errors_{0};
  std::atomic<std::uint64_t> connections_active_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  std::atomic<int> level_;
  mutable std::mutex output_mutex_;
};

}  // namespace dipnet
