/*
 * 설명: 구조화 로그와 프로토콜 계층 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 */
#include "dipnet/observability.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace dipnet {

LogLevel ParseLogLevel(std::string_view value) {
  std::string lowered(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "debug") {
    return LogLevel::kDebug;
  }
  if (lowered == "warn" || lowered == "warning") {
    return LogLevel::kWarn;
  }
  if (lowered == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { requests_sent_.fetch_add(1); }

void Observability::IncrementResponse() { responses_matched_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementTimeout() { timeouts_.fetch_add(1); }

void Observability::IncrementUnmatched() { unmatched_responses_.fetch_add(1); }

void Observability::IncrementNotification() { notifications_dispatched_.fetch_add(1); }

void Observability::IncrementParseError() { parse_errors_.fetch_add(1); }

void Observability::SetConnectionsActive(std::uint64_t count) { connections_active_.store(count); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.requests_sent = requests_sent_.load();
  snapshot.responses_matched = responses_matched_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.timeouts = timeouts_.load();
  snapshot.unmatched_responses = unmatched_responses_.load();
  snapshot.notifications_dispatched = notifications_dispatched_.load();
  snapshot.parse_errors = parse_errors_.load();
  snapshot.connections_active = connections_active_.load();
  return snapshot;
}

void Observability::SetLevel(LogLevel level) { level_.store(static_cast<int>(level)); }

bool Observability::Enabled(LogLevel level) const { return static_cast<int>(level) >= level_.load(); }

void Observability::Log(LogLevel level, const LogContext& ctx) const {
  if (!Enabled(level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = std::string(ToString(level));
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.request_id) {
    log_json["requestId"] = *ctx.request_id;
  }
  if (ctx.game_id) {
    log_json["gameId"] = *ctx.game_id;
  }
  if (ctx.detail) {
    log_json["detail"] = *ctx.detail;
  }
  // 여러 스레드(수신 루프, 핸들러 풀, 호출자)의 로그 줄이 섞이지 않도록 직렬화한다.
  std::lock_guard<std::mutex> lock(output_mutex_);
  auto& out = level >= LogLevel::kWarn ? std::cerr : std::cout;
  out << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

}  // namespace dipnet
