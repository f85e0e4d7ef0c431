/*
 * 설명: 메시지 변형의 이름/종류/범위/요청 ID 접근 헬퍼를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/unit/codec_test.cpp
 */
#include "dipnet/messages.hpp"

#include <type_traits>
#include <utility>

namespace dipnet {

std::string_view NameOf(const Request& request) {
  return std::visit([](const auto& inner) { return std::decay_t<decltype(inner)>::kName; }, request);
}

std::string_view NameOf(const Response& response) {
  return std::visit([](const auto& inner) { return std::decay_t<decltype(inner)>::kName; }, response);
}

std::string_view NameOf(const Notification& notification) {
  return std::visit([](const auto& inner) { return std::decay_t<decltype(inner)>::kName; }, notification);
}

std::string_view NameOf(const Message& message) {
  return std::visit([](const auto& group) { return NameOf(group); }, message);
}

MessageKind KindOf(const Message& message) {
  switch (message.index()) {
    case 0:
      return MessageKind::kRequest;
    case 1:
      return MessageKind::kResponse;
    default:
      return MessageKind::kNotification;
  }
}

RequestScope ScopeOf(const Request& request) {
  return std::visit([](const auto& inner) { return std::decay_t<decltype(inner)>::kScope; }, request);
}

const std::string& RequestIdOf(const Request& request) {
  return std::visit([](const auto& inner) -> const std::string& { return inner.request_id; }, request);
}

const std::string& RequestIdOf(const Response& response) {
  return std::visit([](const auto& inner) -> const std::string& { return inner.request_id; }, response);
}

void SetRequestId(Request& request, std::string request_id) {
  std::visit([&request_id](auto& inner) { inner.request_id = std::move(request_id); }, request);
}

void MarkResent(Request& request) {
  std::visit([](auto& inner) { inner.re_sent = true; }, request);
}

bool IsResent(const Request& request) {
  return std::visit([](const auto& inner) { return inner.re_sent; }, request);
}

std::string_view ToString(RequestScope scope) {
  switch (scope) {
    case RequestScope::kConnection:
      return "connection";
    case RequestScope::kChannel:
      return "channel";
    case RequestScope::kGame:
      return "game";
  }
  return "unknown";
}

}  // namespace dipnet
