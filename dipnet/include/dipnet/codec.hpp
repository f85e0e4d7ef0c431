/*
 * 설명: 와이어 문서(JSON 텍스트 프레임)와 타입 메시지 사이의 인코딩/디코딩을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/unit/codec_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include <nlohmann/json.hpp>

#include "dipnet/errors.hpp"
#include "dipnet/messages.hpp"

namespace dipnet {

namespace detail {

class FieldWriter {
 public:
  explicit FieldWriter(nlohmann::json& out) : out_(out) {}

  template <typename T>
  void operator()(std::string_view key, const T& value, Presence /*presence*/ = Presence::kRequired) {
    out_[std::string(key)] = value;
  }

  template <typename T>
  void operator()(std::string_view key, const std::optional<T>& value, Presence /*presence*/ = Presence::kRequired) {
    if (value) {
      out_[std::string(key)] = *value;
    }
  }

 private:
  nlohmann::json& out_;
};

template <typename T>
struct IsVariant : std::false_type {};

template <typename... Ts>
struct IsVariant<std::variant<Ts...>> : std::true_type {};

}  // namespace detail

// 구체 메시지 타입 또는 Request/Response/Notification/Message 변형을 와이어 문서로 변환한다.
template <typename T>
nlohmann::json Encode(const T& message) {
  if constexpr (detail::IsVariant<T>::value) {
    return std::visit([](const auto& inner) { return Encode(inner); }, message);
  } else {
    nlohmann::json document = nlohmann::json::object();
    document["name"] = std::string(T::kName);
    detail::FieldWriter writer{document};
    T::Fields(message, writer);
    return document;
  }
}

// 문자열 필드가 올바른 UTF-8이 아니면 ParsingError.
template <typename T>
std::string EncodeText(const T& message) {
  try {
    return Encode(message).dump();
  } catch (const nlohmann::json::type_error& ex) {
    throw ParsingError(std::string("cannot encode message: ") + ex.what());
  }
}

// name 누락/형식 오류/선언되지 않은 필드는 ParsingError, 알 수 없는 name은 UnknownMessageError.
Message Decode(const nlohmann::json& document);
Message DecodeText(std::string_view text);

std::optional<MessageKind> KindOfName(std::string_view name);

}  // namespace dipnet
