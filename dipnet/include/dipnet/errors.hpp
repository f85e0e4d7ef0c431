/*
 * 설명: 프로토콜 계층의 오류 분류(파싱/인증/전제조건/서버/타임아웃/연결 종료)를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/unit/codec_test.cpp, dipnet/tests/unit/correlator_test.cpp,
 *         dipnet/tests/e2e/client_flow_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "dipnet/messages.hpp"

namespace dipnet {

// 서버가 error 응답에 싣는 error_type 값.
inline constexpr std::string_view kAuthenticationErrorType = "AUTHENTICATION_ERROR";
inline constexpr std::string_view kGameNotFoundErrorType = "GAME_NOT_FOUND";
inline constexpr std::string_view kUnsupportedRequestErrorType = "UNSUPPORTED_REQUEST";
inline constexpr std::string_view kParsingErrorType = "PARSING_ERROR";
inline constexpr std::string_view kGameErrorType = "GAME_ERROR";

enum class ErrorKind {
  kParsing,
  kUnknownMessage,
  kAuthentication,
  kPrecondition,
  kServer,
  kGameNotFound,
  kUnsupportedRequest,
  kUnexpectedResponse,
  kTimeout,
  kConnectionClosed,
};

std::string_view ToString(ErrorKind kind);

class ProtocolError : public std::runtime_error {
 public:
  ProtocolError(ErrorKind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}
  ErrorKind Kind() const { return kind_; }

 private:
  ErrorKind kind_;
};

class ParsingError : public ProtocolError {
 public:
  explicit ParsingError(const std::string& message) : ProtocolError(ErrorKind::kParsing, message) {}

 protected:
  ParsingError(ErrorKind kind, const std::string& message) : ProtocolError(kind, message) {}
};

// name 값이 닫힌 열거에 없는 경우. 형식 오류와 구분할 수 있도록 별도 타입으로 둔다.
class UnknownMessageError : public ParsingError {
 public:
  explicit UnknownMessageError(std::string name)
      : ParsingError(ErrorKind::kUnknownMessage, "unknown message name: " + name), name_(std::move(name)) {}
  const std::string& Name() const { return name_; }

 private:
  std::string name_;
};

class AuthenticationError : public ProtocolError {
 public:
  explicit AuthenticationError(const std::string& message) : ProtocolError(ErrorKind::kAuthentication, message) {}
};

// 로컬 세션 상태로는 보낼 수 없는 요청. 네트워크에 도달하지 않는다.
class PreconditionError : public ProtocolError {
 public:
  explicit PreconditionError(const std::string& message) : ProtocolError(ErrorKind::kPrecondition, message) {}
};

class ServerError : public ProtocolError {
 public:
  ServerError(std::string error_type, const std::string& message)
      : ServerError(ErrorKind::kServer, std::move(error_type), message) {}
  const std::string& ErrorType() const { return error_type_; }

 protected:
  ServerError(ErrorKind kind, std::string error_type, const std::string& message)
      : ProtocolError(kind, message), error_type_(std::move(error_type)) {}

 private:
  std::string error_type_;
};

class GameNotFoundError : public ServerError {
 public:
  explicit GameNotFoundError(const std::string& message)
      : ServerError(ErrorKind::kGameNotFound, std::string(kGameNotFoundErrorType), message) {}
};

class UnsupportedRequestError : public ServerError {
 public:
  explicit UnsupportedRequestError(const std::string& message)
      : ServerError(ErrorKind::kUnsupportedRequest, std::string(kUnsupportedRequestErrorType), message) {}
};

class UnexpectedResponseError : public ProtocolError {
 public:
  explicit UnexpectedResponseError(const std::string& message)
      : ProtocolError(ErrorKind::kUnexpectedResponse, message) {}
};

class TimeoutError : public ProtocolError {
 public:
  explicit TimeoutError(const std::string& message) : ProtocolError(ErrorKind::kTimeout, message) {}
};

class ConnectionClosedError : public ProtocolError {
 public:
  explicit ConnectionClosedError(const std::string& message)
      : ProtocolError(ErrorKind::kConnectionClosed, message) {}
};

// error 응답이면 error_type에 맞는 예외를 던진다. 그 외 응답은 그대로 통과한다.
void ThrowIfError(const Response& response);

}  // namespace dipnet
