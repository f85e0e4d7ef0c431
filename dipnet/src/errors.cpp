/*
 * 설명: error 응답을 타입이 있는 예외로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/unit/codec_test.cpp, dipnet/tests/e2e/client_flow_test.cpp
 */
#include "dipnet/errors.hpp"

namespace dipnet {

std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kParsing:
      return "parsing";
    case ErrorKind::kUnknownMessage:
      return "unknown_message";
    case ErrorKind::kAuthentication:
      return "authentication";
    case ErrorKind::kPrecondition:
      return "precondition";
    case ErrorKind::kServer:
      return "server";
    case ErrorKind::kGameNotFound:
      return "game_not_found";
    case ErrorKind::kUnsupportedRequest:
      return "unsupported_request";
    case ErrorKind::kUnexpectedResponse:
      return "unexpected_response";
    case ErrorKind::kTimeout:
      return "timeout";
    case ErrorKind::kConnectionClosed:
      return "connection_closed";
  }
  return "unknown";
}

void ThrowIfError(const Response& response) {
  const auto* error = std::get_if<ErrorResponse>(&response);
  if (error == nullptr) {
    return;
  }
  if (error->error_type == kAuthenticationErrorType) {
    throw AuthenticationError(error->message);
  }
  if (error->error_type == kGameNotFoundErrorType) {
    throw GameNotFoundError(error->message);
  }
  if (error->error_type == kUnsupportedRequestErrorType) {
    throw UnsupportedRequestError(error->message);
  }
  throw ServerError(error->error_type, error->message);
}

}  // namespace dipnet
