/*
 * 설명: request_id 기준으로 요청과 응답을 짝짓는 대기 테이블. 응답/타임아웃/취소/연결 종료 중 정확히 한 번 해소된다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/unit/correlator_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <boost/uuid/random_generator.hpp>

#include "dipnet/messages.hpp"
#include "dipnet/observability.hpp"

namespace dipnet {

class Correlator;

enum class ResponseDisposition {
  kResolved,   // 대기자에게 전달됨
  kLate,       // 타임아웃/취소된 요청의 뒤늦은 응답
  kUnmatched,  // 알 수 없는 request_id
};

// 보낸 요청 하나에 대한 이동 전용 핸들. 해소되지 않은 채 소멸하면 대기자를 취소한다.
class PendingCall {
 public:
  PendingCall() = default;
  PendingCall(PendingCall&& other) noexcept = default;
  PendingCall& operator=(PendingCall&& other) noexcept;
  PendingCall(const PendingCall&) = delete;
  PendingCall& operator=(const PendingCall&) = delete;
  ~PendingCall();

  const std::string& RequestId() const { return request_id_; }
  bool Valid() const { return future_.valid(); }

  // 응답을 기다린다. 시간 초과 시 TimeoutError, 연결 종료 시 ConnectionClosedError.
  Response Wait(std::chrono::milliseconds timeout);
  Response Wait() { return Wait(default_timeout_); }

 private:
  friend class Correlator;
  PendingCall(std::weak_ptr<Correlator> owner, std::string request_id, std::future<Response> future,
              std::chrono::milliseconds default_timeout);
  void Release();

  std::weak_ptr<Correlator> owner_;
  std::string request_id_;
  std::future<Response> future_;
  std::chrono::milliseconds default_timeout_{0};
};

// 반드시 std::shared_ptr로 소유한다. PendingCall이 weak_ptr로 되돌아온다.
class Correlator : public std::enable_shared_from_this<Correlator> {
 public:
  using SendFn = std::function<void(std::string frame)>;

  Correlator(SendFn send, std::chrono::milliseconds default_timeout, std::shared_ptr<Observability> observability,
             std::size_t expired_history = 1024);
  ~Correlator();

  Correlator(const Correlator&) = delete;
  Correlator& operator=(const Correlator&) = delete;

  // request_id가 비어 있으면 UUID를 부여한다. 같은 id가 이미 대기 중이면 PreconditionError.
  PendingCall AsyncSendRequest(Request request);
  Response SendRequest(Request request);
  Response SendRequest(Request request, std::chrono::milliseconds timeout);

  ResponseDisposition OnResponse(Response response);

  bool Cancel(const std::string& request_id);
  bool Expire(const std::string& request_id);
  // 모든 대기자를 ConnectionClosedError로 해소하고 이후 요청을 거부한다.
  void FailAll(const std::string& reason);

  std::size_t PendingCount() const;
  bool IsClosed() const;
  std::string NextRequestId();
  std::chrono::milliseconds DefaultTimeout() const { return default_timeout_; }

 private:
  struct Waiter {
    std::promise<Response> promise;
    std::string name;
    std::chrono::steady_clock::time_point sent_at;
  };

  bool Remove(const std::string& request_id, bool timed_out);
  void RememberExpired(const std::string& request_id);

  SendFn send_;
  std::chrono::milliseconds default_timeout_;
  std::shared_ptr<Observability> observability_;
  std::size_t expired_history_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Waiter> pending_;
  std::deque<std::string> expired_;
  boost::uuids::random_generator uuid_generator_;
  bool closed_{false};
  std::string close_reason_;
};

}  // namespace dipnet
