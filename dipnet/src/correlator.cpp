/*
 * 설명: request_id 기준 요청/응답 대기 테이블을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/unit/correlator_test.cpp
 */
#include "dipnet/correlator.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <utility>
#include <vector>

#include <boost/uuid/uuid_io.hpp>

#include "dipnet/codec.hpp"
#include "dipnet/errors.hpp"

namespace dipnet {

PendingCall::PendingCall(std::weak_ptr<Correlator> owner, std::string request_id, std::future<Response> future,
                         std::chrono::milliseconds default_timeout)
    : owner_(std::move(owner)), request_id_(std::move(request_id)), future_(std::move(future)),
      default_timeout_(default_timeout) {}

PendingCall& PendingCall::operator=(PendingCall&& other) noexcept {
  if (this != &other) {
    Release();
    owner_ = std::move(other.owner_);
    request_id_ = std::move(other.request_id_);
    future_ = std::move(other.future_);
    default_timeout_ = other.default_timeout_;
  }
  return *this;
}

PendingCall::~PendingCall() { Release(); }

void PendingCall::Release() {
  if (!future_.valid()) {
    return;
  }
  if (auto owner = owner_.lock()) {
    owner->Cancel(request_id_);
  }
  future_ = std::future<Response>{};
}

Response PendingCall::Wait(std::chrono::milliseconds timeout) {
  if (!future_.valid()) {
    throw PreconditionError("pending call '" + request_id_ + "' was already consumed");
  }
  if (future_.wait_for(timeout) != std::future_status::ready) {
    auto owner = owner_.lock();
    if (owner && owner->Expire(request_id_)) {
      future_ = std::future<Response>{};
      throw TimeoutError("request '" + request_id_ + "' timed out after " + std::to_string(timeout.count()) + "ms");
    }
    // Expire가 실패했다면 응답 또는 종료가 방금 도착한 것이다.
  }
  return future_.get();
}

Correlator::Correlator(SendFn send, std::chrono::milliseconds default_timeout,
                       std::shared_ptr<Observability> observability, std::size_t expired_history)
    : send_(std::move(send)), default_timeout_(default_timeout), observability_(std::move(observability)),
      expired_history_(expired_history) {}

Correlator::~Correlator() { FailAll("correlator destroyed"); }

std::string Correlator::NextRequestId() {
  std::lock_guard<std::mutex> lock(mutex_);
  return boost::uuids::to_string(uuid_generator_());
}

PendingCall Correlator::AsyncSendRequest(Request request) {
  if (RequestIdOf(request).empty()) {
    SetRequestId(request, NextRequestId());
  }
  std::string request_id = RequestIdOf(request);
  const std::string name{NameOf(request)};
  auto frame = EncodeText(request);

  std::future<Response> future;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      throw ConnectionClosedError("cannot send '" + name + "': " + close_reason_);
    }
    if (pending_.count(request_id) > 0) {
      throw PreconditionError("request_id '" + request_id + "' is already pending");
    }
    Waiter waiter{std::promise<Response>{}, name, std::chrono::steady_clock::now()};
    future = waiter.promise.get_future();
    pending_.emplace(request_id, std::move(waiter));
  }

  try {
    send_(std::move(frame));
  } catch (...) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      pending_.erase(request_id);
    }
    observability_->IncrementError();
    throw;
  }
  observability_->IncrementRequest();
  observability_->Log(LogLevel::kDebug, LogContext{.trace_id = observability_->NextTraceId(),
                                                   .name = "request_sent",
                                                   .request_id = request_id,
                                                   .detail = name});
  return PendingCall(weak_from_this(), std::move(request_id), std::move(future), default_timeout_);
}

Response Correlator::SendRequest(Request request) { return SendRequest(std::move(request), default_timeout_); }

Response Correlator::SendRequest(Request request, std::chrono::milliseconds timeout) {
  auto call = AsyncSendRequest(std::move(request));
  return call.Wait(timeout);
}

ResponseDisposition Correlator::OnResponse(Response response) {
  const std::string request_id = RequestIdOf(response);
  std::optional<Waiter> waiter;
  bool late = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(request_id);
    if (it != pending_.end()) {
      waiter.emplace(std::move(it->second));
      pending_.erase(it);
    } else {
      late = std::find(expired_.begin(), expired_.end(), request_id) != expired_.end();
    }
  }

  if (waiter) {
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                         waiter->sent_at);
    observability_->IncrementResponse();
    observability_->Log(LogLevel::kDebug, LogContext{.trace_id = observability_->NextTraceId(),
                                                     .name = "response_matched",
                                                     .request_id = request_id,
                                                     .detail = waiter->name + " -> " + std::string(NameOf(response)),
                                                     .latency_ms = static_cast<long>(latency.count())});
    waiter->promise.set_value(std::move(response));
    return ResponseDisposition::kResolved;
  }

  observability_->IncrementUnmatched();
  observability_->Log(LogLevel::kWarn, LogContext{.trace_id = observability_->NextTraceId(),
                                                  .name = late ? "late_response_dropped" : "unmatched_response_dropped",
                                                  .request_id = request_id,
                                                  .detail = std::string(NameOf(response))});
  return late ? ResponseDisposition::kLate : ResponseDisposition::kUnmatched;
}

bool Correlator::Cancel(const std::string& request_id) { return Remove(request_id, false); }

bool Correlator::Expire(const std::string& request_id) { return Remove(request_id, true); }

bool Correlator::Remove(const std::string& request_id, bool timed_out) {
  std::string name;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(request_id);
    if (it == pending_.end()) {
      return false;
    }
    name = it->second.name;
    pending_.erase(it);
    RememberExpired(request_id);
  }
  if (timed_out) {
    observability_->IncrementTimeout();
  }
  observability_->Log(timed_out ? LogLevel::kWarn : LogLevel::kDebug,
                      LogContext{.trace_id = observability_->NextTraceId(),
                                 .name = timed_out ? "request_timed_out" : "request_cancelled",
                                 .request_id = request_id,
                                 .detail = name});
  return true;
}

void Correlator::RememberExpired(const std::string& request_id) {
  if (expired_history_ == 0) {
    return;
  }
  expired_.push_back(request_id);
  while (expired_.size() > expired_history_) {
    expired_.pop_front();
  }
}

void Correlator::FailAll(const std::string& reason) {
  std::unordered_map<std::string, Waiter> flushed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_) {
      closed_ = true;
      close_reason_ = reason;
    }
    flushed.swap(pending_);
  }
  if (flushed.empty()) {
    return;
  }
  observability_->Log(LogLevel::kWarn, LogContext{.trace_id = observability_->NextTraceId(),
                                                  .name = "pending_requests_failed",
                                                  .detail = reason + " (" + std::to_string(flushed.size()) +
                                                            " waiting)"});
  for (auto& [request_id, waiter] : flushed) {
    waiter.promise.set_exception(std::make_exception_ptr(
        ConnectionClosedError("connection closed while waiting for '" + request_id + "': " + reason)));
  }
}

std::size_t Correlator::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

bool Correlator::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

}  // namespace dipnet
