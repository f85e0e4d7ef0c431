/*
 * 설명: 알림 핸들러 레지스트리와 변형별 strand 실행을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/unit/dispatcher_test.cpp
 */
#include "dipnet/dispatcher.hpp"

#include <algorithm>
#include <exception>
#include <string>

#include <boost/asio/post.hpp>

namespace dipnet {

NotificationDispatcher::NotificationDispatcher(std::size_t threads, std::shared_ptr<Observability> observability)
    : observability_(std::move(observability)), pool_(std::max<std::size_t>(threads, 1)) {
  strands_.reserve(std::variant_size_v<Notification>);
  for (std::size_t i = 0; i < std::variant_size_v<Notification>; ++i) {
    strands_.push_back(boost::asio::make_strand(pool_.get_executor()));
  }
}

NotificationDispatcher::~NotificationDispatcher() { Shutdown(); }

HandlerId NotificationDispatcher::AddHandler(std::optional<std::size_t> index, AnyHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  const HandlerId id = next_id_++;
  subscriptions_.push_back(std::make_shared<Subscription>(id, index, std::move(handler)));
  return id;
}

HandlerId NotificationDispatcher::SubscribeAll(AnyHandler handler) { return AddHandler(std::nullopt, std::move(handler)); }

bool NotificationDispatcher::Unsubscribe(HandlerId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                         [id](const auto& subscription) { return subscription->id == id; });
  if (it == subscriptions_.end()) {
    return false;
  }
  // 이미 큐에 들어간 실행도 건너뛰도록 비활성화한다.
  (*it)->active.store(false);
  subscriptions_.erase(it);
  return true;
}

void NotificationDispatcher::Dispatch(Notification notification) {
  const std::size_t index = notification.index();
  std::vector<std::shared_ptr<Subscription>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
      return;
    }
    for (const auto& subscription : subscriptions_) {
      if (!subscription->index || *subscription->index == index) {
        targets.push_back(subscription);
      }
    }
  }

  observability_->IncrementNotification();
  if (targets.empty()) {
    observability_->Log(LogLevel::kDebug, LogContext{.trace_id = observability_->NextTraceId(),
                                                     .name = "notification_without_handler",
                                                     .detail = std::string(NameOf(notification))});
    return;
  }

  auto shared = std::make_shared<const Notification>(std::move(notification));
  boost::asio::post(strands_[index], [this, shared, targets = std::move(targets)] {
    for (const auto& subscription : targets) {
      if (!subscription->active.load()) {
        continue;
      }
      try {
        subscription->handler(*shared);
      } catch (const std::exception& ex) {
        observability_->Log(LogLevel::kError, LogContext{.trace_id = observability_->NextTraceId(),
                                                         .name = "notification_handler_failed",
                                                         .detail = std::string(NameOf(*shared)) + ": " + ex.what()});
      }
    }
  });
}

void NotificationDispatcher::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
      return;
    }
    shut_down_ = true;
  }
  pool_.join();
}

std::size_t NotificationDispatcher::HandlerCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscriptions_.size();
}

}  // namespace dipnet
