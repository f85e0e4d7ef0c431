/*
 * 설명: 서버 푸시 알림을 변형별 핸들러로 라우팅한다. 핸들러는 스레드 풀에서 변형별 strand로 실행된다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/unit/dispatcher_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include "dipnet/messages.hpp"
#include "dipnet/observability.hpp"

namespace dipnet {

using HandlerId = std::uint64_t;

class NotificationDispatcher {
 public:
  using AnyHandler = std::function<void(const Notification&)>;

  NotificationDispatcher(std::size_t threads, std::shared_ptr<Observability> observability);
  ~NotificationDispatcher();

  NotificationDispatcher(const NotificationDispatcher&) = delete;
  NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

  template <typename T>
  HandlerId Subscribe(std::function<void(const T&)> handler) {
    constexpr std::size_t index = kVariantIndex<T, Notification>;
    return AddHandler(index, [handler = std::move(handler)](const Notification& notification) {
      handler(std::get<T>(notification));
    });
  }

  HandlerId SubscribeAll(AnyHandler handler);
  bool Unsubscribe(HandlerId id);

  // 수신 루프에서 호출된다. 실행은 풀에 넘기고 즉시 반환한다.
  void Dispatch(Notification notification);

  // 이미 큐에 들어간 핸들러까지 실행한 뒤 풀을 정지한다. 이후 Dispatch는 무시된다.
  void Shutdown();

  std::size_t HandlerCount() const;

 private:
  struct Subscription {
    HandlerId id;
    std::optional<std::size_t> index;
    AnyHandler handler;
    std::atomic<bool> active{true};

    Subscription(HandlerId subscription_id, std::optional<std::size_t> variant_index, AnyHandler fn)
        : id(subscription_id), index(variant_index), handler(std::move(fn)) {}
  };

  HandlerId AddHandler(std::optional<std::size_t> index, AnyHandler handler);

  std::shared_ptr<Observability> observability_;
  boost::asio::thread_pool pool_;
  std::vector<boost::asio::strand<boost::asio::thread_pool::executor_type>> strands_;

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<Subscription>> subscriptions_;
  HandlerId next_id_{1};
  bool shut_down_{false};
};

}  // namespace dipnet
