/*
 * 설명: 프로토콜 더블에 붙은 WebSocket 연결을 ConnectionId로 관리하고 응답/푸시 프레임을 전달한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/e2e/client_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "dipnet/fake_server.hpp"
#include "dipnet/observability.hpp"

namespace dipnet {

class FakeServerSession;

class ConnectionRegistry {
 public:
  explicit ConnectionRegistry(std::shared_ptr<Observability> observability);

  ConnectionId Register(const std::shared_ptr<FakeServerSession>& session);
  void Unregister(ConnectionId connection);
  // 끊긴 연결로 가는 프레임은 버린다.
  void Deliver(std::vector<OutboundFrame> frames);
  // close 프레임 없이 모든 소켓을 끊는다.
  void DropAll();
  std::size_t ActiveConnections() const;
  // 등록된 연결이 모두 해제되면 true, timeout이 먼저 지나면 false.
  bool WaitUntilEmpty(std::chrono::milliseconds timeout);

 private:
  std::unordered_map<ConnectionId, std::weak_ptr<FakeServerSession>> connections_;
  ConnectionId next_id_{1};
  mutable std::mutex mutex_;
  std::condition_variable empty_cv_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace dipnet
