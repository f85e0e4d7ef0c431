/*
 * 설명: ConnectionId별 세션 레지스트리와 프레임 전달을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/e2e/client_flow_test.cpp
 */
#include "dipnet/connection_registry.hpp"

#include <utility>

#include "dipnet/fake_server_session.hpp"

namespace dipnet {

ConnectionRegistry::ConnectionRegistry(std::shared_ptr<Observability> observability)
    : observability_(std::move(observability)) {}

ConnectionId ConnectionRegistry::Register(const std::shared_ptr<FakeServerSession>& session) {
  std::lock_guard<std::mutex> lock(mutex_);
  const ConnectionId id = next_id_++;
  connections_[id] = session;
  observability_->SetConnectionsActive(connections_.size());
  return id;
}

void ConnectionRegistry::Unregister(ConnectionId connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (connections_.erase(connection) > 0) {
    observability_->SetConnectionsActive(connections_.size());
  }
  if (connections_.empty()) {
    empty_cv_.notify_all();
  }
}

void ConnectionRegistry::Deliver(std::vector<OutboundFrame> frames) {
  for (auto& frame : frames) {
    std::shared_ptr<FakeServerSession> session;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = connections_.find(frame.connection);
      if (it == connections_.end()) {
        continue;
      }
      session = it->second.lock();
    }
    if (session) {
      session->Send(std::move(frame.text));
    }
  }
}

void ConnectionRegistry::DropAll() {
  std::vector<std::shared_ptr<FakeServerSession>> sessions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, weak] : connections_) {
      if (auto session = weak.lock()) {
        sessions.push_back(std::move(session));
      }
    }
  }
  for (const auto& session : sessions) {
    session->Drop();
  }
}

std::size_t ConnectionRegistry::ActiveConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

bool ConnectionRegistry::WaitUntilEmpty(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return empty_cv_.wait_for(lock, timeout, [this] { return connections_.empty(); });
}

}  // namespace dipnet
