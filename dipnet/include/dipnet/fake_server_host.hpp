/*
 * 설명: FakeServer를 Boost.Beast WebSocket으로 노출하는 호스트. 리스너/워커 스레드/연결 레지스트리 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/e2e/client_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "dipnet/config.hpp"
#include "dipnet/connection_registry.hpp"
#include "dipnet/fake_server.hpp"
#include "dipnet/observability.hpp"

namespace dipnet {

class FakeServerListener;

class FakeServerHost {
 public:
  FakeServerHost(FakeServerConfig config, std::shared_ptr<FakeServer> server,
                 std::shared_ptr<Observability> observability);
  ~FakeServerHost();

  FakeServerHost(const FakeServerHost&) = delete;
  FakeServerHost& operator=(const FakeServerHost&) = delete;

  // 바인드 후 워커 스레드에서 수락을 시작한다. port 0이면 임시 포트를 쓴다.
  void Start();
  // Start 후 SIGINT/SIGTERM 또는 Stop까지 블록한다.
  void Run();
  void Stop();

  unsigned short Port() const { return bound_port_; }
  void DropAllConnections();
  std::size_t ActiveConnections() const;
  FakeServer& Server() { return *server_; }
  const FakeServerConfig& Config() const { return config_; }

 private:
  FakeServerConfig config_;
  std::shared_ptr<FakeServer> server_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<ConnectionRegistry> registry_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<FakeServerListener> listener_;
  std::vector<std::thread> workers_;
  unsigned short bound_port_{0};
  std::atomic<bool> running_{false};

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  bool stop_requested_{false};
};

}  // namespace dipnet
