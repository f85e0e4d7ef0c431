/*
 * 설명: 프로토콜 더블의 WebSocket 연결 하나. 수신 프레임을 FakeServer에 넘기고 제한된 쓰기 큐로 응답한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/e2e/client_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "dipnet/connection_registry.hpp"
#include "dipnet/fake_server.hpp"
#include "dipnet/observability.hpp"

namespace dipnet {

class FakeServerSession : public std::enable_shared_from_this<FakeServerSession> {
 public:
  FakeServerSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<FakeServer> server,
                    std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<Observability> observability,
                    std::size_t max_queue_messages, std::size_t max_queue_bytes);
  ~FakeServerSession();

  void Run();
  // 어느 스레드에서든 호출 가능하다. 세션 strand에서 큐에 넣는다.
  void Send(std::string text);
  void Drop();

 private:
  void OnAccept(boost::beast::error_code ec);
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();
  void Disconnect();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  std::shared_ptr<FakeServer> server_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
  ConnectionId id_{0};
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  bool disconnected_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace dipnet
