/*
 * 설명: Boost.Beast WebSocket 클라이언트 전송. 전용 io_context 스레드에서 읽기 루프와 쓰기 큐를 운영한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/e2e/client_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "dipnet/observability.hpp"
#include "dipnet/transport.hpp"

namespace dipnet {

// Start 이후에는 io 스레드가 자기 참조를 들고 ioc_.run()이 끝날 때까지 객체를 살려 둔다.
// 따라서 shared_ptr로만 소유해야 한다.
class WebSocketTransport : public Transport, public std::enable_shared_from_this<WebSocketTransport> {
 public:
  explicit WebSocketTransport(std::shared_ptr<Observability> observability);
  ~WebSocketTransport() override;

  WebSocketTransport(const WebSocketTransport&) = delete;
  WebSocketTransport& operator=(const WebSocketTransport&) = delete;

  // TCP 연결과 WebSocket 핸드셰이크를 timeout 안에 완료한다. 실패 시 ConnectionClosedError.
  void Connect(const std::string& host, unsigned short port, const std::string& target,
               std::chrono::milliseconds timeout);

  void Start(FrameHandler on_frame, ClosedHandler on_closed) override;
  void Send(std::string frame) override;
  void Close() override;
  bool IsOpen() const override { return open_.load(); }

 private:
  void RunIo();
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void BeginClose();
  void NotifyClosed(const std::string& reason);

  std::shared_ptr<Observability> observability_;
  boost::asio::io_context ioc_;
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
  std::thread io_thread_;
  FrameHandler on_frame_;
  ClosedHandler on_closed_;

  // 아래 상태는 io 스레드에서만 접근한다.
  std::deque<std::string> send_queue_;
  bool writing_{false};
  bool closing_{false};
  bool close_requested_{false};

  std::atomic<bool> open_{false};
  std::atomic<bool> closed_notified_{false};
};

}  // namespace dipnet
