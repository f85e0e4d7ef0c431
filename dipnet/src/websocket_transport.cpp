/*
 * 설명: Boost.Beast WebSocket 클라이언트 전송. 읽기 루프, 직렬화된 쓰기 큐, 1회성 종료 통지를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/e2e/client_flow_test.cpp
 */
#include "dipnet/websocket_transport.hpp"

#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

#include "dipnet/errors.hpp"

namespace dipnet {

WebSocketTransport::WebSocketTransport(std::shared_ptr<Observability> observability)
    : observability_(std::move(observability)), ws_(ioc_) {}

WebSocketTransport::~WebSocketTransport() {
  Close();
  if (io_thread_.joinable()) {
    // io 스레드의 자기 참조가 마지막이었다면 ioc_.run()은 이미 반환했다.
    if (std::this_thread::get_id() == io_thread_.get_id()) {
      io_thread_.detach();
    } else {
      io_thread_.join();
    }
  }
}

void WebSocketTransport::Connect(const std::string& host, unsigned short port, const std::string& target,
                                 std::chrono::milliseconds timeout) {
  boost::beast::error_code ec;
  boost::asio::ip::tcp::resolver resolver{ioc_};
  auto const results = resolver.resolve(host, std::to_string(port), ec);
  if (ec) {
    throw ConnectionClosedError("resolve " + host + " failed: " + ec.message());
  }

  auto& stream = boost::beast::get_lowest_layer(ws_);
  stream.expires_after(timeout);
  stream.async_connect(results, [&ec](boost::beast::error_code connect_ec,
                                      const boost::asio::ip::tcp::endpoint& /*endpoint*/) { ec = connect_ec; });
  ioc_.run();
  ioc_.restart();
  if (ec) {
    throw ConnectionClosedError("connect " + host + ":" + std::to_string(port) + " failed: " + ec.message());
  }

  // 핸드셰이크 이후에는 tcp_stream 타임아웃 대신 WebSocket 타임아웃을 사용한다.
  stream.expires_never();
  boost::beast::websocket::stream_base::timeout options{timeout, boost::beast::websocket::stream_base::none(),
                                                        false};
  ws_.set_option(options);
  ws_.async_handshake(host + ":" + std::to_string(port), target,
                      [&ec](boost::beast::error_code handshake_ec) { ec = handshake_ec; });
  ioc_.run();
  ioc_.restart();
  if (ec) {
    throw ConnectionClosedError("websocket handshake failed: " + ec.message());
  }
  ws_.text(true);
  open_.store(true);

  observability_->Log(LogLevel::kInfo, LogContext{.trace_id = observability_->NextTraceId(),
                                                  .name = "transport_connected",
                                                  .detail = host + ":" + std::to_string(port) + target});
}

void WebSocketTransport::Start(FrameHandler on_frame, ClosedHandler on_closed) {
  if (!open_.load()) {
    throw ConnectionClosedError("transport is not connected");
  }
  on_frame_ = std::move(on_frame);
  on_closed_ = std::move(on_closed);
  work_guard_.emplace(boost::asio::make_work_guard(ioc_));
  boost::asio::post(ioc_, [this] { DoRead(); });
  io_thread_ = std::thread([self = shared_from_this()] { self->RunIo(); });
}

void WebSocketTransport::RunIo() {
  try {
    ioc_.run();
  } catch (const std::exception& ex) {
    observability_->Log(LogLevel::kError, LogContext{.trace_id = observability_->NextTraceId(),
                                                     .name = "transport_io_failed",
                                                     .detail = ex.what()});
    open_.store(false);
    if (!closed_notified_.exchange(true) && on_closed_) {
      on_closed_(ex.what());
    }
  }
}

void WebSocketTransport::Send(std::string frame) {
  if (!open_.load()) {
    throw ConnectionClosedError("connection is closed");
  }
  boost::asio::post(ioc_, [this, frame = std::move(frame)]() mutable { EnqueueMessage(std::move(frame)); });
}

void WebSocketTransport::Close() {
  if (!io_thread_.joinable()) {
    if (open_.exchange(false)) {
      boost::beast::error_code ec;
      boost::beast::get_lowest_layer(ws_).socket().close(ec);
    }
    return;
  }
  boost::asio::post(ioc_, [this] { BeginClose(); });
  if (std::this_thread::get_id() == io_thread_.get_id()) {
    return;
  }
  io_thread_.join();
}

void WebSocketTransport::DoRead() {
  if (closing_) {
    return;
  }
  ws_.async_read(buffer_, [this](boost::beast::error_code ec, std::size_t bytes_transferred) {
    OnRead(ec, bytes_transferred);
  });
}

void WebSocketTransport::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::websocket::error::closed) {
    NotifyClosed("closed by peer");
    return;
  }
  if (ec) {
    NotifyClosed(ec.message());
    return;
  }

  auto frame = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  try {
    on_frame_(std::move(frame));
  } catch (const std::exception& ex) {
    observability_->Log(LogLevel::kError, LogContext{.trace_id = observability_->NextTraceId(),
                                                     .name = "frame_handler_failed",
                                                     .detail = ex.what()});
  }

  if (!closing_) {
    DoRead();
  }
}

void WebSocketTransport::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  send_queue_.push_back(std::move(message));
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketTransport::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [this](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { OnWrite(ec); });
}

void WebSocketTransport::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    NotifyClosed("write failed: " + ec.message());
    return;
  }
  if (close_requested_) {
    close_requested_ = false;
    closing_ = false;
    BeginClose();
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketTransport::BeginClose() {
  if (closing_) {
    work_guard_.reset();
    return;
  }
  open_.store(false);
  if (writing_) {
    // 진행 중인 프레임을 끝까지 쓴 뒤 close 프레임을 보낸다.
    close_requested_ = true;
    closing_ = true;
    return;
  }
  closing_ = true;
  send_queue_.clear();
  ws_.async_close(boost::beast::websocket::close_code::normal, [this](boost::beast::error_code /*ec*/) {
    NotifyClosed("closed locally");
    boost::beast::error_code ignored;
    boost::beast::get_lowest_layer(ws_).socket().close(ignored);
  });
}

void WebSocketTransport::NotifyClosed(const std::string& reason) {
  closing_ = true;
  open_.store(false);
  send_queue_.clear();
  work_guard_.reset();
  if (closed_notified_.exchange(true)) {
    return;
  }
  observability_->Log(LogLevel::kInfo, LogContext{.trace_id = observability_->NextTraceId(),
                                                  .name = "transport_closed",
                                                  .detail = reason});
  if (on_closed_) {
    on_closed_(reason);
  }
}

}  // namespace dipnet
