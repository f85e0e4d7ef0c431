/*
 * 설명: 프로토콜 더블 WebSocket 연결의 수락/읽기 루프/백프레셔 쓰기 큐를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/e2e/client_flow_test.cpp
 */
#include "dipnet/fake_server_session.hpp"

#include <utility>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

namespace dipnet {

FakeServerSession::FakeServerSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<FakeServer> server,
                                     std::shared_ptr<ConnectionRegistry> registry,
                                     std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                                     std::size_t max_queue_bytes)
    : ws_(std::move(socket)), server_(std::move(server)), registry_(std::move(registry)),
      observability_(std::move(observability)), max_queue_messages_(max_queue_messages),
      max_queue_bytes_(max_queue_bytes) {}

FakeServerSession::~FakeServerSession() { Disconnect(); }

void FakeServerSession::Run() {
  boost::asio::dispatch(ws_.get_executor(), [self = shared_from_this()] {
    self->ws_.set_option(
        boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
    self->ws_.async_accept([self](boost::beast::error_code ec) { self->OnAccept(ec); });
  });
}

void FakeServerSession::OnAccept(boost::beast::error_code ec) {
  if (ec) {
    observability_->Log(LogLevel::kWarn, LogContext{.trace_id = observability_->NextTraceId(),
                                                    .name = "fake_server_accept_failed",
                                                    .detail = ec.message()});
    return;
  }
  ws_.text(true);
  id_ = registry_->Register(shared_from_this());
  observability_->Log(LogLevel::kDebug, LogContext{.trace_id = observability_->NextTraceId(),
                                                   .name = "fake_server_connection_opened",
                                                   .detail = std::to_string(id_)});
  DoRead();
}

void FakeServerSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void FakeServerSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    Disconnect();
    return;
  }
  if (closing_) {
    return;
  }

  auto text = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  try {
    registry_->Deliver(server_->HandleFrame(id_, text));
  } catch (const std::exception& ex) {
    observability_->Log(LogLevel::kError, LogContext{.trace_id = observability_->NextTraceId(),
                                                     .name = "fake_server_frame_failed",
                                                     .detail = ex.what()});
  }

  if (!closing_) {
    DoRead();
  }
}

void FakeServerSession::Send(std::string text) {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), text = std::move(text)]() mutable {
    self->EnqueueMessage(std::move(text));
  });
}

void FakeServerSession::Drop() {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this()] {
    self->closing_ = true;
    self->send_queue_.clear();
    self->queued_bytes_ = 0;
    boost::beast::error_code ec;
    auto& socket = boost::beast::get_lowest_layer(self->ws_).socket();
    socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket.close(ec);
    self->Disconnect();
  });
}

void FakeServerSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void FakeServerSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void FakeServerSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    closing_ = true;
    Disconnect();
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void FakeServerSession::TriggerBackpressureClose() {
  if (closing_) {
    return;
  }
  closing_ = true;
  send_queue_.clear();
  queued_bytes_ = 0;
  observability_->Log(LogLevel::kWarn, LogContext{.trace_id = observability_->NextTraceId(),
                                                  .name = "fake_server_backpressure_close",
                                                  .detail = std::to_string(id_)});
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) { self->Disconnect(); });
}

void FakeServerSession::Disconnect() {
  if (disconnected_ || id_ == 0) {
    return;
  }
  disconnected_ = true;
  registry_->Unregister(id_);
  server_->OnDisconnected(id_);
  observability_->Log(LogLevel::kDebug, LogContext{.trace_id = observability_->NextTraceId(),
                                                   .name = "fake_server_connection_closed",
                                                   .detail = std::to_string(id_)});
}

}  // namespace dipnet
