/*
 * 설명: 프로토콜 더블 호스트의 리스너와 워커 스레드 수명주기를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/e2e/client_flow_test.cpp
 */
#include "dipnet/fake_server_host.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <string>
#include <utility>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "dipnet/fake_server_session.hpp"

namespace dipnet {
namespace {
constexpr int kDrainTimeoutMs = 2000;
}  // namespace

class FakeServerListener : public std::enable_shared_from_this<FakeServerListener> {
 public:
  FakeServerListener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
                     const FakeServerConfig& config, std::shared_ptr<FakeServer> server,
                     std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), server_(std::move(server)),
        registry_(std::move(registry)), observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    port_ = acceptor_.local_endpoint(ec).port();
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::asio::post(acceptor_.get_executor(), [self = shared_from_this()] {
      boost::beast::error_code ec;
      self->acceptor_.close(ec);
    });
  }

  unsigned short Port() const { return port_; }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<FakeServerSession>(std::move(socket), self->server_, self->registry_,
                                                self->observability_, self->config_.queue_limit_messages,
                                                self->config_.queue_limit_bytes)
                ->Run();
          } else if (ec != boost::asio::error::operation_aborted) {
            self->observability_->Log(LogLevel::kWarn,
                                      LogContext{.trace_id = self->observability_->NextTraceId(),
                                                 .name = "fake_server_accept_error",
                                                 .detail = ec.message()});
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  FakeServerConfig config_;
  std::shared_ptr<FakeServer> server_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
  unsigned short port_{0};
};

FakeServerHost::FakeServerHost(FakeServerConfig config, std::shared_ptr<FakeServer> server,
                               std::shared_ptr<Observability> observability)
    : config_(std::move(config)), server_(std::move(server)), observability_(std::move(observability)),
      registry_(std::make_shared<ConnectionRegistry>(observability_)),
      ioc_(static_cast<int>(std::max<std::size_t>(1, config_.worker_threads))),
      work_guard_(boost::asio::make_work_guard(ioc_)) {}

FakeServerHost::~FakeServerHost() { Stop(); }

void FakeServerHost::Start() {
  if (running_.exchange(true)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_ = false;
  }
  boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::make_address(config_.host), config_.port};
  try {
    listener_ = std::make_shared<FakeServerListener>(ioc_, endpoint, config_, server_, registry_, observability_);
  } catch (const std::exception&) {
    running_ = false;
    throw;
  }
  bound_port_ = listener_->Port();
  listener_->Run();

  const std::size_t thread_count = std::max<std::size_t>(1, config_.worker_threads);
  for (std::size_t i = 0; i < thread_count; ++i) {
    workers_.emplace_back([this]() {
      try {
        ioc_.run();
      } catch (const std::exception& ex) {
        observability_->Log(LogLevel::kError, LogContext{.trace_id = observability_->NextTraceId(),
                                                         .name = "fake_server_worker_failed",
                                                         .detail = ex.what()});
      }
    });
  }
  observability_->Log(LogContext{.trace_id = observability_->NextTraceId(),
                                 .name = "fake_server_started",
                                 .detail = config_.host + ":" + std::to_string(bound_port_)});
}

void FakeServerHost::Run() {
  Start();
  boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
  signals.async_wait([this](const boost::beast::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    observability_->Log(LogContext{.trace_id = observability_->NextTraceId(),
                                   .name = "fake_server_signal",
                                   .detail = std::to_string(signal_number)});
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_ = true;
    stop_cv_.notify_all();
  });
  {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    stop_cv_.wait(lock, [this] { return stop_requested_; });
  }
  boost::beast::error_code ec;
  signals.cancel(ec);
  Stop();
}

void FakeServerHost::Stop() {
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_ = true;
    stop_cv_.notify_all();
  }
  if (!running_.exchange(false)) {
    return;
  }
  if (listener_) {
    listener_->Stop();
  }
  // 워커가 살아 있는 동안 끊어야 클라이언트가 host 소멸 전에 종료를 본다.
  registry_->DropAll();
  if (!registry_->WaitUntilEmpty(std::chrono::milliseconds(kDrainTimeoutMs))) {
    observability_->Log(LogLevel::kWarn, LogContext{.trace_id = observability_->NextTraceId(),
                                                    .name = "fake_server_drain_timeout",
                                                    .detail = std::to_string(registry_->ActiveConnections())});
  }
  work_guard_.reset();
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
  observability_->Log(LogContext{.trace_id = observability_->NextTraceId(), .name = "fake_server_stopped"});
}

void FakeServerHost::DropAllConnections() { registry_->DropAll(); }

std::size_t FakeServerHost::ActiveConnections() const { return registry_->ActiveConnections(); }

}  // namespace dipnet
