#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "dipnet/codec.hpp"
#include "dipnet/correlator.hpp"
#include "dipnet/errors.hpp"

namespace {

using namespace std::chrono_literals;

class CorrelatorFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    observability_ = std::make_shared<dipnet::Observability>(dipnet::LogLevel::kError);
    correlator_ = std::make_shared<dipnet::Correlator>(
        [this](std::string frame) {
          std::lock_guard<std::mutex> lock(mutex_);
          if (fail_send_) {
            throw dipnet::ConnectionClosedError("socket gone");
          }
          frames_.push_back(std::move(frame));
        },
        500ms, observability_);
  }

  dipnet::Request SignIn(const std::string& request_id = "") {
    dipnet::SignInRequest request;
    request.request_id = request_id;
    request.username = "test_user";
    request.password = "test_password";
    return request;
  }

  dipnet::Response Ok(const std::string& request_id) {
    dipnet::OkResponse ok;
    ok.request_id = request_id;
    return ok;
  }

  std::string LastSentId() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto document = nlohmann::json::parse(frames_.back());
    return document["request_id"].get<std::string>();
  }

  std::size_t SentCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
  }

  std::shared_ptr<dipnet::Observability> observability_;
  std::shared_ptr<dipnet::Correlator> correlator_;
  std::mutex mutex_;
  std::vector<std::string> frames_;
  bool fail_send_{false};
};

TEST_F(CorrelatorFixture, AssignsUuidWhenRequestIdIsEmpty) {
  auto call = correlator_->AsyncSendRequest(SignIn());
  EXPECT_EQ(call.RequestId().size(), 36u);
  EXPECT_EQ(LastSentId(), call.RequestId());
  EXPECT_EQ(correlator_->PendingCount(), 1u);
}

TEST_F(CorrelatorFixture, ResolvesMatchingResponse) {
  auto call = correlator_->AsyncSendRequest(SignIn("req-1"));
  EXPECT_EQ(correlator_->OnResponse(Ok("req-1")), dipnet::ResponseDisposition::kResolved);
  auto response = call.Wait();
  EXPECT_EQ(dipnet::RequestIdOf(response), "req-1");
  EXPECT_EQ(correlator_->PendingCount(), 0u);
  EXPECT_EQ(observability_->Snapshot().responses_matched, 1u);
}

TEST_F(CorrelatorFixture, ResponsesResolveOutOfOrder) {
  auto first = correlator_->AsyncSendRequest(SignIn("a"));
  auto second = correlator_->AsyncSendRequest(SignIn("b"));
  correlator_->OnResponse(Ok("b"));
  correlator_->OnResponse(Ok("a"));
  EXPECT_EQ(dipnet::RequestIdOf(second.Wait()), "b");
  EXPECT_EQ(dipnet::RequestIdOf(first.Wait()), "a");
}

TEST_F(CorrelatorFixture, BlockingSendWakesOnResponseFromAnotherThread) {
  std::thread responder([this] {
    while (SentCount() == 0) {
      std::this_thread::sleep_for(5ms);
    }
    correlator_->OnResponse(Ok(LastSentId()));
  });
  auto response = correlator_->SendRequest(SignIn(), 2000ms);
  responder.join();
  EXPECT_TRUE(std::holds_alternative<dipnet::OkResponse>(response));
}

TEST_F(CorrelatorFixture, DuplicatePendingIdIsRejected) {
  auto call = correlator_->AsyncSendRequest(SignIn("dup"));
  EXPECT_THROW(correlator_->AsyncSendRequest(SignIn("dup")), dipnet::PreconditionError);
  EXPECT_EQ(SentCount(), 1u);
}

TEST_F(CorrelatorFixture, TimeoutRemovesWaiterAndLateResponseIsDropped) {
  auto call = correlator_->AsyncSendRequest(SignIn("slow"));
  EXPECT_THROW(call.Wait(30ms), dipnet::TimeoutError);
  EXPECT_EQ(correlator_->PendingCount(), 0u);
  EXPECT_EQ(observability_->Snapshot().timeouts, 1u);

  EXPECT_EQ(correlator_->OnResponse(Ok("slow")), dipnet::ResponseDisposition::kLate);
  EXPECT_EQ(correlator_->OnResponse(Ok("never-sent")), dipnet::ResponseDisposition::kUnmatched);
  EXPECT_EQ(observability_->Snapshot().unmatched_responses, 2u);
}

TEST_F(CorrelatorFixture, TimedOutIdCanBeReused) {
  {
    auto call = correlator_->AsyncSendRequest(SignIn("retry"));
    EXPECT_THROW(call.Wait(20ms), dipnet::TimeoutError);
  }
  auto resend = correlator_->AsyncSendRequest(SignIn("retry"));
  correlator_->OnResponse(Ok("retry"));
  EXPECT_NO_THROW(resend.Wait());
}

TEST_F(CorrelatorFixture, DestroyingHandleCancelsWaiter) {
  {
    auto call = correlator_->AsyncSendRequest(SignIn("abandoned"));
    EXPECT_EQ(correlator_->PendingCount(), 1u);
  }
  EXPECT_EQ(correlator_->PendingCount(), 0u);
  EXPECT_EQ(correlator_->OnResponse(Ok("abandoned")), dipnet::ResponseDisposition::kLate);
}

TEST_F(CorrelatorFixture, FailAllFlushesWaitersAndRejectsNewRequests) {
  auto first = correlator_->AsyncSendRequest(SignIn("x"));
  auto second = correlator_->AsyncSendRequest(SignIn("y"));
  correlator_->FailAll("server went away");

  EXPECT_THROW(first.Wait(), dipnet::ConnectionClosedError);
  EXPECT_THROW(second.Wait(), dipnet::ConnectionClosedError);
  EXPECT_EQ(correlator_->PendingCount(), 0u);
  EXPECT_TRUE(correlator_->IsClosed());
  EXPECT_THROW(correlator_->AsyncSendRequest(SignIn("z")), dipnet::ConnectionClosedError);
}

TEST_F(CorrelatorFixture, SendFailureLeavesNoWaiter) {
  fail_send_ = true;
  EXPECT_THROW(correlator_->AsyncSendRequest(SignIn("lost")), dipnet::ConnectionClosedError);
  EXPECT_EQ(correlator_->PendingCount(), 0u);
}

TEST_F(CorrelatorFixture, UnencodableRequestIsParsingErrorAndSendsNothing) {
  dipnet::SendGameMessageRequest request;
  request.request_id = "msg-1";
  request.token = "fake_token_abc";
  request.game_id = "GAME_0001";
  request.game_role = "FRANCE";
  request.recipient = "ENGLAND";
  request.message = "bad \xff\xfe utf8";
  EXPECT_THROW(correlator_->AsyncSendRequest(request), dipnet::ParsingError);
  EXPECT_EQ(correlator_->PendingCount(), 0u);
  EXPECT_EQ(SentCount(), 0u);
}

TEST_F(CorrelatorFixture, ErrorResponseIsDeliveredToCaller) {
  auto call = correlator_->AsyncSendRequest(SignIn("bad"));
  dipnet::ErrorResponse error;
  error.request_id = "bad";
  error.error_type = "AUTHENTICATION_ERROR";
  error.message = "Invalid username or password";
  correlator_->OnResponse(error);
  auto response = call.Wait();
  EXPECT_THROW(dipnet::ThrowIfError(response), dipnet::AuthenticationError);
}

TEST_F(CorrelatorFixture, ConcurrentSendersGetTheirOwnResponses) {
  constexpr int kThreads = 8;
  std::vector<std::thread> senders;
  std::vector<std::string> results(kThreads);
  for (int i = 0; i < kThreads; ++i) {
    senders.emplace_back([this, i, &results] {
      auto call = correlator_->AsyncSendRequest(SignIn("id-" + std::to_string(i)));
      correlator_->OnResponse(Ok(call.RequestId()));
      results[i] = dipnet::RequestIdOf(call.Wait());
    });
  }
  for (auto& sender : senders) {
    sender.join();
  }
  for (int i = 0; i < kThreads; ++i) {
    EXPECT_EQ(results[i], "id-" + std::to_string(i));
  }
  EXPECT_EQ(correlator_->PendingCount(), 0u);
}

}  // namespace
