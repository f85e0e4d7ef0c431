#include <algorithm>
#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "dipnet/codec.hpp"
#include "dipnet/errors.hpp"
#include "dipnet/fake_server.hpp"

namespace {

class FakeServerFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    observability_ = std::make_shared<dipnet::Observability>(dipnet::LogLevel::kError);
    dipnet::FakeServerOptions options;
    options.accounts.pbkdf2_iterations = 10;
    server_ = std::make_unique<dipnet::FakeServer>(options, observability_);
  }

  std::vector<dipnet::OutboundFrame> Call(dipnet::ConnectionId connection, dipnet::Request request) {
    if (dipnet::RequestIdOf(request).empty()) {
      dipnet::SetRequestId(request, "req-" + std::to_string(++counter_));
    }
    return server_->HandleRequest(connection, request);
  }

  dipnet::Response Respond(dipnet::ConnectionId connection, dipnet::Request request) {
    auto frames = Call(connection, std::move(request));
    EXPECT_FALSE(frames.empty());
    EXPECT_EQ(frames.front().connection, connection);
    return std::get<dipnet::Response>(dipnet::DecodeText(frames.front().text));
  }

  std::string SignIn(dipnet::ConnectionId connection, const std::string& username = "test_user",
                     const std::string& password = "test_password") {
    dipnet::SignInRequest request;
    request.username = username;
    request.password = password;
    auto response = Respond(connection, request);
    return std::get<dipnet::DataTokenResponse>(response).data;
  }

  std::string CreateGame(dipnet::ConnectionId connection, const std::string& token, int n_controls = 1,
                         std::optional<std::string> power = "FRANCE") {
    dipnet::CreateGameRequest request;
    request.token = token;
    request.n_controls = n_controls;
    request.power_name = std::move(power);
    auto response = Respond(connection, request);
    return std::get<dipnet::DataGameResponse>(response).data["game_id"].get<std::string>();
  }

  template <typename T>
  T GameRequest(const std::string& token, const std::string& game_id, const std::string& role) {
    T request;
    request.token = token;
    request.game_id = game_id;
    request.game_role = role;
    return request;
  }

  std::shared_ptr<dipnet::Observability> observability_;
  std::unique_ptr<dipnet::FakeServer> server_;
  int counter_{0};
};

TEST_F(FakeServerFixture, SignInIssuesFakeToken) {
  auto token = SignIn(1);
  EXPECT_EQ(token.rfind("fake_token_", 0), 0u);
  EXPECT_EQ(token.size(), std::string("fake_token_").size() + 16);
  EXPECT_EQ(server_->Accounts().ActiveTokens(), 1u);
}

TEST_F(FakeServerFixture, BadCredentialsAreAuthenticationErrors) {
  dipnet::SignInRequest request;
  request.username = "test_user";
  request.password = "wrong";
  auto response = Respond(1, request);
  const auto& error = std::get<dipnet::ErrorResponse>(response);
  EXPECT_EQ(error.error_type, "AUTHENTICATION_ERROR");
  EXPECT_EQ(error.message, "Invalid username or password");
}

TEST_F(FakeServerFixture, ChannelRequestNeedsValidToken) {
  dipnet::ListGamesRequest request;
  request.token = "fake_token_deadbeefdeadbeef";
  auto response = Respond(1, request);
  EXPECT_EQ(std::get<dipnet::ErrorResponse>(response).error_type, "AUTHENTICATION_ERROR");
}

TEST_F(FakeServerFixture, CreateGameNumbersGamesAndSnapshots) {
  auto token = SignIn(1);
  EXPECT_EQ(CreateGame(1, token), "GAME_0001");
  EXPECT_EQ(CreateGame(1, token), "GAME_0002");
  EXPECT_EQ(server_->GameCount(), 2u);

  auto snapshot = server_->GameSnapshot("GAME_0001");
  ASSERT_TRUE(snapshot.has_value());
  EXPECT_EQ((*snapshot)["phase"], "S1901M");
  EXPECT_EQ((*snapshot)["status"], "ACTIVE");
  EXPECT_EQ((*snapshot)["controlled_powers"]["FRANCE"], "test_user");
  EXPECT_EQ((*snapshot)["powers"].size(), 7u);
}

TEST_F(FakeServerFixture, UnknownGameIsGameNotFound) {
  auto token = SignIn(1);
  auto response = Respond(1, GameRequest<dipnet::ProcessGameRequest>(token, "GAME_9999", "OMNISCIENT"));
  const auto& error = std::get<dipnet::ErrorResponse>(response);
  EXPECT_EQ(error.error_type, "GAME_NOT_FOUND");
  EXPECT_EQ(error.message, "Game GAME_9999 not found");
}

TEST_F(FakeServerFixture, UnsupportedRequestIsReported) {
  auto token = SignIn(1);
  auto game_id = CreateGame(1, token);
  auto vote = GameRequest<dipnet::VoteRequest>(token, game_id, "FRANCE");
  vote.vote = "yes";
  auto response = Respond(1, vote);
  EXPECT_EQ(std::get<dipnet::ErrorResponse>(response).error_type, "UNSUPPORTED_REQUEST");
}

TEST_F(FakeServerFixture, ProcessAdvancesPhasesAndRecordsHistory) {
  auto token = SignIn(1);
  auto game_id = CreateGame(1, token);

  auto orders = GameRequest<dipnet::SetOrdersRequest>(token, game_id, "FRANCE");
  orders.orders = {"A PAR - BUR"};
  EXPECT_TRUE(std::holds_alternative<dipnet::OkResponse>(Respond(1, orders)));

  for (const char* expected : {"F1901M", "W1901A", "S1902M", "S1902M"}) {
    auto frames = Call(1, GameRequest<dipnet::ProcessGameRequest>(token, game_id, "FRANCE"));
    ASSERT_EQ(frames.size(), 2u);
    auto pushed = std::get<dipnet::Notification>(dipnet::DecodeText(frames[1].text));
    EXPECT_EQ(std::get<dipnet::GameProcessedNotification>(pushed).phase, expected);
  }

  auto history = Respond(1, GameRequest<dipnet::GetPhaseHistoryRequest>(token, game_id, "FRANCE"));
  const auto& phases = std::get<dipnet::DataGamePhasesResponse>(history).data;
  ASSERT_EQ(phases.size(), 4u);
  EXPECT_EQ(phases[0]["name"], "S1901M");
  EXPECT_EQ(phases[0]["orders"]["FRANCE"][0], "A PAR - BUR");
  EXPECT_TRUE(phases[1]["orders"].empty());

  auto ranged = GameRequest<dipnet::GetPhaseHistoryRequest>(token, game_id, "FRANCE");
  ranged.from_phase = "F1901M";
  ranged.to_phase = "W1901A";
  EXPECT_EQ(std::get<dipnet::DataGamePhasesResponse>(Respond(1, ranged)).data.size(), 2u);
}

TEST_F(FakeServerFixture, PhaseMismatchIsRejected) {
  auto token = SignIn(1);
  auto game_id = CreateGame(1, token);
  auto orders = GameRequest<dipnet::SetOrdersRequest>(token, game_id, "FRANCE");
  orders.phase = "F1905M";
  EXPECT_EQ(std::get<dipnet::ErrorResponse>(Respond(1, orders)).error_type, "GAME_ERROR");
}

TEST_F(FakeServerFixture, OrdersArePushedToOtherMembersOnly) {
  auto creator_token = SignIn(1);
  auto game_id = CreateGame(1, creator_token, 2);
  auto joiner_token = SignIn(2, "ai_player", "password");

  dipnet::JoinGameRequest join;
  join.token = joiner_token;
  join.game_id = game_id;
  join.power_name = "ENGLAND";
  auto join_frames = Call(2, join);
  // 응답, 생성자에게 powers_controllers, 두 연결 모두에 game_status_update
  ASSERT_EQ(join_frames.size(), 4u);
  EXPECT_EQ(join_frames[1].connection, 1u);

  auto orders = GameRequest<dipnet::SetOrdersRequest>(joiner_token, game_id, "ENGLAND");
  orders.orders = {"F LON - NTH"};
  auto frames = Call(2, orders);
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(frames[1].connection, 1u);
  auto update = std::get<dipnet::PowerOrdersUpdateNotification>(
      std::get<dipnet::Notification>(dipnet::DecodeText(frames[1].text)));
  EXPECT_EQ(update.power_name, "ENGLAND");
  EXPECT_EQ(update.orders, (std::vector<std::string>{"F LON - NTH"}));
}

TEST_F(FakeServerFixture, ControlledPowerCannotBeTakenTwice) {
  auto creator_token = SignIn(1);
  auto game_id = CreateGame(1, creator_token, 2);
  auto other_token = SignIn(2, "player1", "password");

  dipnet::JoinGameRequest join;
  join.token = other_token;
  join.game_id = game_id;
  join.power_name = "FRANCE";
  EXPECT_EQ(std::get<dipnet::ErrorResponse>(Respond(2, join)).error_type, "GAME_ERROR");

  dipnet::GetPlayablePowersRequest playable;
  playable.token = other_token;
  playable.game_id = game_id;
  auto powers = std::get<dipnet::DataPowerNamesResponse>(Respond(2, playable)).data;
  EXPECT_EQ(powers.size(), 6u);
  EXPECT_EQ(std::find(powers.begin(), powers.end(), "FRANCE"), powers.end());
}

TEST_F(FakeServerFixture, ResentRequestReplaysCachedResponse) {
  auto token = SignIn(1);
  auto game_id = CreateGame(1, token);

  auto process = GameRequest<dipnet::ProcessGameRequest>(token, game_id, "FRANCE");
  process.request_id = "process-once";
  auto first = Call(1, process);
  ASSERT_EQ(first.size(), 2u);

  process.re_sent = true;
  auto replay = Call(1, process);
  ASSERT_EQ(replay.size(), 1u);
  EXPECT_EQ(replay[0].text, first[0].text);
  EXPECT_EQ((*server_->GameSnapshot(game_id))["phase"], "F1901M");
}

TEST_F(FakeServerFixture, ResentCacheIsScopedToConnectionAndName) {
  dipnet::SignInRequest sign_in;
  sign_in.request_id = "1";
  sign_in.username = "test_user";
  sign_in.password = "test_password";
  auto first = std::get<dipnet::DataTokenResponse>(Respond(1, sign_in)).data;

  dipnet::SignInRequest other;
  other.request_id = "1";
  other.re_sent = true;
  other.username = "ai_player";
  other.password = "WRONG";
  auto response = Respond(2, other);
  ASSERT_TRUE(std::holds_alternative<dipnet::ErrorResponse>(response));
  EXPECT_EQ(std::get<dipnet::ErrorResponse>(response).error_type, "AUTHENTICATION_ERROR");

  sign_in.re_sent = true;
  auto replayed = Respond(1, sign_in);
  ASSERT_TRUE(std::holds_alternative<dipnet::DataTokenResponse>(replayed));
  EXPECT_EQ(std::get<dipnet::DataTokenResponse>(replayed).data, first);
  EXPECT_EQ(server_->Accounts().ActiveTokens(), 1u);

  dipnet::LogoutRequest logout;
  logout.request_id = "1";
  logout.re_sent = true;
  logout.token = "bogus";
  auto same_connection = Respond(1, logout);
  ASSERT_TRUE(std::holds_alternative<dipnet::ErrorResponse>(same_connection));
  EXPECT_EQ(std::get<dipnet::ErrorResponse>(same_connection).error_type, "AUTHENTICATION_ERROR");
}

TEST_F(FakeServerFixture, StalledRequestsGetNoAnswer) {
  auto token = SignIn(1);
  auto game_id = CreateGame(1, token);
  server_->SetStalled({"process_game"});
  EXPECT_TRUE(Call(1, GameRequest<dipnet::ProcessGameRequest>(token, game_id, "FRANCE")).empty());
  EXPECT_EQ((*server_->GameSnapshot(game_id))["phase"], "S1901M");
}

TEST_F(FakeServerFixture, UndecodableFrameWithRequestIdGetsParsingError) {
  auto frames = server_->HandleFrame(1, R"({"name":"sign_in","request_id":"r-9","username":"u"})");
  ASSERT_EQ(frames.size(), 1u);
  auto response = std::get<dipnet::Response>(dipnet::DecodeText(frames[0].text));
  const auto& error = std::get<dipnet::ErrorResponse>(response);
  EXPECT_EQ(error.request_id, "r-9");
  EXPECT_EQ(error.error_type, "PARSING_ERROR");

  EXPECT_TRUE(server_->HandleFrame(1, "not json at all").empty());
  EXPECT_TRUE(server_->HandleFrame(1, R"({"name":"game_deleted","game_id":"GAME_0001"})").empty());
  EXPECT_EQ(observability_->Snapshot().parse_errors, 2u);
}

TEST_F(FakeServerFixture, DeleteGameNotifiesMembersAndForgetsGame) {
  auto creator_token = SignIn(1);
  auto game_id = CreateGame(1, creator_token, 2);
  auto joiner_token = SignIn(2, "ai_player", "password");
  dipnet::JoinGameRequest join;
  join.token = joiner_token;
  join.game_id = game_id;
  Respond(2, join);

  auto not_creator = GameRequest<dipnet::DeleteGameRequest>(joiner_token, game_id, "OBSERVER");
  EXPECT_EQ(std::get<dipnet::ErrorResponse>(Respond(2, not_creator)).error_type, "GAME_ERROR");

  auto frames = Call(1, GameRequest<dipnet::DeleteGameRequest>(creator_token, game_id, "FRANCE"));
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(frames[1].connection, 2u);
  EXPECT_EQ(server_->GameCount(), 0u);
}

TEST_F(FakeServerFixture, LogoutInvalidatesToken) {
  auto token = SignIn(1);
  dipnet::LogoutRequest logout;
  logout.token = token;
  EXPECT_TRUE(std::holds_alternative<dipnet::OkResponse>(Respond(1, logout)));

  dipnet::GetAvailableMapsRequest maps;
  maps.token = token;
  EXPECT_EQ(std::get<dipnet::ErrorResponse>(Respond(1, maps)).error_type, "AUTHENTICATION_ERROR");
}

TEST_F(FakeServerFixture, ListGamesHidesProtectedGames) {
  auto token = SignIn(1);
  CreateGame(1, token);
  dipnet::CreateGameRequest hidden;
  hidden.token = token;
  hidden.registration_password = "secret";
  Respond(1, hidden);

  dipnet::ListGamesRequest list;
  list.token = token;
  EXPECT_EQ(std::get<dipnet::DataGamesResponse>(Respond(1, list)).data.size(), 1u);
  list.include_protected = true;
  EXPECT_EQ(std::get<dipnet::DataGamesResponse>(Respond(1, list)).data.size(), 2u);
}

}  // namespace
