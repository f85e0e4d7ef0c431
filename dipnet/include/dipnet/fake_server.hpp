/*
 * 설명: 같은 메시지 분류 체계를 구현하는 인메모리 프로토콜 더블. 사용자/토큰/게임 상태를 보관하고
 *       요청마다 응답 프레임과 다른 연결로 보낼 푸시 알림 프레임을 만든다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/unit/fake_server_test.cpp, dipnet/tests/e2e/client_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "dipnet/account_store.hpp"
#include "dipnet/messages.hpp"
#include "dipnet/observability.hpp"

namespace dipnet {

using ConnectionId = std::uint64_t;

struct OutboundFrame {
  ConnectionId connection;
  std::string text;
};

struct FakeServerOptions {
  AccountConfig accounts;
  std::size_t resent_cache_size{256};
  // test_user/test_password, ai_player/password, player1/password
  bool seed_users{true};
};

class FakeServer {
 public:
  FakeServer(FakeServerOptions options, std::shared_ptr<Observability> observability);

  // 프레임 하나를 처리한다. 응답 프레임이 있으면 항상 첫 번째이고 푸시 알림이 뒤따른다.
  std::vector<OutboundFrame> HandleFrame(ConnectionId connection, const std::string& text);
  std::vector<OutboundFrame> HandleRequest(ConnectionId connection, const Request& request);
  void OnDisconnected(ConnectionId connection);

  // 이름이 포함된 요청은 부수효과 없이 응답도 하지 않는다. 타임아웃/연결 끊김 시나리오용.
  void SetStalled(std::set<std::string> names);

  AccountStore& Accounts() { return accounts_; }
  std::size_t GameCount() const;
  std::optional<nlohmann::json> GameSnapshot(const std::string& game_id) const;

 private:
  struct Game {
    nlohmann::json snapshot;
    std::string creator;
    std::optional<std::string> registration_password;
    std::map<std::string, std::vector<std::string>> orders;
    std::map<std::string, bool> wait_flags;
    std::vector<nlohmann::json> messages;
    std::vector<nlohmann::json> history;
    std::map<ConnectionId, std::string> members;
  };

  using ResentKey = std::pair<ConnectionId, std::string>;

  struct CachedFrame {
    std::string name;
    std::string text;
  };

  struct Context {
    ConnectionId connection;
    std::string request_id;
    std::string username;
    Game* game{nullptr};
    std::vector<OutboundFrame> pushes;
  };

  Response Dispatch(Context& ctx, const Request& request);

  Response Handle(Context& ctx, const SignInRequest& request);
  Response Handle(Context& ctx, const LogoutRequest& request);
  Response Handle(Context& ctx, const GetAvailableMapsRequest& request);
  Response Handle(Context& ctx, const CreateGameRequest& request);
  Response Handle(Context& ctx, const JoinGameRequest& request);
  Response Handle(Context& ctx, const ListGamesRequest& request);
  Response Handle(Context& ctx, const GetPlayablePowersRequest& request);
  Response Handle(Context& ctx, const LeaveGameRequest& request);
  Response Handle(Context& ctx, const SetOrdersRequest& request);
  Response Handle(Context& ctx, const SetWaitFlagRequest& request);
  Response Handle(Context& ctx, const SendGameMessageRequest& request);
  Response Handle(Context& ctx, const ProcessGameRequest& request);
  Response Handle(Context& ctx, const GetAllPossibleOrdersRequest& request);
  Response Handle(Context& ctx, const GetPhaseHistoryRequest& request);
  Response Handle(Context& ctx, const SaveGameRequest& request);
  Response Handle(Context& ctx, const DeleteGameRequest& request);
  template <typename T>
  Response Handle(Context& ctx, const T& request);

  template <typename T>
  void PushToMembers(Context& ctx, const Game& game, const T& notification, bool include_sender);

  Game* FindGame(const std::string& game_id);
  // 통제 국가 수가 n_controls에 도달하면 FORMING -> ACTIVE. 바뀌었으면 true.
  bool RefreshStatus(Game& game);
  // 재전송 캐시는 (연결, request_id) 단위이고 요청 이름까지 같아야 재생한다.
  void RememberResponse(ConnectionId connection, const std::string& request_id, const std::string& name,
                        const std::string& text);
  std::optional<std::string> CachedResponse(ConnectionId connection, const std::string& request_id,
                                            const std::string& name) const;

  FakeServerOptions options_;
  std::shared_ptr<Observability> observability_;
  AccountStore accounts_;

  mutable std::mutex mutex_;
  std::map<std::string, Game> games_;
  int game_counter_{1};
  std::set<std::string> stalled_;
  std::map<ResentKey, CachedFrame> resent_cache_;
  std::deque<ResentKey> resent_order_;
};

}  // namespace dipnet
