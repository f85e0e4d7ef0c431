/*
 * 설명: 요청/응답/알림 메시지 분류 체계와 변형별 필드 집합을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/unit/codec_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace dipnet {

enum class MessageKind { kRequest, kResponse, kNotification };

// 요청이 요구하는 최소 세션 문맥.
enum class RequestScope { kConnection, kChannel, kGame };

// kDefaulted 필드는 디코딩 시 생략 가능하고 인코딩 시 항상 기록된다.
enum class Presence { kRequired, kDefaulted };

using PossibleOrders = std::map<std::string, std::vector<std::string>>;

// 각 메시지는 Fields(self, visitor)로 자신의 필드를 열거한다.
// visitor(key, field[, presence]) 형태로 호출되며 코덱과 검증기가 이를 공유한다.

struct RequestBase {
  static constexpr MessageKind kKind = MessageKind::kRequest;
  static constexpr RequestScope kScope = RequestScope::kConnection;

  std::string request_id;
  bool re_sent{false};

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    v("request_id", self.request_id);
    v("re_sent", self.re_sent, Presence::kDefaulted);
  }

  bool operator==(const RequestBase&) const = default;
};

struct ChannelRequestBase : RequestBase {
  static constexpr RequestScope kScope = RequestScope::kChannel;

  std::string token;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    RequestBase::Fields(self, v);
    v("token", self.token);
  }

  bool operator==(const ChannelRequestBase&) const = default;
};

struct GameRequestBase : ChannelRequestBase {
  static constexpr RequestScope kScope = RequestScope::kGame;

  std::string game_id;
  std::string game_role;
  std::optional<std::string> phase;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    ChannelRequestBase::Fields(self, v);
    v("game_id", self.game_id);
    v("game_role", self.game_role);
    v("phase", self.phase);
  }

  bool operator==(const GameRequestBase&) const = default;
};

struct ResponseBase {
  static constexpr MessageKind kKind = MessageKind::kResponse;

  std::string request_id;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    v("request_id", self.request_id);
  }

  bool operator==(const ResponseBase&) const = default;
};

struct NotificationBase {
  static constexpr MessageKind kKind = MessageKind::kNotification;

  template <typename Self, typename Visitor>
  static void Fields(Self& /*self*/, Visitor& /*v*/) {}

  bool operator==(const NotificationBase&) const = default;
};

// ---------------------------------------------------------------- 연결 단계 요청

struct SignInRequest : RequestBase {
  static constexpr std::string_view kName = "sign_in";
  std::string username;
  std::string password;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    RequestBase::Fields(self, v);
    v("username", self.username);
    v("password", self.password);
  }
  bool operator==(const SignInRequest&) const = default;
};

struct GetDaidePortRequest : RequestBase {
  static constexpr std::string_view kName = "get_daide_port";
  std::string game_id;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    RequestBase::Fields(self, v);
    v("game_id", self.game_id);
  }
  bool operator==(const GetDaidePortRequest&) const = default;
};

// ---------------------------------------------------------------- 채널 단계 요청

struct CreateGameRequest : ChannelRequestBase {
  static constexpr std::string_view kName = "create_game";
  std::string map_name{"standard"};
  std::vector<std::string> rules{"NO_PRESS", "IGNORE_ERRORS"};
  int n_controls{1};
  std::optional<int> deadline;
  std::optional<std::string> registration_password;
  std::optional<std::string> power_name;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    ChannelRequestBase::Fields(self, v);
    v("map_name", self.map_name, Presence::kDefaulted);
    v("rules", self.rules, Presence::kDefaulted);
    v("n_controls", self.n_controls, Presence::kDefaulted);
    v("deadline", self.deadline);
    v("registration_password", self.registration_password);
    v("power_name", self.power_name);
  }
  bool operator==(const CreateGameRequest&) const = default;
};

struct JoinGameRequest : ChannelRequestBase {
  static constexpr std::string_view kName = "join_game";
  std::string game_id;
  std::optional<std::string> power_name;
  std::optional<std::string> registration_password;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    ChannelRequestBase::Fields(self, v);
    v("game_id", self.game_id);
    v("power_name", self.power_name);
    v("registration_password", self.registration_password);
  }
  bool operator==(const JoinGameRequest&) const = default;
};

struct JoinPowersRequest : ChannelRequestBase {
  static constexpr std::string_view kName = "join_powers";
  std::string game_id;
  std::vector<std::string> power_names;
  std::optional<std::string> registration_password;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    ChannelRequestBase::Fields(self, v);
    v("game_id", self.game_id);
    v("power_names", self.power_names);
    v("registration_password", self.registration_password);
  }
  bool operator==(const JoinPowersRequest&) const = default;
};

struct ListGamesRequest : ChannelRequestBase {
  static constexpr std::string_view kName = "list_games";
  std::optional<std::string> game_id_filter;
  std::optional<std::string> map_name;
  std::optional<std::string> status;
  bool include_protected{false};

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    ChannelRequestBase::Fields(self, v);
    v("game_id_filter", self.game_id_filter);
    v("map_name", self.map_name);
    v("status", self.status);
    v("include_protected", self.include_protected, Presence::kDefaulted);
  }
  bool operator==(const ListGamesRequest&) const = default;
};

struct GetPlayablePowersRequest : ChannelRequestBase {
  static constexpr std::string_view kName = "get_playable_powers";
  std::string game_id;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    ChannelRequestBase::Fields(self, v);
    v("game_id", self.game_id);
  }
  bool operator==(const GetPlayablePowersRequest&) const = default;
};

struct GetAvailableMapsRequest : ChannelRequestBase {
  static constexpr std::string_view kName = "get_available_maps";

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    ChannelRequestBase::Fields(self, v);
  }
  bool operator==(const GetAvailableMapsRequest&) const = default;
};

struct GetDummyWaitingPowersRequest : ChannelRequestBase {
  static constexpr std::string_view kName = "get_dummy_waiting_powers";
  std::string game_id;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    ChannelRequestBase::Fields(self, v);
    v("game_id", self.game_id);
  }
  bool operator==(const GetDummyWaitingPowersRequest&) const = default;
};

struct SetGradeRequest : ChannelRequestBase {
  static constexpr std::string_view kName = "set_grade";
  std::string username;
  std::string grade;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    ChannelRequestBase::Fields(self, v);
    v("username", self.username);
    v("grade", self.grade);
  }
  bool operator==(const SetGradeRequest&) const = default;
};

struct DeleteAccountRequest : ChannelRequestBase {
  static constexpr std::string_view kName = "delete_account";

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    ChannelRequestBase::Fields(self, v);
  }
  bool operator==(const DeleteAccountRequest&) const = default;
};

struct LogoutRequest : ChannelRequestBase {
  static constexpr std::string_view kName = "logout";

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    ChannelRequestBase::Fields(self, v);
  }
  bool operator==(const LogoutRequest&) const = default;
};

// ---------------------------------------------------------------- 게임 단계 요청

struct SetOrdersRequest : GameRequestBase {
  static constexpr std::string_view kName = "set_orders";
  std::vector<std::string> orders;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    GameRequestBase::Fields(self, v);
    v("orders", self.orders);
  }
  bool operator==(const SetOrdersRequest&) const = default;
};

struct SetWaitFlagRequest : GameRequestBase {
  static constexpr std::string_view kName = "set_wait_flag";
  bool wait{false};

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    GameRequestBase::Fields(self, v);
    v("wait", self.wait);
  }
  bool operator==(const SetWaitFlagRequest&) const = default;
};

struct SendGameMessageRequest : GameRequestBase {
  static constexpr std::string_view kName = "send_game_message";
  std::string recipient;
  std::string message;
  std::string message_type{"DIPLOMATIC"};

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    GameRequestBase::Fields(self, v);
    v("recipient", self.recipient);
    v("message", self.message);
    v("message_type", self.message_type, Presence::kDefaulted);
  }
  bool operator==(const SendGameMessageRequest&) const = default;
};

struct GetAllPossibleOrdersRequest : GameRequestBase {
  static constexpr std::string_view kName = "get_all_possible_orders";

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    GameRequestBase::Fields(self, v);
  }
  bool operator==(const GetAllPossibleOrdersRequest&) const = default;
};

struct GetPhaseHistoryRequest : GameRequestBase {
  static constexpr std::string_view kName = "get_phase_history";
  std::optional<std::string> from_phase;
  std::optional<std::string> to_phase;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    GameRequestBase::Fields(self, v);
    v("from_phase", self.from_phase);
    v("to_phase", self.to_phase);
  }
  bool operator==(const GetPhaseHistoryRequest&) const = default;
};

struct ProcessGameRequest : GameRequestBase {
  static constexpr std::string_view kName = "process_game";

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    GameRequestBase::Fields(self, v);
  }
  bool operator==(const ProcessGameRequest&) const = default;
};

// vote 값은 "yes" 또는 "no"만 허용된다.
struct VoteRequest : GameRequestBase {
  static constexpr std::string_view kName = "vote";
  std::string vote;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    GameRequestBase::Fields(self, v);
    v("vote", self.vote);
  }
  bool operator==(const VoteRequest&) const = default;
};

struct SaveGameRequest : GameRequestBase {
  static constexpr std::string_view kName = "save_game";

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    GameRequestBase::Fields(self, v);
  }
  bool operator==(const SaveGameRequest&) const = default;
};

struct SetGameStateRequest : GameRequestBase {
  static constexpr std::string_view kName = "set_game_state";
  nlohmann::json state = nlohmann::json::object();

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    GameRequestBase::Fields(self, v);
    v("state", self.state);
  }
  bool operator==(const SetGameStateRequest&) const = default;
};

struct SetGameStatusRequest : GameRequestBase {
  static constexpr std::string_view kName = "set_game_status";
  std::string status;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    GameRequestBase::Fields(self, v);
    v("status", self.status);
  }
  bool operator==(const SetGameStatusRequest&) const = default;
};

struct SetDummyPowersRequest : GameRequestBase {
  static constexpr std::string_view kName = "set_dummy_powers";
  std::vector<std::string> power_names;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    GameRequestBase::Fields(self, v);
    v("power_names", self.power_names);
  }
  bool operator==(const SetDummyPowersRequest&) const = default;
};

struct DeleteGameRequest : GameRequestBase {
  static constexpr std::string_view kName = "delete_game";

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    GameRequestBase::Fields(self, v);
  }
  bool operator==(const DeleteGameRequest&) const = default;
};

struct LeaveGameRequest : GameRequestBase {
  static constexpr std::string_view kName = "leave_game";

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    GameRequestBase::Fields(self, v);
  }
  bool operator==(const LeaveGameRequest&) const = default;
};

// ---------------------------------------------------------------- 응답

struct OkResponse : ResponseBase {
  static constexpr std::string_view kName = "ok";

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    ResponseBase::Fields(self, v);
  }
  bool operator==(const OkResponse&) const = default;
};

struct ErrorResponse : ResponseBase {
  static constexpr std::string_view kName = "error";
  std::string error_type;
  std::string message;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    ResponseBase::Fields(self, v);
    v("error_type", self.error_type);
    v("message", self.message);
  }
  bool operator==(const ErrorResponse&) const = default;
};

struct DataTokenResponse : ResponseBase {
  static constexpr std::string_view kName = "data_token";
  std::string data;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    ResponseBase::Fields(self, v);
    v("data", self.data);
  }
  bool operator==(const DataTokenResponse&) const = default;
};

struct DataGameResponse : ResponseBase {
  static constexpr std::string_view kName = "data_game";
  nlohmann::json data = nlohmann::json::object();

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    ResponseBase::Fields(self, v);
    v("data", self.data);
  }
  bool operator==(const DataGameResponse&) const = default;
};

struct DataGameInfoResponse : ResponseBase {
  static constexpr std::string_view kName = "data_game_info";
  nlohmann::json data = nlohmann::json::object();

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    ResponseBase::Fields(self, v);
    v("data", self.data);
  }
  bool operator==(const DataGameInfoResponse&) const = default;
};

struct DataGamesResponse : ResponseBase {
  static constexpr std::string_view kName = "data_games";
  std::vector<nlohmann::json> data;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    ResponseBase::Fields(self, v);
    v("data", self.data);
  }
  bool operator==(const DataGamesResponse&) const = default;
};

struct DataMapsResponse : ResponseBase {
  static constexpr std::string_view kName = "data_maps";
  std::vector<std::string> data;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    ResponseBase::Fields(self, v);
    v("data", self.data);
  }
  bool operator==(const DataMapsResponse&) const = default;
};

struct DataPowerNamesResponse : ResponseBase {
  static constexpr std::string_view kName = "data_power_names";
  std::vector<std::string> data;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    ResponseBase::Fields(self, v);
    v("data", self.data);
  }
  bool operator==(const DataPowerNamesResponse&) const = default;
};

struct DataPossibleOrdersResponse : ResponseBase {
  static constexpr std::string_view kName = "data_possible_orders";
  PossibleOrders data;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    ResponseBase::Fields(self, v);
    v("data", self.data);
  }
  bool operator==(const DataPossibleOrdersResponse&) const = default;
};

struct DataGamePhasesResponse : ResponseBase {
  static constexpr std::string_view kName = "data_game_phases";
  std::vector<nlohmann::json> data;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    ResponseBase::Fields(self, v);
    v("data", self.data);
  }
  bool operator==(const DataGamePhasesResponse&) const = default;
};

struct DataSavedGameResponse : ResponseBase {
  static constexpr std::string_view kName = "data_saved_game";
  nlohmann::json data = nlohmann::json::object();

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    ResponseBase::Fields(self, v);
    v("data", self.data);
  }
  bool operator==(const DataSavedGameResponse&) const = default;
};

struct DataPortResponse : ResponseBase {
  static constexpr std::string_view kName = "data_port";
  int data{0};

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    ResponseBase::Fields(self, v);
    v("data", self.data);
  }
  bool operator==(const DataPortResponse&) const = default;
};

// ---------------------------------------------------------------- 알림

struct GameProcessedNotification : NotificationBase {
  static constexpr std::string_view kName = "game_processed";
  std::string game_id;
  std::string phase;
  nlohmann::json game_state = nlohmann::json::object();

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    v("game_id", self.game_id);
    v("phase", self.phase);
    v("game_state", self.game_state);
  }
  bool operator==(const GameProcessedNotification&) const = default;
};

struct GamePhaseUpdateNotification : NotificationBase {
  static constexpr std::string_view kName = "game_phase_update";
  std::string game_id;
  std::string phase;
  nlohmann::json game_state = nlohmann::json::object();

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    v("game_id", self.game_id);
    v("phase", self.phase);
    v("game_state", self.game_state);
  }
  bool operator==(const GamePhaseUpdateNotification&) const = default;
};

struct GameStatusUpdateNotification : NotificationBase {
  static constexpr std::string_view kName = "game_status_update";
  std::string game_id;
  std::string status;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    v("game_id", self.game_id);
    v("status", self.status);
  }
  bool operator==(const GameStatusUpdateNotification&) const = default;
};

struct PowersControllersNotification : NotificationBase {
  static constexpr std::string_view kName = "powers_controllers";
  std::string game_id;
  std::map<std::string, std::string> controllers;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    v("game_id", self.game_id);
    v("controllers", self.controllers);
  }
  bool operator==(const PowersControllersNotification&) const = default;
};

struct PowerOrdersUpdateNotification : NotificationBase {
  static constexpr std::string_view kName = "power_orders_update";
  std::string game_id;
  std::string power_name;
  std::vector<std::string> orders;
  std::string phase;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    v("game_id", self.game_id);
    v("power_name", self.power_name);
    v("orders", self.orders);
    v("phase", self.phase);
  }
  bool operator==(const PowerOrdersUpdateNotification&) const = default;
};

struct PowerOrdersFlagNotification : NotificationBase {
  static constexpr std::string_view kName = "power_orders_flag";
  std::string game_id;
  std::string power_name;
  bool order_is_set{false};
  std::string phase;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    v("game_id", self.game_id);
    v("power_name", self.power_name);
    v("order_is_set", self.order_is_set);
    v("phase", self.phase);
  }
  bool operator==(const PowerOrdersFlagNotification&) const = default;
};

struct PowerWaitFlagNotification : NotificationBase {
  static constexpr std::string_view kName = "power_wait_flag";
  std::string game_id;
  std::string power_name;
  bool wait{false};

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    v("game_id", self.game_id);
    v("power_name", self.power_name);
    v("wait", self.wait);
  }
  bool operator==(const PowerWaitFlagNotification&) const = default;
};

struct GameMessageReceivedNotification : NotificationBase {
  static constexpr std::string_view kName = "game_message_received";
  std::string game_id;
  std::string sender;
  std::string recipient;
  std::string message;
  std::string message_type;
  std::int64_t time_sent{0};

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    v("game_id", self.game_id);
    v("sender", self.sender);
    v("recipient", self.recipient);
    v("message", self.message);
    v("message_type", self.message_type);
    v("time_sent", self.time_sent);
  }
  bool operator==(const GameMessageReceivedNotification&) const = default;
};

struct VoteUpdatedNotification : NotificationBase {
  static constexpr std::string_view kName = "vote_updated";
  std::string game_id;
  std::map<std::string, std::string> votes;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    v("game_id", self.game_id);
    v("votes", self.votes);
  }
  bool operator==(const VoteUpdatedNotification&) const = default;
};

struct VoteCountUpdatedNotification : NotificationBase {
  static constexpr std::string_view kName = "vote_count_updated";
  std::string game_id;
  int count_yes{0};
  int count_no{0};

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    v("game_id", self.game_id);
    v("count_yes", self.count_yes);
    v("count_no", self.count_no);
  }
  bool operator==(const VoteCountUpdatedNotification&) const = default;
};

struct PowerVoteUpdatedNotification : NotificationBase {
  static constexpr std::string_view kName = "power_vote_updated";
  std::string game_id;
  std::string power_name;
  std::string vote;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    v("game_id", self.game_id);
    v("power_name", self.power_name);
    v("vote", self.vote);
  }
  bool operator==(const PowerVoteUpdatedNotification&) const = default;
};

struct GameDeletedNotification : NotificationBase {
  static constexpr std::string_view kName = "game_deleted";
  std::string game_id;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    v("game_id", self.game_id);
  }
  bool operator==(const GameDeletedNotification&) const = default;
};

struct OmniscientUpdatedNotification : NotificationBase {
  static constexpr std::string_view kName = "omniscient_updated";
  std::string game_id;
  std::string omniscient_type;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    v("game_id", self.game_id);
    v("omniscient_type", self.omniscient_type);
  }
  bool operator==(const OmniscientUpdatedNotification&) const = default;
};

struct AccountDeletedNotification : NotificationBase {
  static constexpr std::string_view kName = "account_deleted";
  std::string username;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    v("username", self.username);
  }
  bool operator==(const AccountDeletedNotification&) const = default;
};

struct ClearedCentersNotification : NotificationBase {
  static constexpr std::string_view kName = "cleared_centers";
  std::string game_id;
  std::string power_name;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    v("game_id", self.game_id);
    v("power_name", self.power_name);
  }
  bool operator==(const ClearedCentersNotification&) const = default;
};

struct ClearedOrdersNotification : NotificationBase {
  static constexpr std::string_view kName = "cleared_orders";
  std::string game_id;
  std::string power_name;
  std::string phase;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    v("game_id", self.game_id);
    v("power_name", self.power_name);
    v("phase", self.phase);
  }
  bool operator==(const ClearedOrdersNotification&) const = default;
};

struct ClearedUnitsNotification : NotificationBase {
  static constexpr std::string_view kName = "cleared_units";
  std::string game_id;
  std::string power_name;

  template <typename Self, typename Visitor>
  static void Fields(Self& self, Visitor& v) {
    v("game_id", self.game_id);
    v("power_name", self.power_name);
  }
  bool operator==(const ClearedUnitsNotification&) const = default;
};

// ---------------------------------------------------------------- 닫힌 합 타입

using Request = std::variant<SignInRequest, GetDaidePortRequest, CreateGameRequest, JoinGameRequest,
                             JoinPowersRequest, ListGamesRequest, GetPlayablePowersRequest,
                             GetAvailableMapsRequest, GetDummyWaitingPowersRequest, SetGradeRequest,
                             DeleteAccountRequest, LogoutRequest, SetOrdersRequest, SetWaitFlagRequest,
                             SendGameMessageRequest, GetAllPossibleOrdersRequest, GetPhaseHistoryRequest,
                             ProcessGameRequest, VoteRequest, SaveGameRequest, SetGameStateRequest,
                             SetGameStatusRequest, SetDummyPowersRequest, DeleteGameRequest, LeaveGameRequest>;

using Response = std::variant<OkResponse, ErrorResponse, DataTokenResponse, DataGameResponse, DataGameInfoResponse,
                              DataGamesResponse, DataMapsResponse, DataPowerNamesResponse,
                              DataPossibleOrdersResponse, DataGamePhasesResponse, DataSavedGameResponse,
                              DataPortResponse>;

using Notification =
    std::variant<GameProcessedNotification, GamePhaseUpdateNotification, GameStatusUpdateNotification,
                 PowersControllersNotification, PowerOrdersUpdateNotification, PowerOrdersFlagNotification,
                 PowerWaitFlagNotification, GameMessageReceivedNotification, VoteUpdatedNotification,
                 VoteCountUpdatedNotification, PowerVoteUpdatedNotification, GameDeletedNotification,
                 OmniscientUpdatedNotification, AccountDeletedNotification, ClearedCentersNotification,
                 ClearedOrdersNotification, ClearedUnitsNotification>;

using Message = std::variant<Request, Response, Notification>;

template <typename T, typename Variant>
struct VariantIndex;

template <typename T, typename... Ts>
struct VariantIndex<T, std::variant<Ts...>> {
  static constexpr std::size_t value = [] {
    std::size_t index = 0;
    ((std::is_same_v<T, Ts> ? false : (++index, true)) && ...);
    return index;
  }();
  static_assert(value < sizeof...(Ts), "type is not an alternative of the variant");
};

template <typename T, typename Variant>
inline constexpr std::size_t kVariantIndex = VariantIndex<T, Variant>::value;

std::string_view NameOf(const Request& request);
std::string_view NameOf(const Response& response);
std::string_view NameOf(const Notification& notification);
std::string_view NameOf(const Message& message);
MessageKind KindOf(const Message& message);

RequestScope ScopeOf(const Request& request);
const std::string& RequestIdOf(const Request& request);
const std::string& RequestIdOf(const Response& response);
void SetRequestId(Request& request, std::string request_id);
void MarkResent(Request& request);
bool IsResent(const Request& request);

std::string_view ToString(RequestScope scope);

}  // namespace dipnet
