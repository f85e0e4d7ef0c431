/*
 * 설명: 인메모리 프로토콜 더블의 요청 처리기. 토큰/게임 검증 후 변형별 핸들러로 보내고
 *       응답 캐시(re_sent)와 게임 구성원 대상 푸시 알림을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/unit/fake_server_test.cpp, dipnet/tests/e2e/client_flow_test.cpp
 */
#include "dipnet/fake_server.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>

#include "dipnet/codec.hpp"
#include "dipnet/errors.hpp"

namespace dipnet {
namespace {

const std::set<std::string_view>& SupportedRequests() {
  static const std::set<std::string_view> names{
      SignInRequest::kName,         LogoutRequest::kName,          GetAvailableMapsRequest::kName,
      CreateGameRequest::kName,     JoinGameRequest::kName,        ListGamesRequest::kName,
      GetPlayablePowersRequest::kName, LeaveGameRequest::kName,    SetOrdersRequest::kName,
      SetWaitFlagRequest::kName,    SendGameMessageRequest::kName, ProcessGameRequest::kName,
      GetAllPossibleOrdersRequest::kName, GetPhaseHistoryRequest::kName, SaveGameRequest::kName,
      DeleteGameRequest::kName};
  return names;
}

nlohmann::json PowerEntry(std::initializer_list<const char*> units, std::initializer_list<const char*> centers) {
  nlohmann::json unit_list = nlohmann::json::array();
  for (const auto* unit : units) {
    unit_list.push_back(unit);
  }
  nlohmann::json center_list = nlohmann::json::array();
  for (const auto* center : centers) {
    center_list.push_back(center);
  }
  return {{"units", unit_list}, {"centers", center_list}, {"is_eliminated", false}};
}

nlohmann::json StandardPowers() {
  nlohmann::json powers = nlohmann::json::object();
  powers["AUSTRIA"] = PowerEntry({"A VIE", "A BUD", "F TRI"}, {"VIE", "BUD", "TRI"});
  powers["ENGLAND"] = PowerEntry({"F EDI", "F LON", "A LVP"}, {"EDI", "LVP", "LON"});
  powers["FRANCE"] = PowerEntry({"F BRE", "A PAR", "A MAR"}, {"PAR", "BRE", "MAR"});
  powers["GERMANY"] = PowerEntry({"F KIE", "A BER", "A MUN"}, {"BER", "MUN", "KIE"});
  powers["ITALY"] = PowerEntry({"F NAP", "A ROM", "A VEN"}, {"ROM", "NAP", "VEN"});
  powers["RUSSIA"] = PowerEntry({"A WAR", "A MOS", "F SEV", "F STP/SC"}, {"MOS", "SEV", "STP", "WAR"});
  powers["TURKEY"] = PowerEntry({"F ANK", "A CON", "A SMY"}, {"ANK", "CON", "SMY"});
  return powers;
}

PossibleOrders CannedPossibleOrders() {
  return {
      {"PAR", {"A PAR H", "A PAR - BUR", "A PAR - PIC", "A PAR - GAS"}},
      {"BRE", {"F BRE H", "F BRE - MAO", "F BRE - ENG", "F BRE - PIC"}},
      {"MAR", {"A MAR H", "A MAR - GAS", "A MAR - SPA", "A MAR - PIE"}},
  };
}

// 판정 없이 고정된 페이즈 문자열만 진행한다.
std::string NextPhase(const std::string& current) {
  if (current == "S1901M") {
    return "F1901M";
  }
  if (current == "F1901M") {
    return "W1901A";
  }
  return "S1902M";
}

bool IsAdminRole(const std::string& role) { return role == "OMNISCIENT" || role == "MASTER"; }

bool IsPower(const nlohmann::json& snapshot, const std::string& role) {
  return snapshot["powers"].contains(role);
}

std::map<std::string, std::string> Controllers(const nlohmann::json& snapshot) {
  std::map<std::string, std::string> controllers;
  for (const auto& [power, username] : snapshot["controlled_powers"].items()) {
    controllers.emplace(power, username.get<std::string>());
  }
  return controllers;
}

Response MakeError(const std::string& request_id, std::string_view error_type, std::string message) {
  ErrorResponse error;
  error.request_id = request_id;
  error.error_type = std::string(error_type);
  error.message = std::move(message);
  return error;
}

Response MakeOk(const std::string& request_id) {
  OkResponse ok;
  ok.request_id = request_id;
  return ok;
}

std::optional<std::string> SalvageRequestId(const std::string& text) {
  auto document = nlohmann::json::parse(text, nullptr, false);
  if (document.is_discarded() || !document.is_object()) {
    return std::nullopt;
  }
  auto it = document.find("request_id");
  if (it == document.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

std::string FormatGameId(int counter) {
  std::ostringstream oss;
  oss << "GAME_" << std::setw(4) << std::setfill('0') << counter;
  return oss.str();
}

}  // namespace

FakeServer::FakeServer(FakeServerOptions options, std::shared_ptr<Observability> observability)
    : options_(std::move(options)), observability_(std::move(observability)), accounts_(options_.accounts) {
  if (!options_.seed_users) {
    return;
  }
  const std::pair<const char*, const char*> seeds[] = {
      {"test_user", "test_password"}, {"ai_player", "password"}, {"player1", "password"}};
  for (const auto& [username, password] : seeds) {
    std::string error_code;
    std::string error_message;
    if (!accounts_.RegisterUser(username, password, error_code, error_message)) {
      throw std::runtime_error("seed user " + std::string(username) + ": " + error_message);
    }
  }
}

template <typename T>
void FakeServer::PushToMembers(Context& ctx, const Game& game, const T& notification, bool include_sender) {
  const auto text = EncodeText(notification);
  for (const auto& [connection, role] : game.members) {
    if (!include_sender && connection == ctx.connection) {
      continue;
    }
    ctx.pushes.push_back(OutboundFrame{connection, text});
  }
}

template <typename T>
Response FakeServer::Handle(Context& ctx, const T& /*request*/) {
  return MakeError(ctx.request_id, kUnsupportedRequestErrorType,
                   "Request type " + std::string(T::kName) + " not supported by fake server");
}

std::vector<OutboundFrame> FakeServer::HandleFrame(ConnectionId connection, const std::string& text) {
  Message message;
  try {
    message = DecodeText(text);
  } catch (const ParsingError& ex) {
    observability_->IncrementParseError();
    auto request_id = SalvageRequestId(text);
    observability_->Log(LogLevel::kWarn, LogContext{.trace_id = observability_->NextTraceId(),
                                                    .name = "fake_server_parse_failed",
                                                    .request_id = request_id,
                                                    .detail = ex.what()});
    if (!request_id) {
      return {};
    }
    return {OutboundFrame{connection, EncodeText(MakeError(*request_id, kParsingErrorType, ex.what()))}};
  }

  if (auto* request = std::get_if<Request>(&message)) {
    return HandleRequest(connection, *request);
  }
  auto request_id = SalvageRequestId(text);
  observability_->Log(LogLevel::kWarn, LogContext{.trace_id = observability_->NextTraceId(),
                                                  .name = "fake_server_non_request_dropped",
                                                  .request_id = request_id,
                                                  .detail = std::string(NameOf(message))});
  if (!request_id) {
    return {};
  }
  return {OutboundFrame{connection, EncodeText(MakeError(*request_id, kParsingErrorType,
                                                         "expected a request, got " +
                                                             std::string(NameOf(message))))}};
}

std::vector<OutboundFrame> FakeServer::HandleRequest(ConnectionId connection, const Request& request) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string name{NameOf(request)};
  const std::string& request_id = RequestIdOf(request);

  if (stalled_.count(name) > 0) {
    observability_->Log(LogLevel::kDebug, LogContext{.trace_id = observability_->NextTraceId(),
                                                     .name = "fake_server_request_stalled",
                                                     .request_id = request_id,
                                                     .detail = name});
    return {};
  }

  if (IsResent(request)) {
    if (auto cached = CachedResponse(connection, request_id, name)) {
      observability_->Log(LogLevel::kInfo, LogContext{.trace_id = observability_->NextTraceId(),
                                                      .name = "fake_server_resent_replayed",
                                                      .request_id = request_id,
                                                      .detail = name});
      return {OutboundFrame{connection, *cached}};
    }
  }

  observability_->IncrementRequest();
  Context ctx{connection, request_id};
  Response response = Dispatch(ctx, request);
  if (const auto* error = std::get_if<ErrorResponse>(&response)) {
    observability_->IncrementError();
    observability_->Log(LogLevel::kInfo, LogContext{.trace_id = observability_->NextTraceId(),
                                                    .name = "fake_server_request_failed",
                                                    .request_id = request_id,
                                                    .detail = name + ": " + error->error_type + " " + error->message});
  } else {
    observability_->Log(LogLevel::kDebug, LogContext{.trace_id = observability_->NextTraceId(),
                                                     .name = "fake_server_request_handled",
                                                     .request_id = request_id,
                                                     .detail = name});
  }

  auto text = EncodeText(response);
  RememberResponse(connection, request_id, name, text);

  std::vector<OutboundFrame> frames;
  frames.reserve(ctx.pushes.size() + 1);
  frames.push_back(OutboundFrame{connection, std::move(text)});
  for (auto& push : ctx.pushes) {
    frames.push_back(std::move(push));
  }
  return frames;
}

Response FakeServer::Dispatch(Context& ctx, const Request& request) {
  if (SupportedRequests().count(NameOf(request)) == 0) {
    return std::visit([this, &ctx](const auto& inner) { return Handle(ctx, inner); }, request);
  }
  return std::visit(
      [this, &ctx](const auto& inner) -> Response {
        using T = std::decay_t<decltype(inner)>;
        if constexpr (std::is_base_of_v<ChannelRequestBase, T>) {
          auto username = accounts_.ValidateToken(inner.token);
          if (!username) {
            return MakeError(ctx.request_id, kAuthenticationErrorType, "Invalid or missing authentication token");
          }
          ctx.username = *username;
        }
        if constexpr (std::is_base_of_v<GameRequestBase, T>) {
          ctx.game = FindGame(inner.game_id);
          if (ctx.game == nullptr) {
            return MakeError(ctx.request_id, kGameNotFoundErrorType, "Game " + inner.game_id + " not found");
          }
          if (inner.phase && *inner.phase != ctx.game->snapshot["phase"].template get<std::string>()) {
            return MakeError(ctx.request_id, kGameErrorType,
                             "Phase mismatch: game " + inner.game_id + " is at " +
                                 ctx.game->snapshot["phase"].template get<std::string>());
          }
        }
        return Handle(ctx, inner);
      },
      request);
}

Response FakeServer::Handle(Context& ctx, const SignInRequest& request) {
  std::string error_code;
  std::string error_message;
  auto token = accounts_.SignIn(request.username, request.password, error_code, error_message);
  if (!token) {
    return MakeError(ctx.request_id, error_code, error_message);
  }
  DataTokenResponse response;
  response.request_id = ctx.request_id;
  response.data = *token;
  return response;
}

Response FakeServer::Handle(Context& ctx, const LogoutRequest& request) {
  if (!accounts_.Logout(request.token)) {
    return MakeError(ctx.request_id, kAuthenticationErrorType, "Token is no longer valid");
  }
  return MakeOk(ctx.request_id);
}

Response FakeServer::Handle(Context& ctx, const GetAvailableMapsRequest& /*request*/) {
  DataMapsResponse response;
  response.request_id = ctx.request_id;
  response.data = {"standard"};
  return response;
}

Response FakeServer::Handle(Context& ctx, const CreateGameRequest& request) {
  if (request.map_name != "standard") {
    return MakeError(ctx.request_id, kGameErrorType, "Map " + request.map_name + " is not available");
  }
  if (request.n_controls < 1 || request.n_controls > 7) {
    return MakeError(ctx.request_id, kGameErrorType, "n_controls must be between 1 and 7");
  }

  Game game;
  const std::string game_id = FormatGameId(game_counter_);
  game.snapshot = {{"game_id", game_id},
                   {"map_name", request.map_name},
                   {"rules", request.rules},
                   {"phase", "S1901M"},
                   {"status", "FORMING"},
                   {"n_controls", request.n_controls},
                   {"powers", StandardPowers()},
                   {"controlled_powers", nlohmann::json::object()}};
  if (request.deadline) {
    game.snapshot["deadline"] = *request.deadline;
  }
  if (request.power_name) {
    if (!IsPower(game.snapshot, *request.power_name)) {
      return MakeError(ctx.request_id, kGameErrorType, "Unknown power " + *request.power_name);
    }
    game.snapshot["controlled_powers"][*request.power_name] = ctx.username;
  }
  game.creator = ctx.username;
  game.registration_password = request.registration_password;
  game.members[ctx.connection] = request.power_name.value_or("OMNISCIENT");
  RefreshStatus(game);
  ++game_counter_;

  DataGameResponse response;
  response.request_id = ctx.request_id;
  response.data = game.snapshot;
  games_.emplace(game_id, std::move(game));
  return response;
}

Response FakeServer::Handle(Context& ctx, const JoinGameRequest& request) {
  Game* game = FindGame(request.game_id);
  if (game == nullptr) {
    return MakeError(ctx.request_id, kGameNotFoundErrorType, "Game " + request.game_id + " not found");
  }
  if (game->registration_password && request.registration_password != game->registration_password) {
    return MakeError(ctx.request_id, kGameErrorType, "Invalid registration password");
  }

  if (request.power_name) {
    const auto& power = *request.power_name;
    if (!IsPower(game->snapshot, power)) {
      return MakeError(ctx.request_id, kGameErrorType, "Unknown power " + power);
    }
    auto& controlled = game->snapshot["controlled_powers"];
    if (controlled.contains(power) && controlled[power].get<std::string>() != ctx.username) {
      return MakeError(ctx.request_id, kGameErrorType, "Power " + power + " is already controlled");
    }
    controlled[power] = ctx.username;
  }
  game->members[ctx.connection] = request.power_name.value_or("OBSERVER");

  const bool activated = RefreshStatus(*game);
  if (request.power_name) {
    PowersControllersNotification controllers;
    controllers.game_id = request.game_id;
    controllers.controllers = Controllers(game->snapshot);
    PushToMembers(ctx, *game, controllers, false);
  }
  if (activated) {
    GameStatusUpdateNotification status;
    status.game_id = request.game_id;
    status.status = game->snapshot["status"].get<std::string>();
    PushToMembers(ctx, *game, status, true);
  }

  DataGameResponse response;
  response.request_id = ctx.request_id;
  response.data = game->snapshot;
  return response;
}

Response FakeServer::Handle(Context& ctx, const ListGamesRequest& request) {
  DataGamesResponse response;
  response.request_id = ctx.request_id;
  for (const auto& [game_id, game] : games_) {
    const auto& snapshot = game.snapshot;
    if (request.game_id_filter && game_id.find(*request.game_id_filter) == std::string::npos) {
      continue;
    }
    if (request.map_name && snapshot["map_name"].get<std::string>() != *request.map_name) {
      continue;
    }
    if (request.status && snapshot["status"].get<std::string>() != *request.status) {
      continue;
    }
    if (game.registration_password && !request.include_protected) {
      continue;
    }
    response.data.push_back({{"game_id", game_id},
                             {"map_name", snapshot["map_name"]},
                             {"status", snapshot["status"]},
                             {"phase", snapshot["phase"]},
                             {"n_controls", snapshot["n_controls"]}});
  }
  return response;
}

Response FakeServer::Handle(Context& ctx, const GetPlayablePowersRequest& request) {
  Game* game = FindGame(request.game_id);
  if (game == nullptr) {
    return MakeError(ctx.request_id, kGameNotFoundErrorType, "Game " + request.game_id + " not found");
  }
  DataPowerNamesResponse response;
  response.request_id = ctx.request_id;
  const auto& controlled = game->snapshot["controlled_powers"];
  for (const auto& entry : game->snapshot["powers"].items()) {
    if (!controlled.contains(entry.key())) {
      response.data.push_back(entry.key());
    }
  }
  return response;
}

Response FakeServer::Handle(Context& ctx, const LeaveGameRequest& request) {
  Game& game = *ctx.game;
  game.members.erase(ctx.connection);
  auto& controlled = game.snapshot["controlled_powers"];
  if (controlled.contains(request.game_role) && controlled[request.game_role].get<std::string>() == ctx.username) {
    controlled.erase(request.game_role);
    PowersControllersNotification controllers;
    controllers.game_id = request.game_id;
    controllers.controllers = Controllers(game.snapshot);
    PushToMembers(ctx, game, controllers, false);
  }
  return MakeOk(ctx.request_id);
}

Response FakeServer::Handle(Context& ctx, const SetOrdersRequest& request) {
  Game& game = *ctx.game;
  if (!IsPower(game.snapshot, request.game_role)) {
    return MakeError(ctx.request_id, kGameErrorType, "Role " + request.game_role + " cannot submit orders");
  }
  game.orders[request.game_role] = request.orders;

  PowerOrdersUpdateNotification update;
  update.game_id = request.game_id;
  update.power_name = request.game_role;
  update.orders = request.orders;
  update.phase = game.snapshot["phase"].get<std::string>();
  PushToMembers(ctx, game, update, false);
  return MakeOk(ctx.request_id);
}

Response FakeServer::Handle(Context& ctx, const SetWaitFlagRequest& request) {
  Game& game = *ctx.game;
  if (!IsPower(game.snapshot, request.game_role)) {
    return MakeError(ctx.request_id, kGameErrorType, "Role " + request.game_role + " has no wait flag");
  }
  game.wait_flags[request.game_role] = request.wait;

  PowerWaitFlagNotification update;
  update.game_id = request.game_id;
  update.power_name = request.game_role;
  update.wait = request.wait;
  PushToMembers(ctx, game, update, false);
  return MakeOk(ctx.request_id);
}

Response FakeServer::Handle(Context& ctx, const SendGameMessageRequest& request) {
  Game& game = *ctx.game;
  if (request.recipient != "GLOBAL" && !IsPower(game.snapshot, request.recipient)) {
    return MakeError(ctx.request_id, kGameErrorType, "Unknown recipient " + request.recipient);
  }
  const auto time_sent = std::chrono::duration_cast<std::chrono::microseconds>(
                             std::chrono::system_clock::now().time_since_epoch())
                             .count();

  GameMessageReceivedNotification received;
  received.game_id = request.game_id;
  received.sender = request.game_role;
  received.recipient = request.recipient;
  received.message = request.message;
  received.message_type = request.message_type;
  received.time_sent = static_cast<std::int64_t>(time_sent);
  game.messages.push_back({{"sender", received.sender},
                           {"recipient", received.recipient},
                           {"message", received.message},
                           {"message_type", received.message_type},
                           {"time_sent", received.time_sent},
                           {"phase", game.snapshot["phase"]}});
  PushToMembers(ctx, game, received, false);
  return MakeOk(ctx.request_id);
}

Response FakeServer::Handle(Context& ctx, const ProcessGameRequest& request) {
  Game& game = *ctx.game;
  const auto current = game.snapshot["phase"].get<std::string>();

  nlohmann::json orders = nlohmann::json::object();
  for (const auto& [power, power_orders] : game.orders) {
    orders[power] = power_orders;
  }
  game.history.push_back({{"name", current},
                          {"orders", orders},
                          {"messages", game.messages},
                          {"state", game.snapshot}});
  game.orders.clear();
  game.wait_flags.clear();
  game.messages.clear();

  const auto next = NextPhase(current);
  game.snapshot["phase"] = next;

  GameProcessedNotification processed;
  processed.game_id = request.game_id;
  processed.phase = next;
  processed.game_state = game.snapshot;
  PushToMembers(ctx, game, processed, true);

  observability_->Log(LogContext{.trace_id = observability_->NextTraceId(),
                                 .name = "fake_server_game_processed",
                                 .game_id = request.game_id,
                                 .detail = current + " -> " + next});
  return MakeOk(ctx.request_id);
}

Response FakeServer::Handle(Context& ctx, const GetAllPossibleOrdersRequest& /*request*/) {
  DataPossibleOrdersResponse response;
  response.request_id = ctx.request_id;
  response.data = CannedPossibleOrders();
  return response;
}

Response FakeServer::Handle(Context& ctx, const GetPhaseHistoryRequest& request) {
  const auto& history = ctx.game->history;
  auto begin = history.begin();
  auto end = history.end();
  if (request.from_phase) {
    auto it = std::find_if(history.begin(), history.end(),
                           [&](const nlohmann::json& phase) { return phase["name"] == *request.from_phase; });
    if (it != history.end()) {
      begin = it;
    }
  }
  if (request.to_phase) {
    auto it = std::find_if(begin, history.end(),
                           [&](const nlohmann::json& phase) { return phase["name"] == *request.to_phase; });
    if (it != history.end()) {
      end = it + 1;
    }
  }
  DataGamePhasesResponse response;
  response.request_id = ctx.request_id;
  response.data.assign(begin, end);
  return response;
}

Response FakeServer::Handle(Context& ctx, const SaveGameRequest& request) {
  const Game& game = *ctx.game;
  nlohmann::json phases = game.history;
  phases.push_back({{"name", game.snapshot["phase"]}, {"state", game.snapshot}});

  DataSavedGameResponse response;
  response.request_id = ctx.request_id;
  response.data = {{"id", request.game_id},
                   {"map", game.snapshot["map_name"]},
                   {"rules", game.snapshot["rules"]},
                   {"phases", phases}};
  return response;
}

Response FakeServer::Handle(Context& ctx, const DeleteGameRequest& request) {
  if (!IsAdminRole(request.game_role) && ctx.game->creator != ctx.username) {
    return MakeError(ctx.request_id, kGameErrorType, "Only the creator or an administrator may delete a game");
  }
  Game removed = std::move(*ctx.game);
  games_.erase(request.game_id);
  ctx.game = nullptr;

  GameDeletedNotification deleted;
  deleted.game_id = request.game_id;
  PushToMembers(ctx, removed, deleted, false);
  return MakeOk(ctx.request_id);
}

void FakeServer::OnDisconnected(ConnectionId connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& [game_id, game] : games_) {
    game.members.erase(connection);
  }
}

void FakeServer::SetStalled(std::set<std::string> names) {
  std::lock_guard<std::mutex> lock(mutex_);
  stalled_ = std::move(names);
}

std::size_t FakeServer::GameCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return games_.size();
}

std::optional<nlohmann::json> FakeServer::GameSnapshot(const std::string& game_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = games_.find(game_id);
  if (it == games_.end()) {
    return std::nullopt;
  }
  return it->second.snapshot;
}

FakeServer::Game* FakeServer::FindGame(const std::string& game_id) {
  auto it = games_.find(game_id);
  return it == games_.end() ? nullptr : &it->second;
}

bool FakeServer::RefreshStatus(Game& game) {
  auto& status = game.snapshot["status"];
  if (status.get<std::string>() != "FORMING") {
    return false;
  }
  if (game.snapshot["controlled_powers"].size() < game.snapshot["n_controls"].get<std::size_t>()) {
    return false;
  }
  status = "ACTIVE";
  return true;
}

void FakeServer::RememberResponse(ConnectionId connection, const std::string& request_id, const std::string& name,
                                  const std::string& text) {
  if (options_.resent_cache_size == 0) {
    return;
  }
  ResentKey key{connection, request_id};
  if (resent_cache_.insert_or_assign(key, CachedFrame{name, text}).second) {
    resent_order_.push_back(std::move(key));
  }
  while (resent_order_.size() > options_.resent_cache_size) {
    resent_cache_.erase(resent_order_.front());
    resent_order_.pop_front();
  }
}

std::optional<std::string> FakeServer::CachedResponse(ConnectionId connection, const std::string& request_id,
                                                      const std::string& name) const {
  auto it = resent_cache_.find(ResentKey{connection, request_id});
  if (it == resent_cache_.end() || it->second.name != name) {
    return std::nullopt;
  }
  return it->second.text;
}

}  // namespace dipnet
