/*
 * 설명: 타입 WebSocket 클라이언트. 송신 경로(세션 -> 상관 엔진 -> 전송)와 수신 경로(전송 -> 코덱 -> 상관 엔진/디스패처)를 연결한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/e2e/client_flow_test.cpp
 */
#include "dipnet/client.hpp"

#include <utility>

#include "dipnet/codec.hpp"
#include "dipnet/errors.hpp"
#include "dipnet/websocket_transport.hpp"

namespace dipnet {
namespace {

template <typename T>
T Expect(Response response, std::string_view operation) {
  ThrowIfError(response);
  if (auto* typed = std::get_if<T>(&response)) {
    return std::move(*typed);
  }
  throw UnexpectedResponseError(std::string(operation) + " expected '" + std::string(T::kName) + "' but got '" +
                                std::string(NameOf(response)) + "'");
}

}  // namespace

Client::Client(ClientConfig config)
    : Client(config, std::make_shared<Observability>(ParseLogLevel(config.log_level))) {}

Client::Client(ClientConfig config, std::shared_ptr<Observability> observability)
    : config_(std::move(config)), observability_(std::move(observability)),
      dispatcher_(std::make_unique<NotificationDispatcher>(config_.handler_threads, observability_)) {}

Client::~Client() {
  Close();
  dispatcher_->Shutdown();
}

void Client::Connect() {
  auto transport = std::make_shared<WebSocketTransport>(observability_);
  transport->Connect(config_.host, config_.port, config_.target,
                     std::chrono::milliseconds(config_.connect_timeout_ms));
  Connect(std::move(transport));
}

void Client::Connect(std::shared_ptr<Transport> transport) {
  std::lock_guard<std::mutex> lock(connection_mutex_);
  if (transport_ && transport_->IsOpen()) {
    throw PreconditionError("client is already connected");
  }

  std::weak_ptr<Transport> weak_transport = transport;
  auto correlator = std::make_shared<Correlator>(
      [weak_transport](std::string frame) {
        auto target = weak_transport.lock();
        if (!target) {
          throw ConnectionClosedError("transport was released");
        }
        target->Send(std::move(frame));
      },
      std::chrono::milliseconds(config_.request_timeout_ms), observability_);

  session_.OnConnected();
  transport_ = transport;
  correlator_ = correlator;
  try {
    transport->Start([this, correlator](std::string frame) { OnFrame(*correlator, std::move(frame)); },
                     [this, correlator](const std::string& reason) { OnClosed(*correlator, reason); });
  } catch (const std::exception&) {
    transport_.reset();
    correlator_.reset();
    session_.OnDisconnected();
    throw;
  }
  observability_->SetConnectionsActive(1);
}

void Client::Close() {
  std::shared_ptr<Transport> transport;
  std::shared_ptr<Correlator> correlator;
  {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    transport = std::move(transport_);
    correlator = std::move(correlator_);
  }
  if (transport) {
    transport->Close();
  }
  if (correlator) {
    correlator->FailAll("client closed");
  }
  session_.OnDisconnected();
  observability_->SetConnectionsActive(0);
}

bool Client::IsConnected() const {
  std::lock_guard<std::mutex> lock(connection_mutex_);
  return transport_ && transport_->IsOpen();
}

std::shared_ptr<Correlator> Client::CurrentCorrelator() const {
  std::lock_guard<std::mutex> lock(connection_mutex_);
  if (!correlator_) {
    throw ConnectionClosedError("client is not connected");
  }
  return correlator_;
}

std::size_t Client::PendingRequests() const {
  std::lock_guard<std::mutex> lock(connection_mutex_);
  return correlator_ ? correlator_->PendingCount() : 0;
}

Response Client::Send(Request request) {
  return Send(std::move(request), std::chrono::milliseconds(config_.request_timeout_ms));
}

Response Client::Send(Request request, std::chrono::milliseconds timeout) {
  session_.Stamp(request);
  return CurrentCorrelator()->SendRequest(std::move(request), timeout);
}

PendingCall Client::SendAsync(Request request) {
  session_.Stamp(request);
  return CurrentCorrelator()->AsyncSendRequest(std::move(request));
}

Response Client::SendWithRetry(Request request, int attempts) {
  if (attempts < 1) {
    throw PreconditionError("SendWithRetry needs at least one attempt");
  }
  if (RequestIdOf(request).empty()) {
    SetRequestId(request, CurrentCorrelator()->NextRequestId());
  }
  for (int attempt = 1;; ++attempt) {
    try {
      return Send(request);
    } catch (const TimeoutError& ex) {
      if (attempt >= attempts) {
        throw;
      }
      observability_->Log(LogLevel::kWarn, LogContext{.trace_id = observability_->NextTraceId(),
                                                      .name = "request_retry",
                                                      .request_id = RequestIdOf(request),
                                                      .detail = std::string(NameOf(request)) + " attempt " +
                                                                std::to_string(attempt + 1) + ": " + ex.what()});
      MarkResent(request);
    }
  }
}

std::string Client::SignIn(const std::string& username, const std::string& password) {
  SignInRequest request;
  request.username = username;
  request.password = password;
  auto response = Expect<DataTokenResponse>(Send(std::move(request)), "sign_in");
  session_.OnAuthenticated(response.data);
  observability_->Log(LogContext{.trace_id = observability_->NextTraceId(), .name = "signed_in", .detail = username});
  return response.data;
}

nlohmann::json Client::CreateGame(CreateGameRequest request) {
  const std::string role = request.power_name.value_or("OMNISCIENT");
  auto response = Expect<DataGameResponse>(Send(std::move(request)), "create_game");
  auto game_id_it = response.data.find("game_id");
  if (game_id_it == response.data.end() || !game_id_it->is_string()) {
    throw UnexpectedResponseError("create_game snapshot has no game_id");
  }
  session_.OnGameEntered(game_id_it->get<std::string>(), role);
  observability_->Log(LogContext{.trace_id = observability_->NextTraceId(),
                                 .name = "game_created",
                                 .game_id = game_id_it->get<std::string>(),
                                 .detail = role});
  return std::move(response.data);
}

nlohmann::json Client::JoinGame(const std::string& game_id, std::optional<std::string> power_name,
                                std::optional<std::string> registration_password) {
  JoinGameRequest request;
  request.game_id = game_id;
  request.power_name = power_name;
  request.registration_password = std::move(registration_password);
  auto response = Expect<DataGameResponse>(Send(std::move(request)), "join_game");
  const std::string role = power_name.value_or("OBSERVER");
  session_.OnGameEntered(game_id, role);
  observability_->Log(
      LogContext{.trace_id = observability_->NextTraceId(), .name = "game_joined", .game_id = game_id, .detail = role});
  return std::move(response.data);
}

std::vector<nlohmann::json> Client::ListGames(ListGamesRequest filter) {
  return Expect<DataGamesResponse>(Send(std::move(filter)), "list_games").data;
}

std::vector<std::string> Client::GetAvailableMaps() {
  return Expect<DataMapsResponse>(Send(GetAvailableMapsRequest{}), "get_available_maps").data;
}

std::vector<std::string> Client::GetPlayablePowers(const std::string& game_id) {
  GetPlayablePowersRequest request;
  request.game_id = game_id;
  return Expect<DataPowerNamesResponse>(Send(std::move(request)), "get_playable_powers").data;
}

void Client::Logout() {
  Expect<OkResponse>(Send(LogoutRequest{}), "logout");
  session_.OnLoggedOut();
}

void Client::SetOrders(const std::string& power_name, std::vector<std::string> orders,
                       std::optional<std::string> phase) {
  SetOrdersRequest request;
  request.game_role = power_name;
  request.phase = std::move(phase);
  request.orders = std::move(orders);
  Expect<OkResponse>(Send(std::move(request)), "set_orders");
}

ValidatedOrders Client::SubmitOrders(const std::string& power_name, const std::vector<std::string>& proposed) {
  auto validated = ValidateOrders(proposed, GetAllPossibleOrders());
  if (!validated.rejected.empty()) {
    observability_->Log(LogLevel::kWarn, LogContext{.trace_id = observability_->NextTraceId(),
                                                    .name = "orders_rejected",
                                                    .game_id = session_.Game().game_id,
                                                    .detail = power_name + ": " +
                                                              std::to_string(validated.rejected.size()) +
                                                              " rejected"});
  }
  SetOrders(power_name, validated.valid);
  return validated;
}

void Client::SetWaitFlag(bool wait) {
  SetWaitFlagRequest request;
  request.wait = wait;
  Expect<OkResponse>(Send(std::move(request)), "set_wait_flag");
}

void Client::SendGameMessage(const std::string& recipient, const std::string& message,
                             const std::string& message_type) {
  SendGameMessageRequest request;
  request.recipient = recipient;
  request.message = message;
  request.message_type = message_type;
  Expect<OkResponse>(Send(std::move(request)), "send_game_message");
}

void Client::ProcessGame(std::optional<std::string> phase) {
  ProcessGameRequest request;
  request.phase = std::move(phase);
  Expect<OkResponse>(Send(std::move(request)), "process_game");
}

PossibleOrders Client::GetAllPossibleOrders(std::optional<std::string> phase) {
  GetAllPossibleOrdersRequest request;
  request.phase = std::move(phase);
  return Expect<DataPossibleOrdersResponse>(Send(std::move(request)), "get_all_possible_orders").data;
}

std::vector<nlohmann::json> Client::GetPhaseHistory(std::optional<std::string> from_phase,
                                                    std::optional<std::string> to_phase) {
  GetPhaseHistoryRequest request;
  request.from_phase = std::move(from_phase);
  request.to_phase = std::move(to_phase);
  return Expect<DataGamePhasesResponse>(Send(std::move(request)), "get_phase_history").data;
}

nlohmann::json Client::SaveGame() {
  return Expect<DataSavedGameResponse>(Send(SaveGameRequest{}), "save_game").data;
}

void Client::DeleteGame() {
  Expect<OkResponse>(Send(DeleteGameRequest{}), "delete_game");
  session_.OnGameLeft();
}

void Client::LeaveGame() {
  Expect<OkResponse>(Send(LeaveGameRequest{}), "leave_game");
  session_.OnGameLeft();
}

void Client::OnFrame(Correlator& correlator, std::string frame) {
  Message message;
  try {
    message = DecodeText(frame);
  } catch (const ParsingError& ex) {
    observability_->IncrementParseError();
    observability_->Log(LogLevel::kWarn, LogContext{.trace_id = observability_->NextTraceId(),
                                                    .name = "frame_rejected",
                                                    .detail = ex.what()});
    return;
  }

  if (auto* response = std::get_if<Response>(&message)) {
    correlator.OnResponse(std::move(*response));
    return;
  }
  if (auto* notification = std::get_if<Notification>(&message)) {
    if (const auto* deleted = std::get_if<GameDeletedNotification>(notification)) {
      auto game = session_.CurrentGame();
      if (game && game->game_id == deleted->game_id) {
        session_.OnGameLeft();
      }
    }
    dispatcher_->Dispatch(std::move(*notification));
    return;
  }
  observability_->Log(LogLevel::kWarn, LogContext{.trace_id = observability_->NextTraceId(),
                                                  .name = "server_request_dropped",
                                                  .detail = std::string(NameOf(message))});
}

void Client::OnClosed(Correlator& correlator, const std::string& reason) {
  correlator.FailAll(reason);
  session_.OnDisconnected();
  observability_->SetConnectionsActive(0);
  observability_->Log(LogLevel::kWarn, LogContext{.trace_id = observability_->NextTraceId(),
                                                  .name = "connection_lost",
                                                  .detail = reason});
}

}  // namespace dipnet
