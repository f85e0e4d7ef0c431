/*
 * 설명: 전송/코덱/상관 엔진/알림 디스패처/세션을 묶은 타입 WebSocket 클라이언트.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/e2e/client_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "dipnet/config.hpp"
#include "dipnet/correlator.hpp"
#include "dipnet/dispatcher.hpp"
#include "dipnet/messages.hpp"
#include "dipnet/observability.hpp"
#include "dipnet/order_validation.hpp"
#include "dipnet/session.hpp"
#include "dipnet/transport.hpp"

namespace dipnet {

class Client {
 public:
  // config.log_level로 자체 Observability를 만든다.
  explicit Client(ClientConfig config);
  Client(ClientConfig config, std::shared_ptr<Observability> observability);
  ~Client();

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  // config의 host/port/target으로 WebSocket 연결을 연다.
  void Connect();
  // 이미 연결된 전송을 사용한다.
  void Connect(std::shared_ptr<Transport> transport);
  void Close();
  bool IsConnected() const;

  // 세션이 token/game_id/game_role을 채운 뒤 상관 엔진으로 보낸다.
  Response Send(Request request);
  Response Send(Request request, std::chrono::milliseconds timeout);
  PendingCall SendAsync(Request request);
  // TimeoutError 뒤에 같은 request_id로 re_sent=true를 붙여 다시 보낸다.
  Response SendWithRetry(Request request, int attempts);

  std::string SignIn(const std::string& username, const std::string& password);
  nlohmann::json CreateGame(CreateGameRequest request = {});
  nlohmann::json JoinGame(const std::string& game_id, std::optional<std::string> power_name = std::nullopt,
                          std::optional<std::string> registration_password = std::nullopt);
  std::vector<nlohmann::json> ListGames(ListGamesRequest filter = {});
  std::vector<std::string> GetAvailableMaps();
  std::vector<std::string> GetPlayablePowers(const std::string& game_id);
  void Logout();

  void SetOrders(const std::string& power_name, std::vector<std::string> orders,
                 std::optional<std::string> phase = std::nullopt);
  // 합법 주문 표로 걸러낸 유효 주문만 제출한다.
  ValidatedOrders SubmitOrders(const std::string& power_name, const std::vector<std::string>& proposed);
  void SetWaitFlag(bool wait);
  void SendGameMessage(const std::string& recipient, const std::string& message,
                       const std::string& message_type = "DIPLOMATIC");
  void ProcessGame(std::optional<std::string> phase = std::nullopt);
  PossibleOrders GetAllPossibleOrders(std::optional<std::string> phase = std::nullopt);
  std::vector<nlohmann::json> GetPhaseHistory(std::optional<std::string> from_phase = std::nullopt,
                                              std::optional<std::string> to_phase = std::nullopt);
  nlohmann::json SaveGame();
  void DeleteGame();
  void LeaveGame();

  NotificationDispatcher& Notifications() { return *dispatcher_; }
  const Session& GetSession() const { return session_; }
  std::size_t PendingRequests() const;
  const ClientConfig& Config() const { return config_; }

 private:
  std::shared_ptr<Correlator> CurrentCorrelator() const;
  void OnFrame(Correlator& correlator, std::string frame);
  void OnClosed(Correlator& correlator, const std::string& reason);

  ClientConfig config_;
  std::shared_ptr<Observability> observability_;
  std::unique_ptr<NotificationDispatcher> dispatcher_;
  Session session_;

  mutable std::mutex connection_mutex_;
  std::shared_ptr<Correlator> correlator_;
  std::shared_ptr<Transport> transport_;
};

}  // namespace dipnet
