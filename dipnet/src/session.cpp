/*
 * 설명: 세션 상태 전이와 요청 범위 검사를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/unit/session_test.cpp
 */
#include "dipnet/session.hpp"

#include <type_traits>
#include <utility>

#include "dipnet/errors.hpp"

namespace dipnet {

std::string_view ToString(SessionState state) {
  switch (state) {
    case SessionState::kDisconnected:
      return "disconnected";
    case SessionState::kConnected:
      return "connected";
    case SessionState::kAuthenticated:
      return "authenticated";
    case SessionState::kInGame:
      return "in_game";
  }
  return "unknown";
}

void Session::OnConnected() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != SessionState::kDisconnected) {
    throw PreconditionError("session is already " + std::string(ToString(state_)));
  }
  state_ = SessionState::kConnected;
}

void Session::OnAuthenticated(std::string token) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == SessionState::kDisconnected) {
    throw PreconditionError("cannot authenticate a disconnected session");
  }
  token_ = std::move(token);
  game_id_.clear();
  game_role_.clear();
  state_ = SessionState::kAuthenticated;
}

void Session::OnGameEntered(std::string game_id, std::string game_role) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != SessionState::kAuthenticated && state_ != SessionState::kInGame) {
    throw PreconditionError("cannot enter a game from state " + std::string(ToString(state_)));
  }
  game_id_ = std::move(game_id);
  game_role_ = std::move(game_role);
  state_ = SessionState::kInGame;
}

void Session::OnGameLeft() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != SessionState::kInGame) {
    return;
  }
  game_id_.clear();
  game_role_.clear();
  state_ = SessionState::kAuthenticated;
}

void Session::OnLoggedOut() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == SessionState::kDisconnected) {
    return;
  }
  token_.clear();
  game_id_.clear();
  game_role_.clear();
  state_ = SessionState::kConnected;
}

void Session::OnDisconnected() {
  std::lock_guard<std::mutex> lock(mutex_);
  token_.clear();
  game_id_.clear();
  game_role_.clear();
  state_ = SessionState::kDisconnected;
}

SessionState Session::State() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::string Session::Token() const {
  std::lock_guard<std::mutex> lock(mutex_);
  RequireLocked(RequestScope::kChannel);
  return token_;
}

GameContext Session::Game() const {
  std::lock_guard<std::mutex> lock(mutex_);
  RequireLocked(RequestScope::kGame);
  return GameContext{game_id_, game_role_};
}

std::optional<GameContext> Session::CurrentGame() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != SessionState::kInGame) {
    return std::nullopt;
  }
  return GameContext{game_id_, game_role_};
}

void Session::Require(RequestScope scope) const {
  std::lock_guard<std::mutex> lock(mutex_);
  RequireLocked(scope);
}

void Session::RequireLocked(RequestScope scope) const {
  switch (scope) {
    case RequestScope::kConnection:
      if (state_ == SessionState::kDisconnected) {
        throw PreconditionError("not connected");
      }
      return;
    case RequestScope::kChannel:
      if (state_ != SessionState::kAuthenticated && state_ != SessionState::kInGame) {
        throw PreconditionError(std::string(ToString(scope)) +
                                " request requires an authenticated session (state: " +
                                std::string(ToString(state_)) + ")");
      }
      return;
    case RequestScope::kGame:
      if (state_ != SessionState::kInGame) {
        throw PreconditionError(std::string(ToString(scope)) + " request requires a joined game (state: " +
                                std::string(ToString(state_)) + ")");
      }
      return;
  }
}

void Session::Stamp(Request& request) const {
  std::lock_guard<std::mutex> lock(mutex_);
  RequireLocked(ScopeOf(request));
  std::visit(
      [this](auto& inner) {
        using T = std::decay_t<decltype(inner)>;
        if constexpr (std::is_base_of_v<ChannelRequestBase, T>) {
          if (inner.token.empty()) {
            inner.token = token_;
          }
        }
        if constexpr (std::is_base_of_v<GameRequestBase, T>) {
          if (inner.game_id.empty()) {
            inner.game_id = game_id_;
          } else if (inner.game_id != game_id_) {
            throw PreconditionError("request targets game '" + inner.game_id + "' but the session is in '" +
                                    game_id_ + "'");
          }
          if (inner.game_role.empty()) {
            inner.game_role = game_role_;
          }
        }
      },
      request);
}

}  // namespace dipnet
