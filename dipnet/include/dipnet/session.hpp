/*
 * 설명: 연결/인증/게임 참여 상태를 추적하고 요청 범위에 맞는 전송 가능 여부를 판정한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/unit/session_test.cpp
 */
#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "dipnet/messages.hpp"

namespace dipnet {

enum class SessionState { kDisconnected, kConnected, kAuthenticated, kInGame };

std::string_view ToString(SessionState state);

struct GameContext {
  std::string game_id;
  std::string game_role;
};

class Session {
 public:
  void OnConnected();
  void OnAuthenticated(std::string token);
  void OnGameEntered(std::string game_id, std::string game_role);
  void OnGameLeft();
  void OnLoggedOut();
  void OnDisconnected();

  SessionState State() const;
  // 인증 전이면 PreconditionError.
  std::string Token() const;
  // 게임 밖이면 PreconditionError.
  GameContext Game() const;
  std::optional<GameContext> CurrentGame() const;

  // scope를 만족하지 않으면 PreconditionError. 네트워크에 닿지 않는다.
  void Require(RequestScope scope) const;
  // 범위 검사 후 비어 있는 token/game_id/game_role을 세션 값으로 채운다.
  void Stamp(Request& request) const;

 private:
  void RequireLocked(RequestScope scope) const;

  mutable std::mutex mutex_;
  SessionState state_{SessionState::kDisconnected};
  std::string token_;
  std::string game_id_;
  std::string game_role_;
};

}  // namespace dipnet
