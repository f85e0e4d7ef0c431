/*
 * 설명: 프로토콜 더블의 계정 저장소. PBKDF2 비밀번호 해시와 발급 토큰을 메모리에 보관한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/unit/fake_server_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace dipnet {

struct AccountConfig {
  std::chrono::seconds token_ttl{std::chrono::seconds(3600)};
  std::size_t pbkdf2_iterations{1000};
};

class AccountStore {
 public:
  explicit AccountStore(const AccountConfig& config);

  bool RegisterUser(const std::string& username, const std::string& password, std::string& error_code,
                    std::string& error_message);
  // 성공 시 "fake_token_<16 hex>" 형식의 토큰을 발급한다.
  std::optional<std::string> SignIn(const std::string& username, const std::string& password,
                                    std::string& error_code, std::string& error_message);
  bool Logout(const std::string& token);
  // 토큰 소유자 username. 만료/미발급이면 nullopt.
  std::optional<std::string> ValidateToken(const std::string& token);

  std::size_t ActiveTokens() const;

 private:
  struct UserRecord {
    std::string username;
    std::string salt_hex;
    std::string hash_hex;
  };

  struct TokenRecord {
    std::string username;
    std::chrono::system_clock::time_point expires_at;
  };

  std::string HashPassword(const std::string& password, const std::string& salt_hex) const;
  bool VerifyPassword(const std::string& password, const UserRecord& user) const;
  void CleanupExpired(std::chrono::system_clock::time_point now);

  AccountConfig config_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, UserRecord> users_;
  std::unordered_map<std::string, TokenRecord> tokens_;
};

}  // namespace dipnet
