/*
 * 설명: 프로토콜 더블의 계정/토큰 로직을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/unit/fake_server_test.cpp
 */
#include "dipnet/account_store.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include "dipnet/errors.hpp"

namespace dipnet {

namespace {
std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

bool HexToBytes(const std::string& hex, std::vector<unsigned char>& out) {
  if (hex.size() % 2 != 0) {
    return false;
  }
  out.clear();
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    unsigned int byte;
    std::istringstream iss(hex.substr(i, 2));
    iss >> std::hex >> byte;
    if (iss.fail()) {
      return false;
    }
    out.push_back(static_cast<unsigned char>(byte));
  }
  return true;
}

std::string RandomHex(std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return BytesToHex(buffer.data(), buffer.size());
}
}  // namespace

AccountStore::AccountStore(const AccountConfig& config) : config_(config) {}

bool AccountStore::RegisterUser(const std::string& username, const std::string& password, std::string& error_code,
                                std::string& error_message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (username.empty() || password.empty()) {
    error_code = "INVALID_ACCOUNT";
    error_message = "username and password are required";
    return false;
  }
  if (users_.find(username) != users_.end()) {
    error_code = "INVALID_ACCOUNT";
    error_message = "user " + username + " already exists";
    return false;
  }
  UserRecord rec;
  rec.username = username;
  rec.salt_hex = RandomHex(16);
  rec.hash_hex = HashPassword(password, rec.salt_hex);
  users_.emplace(username, rec);
  return true;
}

std::optional<std::string> AccountStore::SignIn(const std::string& username, const std::string& password,
                                                std::string& error_code, std::string& error_message) {
  auto now = std::chrono::system_clock::now();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = users_.find(username);
  if (it == users_.end() || !VerifyPassword(password, it->second)) {
    error_code = std::string(kAuthenticationErrorType);
    error_message = "Invalid username or password";
    return std::nullopt;
  }
  CleanupExpired(now);
  std::string token = "fake_token_" + RandomHex(8);
  tokens_[token] = TokenRecord{username, now + config_.token_ttl};
  return token;
}

bool AccountStore::Logout(const std::string& token) {
  std::lock_guard<std::mutex> lock(mutex_);
  return tokens_.erase(token) > 0;
}

std::optional<std::string> AccountStore::ValidateToken(const std::string& token) {
  auto now = std::chrono::system_clock::now();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tokens_.find(token);
  if (it == tokens_.end()) {
    return std::nullopt;
  }
  if (now > it->second.expires_at) {
    tokens_.erase(it);
    return std::nullopt;
  }
  return it->second.username;
}

std::size_t AccountStore::ActiveTokens() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tokens_.size();
}

std::string AccountStore::HashPassword(const std::string& password, const std::string& salt_hex) const {
  std::vector<unsigned char> salt;
  if (!HexToBytes(salt_hex, salt)) {
    return {};
  }
  std::vector<unsigned char> output(32);
  if (PKCS5_PBKDF2_HMAC(password.c_str(), static_cast<int>(password.size()), salt.data(),
                        static_cast<int>(salt.size()), static_cast<int>(config_.pbkdf2_iterations), EVP_sha256(),
                        static_cast<int>(output.size()), output.data()) != 1) {
    throw std::runtime_error("PKCS5_PBKDF2_HMAC failed");
  }
  return BytesToHex(output.data(), output.size());
}

bool AccountStore::VerifyPassword(const std::string& password, const UserRecord& user) const {
  auto computed = HashPassword(password, user.salt_hex);
  if (computed.size() != user.hash_hex.size()) {
    return false;
  }
  return CRYPTO_memcmp(computed.data(), user.hash_hex.data(), computed.size()) == 0;
}

void AccountStore::CleanupExpired(std::chrono::system_clock::time_point now) {
  for (auto it = tokens_.begin(); it != tokens_.end();) {
    if (now > it->second.expires_at) {
      it = tokens_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace dipnet
