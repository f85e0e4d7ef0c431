/*
 * 설명: 합법 주문 표 기반 주문 검증을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/unit/order_validation_test.cpp
 */
#include "dipnet/order_validation.hpp"

#include <cctype>
#include <set>
#include <unordered_map>

namespace dipnet {

std::string NormalizeOrder(std::string_view order) {
  std::string normalized;
  normalized.reserve(order.size());
  bool pending_space = false;
  for (char raw : order) {
    const auto c = static_cast<unsigned char>(raw);
    if (std::isspace(c)) {
      pending_space = !normalized.empty();
      continue;
    }
    if (pending_space) {
      normalized.push_back(' ');
      pending_space = false;
    }
    normalized.push_back(static_cast<char>(std::toupper(c)));
  }
  return normalized;
}

ValidatedOrders ValidateOrders(const std::vector<std::string>& proposed, const PossibleOrders& possible_orders) {
  struct Legal {
    const std::string* location;
    const std::string* order;
  };
  std::unordered_map<std::string, Legal> legal;
  for (const auto& [location, orders] : possible_orders) {
    for (const auto& order : orders) {
      legal.emplace(NormalizeOrder(order), Legal{&location, &order});
    }
  }

  ValidatedOrders result;
  std::set<std::string> used_locations;
  for (const auto& order : proposed) {
    auto it = legal.find(NormalizeOrder(order));
    if (it == legal.end() || !used_locations.insert(*it->second.location).second) {
      result.rejected.push_back(order);
      continue;
    }
    result.valid.push_back(*it->second.order);
  }
  return result;
}

}  // namespace dipnet
