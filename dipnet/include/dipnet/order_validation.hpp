/*
 * 설명: 제안된 주문 목록을 서버가 준 합법 주문 표와 대조해 유효/거부 주문으로 나눈다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/unit/order_validation_test.cpp
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "dipnet/messages.hpp"

namespace dipnet {

struct ValidatedOrders {
  std::vector<std::string> valid;
  std::vector<std::string> rejected;
};

// 공백을 하나로 줄이고 대문자로 바꾼다. "a  par - bur " -> "A PAR - BUR"
std::string NormalizeOrder(std::string_view order);

// 정규화 후 합법 주문 표에 있는 주문만 유효로 본다. 위치(표의 키)당 첫 주문만 받고 나머지는 거부한다.
// valid에는 표에 적힌 형태 그대로 담긴다.
ValidatedOrders ValidateOrders(const std::vector<std::string>& proposed, const PossibleOrders& possible_orders);

}  // namespace dipnet
