#include <gtest/gtest.h>

#include "dipnet/order_validation.hpp"

namespace {

dipnet::PossibleOrders FranceOrders() {
  return {
      {"PAR", {"A PAR H", "A PAR - BUR", "A PAR - PIC"}},
      {"BRE", {"F BRE H", "F BRE - MAO"}},
      {"MAR", {"A MAR H", "A MAR - SPA"}},
  };
}

}  // namespace

TEST(OrderValidationTest, NormalizesWhitespaceAndCase) {
  EXPECT_EQ(dipnet::NormalizeOrder("a  par -   bur "), "A PAR - BUR");
  EXPECT_EQ(dipnet::NormalizeOrder("\tf bre h\n"), "F BRE H");
  EXPECT_EQ(dipnet::NormalizeOrder(""), "");
}

TEST(OrderValidationTest, KeepsLegalOrdersInTableSpelling) {
  auto result = dipnet::ValidateOrders({"a par - bur", "F BRE - MAO"}, FranceOrders());
  EXPECT_EQ(result.valid, (std::vector<std::string>{"A PAR - BUR", "F BRE - MAO"}));
  EXPECT_TRUE(result.rejected.empty());
}

TEST(OrderValidationTest, RejectsIllegalOrders) {
  auto result = dipnet::ValidateOrders({"A PAR - MUN", "A MAR H", "F LON H"}, FranceOrders());
  EXPECT_EQ(result.valid, (std::vector<std::string>{"A MAR H"}));
  EXPECT_EQ(result.rejected, (std::vector<std::string>{"A PAR - MUN", "F LON H"}));
}

TEST(OrderValidationTest, OneOrderPerLocation) {
  auto result = dipnet::ValidateOrders({"A PAR H", "A PAR - BUR"}, FranceOrders());
  EXPECT_EQ(result.valid, (std::vector<std::string>{"A PAR H"}));
  EXPECT_EQ(result.rejected, (std::vector<std::string>{"A PAR - BUR"}));
}

TEST(OrderValidationTest, EmptyTableRejectsEverything) {
  auto result = dipnet::ValidateOrders({"A PAR H"}, {});
  EXPECT_TRUE(result.valid.empty());
  EXPECT_EQ(result.rejected.size(), 1u);
}
