#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

#include "dipnet/codec.hpp"
#include "dipnet/errors.hpp"

using dipnet::Decode;
using dipnet::DecodeText;
using dipnet::Encode;
using dipnet::EncodeText;

namespace {

// 모든 선언 필드를 키 이름에서 파생한 비어 있지 않은 값으로 채운다.
struct FieldFiller {
  void operator()(std::string_view key, std::string& value, dipnet::Presence = dipnet::Presence::kRequired) {
    value = std::string(key) + "-value";
  }
  void operator()(std::string_view, bool& value, dipnet::Presence = dipnet::Presence::kRequired) { value = true; }
  void operator()(std::string_view, int& value, dipnet::Presence = dipnet::Presence::kRequired) { value = 7; }
  void operator()(std::string_view, std::int64_t& value, dipnet::Presence = dipnet::Presence::kRequired) {
    value = 1700000000123456;
  }
  void operator()(std::string_view key, nlohmann::json& value, dipnet::Presence = dipnet::Presence::kRequired) {
    value = {{"key", std::string(key)}, {"units", {"A PAR", "F BRE"}}};
  }
  void operator()(std::string_view key, std::vector<std::string>& value,
                  dipnet::Presence = dipnet::Presence::kRequired) {
    value = {std::string(key), "second"};
  }
  void operator()(std::string_view key, std::vector<nlohmann::json>& value,
                  dipnet::Presence = dipnet::Presence::kRequired) {
    value = {{{"key", std::string(key)}}, {{"index", 1}}};
  }
  void operator()(std::string_view key, std::map<std::string, std::string>& value,
                  dipnet::Presence = dipnet::Presence::kRequired) {
    value = {{"FRANCE", std::string(key)}, {"ENGLAND", "other"}};
  }
  void operator()(std::string_view, dipnet::PossibleOrders& value, dipnet::Presence = dipnet::Presence::kRequired) {
    value = {{"PAR", {"A PAR H", "A PAR - BUR"}}, {"BRE", {"F BRE H"}}};
  }
  template <typename T>
  void operator()(std::string_view key, std::optional<T>& value, dipnet::Presence = dipnet::Presence::kRequired) {
    T inner{};
    (*this)(key, inner);
    value = std::move(inner);
  }
};

template <typename Group, typename T>
void ExpectFilledRoundTrip() {
  T message{};
  FieldFiller filler;
  T::Fields(message, filler);
  if constexpr (std::is_same_v<T, dipnet::VoteRequest>) {
    message.vote = "yes";
  }
  auto decoded = DecodeText(EncodeText(dipnet::Message{Group{message}}));
  ASSERT_TRUE(std::holds_alternative<Group>(decoded)) << T::kName;
  const auto& group = std::get<Group>(decoded);
  ASSERT_TRUE(std::holds_alternative<T>(group)) << T::kName;
  EXPECT_EQ(std::get<T>(group), message) << T::kName;
}

template <typename Group, std::size_t... I>
void ExpectEveryAlternativeRoundTrips(std::index_sequence<I...>) {
  (ExpectFilledRoundTrip<Group, std::variant_alternative_t<I, Group>>(), ...);
}

template <typename Group>
void ExpectEveryAlternativeRoundTrips() {
  ExpectEveryAlternativeRoundTrips<Group>(std::make_index_sequence<std::variant_size_v<Group>>{});
}

}  // namespace

TEST(CodecTest, SignInEncodesNameAndFields) {
  dipnet::SignInRequest request;
  request.request_id = "req-1";
  request.username = "test_user";
  request.password = "test_password";

  auto document = Encode(dipnet::Request{request});
  EXPECT_EQ(document["name"], "sign_in");
  EXPECT_EQ(document["request_id"], "req-1");
  EXPECT_EQ(document["username"], "test_user");
  EXPECT_EQ(document["password"], "test_password");
  EXPECT_EQ(document["re_sent"], false);
}

TEST(CodecTest, RequestRoundTripKeepsEveryField) {
  dipnet::SetOrdersRequest request;
  request.request_id = "req-2";
  request.token = "fake_token_abc";
  request.game_id = "GAME_0001";
  request.game_role = "FRANCE";
  request.phase = "S1901M";
  request.orders = {"A PAR - BUR", "F BRE - MAO"};

  auto decoded = DecodeText(EncodeText(dipnet::Request{request}));
  ASSERT_TRUE(std::holds_alternative<dipnet::Request>(decoded));
  const auto& inner = std::get<dipnet::Request>(decoded);
  ASSERT_TRUE(std::holds_alternative<dipnet::SetOrdersRequest>(inner));
  EXPECT_EQ(std::get<dipnet::SetOrdersRequest>(inner), request);
}

TEST(CodecTest, ResponseAndNotificationRoundTrip) {
  dipnet::DataPossibleOrdersResponse response;
  response.request_id = "req-3";
  response.data = {{"PAR", {"A PAR H", "A PAR - BUR"}}, {"MAR", {"A MAR H"}}};
  auto decoded_response = Decode(Encode(dipnet::Response{response}));
  EXPECT_EQ(std::get<dipnet::DataPossibleOrdersResponse>(std::get<dipnet::Response>(decoded_response)), response);

  dipnet::GameMessageReceivedNotification notification;
  notification.game_id = "GAME_0001";
  notification.sender = "FRANCE";
  notification.recipient = "ENGLAND";
  notification.message = "Shall we?";
  notification.message_type = "DIPLOMATIC";
  notification.time_sent = 1700000000123456;
  auto decoded_notification = Decode(Encode(dipnet::Notification{notification}));
  EXPECT_EQ(std::get<dipnet::GameMessageReceivedNotification>(std::get<dipnet::Notification>(decoded_notification)),
            notification);
}

TEST(CodecTest, EveryRequestRoundTrips) {
  EXPECT_EQ(std::variant_size_v<dipnet::Request>, 25u);
  ExpectEveryAlternativeRoundTrips<dipnet::Request>();
}

TEST(CodecTest, EveryResponseRoundTrips) {
  EXPECT_EQ(std::variant_size_v<dipnet::Response>, 12u);
  ExpectEveryAlternativeRoundTrips<dipnet::Response>();
}

TEST(CodecTest, EveryNotificationRoundTrips) {
  EXPECT_EQ(std::variant_size_v<dipnet::Notification>, 17u);
  ExpectEveryAlternativeRoundTrips<dipnet::Notification>();
}

TEST(CodecTest, DefaultObjectPayloadsRoundTripButNullIsRejected) {
  dipnet::DataGameResponse response;
  response.request_id = "req-6";
  EXPECT_TRUE(response.data.is_object());
  EXPECT_EQ(std::get<dipnet::DataGameResponse>(std::get<dipnet::Response>(Decode(Encode(response)))), response);

  response.data = nlohmann::json();
  auto document = Encode(response);
  EXPECT_TRUE(document["data"].is_null());
  EXPECT_THROW(Decode(document), dipnet::ParsingError);
}

TEST(CodecTest, InvalidUtf8IsParsingErrorOnEncode) {
  dipnet::GameMessageReceivedNotification notification;
  notification.game_id = "GAME_0001";
  notification.sender = "FRANCE";
  notification.recipient = "ENGLAND";
  notification.message = "bad \xff\xfe utf8";
  EXPECT_THROW(EncodeText(notification), dipnet::ParsingError);
}

TEST(CodecTest, DefaultedFieldsMayBeOmitted) {
  nlohmann::json document = {{"name", "create_game"}, {"request_id", "req-4"}, {"token", "t"}};
  auto decoded = Decode(document);
  const auto& request = std::get<dipnet::CreateGameRequest>(std::get<dipnet::Request>(decoded));
  EXPECT_EQ(request.map_name, "standard");
  EXPECT_EQ(request.n_controls, 1);
  EXPECT_FALSE(request.re_sent);
  EXPECT_FALSE(request.deadline.has_value());
  EXPECT_FALSE(request.power_name.has_value());
}

TEST(CodecTest, OptionalFieldsAreOmittedWhenUnset) {
  dipnet::JoinGameRequest request;
  request.request_id = "req-5";
  request.token = "t";
  request.game_id = "GAME_0001";
  auto document = Encode(request);
  EXPECT_FALSE(document.contains("power_name"));
  EXPECT_FALSE(document.contains("registration_password"));

  document["power_name"] = nullptr;
  auto decoded = Decode(document);
  EXPECT_FALSE(std::get<dipnet::JoinGameRequest>(std::get<dipnet::Request>(decoded)).power_name.has_value());
}

TEST(CodecTest, ClassifiesKindByName) {
  EXPECT_EQ(dipnet::KindOfName("sign_in"), dipnet::MessageKind::kRequest);
  EXPECT_EQ(dipnet::KindOfName("data_token"), dipnet::MessageKind::kResponse);
  EXPECT_EQ(dipnet::KindOfName("game_processed"), dipnet::MessageKind::kNotification);
  EXPECT_FALSE(dipnet::KindOfName("bogus").has_value());

  auto decoded = DecodeText(R"({"name":"game_deleted","game_id":"GAME_0002"})");
  EXPECT_EQ(dipnet::KindOf(decoded), dipnet::MessageKind::kNotification);
  EXPECT_EQ(dipnet::NameOf(decoded), "game_deleted");
}

TEST(CodecTest, RejectsUnknownKeys) {
  nlohmann::json document = {{"name", "ok"}, {"request_id", "r"}, {"extra", 1}};
  EXPECT_THROW(Decode(document), dipnet::ParsingError);
}

TEST(CodecTest, RejectsWrongTypes) {
  EXPECT_THROW(Decode({{"name", "ok"}, {"request_id", 42}}), dipnet::ParsingError);
  EXPECT_THROW(Decode({{"name", "set_wait_flag"},
                       {"request_id", "r"},
                       {"token", "t"},
                       {"game_id", "g"},
                       {"game_role", "FRANCE"},
                       {"wait", "yes"}}),
               dipnet::ParsingError);
  EXPECT_THROW(Decode({{"name", "data_port"}, {"request_id", "r"}, {"data", 1.5}}), dipnet::ParsingError);
}

TEST(CodecTest, RejectsMissingRequiredField) {
  EXPECT_THROW(Decode({{"name", "sign_in"}, {"request_id", "r"}, {"username", "u"}}), dipnet::ParsingError);
  EXPECT_THROW(Decode({{"name", "sign_in"}, {"request_id", "r"}, {"username", "u"}, {"password", nullptr}}),
               dipnet::ParsingError);
}

TEST(CodecTest, RejectsMalformedDocuments) {
  EXPECT_THROW(DecodeText("{not json"), dipnet::ParsingError);
  EXPECT_THROW(DecodeText("[1,2,3]"), dipnet::ParsingError);
  EXPECT_THROW(DecodeText(R"({"request_id":"r"})"), dipnet::ParsingError);
  EXPECT_THROW(DecodeText(R"({"name":5})"), dipnet::ParsingError);
}

TEST(CodecTest, UnknownNameIsDistinguishable) {
  try {
    DecodeText(R"({"name":"teleport_units","request_id":"r"})");
    FAIL() << "expected UnknownMessageError";
  } catch (const dipnet::UnknownMessageError& ex) {
    EXPECT_EQ(ex.Name(), "teleport_units");
    EXPECT_EQ(ex.Kind(), dipnet::ErrorKind::kUnknownMessage);
  }
}

TEST(CodecTest, VoteAcceptsOnlyYesOrNo) {
  nlohmann::json document = {{"name", "vote"},   {"request_id", "r"},     {"token", "t"},
                             {"game_id", "g"}, {"game_role", "FRANCE"}, {"vote", "yes"}};
  EXPECT_NO_THROW(Decode(document));
  document["vote"] = "maybe";
  EXPECT_THROW(Decode(document), dipnet::ParsingError);
}

TEST(CodecTest, DataObjectsMustBeObjects) {
  EXPECT_THROW(Decode({{"name", "data_game"}, {"request_id", "r"}, {"data", "GAME_0001"}}), dipnet::ParsingError);
  EXPECT_NO_THROW(Decode({{"name", "data_game"}, {"request_id", "r"}, {"data", {{"game_id", "GAME_0001"}}}}));
}

TEST(ErrorMappingTest, ThrowIfErrorMapsErrorTypes) {
  auto make_error = [](const std::string& type) {
    dipnet::ErrorResponse error;
    error.request_id = "r";
    error.error_type = type;
    error.message = "boom";
    return dipnet::Response{error};
  };
  EXPECT_THROW(dipnet::ThrowIfError(make_error("AUTHENTICATION_ERROR")), dipnet::AuthenticationError);
  EXPECT_THROW(dipnet::ThrowIfError(make_error("GAME_NOT_FOUND")), dipnet::GameNotFoundError);
  EXPECT_THROW(dipnet::ThrowIfError(make_error("UNSUPPORTED_REQUEST")), dipnet::UnsupportedRequestError);
  try {
    dipnet::ThrowIfError(make_error("GAME_ERROR"));
    FAIL() << "expected ServerError";
  } catch (const dipnet::ServerError& ex) {
    EXPECT_EQ(ex.ErrorType(), "GAME_ERROR");
  }

  dipnet::OkResponse ok;
  ok.request_id = "r";
  EXPECT_NO_THROW(dipnet::ThrowIfError(dipnet::Response{ok}));
}
