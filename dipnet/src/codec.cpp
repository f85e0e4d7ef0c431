/*
 * 설명: name 기반 디코더 테이블로 와이어 문서를 검증하고 타입 메시지로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: dipnet/tests/unit/codec_test.cpp
 */
#include "dipnet/codec.hpp"

#include <algorithm>
#include <limits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "dipnet/errors.hpp"

namespace dipnet {
namespace {

bool ReadValue(const nlohmann::json& j, std::string& out) {
  if (!j.is_string()) {
    return false;
  }
  out = j.get<std::string>();
  return true;
}

bool ReadValue(const nlohmann::json& j, bool& out) {
  if (!j.is_boolean()) {
    return false;
  }
  out = j.get<bool>();
  return true;
}

bool ReadValue(const nlohmann::json& j, std::int64_t& out) {
  if (!j.is_number_integer()) {
    return false;
  }
  out = j.get<std::int64_t>();
  return true;
}

bool ReadValue(const nlohmann::json& j, int& out) {
  std::int64_t wide = 0;
  if (!ReadValue(j, wide)) {
    return false;
  }
  if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
    return false;
  }
  out = static_cast<int>(wide);
  return true;
}

// 게임 스냅샷 등 구조화 문서 필드는 항상 JSON 객체여야 한다.
bool ReadValue(const nlohmann::json& j, nlohmann::json& out) {
  if (!j.is_object()) {
    return false;
  }
  out = j;
  return true;
}

template <typename T>
bool ReadValue(const nlohmann::json& j, std::vector<T>& out) {
  if (!j.is_array()) {
    return false;
  }
  std::vector<T> values;
  values.reserve(j.size());
  for (const auto& element : j) {
    T value{};
    if (!ReadValue(element, value)) {
      return false;
    }
    values.push_back(std::move(value));
  }
  out = std::move(values);
  return true;
}

template <typename T>
bool ReadValue(const nlohmann::json& j, std::map<std::string, T>& out) {
  if (!j.is_object()) {
    return false;
  }
  std::map<std::string, T> values;
  for (const auto& [key, element] : j.items()) {
    T value{};
    if (!ReadValue(element, value)) {
      return false;
    }
    values.emplace(key, std::move(value));
  }
  out = std::move(values);
  return true;
}

class FieldReader {
 public:
  FieldReader(const nlohmann::json& document, std::string_view name) : document_(document), name_(name) {}

  template <typename T>
  void operator()(std::string_view key, T& value, Presence presence = Presence::kRequired) {
    auto it = document_.find(std::string(key));
    if (it == document_.end() || it->is_null()) {
      if (presence == Presence::kDefaulted) {
        return;
      }
      throw ParsingError("'" + std::string(name_) + "' is missing required field '" + std::string(key) + "'");
    }
    if (!ReadValue(*it, value)) {
      throw ParsingError("'" + std::string(name_) + "' field '" + std::string(key) + "' has the wrong type");
    }
  }

  template <typename T>
  void operator()(std::string_view key, std::optional<T>& value, Presence /*presence*/ = Presence::kRequired) {
    auto it = document_.find(std::string(key));
    if (it == document_.end() || it->is_null()) {
      value.reset();
      return;
    }
    T parsed{};
    if (!ReadValue(*it, parsed)) {
      throw ParsingError("'" + std::string(name_) + "' field '" + std::string(key) + "' has the wrong type");
    }
    value = std::move(parsed);
  }

 private:
  const nlohmann::json& document_;
  std::string_view name_;
};

class KeyCollector {
 public:
  explicit KeyCollector(std::vector<std::string_view>& keys) : keys_(keys) {}

  template <typename T>
  void operator()(std::string_view key, const T& /*value*/, Presence /*presence*/ = Presence::kRequired) {
    keys_.push_back(key);
  }

 private:
  std::vector<std::string_view>& keys_;
};

template <typename T>
void CheckDeclaredFields(const nlohmann::json& document) {
  std::vector<std::string_view> declared{"name"};
  const T blank{};
  KeyCollector collector{declared};
  T::Fields(blank, collector);
  for (const auto& item : document.items()) {
    const auto& key = item.key();
    if (std::find(declared.begin(), declared.end(), std::string_view(key)) == declared.end()) {
      throw ParsingError("'" + std::string(T::kName) + "' does not declare field '" + key + "'");
    }
  }
}

template <typename T>
void CheckValues(const T& /*message*/) {}

template <>
void CheckValues<VoteRequest>(const VoteRequest& message) {
  if (message.vote != "yes" && message.vote != "no") {
    throw ParsingError("'vote' must be \"yes\" or \"no\", got \"" + message.vote + "\"");
  }
}

template <typename T, typename Group>
Message DecodeAs(const nlohmann::json& document) {
  CheckDeclaredFields<T>(document);
  T message{};
  FieldReader reader{document, T::kName};
  T::Fields(message, reader);
  CheckValues(message);
  return Message{Group{std::move(message)}};
}

using DecodeFn = Message (*)(const nlohmann::json&);

struct DecoderEntry {
  MessageKind kind;
  DecodeFn decode;
};

using DecoderTable = std::unordered_map<std::string_view, DecoderEntry>;

template <typename Group, std::size_t... I>
void RegisterGroup(DecoderTable& table, std::index_sequence<I...>) {
  (table.emplace(std::variant_alternative_t<I, Group>::kName,
                 DecoderEntry{std::variant_alternative_t<I, Group>::kKind,
                              &DecodeAs<std::variant_alternative_t<I, Group>, Group>}),
   ...);
}

const DecoderTable& Decoders() {
  static const DecoderTable table = [] {
    DecoderTable t;
    RegisterGroup<Request>(t, std::make_index_sequence<std::variant_size_v<Request>>{});
    RegisterGroup<Response>(t, std::make_index_sequence<std::variant_size_v<Response>>{});
    RegisterGroup<Notification>(t, std::make_index_sequence<std::variant_size_v<Notification>>{});
    return t;
  }();
  return table;
}

}  // namespace

Message Decode(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw ParsingError("wire document is not a JSON object");
  }
  auto name_it = document.find("name");
  if (name_it == document.end()) {
    throw ParsingError("wire document has no 'name' field");
  }
  if (!name_it->is_string()) {
    throw ParsingError("'name' field is not a string");
  }
  const auto name = name_it->get<std::string>();
  const auto& decoders = Decoders();
  auto entry = decoders.find(name);
  if (entry == decoders.end()) {
    throw UnknownMessageError(name);
  }
  return entry->second.decode(document);
}

Message DecodeText(std::string_view text) {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& ex) {
    throw ParsingError(std::string("invalid JSON frame: ") + ex.what());
  }
  return Decode(document);
}

std::optional<MessageKind> KindOfName(std::string_view name) {
  const auto& decoders = Decoders();
  auto entry = decoders.find(name);
  if (entry == decoders.end()) {
    return std::nullopt;
  }
  return entry->second.kind;
}

}  // namespace dipnet
