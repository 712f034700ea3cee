#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include <charconv>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace vodbridge::util::json {

std::optional<Value> Parse(const std::string& text) {
  Value value;
  auto  status = google::protobuf::util::JsonStringToMessage(text, &value);
  if (!status.ok()) {
    return std::nullopt;
  }
  return value;
}

std::string Serialize(const Value& value) {
  return Serialize(static_cast<const google::protobuf::Message&>(value));
}

std::string Serialize(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(message, &out, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize message to JSON: " + std::string(status.message()));
  }
  return out;
}

Value MessageToValue(const google::protobuf::Message& message) {
  auto parsed = Parse(Serialize(message));
  if (!parsed) {
    throw std::runtime_error("Failed to convert message to JSON value");
  }
  return *parsed;
}

bool ValueToMessage(const Value& value, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(Serialize(value), message, options);
  return status.ok();
}

Value StringValue(std::string_view s) {
  Value v;
  v.set_string_value(std::string(s));
  return v;
}

Value NumberValue(double n) {
  Value v;
  v.set_number_value(n);
  return v;
}

Value BoolValue(bool b) {
  Value v;
  v.set_bool_value(b);
  return v;
}

Value NullValue() {
  Value v;
  v.set_null_value(google::protobuf::NULL_VALUE);
  return v;
}

const Value* Field(const Value& v, std::string_view key) {
  if (!IsStruct(v)) {
    return nullptr;
  }
  const auto& fields = v.struct_value().fields();
  auto        it     = fields.find(std::string(key));
  if (it == fields.end() || IsNull(it->second)) {
    return nullptr;
  }
  return &it->second;
}

const Value* FirstField(const Value& v, std::initializer_list<std::string_view> keys) {
  for (auto key : keys) {
    if (const auto* found = Field(v, key)) {
      return found;
    }
  }
  return nullptr;
}

const Value* FieldPath(const Value& v, std::initializer_list<std::string_view> path) {
  const Value* current = &v;
  for (auto key : path) {
    current = Field(*current, key);
    if (!current) {
      return nullptr;
    }
  }
  return current;
}

std::optional<std::string> AsString(const Value& v) {
  switch (v.kind_case()) {
    case Value::kStringValue:
      return v.string_value();

    case Value::kNumberValue: {
      const double n = v.number_value();
      if (!std::isfinite(n)) {
        return std::nullopt;
      }
      if (n == std::floor(n) && std::fabs(n) < 1e15) {
        return std::to_string(static_cast<long long>(n));
      }
      return std::to_string(n);
    }

    default:
      return std::nullopt;
  }
}

std::optional<std::int32_t> AsInt(const Value& v) {
  switch (v.kind_case()) {
    case Value::kNumberValue: {
      const double n = v.number_value();
      if (!std::isfinite(n) || n < std::numeric_limits<std::int32_t>::min() || n > std::numeric_limits<std::int32_t>::max()) {
        return std::nullopt;
      }
      return static_cast<std::int32_t>(n);
    }

    case Value::kStringValue: {
      const auto&  s     = v.string_value();
      std::int32_t out   = 0;
      const char*  begin = s.data();
      const char*  end   = s.data() + s.size();
      while (begin != end && *begin == ' ') ++begin;
      while (end != begin && *(end - 1) == ' ') --end;
      if (begin == end) {
        return std::nullopt;
      }
      auto [ptr, ec] = std::from_chars(begin, end, out);
      if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
      }
      return out;
    }

    default:
      return std::nullopt;
  }
}

std::optional<bool> AsBool(const Value& v) {
  switch (v.kind_case()) {
    case Value::kBoolValue:
      return v.bool_value();

    case Value::kNumberValue:
      return v.number_value() != 0.0;

    case Value::kStringValue:
      if (v.string_value() == "true" || v.string_value() == "1") return true;
      if (v.string_value() == "false" || v.string_value() == "0") return false;
      return std::nullopt;

    default:
      return std::nullopt;
  }
}

} // namespace vodbridge::util::json
