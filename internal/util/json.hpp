#pragma once

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace vodbridge::util::json {

/*
  Helpers over google::protobuf::Value, the dynamic JSON document type used
  for everything the provider extension hands back.
*/

using Value  = google::protobuf::Value;
using Struct = google::protobuf::Struct;

// Parse arbitrary JSON (objects, arrays and bare scalars).
std::optional<Value> Parse(const std::string& text);

std::string Serialize(const Value& value);
std::string Serialize(const google::protobuf::Message& message);

Value MessageToValue(const google::protobuf::Message& message);
bool  ValueToMessage(const Value& value, google::protobuf::Message* message);

Value StringValue(std::string_view s);
Value NumberValue(double n);
Value BoolValue(bool b);
Value NullValue();

inline bool IsNull(const Value& v) {
  return v.kind_case() == Value::KIND_NOT_SET || v.kind_case() == Value::kNullValue;
}

inline bool IsStruct(const Value& v) {
  return v.kind_case() == Value::kStructValue;
}

inline bool IsList(const Value& v) {
  return v.kind_case() == Value::kListValue;
}

inline bool IsString(const Value& v) {
  return v.kind_case() == Value::kStringValue;
}

// Member `key` of a struct value; nullptr when absent, null or `v` is not a struct.
const Value* Field(const Value& v, std::string_view key);

// First present, non-null member among `keys`, in order.
const Value* FirstField(const Value& v, std::initializer_list<std::string_view> keys);

// Nested lookup: FieldPath(v, {"playbackUrls", "mainManifestUrl"}).
const Value* FieldPath(const Value& v, std::initializer_list<std::string_view> path);

// Defensive coercions: never throw, return nullopt for unusable input.
std::optional<std::string>  AsString(const Value& v);
std::optional<std::int32_t> AsInt(const Value& v);
std::optional<bool>         AsBool(const Value& v);

} // namespace vodbridge::util::json
