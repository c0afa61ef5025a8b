#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace muse::util {

std::string ToJson(const google::protobuf::Message& message) {
  std::string                                json;
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to parse " + message->GetTypeName() + ": " + std::string(status.message()));
  }
}

std::string ToJson(const std::map<std::string, std::string>& fields) {
  google::protobuf::Struct value;
  for (const auto& [key, field] : fields) {
    SetString(&value, key, field);
  }
  return ToJson(value);
}

std::map<std::string, std::string> StringMapFromJson(const std::string& json) {
  std::map<std::string, std::string> out;
  if (json.empty()) return out;

  auto value = FromJson<google::protobuf::Struct>(json);
  for (const auto& [key, field] : value.fields()) {
    if (field.kind_case() == google::protobuf::Value::kStringValue) {
      out[key] = field.string_value();
    } else {
      std::string rendered;
      auto        status = google::protobuf::util::MessageToJsonString(field, &rendered);
      out[key]           = status.ok() ? rendered : std::string();
    }
  }
  return out;
}

void SetString(google::protobuf::Struct* target, const std::string& key, const std::string& value) {
  (*target->mutable_fields())[key].set_string_value(value);
}

void SetNumber(google::protobuf::Struct* target, const std::string& key, double value) {
  (*target->mutable_fields())[key].set_number_value(value);
}

void SetBool(google::protobuf::Struct* target, const std::string& key, bool value) {
  (*target->mutable_fields())[key].set_bool_value(value);
}

} // namespace muse::util
