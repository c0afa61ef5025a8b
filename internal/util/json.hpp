#pragma once

#include <map>
#include <string>

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>

namespace muse::util {

/*
  JSON at the persistence edge. Messages go through protobuf JsonUtil;
  failures throw std::runtime_error.
*/

std::string ToJson(const google::protobuf::Message& message);
void        FromJson(const std::string& json, google::protobuf::Message* message);

template <typename MessageT>
MessageT FromJson(const std::string& json) {
  MessageT message;
  FromJson(json, &message);
  return message;
}

std::string                        ToJson(const std::map<std::string, std::string>& fields);
std::map<std::string, std::string> StringMapFromJson(const std::string& json);

// Builder helpers for event payloads.
void SetString(google::protobuf::Struct* target, const std::string& key, const std::string& value);
void SetNumber(google::protobuf::Struct* target, const std::string& key, double value);
void SetBool(google::protobuf::Struct* target, const std::string& key, bool value);

} // namespace muse::util
