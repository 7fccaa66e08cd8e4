#include "json_utils.hpp"

#include <sstream>

namespace zvukdl::utils {

Result<Json::Value> ParseJson(const std::string& text) {
  Json::Value root;
  Json::CharReaderBuilder builder;
  std::string errs;
  std::istringstream in(text);
  if (!Json::parseFromStream(builder, in, &root, &errs)) {
    return Error(ErrorCode::InvalidData, "malformed JSON: " + errs);
  }
  return root;
}

std::string JsonId(const Json::Value& value) {
  if (value.isString()) return value.asString();
  if (value.isUInt64()) return std::to_string(value.asUInt64());
  if (value.isInt64()) return std::to_string(value.asInt64());
  return "";
}

Result<Json::Value> JsonPath(const Json::Value& root,
                             const std::vector<std::string>& path) {
  const Json::Value* node = &root;
  std::string walked;
  for (const auto& key : path) {
    walked += walked.empty() ? key : "." + key;
    if (!node->isObject() || !node->isMember(key) || (*node)[key].isNull()) {
      return Error(ErrorCode::InvalidData, "missing field '" + walked + "'");
    }
    node = &(*node)[key];
  }
  return *node;
}

std::string JsonString(const Json::Value& object, const char* key,
                       const std::string& fallback) {
  if (!object.isObject() || !object.isMember(key)) return fallback;
  const Json::Value& value = object[key];
  if (value.isString()) return value.asString();
  if (value.isNumeric()) return JsonId(value);
  return fallback;
}

std::vector<std::string> JsonIdList(const Json::Value& array) {
  std::vector<std::string> ids;
  if (!array.isArray()) return ids;
  for (const auto& item : array) {
    std::string id = item.isObject() ? JsonId(item["id"]) : JsonId(item);
    if (!id.empty()) ids.push_back(id);
  }
  return ids;
}

}  // namespace zvukdl::utils
