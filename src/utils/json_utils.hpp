#pragma once

#include <json/json.h>

#include <string>
#include <vector>

#include "result.hpp"

namespace zvukdl::utils {

Result<Json::Value> ParseJson(const std::string& text);

// 数字或字符串形式的 id 统一转成字符串；其他类型返回空串
std::string JsonId(const Json::Value& value);

// 逐级取对象成员，任一级缺失返回 InvalidData，消息为缺失的路径
Result<Json::Value> JsonPath(const Json::Value& root,
                             const std::vector<std::string>& path);

// 字符串字段，缺失或类型不符时返回 fallback
std::string JsonString(const Json::Value& object, const char* key,
                       const std::string& fallback = "");

std::vector<std::string> JsonIdList(const Json::Value& array);

}  // namespace zvukdl::utils
