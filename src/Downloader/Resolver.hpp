#ifndef RESOLVER_HPP_
#define RESOLVER_HPP_

#include <string>

#include "result.hpp"

namespace zvukdl {

enum class ResourceKind {
  Track,
  Release,
  Playlist,
  Artist,
  Selection,
  Podcast,
  Audiobook
};

const char* ResourceKindName(ResourceKind kind);

struct ResourceRef {
  ResourceKind kind;
  std::string id;

  bool operator==(const ResourceRef& other) const {
    return kind == other.kind && id == other.id;
  }
};

// 按固定顺序匹配 /track/ /release/ /playlist/ /artist/ /selection/
// /podcast/ /abook/，id 取标记之后到下一个 '/' 为止。无匹配返回
// UnrecognizedLink。纯函数。
utils::Result<ResourceRef> ResolveLink(const std::string& link);

}  // namespace zvukdl

#endif  // RESOLVER_HPP_
