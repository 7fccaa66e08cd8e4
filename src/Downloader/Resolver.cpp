#include "Resolver.hpp"

namespace zvukdl {

namespace {

struct Marker {
  const char* segment;
  ResourceKind kind;
};

constexpr Marker kMarkers[] = {
    {"/track/", ResourceKind::Track},
    {"/release/", ResourceKind::Release},
    {"/playlist/", ResourceKind::Playlist},
    {"/artist/", ResourceKind::Artist},
    {"/selection/", ResourceKind::Selection},
    {"/podcast/", ResourceKind::Podcast},
    {"/abook/", ResourceKind::Audiobook},
};

}  // namespace

const char* ResourceKindName(ResourceKind kind) {
  switch (kind) {
    case ResourceKind::Track:
      return "track";
    case ResourceKind::Release:
      return "release";
    case ResourceKind::Playlist:
      return "playlist";
    case ResourceKind::Artist:
      return "artist";
    case ResourceKind::Selection:
      return "selection";
    case ResourceKind::Podcast:
      return "podcast";
    case ResourceKind::Audiobook:
      return "audiobook";
  }
  return "unknown";
}

utils::Result<ResourceRef> ResolveLink(const std::string& link) {
  for (const auto& marker : kMarkers) {
    const std::string segment = marker.segment;
    auto pos = link.find(segment);
    if (pos == std::string::npos) continue;
    std::string rest = link.substr(pos + segment.size());
    std::string id = rest.substr(0, rest.find('/'));
    if (id.empty()) break;
    return ResourceRef{marker.kind, id};
  }
  return utils::Error(utils::ErrorCode::UnrecognizedLink,
                      "unrecognized link: " + link);
}

}  // namespace zvukdl
