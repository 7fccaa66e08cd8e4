#include "Catalog.hpp"

#include <algorithm>
#include <utility>

#include "logger.hpp"

namespace zvukdl {

using utils::Error;
using utils::ErrorCode;
using utils::JsonId;
using utils::JsonIdList;
using utils::JsonPath;
using utils::JsonString;
using utils::Result;

namespace {

// 单次 tracks 请求最多携带的 id 数
constexpr size_t kTrackBatchSize = 100;

constexpr const char* kGraphQLPath = "/api/v1/graphql";

constexpr const char* kAudiobookQuery = R"(
query getAudioBookData($id: Int!) {
  book: audioBook(id: $id) {
    id
    title
    authorName
    chapters {
      id
      title
    }
  }
}
)";

constexpr const char* kChapterQuery = R"(
query getAudioBookChapter($id: Int!) {
  chapter(id: $id) {
    id
    title
    mid
  }
}
)";

std::string joinIds(const std::vector<std::string>& ids, size_t begin,
                    size_t end) {
  std::string out;
  for (size_t i = begin; i < end; ++i) {
    if (!out.empty()) out += ",";
    out += ids[i];
  }
  return out;
}

std::string yearOf(const std::string& date) { return date.substr(0, 4); }

Result<Json::Value> memberById(const Json::Value& root,
                               const std::vector<std::string>& path,
                               const std::string& id) {
  auto container = JsonPath(root, path);
  if (!container) return container.error();
  const Json::Value& value = container.value();
  if (!value.isObject() || !value.isMember(id) || value[id].isNull()) {
    return Error(ErrorCode::NotFound, "id " + id + " not in response");
  }
  return value[id];
}

int positionOf(const Json::Value& track) {
  const Json::Value& position = track["position"];
  if (position.isInt()) return position.asInt();
  if (position.isString()) {
    try {
      return std::stoi(position.asString());
    } catch (const std::exception&) {
      return 0;
    }
  }
  return 0;
}

}  // namespace

Catalog::Catalog(Fetcher& fetcher, const Session& session,
                 std::string base_url)
    : fetcher_(fetcher), session_(session), base_url_(std::move(base_url)) {}

std::string ProfileUrl(const std::string& base_url) {
  return base_url + "/api/v2/tiny/profile";
}

Result<Json::Value> Catalog::GetJson(const std::string& path, bool use_cache) {
  auto response = fetcher_.Fetch(base_url_ + path, session_.Options(use_cache));
  if (!response) return response.error();
  return utils::ParseJson(response.value().body);
}

Result<Json::Value> Catalog::GraphQL(const std::string& operation,
                                     const std::string& query,
                                     const std::string& id, bool use_cache) {
  Json::Int64 numeric_id = 0;
  try {
    numeric_id = std::stoll(id);
  } catch (const std::exception&) {
    return Error(ErrorCode::InvalidArgument, "non-numeric id '" + id + "'");
  }
  Json::Value payload(Json::objectValue);
  payload["operationName"] = operation;
  payload["variables"]["id"] = numeric_id;
  payload["query"] = query;
  Json::StreamWriterBuilder writer;
  writer["indentation"] = "";

  FetchOptions options = session_.Options(use_cache);
  options.post = true;
  options.body = Json::writeString(writer, payload);
  options.headers["Content-Type"] = "application/json";

  auto response = fetcher_.Fetch(base_url_ + kGraphQLPath, options);
  if (!response) return response.error();
  auto root = utils::ParseJson(response.value().body);
  if (!root) return root.error();
  if (root.value().isMember("errors")) {
    Json::StreamWriterBuilder compact;
    compact["indentation"] = "";
    return Error(ErrorCode::InvalidData,
                 operation + " returned errors: " +
                     Json::writeString(compact, root.value()["errors"]));
  }
  return root;
}

Result<std::map<std::string, TrackMetadata>> Catalog::GetTracks(
    const std::vector<std::string>& ids) {
  std::map<std::string, TrackMetadata> tracks;
  for (size_t begin = 0; begin < ids.size(); begin += kTrackBatchSize) {
    const size_t end = std::min(ids.size(), begin + kTrackBatchSize);
    auto root = GetJson("/api/tiny/tracks?ids=" + joinIds(ids, begin, end));
    if (!root) return root.error();
    auto list = JsonPath(root.value(), {"result", "tracks"});
    if (!list) return list.error();
    const Json::Value& items = list.value();
    if (!items.isObject()) {
      return Error(ErrorCode::InvalidData, "tracks response is not an object");
    }
    for (const auto& key : items.getMemberNames()) {
      const Json::Value& item = items[key];
      TrackMetadata track;
      track.id = key;
      track.title = JsonString(item, "title");
      track.performer = JsonString(item, "credits");
      track.album = JsonString(item, "release_title");
      track.position = positionOf(item);
      track.releaseDate = JsonString(item, "release_date");
      if (track.title.empty()) {
        LOG(WARN) << "Track " << key << " has no title in response";
        continue;
      }
      tracks.emplace(key, std::move(track));
    }
  }
  return tracks;
}

Result<std::string> Catalog::GetStreamUrl(const std::string& track_id,
                                          Quality quality) {
  auto root = GetJson("/api/tiny/track/stream?id=" + track_id +
                          "&quality=" + QualityApiName(quality),
                      false);
  if (!root) return root.error();
  auto stream = JsonPath(root.value(), {"result", "stream"});
  if (!stream) return stream.error();
  if (!stream.value().isString() || stream.value().asString().empty()) {
    return Error(ErrorCode::NotFound, "no stream URL for track " + track_id);
  }
  return stream.value().asString();
}

Result<ReleaseInfo> Catalog::GetRelease(const std::string& id) {
  auto root = GetJson("/api/tiny/releases?ids=" + id);
  if (!root) return root.error();
  auto item = memberById(root.value(), {"result", "releases"}, id);
  if (!item) return item.error();
  ReleaseInfo release;
  release.id = id;
  release.title = JsonString(item.value(), "title");
  release.artist = JsonString(item.value(), "credits");
  release.year = yearOf(JsonString(item.value(), "date"));
  release.trackIds = JsonIdList(item.value()["track_ids"]);
  if (release.title.empty()) {
    return Error(ErrorCode::InvalidData, "release " + id + " has no title");
  }
  return release;
}

Result<CollectionInfo> Catalog::GetPlaylist(const std::string& id) {
  auto root = GetJson("/api/tiny/playlists?ids=" + id + "&include=track,release");
  if (!root) return root.error();
  auto item = memberById(root.value(), {"result", "playlists"}, id);
  if (!item) return item.error();
  CollectionInfo playlist;
  playlist.id = id;
  playlist.title = JsonString(item.value(), "title", "playlist " + id);
  playlist.trackIds = JsonIdList(item.value()["track_ids"]);
  return playlist;
}

Result<CollectionInfo> Catalog::GetSelection(const std::string& id) {
  auto root = GetJson("/api/tiny/selection?id=" + id + "&include=track");
  if (!root) return root.error();
  auto item = JsonPath(root.value(), {"result", "selection"});
  if (!item) return item.error();
  CollectionInfo selection;
  selection.id = id;
  selection.title = JsonString(item.value(), "title", "selection " + id);
  selection.trackIds = JsonIdList(item.value()["track_ids"]);
  return selection;
}

Result<std::vector<std::string>> Catalog::GetArtistReleaseIds(
    const std::string& artist_id) {
  auto root = GetJson("/api/tiny/artists/releases?artist_id=" + artist_id);
  if (!root) return root.error();
  auto result = JsonPath(root.value(), {"result"});
  if (!result) return result.error();
  if (!result.value().isArray()) {
    return Error(ErrorCode::InvalidData,
                 "artist " + artist_id + ": release list is not an array");
  }
  return JsonIdList(result.value());
}

Result<PodcastInfo> Catalog::GetPodcast(const std::string& id) {
  auto root = GetJson("/api/tiny/podcasts?ids=" + id);
  if (!root) return root.error();
  auto item = memberById(root.value(), {"result", "podcasts"}, id);
  if (!item) return item.error();
  PodcastInfo podcast;
  podcast.id = id;
  podcast.title = JsonString(item.value(), "title", "podcast " + id);
  podcast.episodeIds = JsonIdList(item.value()["episodes"]);
  return podcast;
}

Result<EpisodeInfo> Catalog::GetEpisode(const std::string& id) {
  // 响应里带签名的流地址，不缓存
  auto root = GetJson("/api/tiny/podcast_episodes?id=" + id, false);
  if (!root) return root.error();
  auto item = memberById(root.value(), {"result", "episodes"}, id);
  if (!item) return item.error();
  EpisodeInfo episode;
  episode.id = id;
  episode.title = JsonString(item.value(), "title");
  episode.author = JsonString(item.value(), "author");
  episode.streamUrl = JsonString(item.value(), "stream_url");
  if (episode.title.empty()) {
    return Error(ErrorCode::InvalidData, "episode " + id + " has no title");
  }
  if (episode.streamUrl.empty()) {
    return Error(ErrorCode::NotFound, "no stream URL for episode " + id);
  }
  return episode;
}

Result<AudiobookInfo> Catalog::GetAudiobook(const std::string& id) {
  auto root = GraphQL("getAudioBookData", kAudiobookQuery, id);
  if (!root) return root.error();
  auto book = JsonPath(root.value(), {"data", "book"});
  if (!book) {
    return Error(ErrorCode::NotFound, "audiobook " + id + " not found");
  }
  AudiobookInfo info;
  info.id = id;
  info.title = JsonString(book.value(), "title", "Unknown_Book_" + id);
  info.author = JsonString(book.value(), "authorName", "Unknown_Author");
  for (const auto& chapter : book.value()["chapters"]) {
    ChapterRef ref;
    ref.id = JsonId(chapter["id"]);
    if (ref.id.empty()) continue;
    ref.title = JsonString(chapter, "title", "Chapter_" + ref.id);
    info.chapters.push_back(std::move(ref));
  }
  return info;
}

Result<ChapterInfo> Catalog::GetChapter(const std::string& id) {
  // mid 是短期有效的签名地址，不缓存
  auto root = GraphQL("getAudioBookChapter", kChapterQuery, id, false);
  if (!root) return root.error();
  auto chapter = JsonPath(root.value(), {"data", "chapter"});
  if (!chapter) {
    return Error(ErrorCode::NotFound, "chapter " + id + " not found");
  }
  ChapterInfo info;
  info.id = id;
  info.title = JsonString(chapter.value(), "title", "Chapter_" + id);
  info.streamUrl = JsonString(chapter.value(), "mid");
  if (info.streamUrl.empty()) {
    return Error(ErrorCode::NotFound, "no stream URL (mid) for chapter " + id);
  }
  return info;
}

}  // namespace zvukdl
