#ifndef CATALOG_HPP_
#define CATALOG_HPP_

#include <map>
#include <string>
#include <vector>

#include "DownloadConfig.hpp"
#include "Fetcher.hpp"
#include "json_utils.hpp"
#include "Session.hpp"
#include "result.hpp"

namespace zvukdl {

constexpr const char* kCatalogDomain = "zvuk.com";
constexpr const char* kCatalogBaseUrl = "https://zvuk.com";

// 订阅状态接口
std::string ProfileUrl(const std::string& base_url);

struct TrackMetadata {
  std::string id;
  std::string title;
  std::string performer;
  std::string album;
  int position = 0;
  std::string releaseDate;
  std::string streamUrl;  // 下载前单独解析
};

struct ReleaseInfo {
  std::string id;
  std::string title;
  std::string artist;
  std::string year;
  std::vector<std::string> trackIds;
};

// 歌单和精选集
struct CollectionInfo {
  std::string id;
  std::string title;
  std::vector<std::string> trackIds;
};

struct PodcastInfo {
  std::string id;
  std::string title;
  std::vector<std::string> episodeIds;
};

struct EpisodeInfo {
  std::string id;
  std::string title;
  std::string author;
  std::string streamUrl;
};

struct ChapterRef {
  std::string id;
  std::string title;
};

struct AudiobookInfo {
  std::string id;
  std::string title;
  std::string author;
  std::vector<ChapterRef> chapters;
};

struct ChapterInfo {
  std::string id;
  std::string title;
  std::string streamUrl;
};

/**
 * @brief 目录服务的类型化访问层
 *
 * 所有元数据请求都经过 Fetcher（缓存 + 重试）。流地址短期有效，不缓存：
 * GetStreamUrl、GetEpisode、GetChapter 每次都请求服务端。
 * 字段缺失时返回 InvalidData，id 不存在时返回 NotFound。
 */
class Catalog {
 public:
  Catalog(Fetcher& fetcher, const Session& session,
          std::string base_url = kCatalogBaseUrl);

  // 返回 id -> 元数据；响应里没有的 id 不出现在结果中
  utils::Result<std::map<std::string, TrackMetadata>> GetTracks(
      const std::vector<std::string>& ids);
  utils::Result<std::string> GetStreamUrl(const std::string& track_id,
                                          Quality quality);
  utils::Result<ReleaseInfo> GetRelease(const std::string& id);
  utils::Result<CollectionInfo> GetPlaylist(const std::string& id);
  utils::Result<CollectionInfo> GetSelection(const std::string& id);
  utils::Result<std::vector<std::string>> GetArtistReleaseIds(
      const std::string& artist_id);
  utils::Result<PodcastInfo> GetPodcast(const std::string& id);
  utils::Result<EpisodeInfo> GetEpisode(const std::string& id);
  utils::Result<AudiobookInfo> GetAudiobook(const std::string& id);
  utils::Result<ChapterInfo> GetChapter(const std::string& id);

  const Session& session() const { return session_; }

 private:
  utils::Result<Json::Value> GetJson(const std::string& path,
                                     bool use_cache = true);
  utils::Result<Json::Value> GraphQL(const std::string& operation,
                                     const std::string& query,
                                     const std::string& id,
                                     bool use_cache = true);

  Fetcher& fetcher_;
  const Session& session_;
  std::string base_url_;
};

}  // namespace zvukdl

#endif  // CATALOG_HPP_
