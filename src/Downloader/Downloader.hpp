#ifndef DOWNLOADER_HPP_
#define DOWNLOADER_HPP_

#include <filesystem>
#include <string>
#include <vector>

#include "Catalog.hpp"
#include "DownloadConfig.hpp"
#include "Fetcher.hpp"
#include "Resolver.hpp"
#include "Tagger.hpp"
#include "result.hpp"
#include "task_runner.hpp"

namespace zvukdl {

// 各层并发 arena 名称，可用 --parallel_control 单独设置上限
constexpr const char* kLinksArena = "links";
constexpr const char* kReleasesArena = "releases";
constexpr const char* kItemsArena = "items";

// 由外到内的嵌套顺序
inline std::vector<std::string> DownloadLevels() {
  return {kLinksArena, kReleasesArena, kItemsArena};
}

struct DownloadTask {
  std::string sourceId;
  std::string outputPath;
};

struct DownloadSummary {
  size_t links = 0;
  size_t unrecognized = 0;
  size_t succeeded = 0;
  size_t failed = 0;

  bool ok() const { return unrecognized == 0 && failed == 0; }
};

/**
 * @brief 链接分发与按类型下载
 *
 * 每个下载过程分三步：解析元数据 -> 计算目标路径 -> 获取流并写盘（曲目
 * 额外写标签）。多项资源的叶子任务交给 TaskRunner 并行执行，单项失败只
 * 记录日志并计入报告，不影响同级任务。
 */
class Downloader {
 public:
  Downloader(const DownloadConfig& config, Catalog& catalog, Fetcher& fetcher,
             TagWriter& tagger, utils::TaskRunner& runner);

  DownloadSummary DownloadAll(const std::vector<std::string>& links);
  utils::Result<void> Dispatch(const ResourceRef& ref);

  utils::Result<void> DownloadTrack(const std::string& id);
  utils::Result<void> DownloadRelease(const std::string& id);
  utils::Result<void> DownloadPlaylist(const std::string& id);
  utils::Result<void> DownloadArtist(const std::string& id);
  utils::Result<void> DownloadSelection(const std::string& id);
  utils::Result<void> DownloadPodcast(const std::string& id);
  utils::Result<void> DownloadAudiobook(const std::string& id);

 private:
  struct TrackJob {
    TrackMetadata track;
    DownloadTask task;
    std::string year;
  };

  struct EpisodeJob {
    std::string episodeId;
    int index;
    std::filesystem::path dir;
  };

  struct ChapterJob {
    ChapterRef chapter;
    int index;
    std::filesystem::path dir;
  };

  utils::Result<void> DownloadTracks(const std::vector<std::string>& ids,
                                     const std::filesystem::path& out_dir,
                                     const std::string& fallback_year);
  TrackJob MakeTrackJob(const TrackMetadata& track,
                        const std::filesystem::path& out_dir,
                        const std::string& fallback_year) const;

  utils::Result<void> FetchTrack(const TrackJob& job);
  utils::Result<void> FetchEpisode(const EpisodeJob& job);
  utils::Result<void> FetchChapter(const ChapterJob& job);

  std::filesystem::path OutputRoot() const;

  const DownloadConfig config_;
  Catalog& catalog_;
  Fetcher& fetcher_;
  TagWriter& tagger_;
  utils::TaskRunner& runner_;
};

}  // namespace zvukdl

#endif  // DOWNLOADER_HPP_
