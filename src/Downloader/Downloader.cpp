#include "Downloader.hpp"

#include <set>
#include <system_error>
#include <utility>

#include "logger.hpp"
#include "name_sanitizer.hpp"

namespace zvukdl {

using utils::Error;
using utils::ErrorCode;
using utils::Result;
using utils::RunReport;
using utils::SanitizeName;

namespace fs = std::filesystem;

namespace {

constexpr int kTrackNumberWidth = 2;
constexpr int kChapterNumberWidth = 3;
constexpr const char* kSpokenWordExtension = "mp3";

Result<void> ensureDir(const fs::path& dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    return Error(ErrorCode::WriteError,
                 "cannot create directory " + dir.string() + ": " +
                     ec.message());
  }
  return utils::Ok();
}

unsigned int parseYear(const std::string& year) {
  try {
    int value = std::stoi(year);
    return value > 0 ? static_cast<unsigned int>(value) : 0;
  } catch (const std::exception&) {
    return 0;
  }
}

// 报告中有失败项时转为错误，交给上一层统计
Result<void> fromReport(const RunReport& report, const std::string& what) {
  if (report.ok()) {
    return utils::Ok();
  }
  return Error(ErrorCode::PartialFailure,
               what + ": " + std::to_string(report.failures.size()) + " of " +
                   std::to_string(report.total) + " items failed");
}

}  // namespace

Downloader::Downloader(const DownloadConfig& config, Catalog& catalog,
                       Fetcher& fetcher, TagWriter& tagger,
                       utils::TaskRunner& runner)
    : config_(config),
      catalog_(catalog),
      fetcher_(fetcher),
      tagger_(tagger),
      runner_(runner) {}

fs::path Downloader::OutputRoot() const { return fs::path(config_.outputPath); }

DownloadSummary Downloader::DownloadAll(const std::vector<std::string>& links) {
  DownloadSummary summary;
  summary.links = links.size();

  std::vector<ResourceRef> refs;
  for (const auto& link : links) {
    auto ref = ResolveLink(link);
    if (!ref) {
      LOG(ERROR) << "Unrecognized link format: " << link;
      ++summary.unrecognized;
      continue;
    }
    refs.push_back(ref.value());
  }

  RunReport report = runner_.Run(
      kLinksArena, refs,
      [this](const ResourceRef& ref) { return Dispatch(ref); },
      [](const ResourceRef& ref) {
        return std::string(ResourceKindName(ref.kind)) + " " + ref.id;
      });
  summary.succeeded = report.succeeded;
  summary.failed = report.failures.size();

  LOG(INFO) << "Finished: " << summary.links << " links, "
            << summary.succeeded << " succeeded, " << summary.failed
            << " failed, " << summary.unrecognized << " unrecognized";
  return summary;
}

Result<void> Downloader::Dispatch(const ResourceRef& ref) {
  switch (ref.kind) {
    case ResourceKind::Track:
      return DownloadTrack(ref.id);
    case ResourceKind::Release:
      return DownloadRelease(ref.id);
    case ResourceKind::Playlist:
      return DownloadPlaylist(ref.id);
    case ResourceKind::Artist:
      return DownloadArtist(ref.id);
    case ResourceKind::Selection:
      return DownloadSelection(ref.id);
    case ResourceKind::Podcast:
      return DownloadPodcast(ref.id);
    case ResourceKind::Audiobook:
      return DownloadAudiobook(ref.id);
  }
  return Error(ErrorCode::InternalError, "unhandled resource kind");
}

Downloader::TrackJob Downloader::MakeTrackJob(
    const TrackMetadata& track, const fs::path& out_dir,
    const std::string& fallback_year) const {
  TrackJob job;
  job.track = track;
  job.task.sourceId = track.id;
  job.task.outputPath =
      (out_dir / utils::NumberedFileName(track.position, kTrackNumberWidth,
                                         track.title,
                                         QualityExtension(config_.quality)))
          .string();
  job.year = track.releaseDate.size() >= 4 ? track.releaseDate.substr(0, 4)
                                           : fallback_year;
  return job;
}

Result<void> Downloader::DownloadTrack(const std::string& id) {
  LOG(INFO) << "Downloading track: " << id;
  auto tracks = catalog_.GetTracks({id});
  if (!tracks) return tracks.error();
  auto it = tracks.value().find(id);
  if (it == tracks.value().end()) {
    return Error(ErrorCode::NotFound, "track " + id + " not in catalog");
  }
  const TrackMetadata& track = it->second;

  fs::path out_dir = OutputRoot() / "_tracks" /
                     (SanitizeName(track.performer) + " - " +
                      SanitizeName(track.album));
  auto dir = ensureDir(out_dir);
  if (!dir) return dir;
  return FetchTrack(MakeTrackJob(track, out_dir, ""));
}

Result<void> Downloader::DownloadTracks(const std::vector<std::string>& ids,
                                        const fs::path& out_dir,
                                        const std::string& fallback_year) {
  if (ids.empty()) {
    LOG(WARN) << "No tracks to download into " << out_dir.string();
    return utils::Ok();
  }
  // 重复的 id 会让两个任务写同一个文件
  std::vector<std::string> unique_ids;
  std::set<std::string> seen;
  for (const auto& id : ids) {
    if (seen.insert(id).second) {
      unique_ids.push_back(id);
    } else {
      LOG(WARN) << "Skipping duplicate track " << id << " in "
                << out_dir.string();
    }
  }

  auto tracks = catalog_.GetTracks(unique_ids);
  if (!tracks) return tracks.error();
  auto dir = ensureDir(out_dir);
  if (!dir) return dir;

  std::vector<TrackJob> jobs;
  size_t missing = 0;
  for (const auto& id : unique_ids) {
    auto it = tracks.value().find(id);
    if (it == tracks.value().end()) {
      LOG(ERROR) << "Track " << id << " missing from catalog response";
      ++missing;
      continue;
    }
    jobs.push_back(MakeTrackJob(it->second, out_dir, fallback_year));
  }

  RunReport report = runner_.Run(
      kItemsArena, jobs, [this](const TrackJob& job) { return FetchTrack(job); },
      [](const TrackJob& job) { return "track " + job.task.sourceId; });
  if (missing > 0 && report.ok()) {
    return Error(ErrorCode::NotFound, std::to_string(missing) + " of " +
                                          std::to_string(unique_ids.size()) +
                                          " tracks missing from catalog");
  }
  return fromReport(report, out_dir.string());
}

Result<void> Downloader::FetchTrack(const TrackJob& job) {
  auto stream_url =
      catalog_.GetStreamUrl(job.task.sourceId, config_.quality);
  if (!stream_url) return stream_url.error();

  auto written = fetcher_.FetchToFile(stream_url.value(), job.task.outputPath);
  if (!written) return written;

  TrackTags tags;
  tags.artist = job.track.performer;
  tags.title = job.track.title;
  tags.album = job.track.album;
  tags.trackNumber =
      job.track.position > 0 ? static_cast<unsigned int>(job.track.position) : 0;
  tags.year = parseYear(job.year);
  auto tagged = tagger_.Apply(job.task.outputPath, tags);
  if (!tagged) return tagged;

  LOG(INFO) << "Downloaded: " << job.task.outputPath;
  return utils::Ok();
}

Result<void> Downloader::DownloadRelease(const std::string& id) {
  LOG(INFO) << "Downloading release: " << id;
  auto release = catalog_.GetRelease(id);
  if (!release) return release.error();
  const ReleaseInfo& info = release.value();
  fs::path out_dir =
      OutputRoot() / utils::FormatAlbumPath(config_.albumTemplate, info.artist,
                                            info.year, info.title);
  return DownloadTracks(info.trackIds, out_dir, info.year);
}

Result<void> Downloader::DownloadPlaylist(const std::string& id) {
  LOG(INFO) << "Downloading playlist: " << id;
  auto playlist = catalog_.GetPlaylist(id);
  if (!playlist) return playlist.error();
  fs::path out_dir =
      OutputRoot() / "_playlists" / SanitizeName(playlist.value().title);
  return DownloadTracks(playlist.value().trackIds, out_dir, "");
}

Result<void> Downloader::DownloadSelection(const std::string& id) {
  LOG(INFO) << "Downloading selection: " << id;
  auto selection = catalog_.GetSelection(id);
  if (!selection) return selection.error();
  fs::path out_dir =
      OutputRoot() / "_selections" / SanitizeName(selection.value().title);
  return DownloadTracks(selection.value().trackIds, out_dir, "");
}

Result<void> Downloader::DownloadArtist(const std::string& id) {
  LOG(INFO) << "Downloading artist catalog: " << id;
  auto release_ids = catalog_.GetArtistReleaseIds(id);
  if (!release_ids) return release_ids.error();
  if (release_ids.value().empty()) {
    LOG(WARN) << "Artist " << id << " has no releases";
    return utils::Ok();
  }
  RunReport report = runner_.Run(
      kReleasesArena, release_ids.value(),
      [this](const std::string& release_id) {
        return DownloadRelease(release_id);
      },
      [](const std::string& release_id) { return "release " + release_id; });
  return fromReport(report, "artist " + id);
}

Result<void> Downloader::DownloadPodcast(const std::string& id) {
  LOG(INFO) << "Downloading podcast: " << id;
  auto podcast = catalog_.GetPodcast(id);
  if (!podcast) return podcast.error();
  const PodcastInfo& info = podcast.value();
  if (info.episodeIds.empty()) {
    LOG(WARN) << "Podcast '" << info.title << "' has no episodes";
    return utils::Ok();
  }
  fs::path out_dir = OutputRoot() / "_podcasts" / SanitizeName(info.title);
  auto dir = ensureDir(out_dir);
  if (!dir) return dir;

  std::vector<EpisodeJob> jobs;
  for (size_t i = 0; i < info.episodeIds.size(); ++i) {
    jobs.push_back(EpisodeJob{info.episodeIds[i], static_cast<int>(i + 1),
                              out_dir});
  }
  RunReport report = runner_.Run(
      kItemsArena, jobs,
      [this](const EpisodeJob& job) { return FetchEpisode(job); },
      [](const EpisodeJob& job) { return "episode " + job.episodeId; });
  return fromReport(report, "podcast " + id);
}

Result<void> Downloader::FetchEpisode(const EpisodeJob& job) {
  auto episode = catalog_.GetEpisode(job.episodeId);
  if (!episode) return episode.error();
  const std::string path =
      (job.dir / utils::NumberedFileName(job.index, kChapterNumberWidth,
                                         episode.value().title,
                                         kSpokenWordExtension))
          .string();
  auto written = fetcher_.FetchToFile(episode.value().streamUrl, path);
  if (!written) return written;
  LOG(INFO) << "Downloaded: " << path;
  return utils::Ok();
}

Result<void> Downloader::DownloadAudiobook(const std::string& id) {
  LOG(INFO) << "Downloading audiobook: " << id;
  auto book = catalog_.GetAudiobook(id);
  if (!book) return book.error();
  const AudiobookInfo& info = book.value();
  if (info.chapters.empty()) {
    LOG(WARN) << "Audiobook '" << info.title << "' has no chapters";
    return utils::Ok();
  }
  LOG(INFO) << "Found " << info.chapters.size() << " chapters in '"
            << info.title << "'";
  fs::path out_dir = OutputRoot() / "_audiobooks" /
                     (SanitizeName(info.author) + " - " +
                      SanitizeName(info.title));
  auto dir = ensureDir(out_dir);
  if (!dir) return dir;

  std::vector<ChapterJob> jobs;
  for (size_t i = 0; i < info.chapters.size(); ++i) {
    jobs.push_back(
        ChapterJob{info.chapters[i], static_cast<int>(i + 1), out_dir});
  }
  RunReport report = runner_.Run(
      kItemsArena, jobs,
      [this](const ChapterJob& job) { return FetchChapter(job); },
      [](const ChapterJob& job) { return "chapter " + job.chapter.id; });
  return fromReport(report, "audiobook " + id);
}

Result<void> Downloader::FetchChapter(const ChapterJob& job) {
  auto chapter = catalog_.GetChapter(job.chapter.id);
  if (!chapter) return chapter.error();
  const std::string path =
      (job.dir / utils::NumberedFileName(job.index, kChapterNumberWidth,
                                         chapter.value().title,
                                         kSpokenWordExtension))
          .string();
  // 章节音频需要会话凭据
  auto written = fetcher_.FetchToFile(chapter.value().streamUrl, path,
                                      catalog_.session().Options(false));
  if (!written) return written;
  LOG(INFO) << "Downloaded: " << path;
  return utils::Ok();
}

}  // namespace zvukdl
