#include <gflags/gflags.h>

#include <chrono>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "Application.hpp"
#include "DownloadConfig.hpp"
#include "Downloader.hpp"
#include "HttpClient.hpp"
#include "Tagger.hpp"
#include "logger.hpp"
#include "task_runner.hpp"

DECLARE_bool(help);

DEFINE_int32(threads, 5, "Concurrency ceiling for every parallel level");
DEFINE_string(output_path, "zvuk_downloads", "Directory to download into");
DEFINE_int32(format, 3, "Audio format: 1=MP3-128, 2=MP3-320, 3=FLAC");
DEFINE_bool(check_auth, false, "Validate credentials only, no downloads");
DEFINE_string(cookies, "cookies.txt", "Netscape-format cookie file");
DEFINE_string(cache_file, "api_cache.db", "Persistent API response cache");
DEFINE_bool(no_cache, false, "Do not read or write the response cache");
DEFINE_string(album_template, "_releases/{artist}/{year} - {title}",
              "Release folder template ({artist}, {year}, {title})");
DEFINE_int32(retry_attempts, 3, "Attempts per request before giving up");
DEFINE_int32(retry_delay_ms, 2000, "Delay between attempts, milliseconds");
DEFINE_string(parallel_control, "",
              "Per-level concurrency overrides for links, releases and "
              "items, e.g. links:4,items:8");
DEFINE_string(log_dir, "logs", "Log directory");
DEFINE_string(log_level, "info", "Minimum log level: debug|info|warn|error");
DEFINE_int32(log_max_size_mb, 10, "Rotate the log file at this size");
DEFINE_int32(log_backups, 3, "Rotated log files to keep");

namespace {

bool ValidatePositive(const char* flagname, gflags::int32 value) {
  if (value >= 1) return true;
  std::cerr << "Invalid value for --" << flagname << ": " << value
            << " (must be >= 1)" << std::endl;
  return false;
}

bool ValidateNonNegative(const char* flagname, gflags::int32 value) {
  if (value >= 0) return true;
  std::cerr << "Invalid value for --" << flagname << ": " << value
            << " (must be >= 0)" << std::endl;
  return false;
}

bool ValidateFormat(const char* flagname, gflags::int32 value) {
  if (zvukdl::QualityFromFormat(value)) return true;
  std::cerr << "Invalid value for --" << flagname
            << ". Allowed: 1, 2, 3" << std::endl;
  return false;
}

bool ValidateLogLevel(const char* flagname, const std::string& value) {
  zvukdl::utils::LogLevel level;
  if (zvukdl::utils::ParseLogLevel(value, &level)) return true;
  std::cerr << "Invalid value for --" << flagname << ": " << value
            << std::endl;
  return false;
}

bool ValidateParallelControl(const char* flagname, const std::string& value) {
  auto parsed =
      zvukdl::utils::ParseParallelControl(value, zvukdl::DownloadLevels());
  if (parsed) return true;
  std::cerr << "Invalid value for --" << flagname << ": "
            << parsed.error().message << std::endl;
  return false;
}

DEFINE_validator(threads, &ValidatePositive);
DEFINE_validator(format, &ValidateFormat);
DEFINE_validator(retry_attempts, &ValidatePositive);
DEFINE_validator(retry_delay_ms, &ValidateNonNegative);
DEFINE_validator(log_level, &ValidateLogLevel);
DEFINE_validator(parallel_control, &ValidateParallelControl);

const char kUsage[] = R"(Download tracks, releases, playlists, artists, selections,
podcasts and audiobooks from zvuk.com.

Usage:
  zvukdl [flags] <link> [<link> ...]

Examples:
  zvukdl --threads=10 https://zvuk.com/artist/852542
  zvukdl https://zvuk.com/release/29015282
  zvukdl https://zvuk.com/playlist/8545187
  zvukdl https://zvuk.com/track/12776890
  zvukdl https://zvuk.com/selection/1
  zvukdl https://zvuk.com/podcast/14574115
  zvukdl https://zvuk.com/abook/24072774
  zvukdl --check-auth

Main flags:
  --output-path=DIR   download directory
  --format=1|2|3      1=MP3-128, 2=MP3-320, 3=FLAC (default)
  --threads=N         concurrency ceiling (default 5)
  --check-auth        validate credentials and subscription only

Requires a Netscape-format cookies.txt exported from a browser session on
zvuk.com (the access_token cookie is used) and an active subscription.
API responses are cached in --cache_file and never expire; delete the file
to force fresh metadata.)";

zvukdl::utils::LogConfig MakeLogConfig() {
  zvukdl::utils::LogConfig cfg;
  cfg.logFilePath = FLAGS_log_dir;
  cfg.maxFileSize = static_cast<size_t>(FLAGS_log_max_size_mb) * 1024 * 1024;
  cfg.maxBackupFiles = static_cast<size_t>(FLAGS_log_backups);
  zvukdl::utils::ParseLogLevel(FLAGS_log_level, &cfg.minLevel);
  return cfg;
}

zvukdl::ApplicationOptions MakeApplicationOptions() {
  zvukdl::ApplicationOptions options;
  options.cookieFile = FLAGS_cookies;
  options.cacheFile = FLAGS_no_cache ? std::string() : FLAGS_cache_file;
  options.checkAuthOnly = FLAGS_check_auth;
  options.retry.attempts = FLAGS_retry_attempts;
  options.retry.delay = std::chrono::milliseconds(FLAGS_retry_delay_ms);

  options.download.outputPath = FLAGS_output_path;
  options.download.quality = zvukdl::QualityFromFormat(FLAGS_format).value();
  options.download.albumTemplate = FLAGS_album_template;

  options.runner.defaultConcurrency = FLAGS_threads;
  options.runner.levels = zvukdl::DownloadLevels();
  options.runner.overrides =
      zvukdl::utils::ParseParallelControl(FLAGS_parallel_control,
                                          options.runner.levels)
          .value();
  return options;
}

}  // namespace

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage(kUsage);
  gflags::ParseCommandLineNonHelpFlags(&argc, &argv, true);

  if (FLAGS_help || (argc == 1 && !FLAGS_check_auth)) {
    std::cout << kUsage << std::endl;
    return 0;
  }

  zvukdl::utils::Logger::initialize(MakeLogConfig());

  std::vector<std::string> links(argv + 1, argv + argc);
  try {
    zvukdl::CurlGlobal curl_global;
    zvukdl::CurlHttpClient http;
    zvukdl::TagLibWriter tagger;
    return zvukdl::RunApplication(http, tagger, MakeApplicationOptions(), links,
                                  std::cout);
  } catch (const std::exception& e) {
    LOG(FATAL) << e.what();
    return 1;
  }
}
