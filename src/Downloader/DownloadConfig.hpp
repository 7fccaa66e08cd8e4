#ifndef DOWNLOAD_CONFIG_HPP_
#define DOWNLOAD_CONFIG_HPP_

#include <string>

#include "result.hpp"

namespace zvukdl {

// --format=1|2|3
enum class Quality { Mp3Mid = 1, Mp3High = 2, Flac = 3 };

utils::Result<Quality> QualityFromFormat(int format);
const char* QualityApiName(Quality quality);   // mid / high / flac
const char* QualityExtension(Quality quality);  // mp3 / flac

// 命令行解析后构造一次，之后只读
struct DownloadConfig {
  std::string outputPath = "zvuk_downloads";
  Quality quality = Quality::Flac;
  std::string albumTemplate = "_releases/{artist}/{year} - {title}";
};

}  // namespace zvukdl

#endif  // DOWNLOAD_CONFIG_HPP_
