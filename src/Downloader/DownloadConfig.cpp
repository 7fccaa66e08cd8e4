#include "DownloadConfig.hpp"

namespace zvukdl {

utils::Result<Quality> QualityFromFormat(int format) {
  switch (format) {
    case 1:
      return Quality::Mp3Mid;
    case 2:
      return Quality::Mp3High;
    case 3:
      return Quality::Flac;
    default:
      return utils::Error(utils::ErrorCode::InvalidArgument,
                          "format must be 1, 2 or 3, got " +
                              std::to_string(format));
  }
}

const char* QualityApiName(Quality quality) {
  switch (quality) {
    case Quality::Mp3Mid:
      return "mid";
    case Quality::Mp3High:
      return "high";
    case Quality::Flac:
      return "flac";
  }
  return "flac";
}

const char* QualityExtension(Quality quality) {
  return quality == Quality::Flac ? "flac" : "mp3";
}

}  // namespace zvukdl
