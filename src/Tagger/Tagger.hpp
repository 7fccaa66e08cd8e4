#ifndef TAGGER_HPP_
#define TAGGER_HPP_

#include <string>

#include "result.hpp"

namespace zvukdl {

struct TrackTags {
  std::string artist;
  std::string title;
  std::string album;
  unsigned int trackNumber = 0;
  unsigned int year = 0;  // 0 表示未知
};

class TagWriter {
 public:
  virtual ~TagWriter() = default;
  // 原地修改已写入文件的标签
  virtual utils::Result<void> Apply(const std::string& path,
                                    const TrackTags& tags) = 0;
};

// 通过 TagLib::FileRef 写入，按扩展名自动识别 FLAC / MP3
class TagLibWriter : public TagWriter {
 public:
  utils::Result<void> Apply(const std::string& path,
                            const TrackTags& tags) override;
};

}  // namespace zvukdl

#endif  // TAGGER_HPP_
