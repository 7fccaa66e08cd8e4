#include "Tagger.hpp"

#include <taglib/fileref.h>
#include <taglib/tag.h>
#include <taglib/tstring.h>

#include "logger.hpp"

namespace zvukdl {

using utils::Error;
using utils::ErrorCode;

namespace {
TagLib::String utf8(const std::string& text) {
  return TagLib::String(text, TagLib::String::UTF8);
}
}  // namespace

utils::Result<void> TagLibWriter::Apply(const std::string& path,
                                        const TrackTags& tags) {
  TagLib::FileRef file(path.c_str());
  if (file.isNull() || !file.tag()) {
    return Error(ErrorCode::TaggingError, "unsupported audio file: " + path);
  }
  TagLib::Tag* tag = file.tag();
  tag->setArtist(utf8(tags.artist));
  tag->setTitle(utf8(tags.title));
  tag->setAlbum(utf8(tags.album));
  tag->setTrack(tags.trackNumber);
  if (tags.year > 0) {
    tag->setYear(tags.year);
  }
  if (!file.save()) {
    return Error(ErrorCode::TaggingError, "failed to save tags: " + path);
  }
  LOG(DEBUG) << "Tagged " << path;
  return utils::Ok();
}

}  // namespace zvukdl
