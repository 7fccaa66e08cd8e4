#include "name_sanitizer.hpp"

#include <cctype>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace zvukdl::utils {

namespace {
constexpr char kReservedChars[] = "<>@%!+:\"/\\|?*";

bool isReserved(char ch) {
  return ch != '\0' && std::strchr(kReservedChars, ch) != nullptr;
}

void replaceAll(std::string* text, const std::string& from,
                const std::string& to) {
  size_t pos = 0;
  while ((pos = text->find(from, pos)) != std::string::npos) {
    text->replace(pos, from.size(), to);
    pos += to.size();
  }
}
}  // namespace

std::string SanitizeName(const std::string& name) {
  std::string out;
  out.reserve(name.size());
  bool pending_space = false;
  for (char ch : name) {
    if (std::isspace(static_cast<unsigned char>(ch))) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(isReserved(ch) ? '_' : ch);
  }
  return out;
}

std::string FormatAlbumPath(const std::string& tmpl, const std::string& artist,
                            const std::string& year,
                            const std::string& title) {
  std::string path = tmpl;
  replaceAll(&path, "{artist}", SanitizeName(artist));
  replaceAll(&path, "{year}", SanitizeName(year));
  replaceAll(&path, "{title}", SanitizeName(title));
  return path;
}

std::string NumberedFileName(int position, int width, const std::string& title,
                             const std::string& extension) {
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(width) << position << " - "
      << SanitizeName(title) << "." << extension;
  return oss.str();
}

}  // namespace zvukdl::utils
