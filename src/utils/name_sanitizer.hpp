#pragma once

#include <string>

namespace zvukdl::utils {

// 把 < > @ % ! + : " / \ | ? * 替换为 '_'，连续空白压缩为一个空格并去掉首尾空白
std::string SanitizeName(const std::string& name);

// "{artist}/{year} - {title}"，三个占位符的值都会先经过 SanitizeName
std::string FormatAlbumPath(const std::string& tmpl, const std::string& artist,
                            const std::string& year, const std::string& title);

// NumberedFileName(3, 2, "Intro", "flac") -> "03 - Intro.flac"
std::string NumberedFileName(int position, int width, const std::string& title,
                             const std::string& extension);

}  // namespace zvukdl::utils
