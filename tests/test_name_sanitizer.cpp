#include <gtest/gtest.h>

#include <string>

#include "name_sanitizer.hpp"

using zvukdl::utils::FormatAlbumPath;
using zvukdl::utils::NumberedFileName;
using zvukdl::utils::SanitizeName;

TEST(NameSanitizerTest, ReplacesEveryReservedCharacter) {
  EXPECT_EQ(SanitizeName("<>@%!+:\"/\\|?*"), std::string(13, '_'));
  EXPECT_EQ(SanitizeName("AC/DC"), "AC_DC");
  EXPECT_EQ(SanitizeName("What? Why!"), "What_ Why_");
}

TEST(NameSanitizerTest, CollapsesAndTrimsWhitespace) {
  EXPECT_EQ(SanitizeName("  Hello \t\n  World  "), "Hello World");
  EXPECT_EQ(SanitizeName("   "), "");
  EXPECT_EQ(SanitizeName(""), "");
}

TEST(NameSanitizerTest, KeepsNonAsciiText) {
  EXPECT_EQ(SanitizeName("Кино - Группа крови"), "Кино - Группа крови");
}

TEST(NameSanitizerTest, Idempotent) {
  for (const std::string name :
       {"AC/DC", "  a  b  ", "x:y|z", "Кино", "a\\b?c*d\"e"}) {
    const std::string once = SanitizeName(name);
    EXPECT_EQ(SanitizeName(once), once) << name;
  }
}

TEST(NameSanitizerTest, AlbumPathSanitizesEachPlaceholder) {
  EXPECT_EQ(FormatAlbumPath("_releases/{artist}/{year} - {title}", "AC/DC",
                            "1980", "Back in Black"),
            "_releases/AC_DC/1980 - Back in Black");
  EXPECT_EQ(FormatAlbumPath("{artist} - {title} ({year})", "A", "2001",
                            "B: Live"),
            "A - B_ Live (2001)");
}

TEST(NameSanitizerTest, AlbumPathWithoutPlaceholders) {
  EXPECT_EQ(FormatAlbumPath("flat", "a", "b", "c"), "flat");
}

TEST(NameSanitizerTest, NumberedFileName) {
  EXPECT_EQ(NumberedFileName(3, 2, "Intro", "flac"), "03 - Intro.flac");
  EXPECT_EQ(NumberedFileName(12, 3, "A: B", "mp3"), "012 - A_ B.mp3");
  EXPECT_EQ(NumberedFileName(123, 2, "Long", "mp3"), "123 - Long.mp3");
}
