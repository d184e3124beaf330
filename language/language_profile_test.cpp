#include "language/language_profile.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::SizeIs;

TEST(LanguageProfileTest, KnownLanguages) {
  EXPECT_EQ(language::Resolve("python").source_filename, "main.py");
  EXPECT_EQ(language::Resolve("java").source_filename, "Main.java");
  EXPECT_EQ(language::Resolve("cpp").source_filename, "main.cpp");
  EXPECT_EQ(language::Resolve("c").source_filename, "main.c");
  EXPECT_EQ(language::Resolve("javascript").source_filename, "main.js");
}

TEST(LanguageProfileTest, UnknownLanguagesUsePython) {
  for (const char* name : {"", "cobol", "rust", "pythonn", "  "}) {
    const language::LanguageProfile& profile = language::Resolve(name);
    EXPECT_EQ(profile.language, proto::PYTHON) << name;
    EXPECT_EQ(profile.source_filename, "main.py") << name;
    EXPECT_EQ(profile.run_command_template, "python3 {src}") << name;
  }
}

TEST(LanguageProfileTest, CaseAndWhitespaceInsensitive) {
  EXPECT_EQ(language::ParseLanguage(" Java\n"), proto::JAVA);
  EXPECT_EQ(language::ParseLanguage("CPP"), proto::CPP);
  EXPECT_EQ(language::ParseLanguage("JavaScript"), proto::JAVASCRIPT);
}

TEST(LanguageProfileTest, Aliases) {
  EXPECT_EQ(language::ParseLanguage("c++"), proto::CPP);
  EXPECT_EQ(language::ParseLanguage("js"), proto::JAVASCRIPT);
  EXPECT_EQ(language::ParseLanguage("node"), proto::JAVASCRIPT);
  EXPECT_EQ(language::ParseLanguage("py"), proto::PYTHON);
  EXPECT_EQ(language::ParseLanguage("python3"), proto::PYTHON);
}

TEST(LanguageProfileTest, CompiledLanguagesChainCompileAndRun) {
  for (proto::Language lang : {proto::C, proto::CPP}) {
    const language::LanguageProfile& profile = language::ProfileFor(lang);
    EXPECT_THAT(profile.run_command_template, HasSubstr(" && "));
    EXPECT_TRUE(profile.limit_address_space);
  }
  EXPECT_THAT(language::ProfileFor(proto::PYTHON).run_command_template,
              Not(HasSubstr("&&")));
}

TEST(LanguageProfileTest, RunCommand) {
  EXPECT_EQ(language::ProfileFor(proto::PYTHON).RunCommand("/code", "/tmp"),
            "python3 '/code/main.py'");
  EXPECT_EQ(language::ProfileFor(proto::CPP).RunCommand("/code", "/tmp"),
            "g++ -O2 -o '/tmp'/a.out '/code/main.cpp' && '/tmp'/a.out");
  EXPECT_EQ(language::ProfileFor(proto::JAVA).RunCommand("/a'b", "/tmp"),
            "java '/a'\\''b/Main.java'");
}

TEST(LanguageProfileTest, Image) {
  EXPECT_EQ(language::ProfileFor(proto::PYTHON).Image(),
            "code-sandbox-python:latest");
  EXPECT_EQ(language::ProfileFor(proto::JAVASCRIPT).Image(),
            "code-sandbox-javascript:latest");
}

TEST(LanguageProfileTest, SupportedLanguages) {
  std::vector<language::LanguageInfo> languages =
      language::SupportedLanguages();
  ASSERT_THAT(languages, SizeIs(5));
  for (const language::LanguageInfo& info : languages) {
    const language::LanguageProfile& profile = language::Resolve(info.value);
    EXPECT_EQ(profile.name, info.value);
    EXPECT_THAT(profile.source_filename, HasSubstr(info.extension));
  }
}

}  // namespace
