#include "language/language_profile.hpp"

#include "absl/strings/ascii.h"
#include "absl/strings/str_replace.h"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace language {

namespace {

const LanguageProfile kPython{proto::PYTHON, "python", "main.py",
                              "python3 {src}", true};
const LanguageProfile kJava{proto::JAVA, "java", "Main.java", "java {src}",
                            false};
const LanguageProfile kCpp{proto::CPP, "cpp", "main.cpp",
                           "g++ -O2 -o {bin}/a.out {src} && {bin}/a.out", true};
const LanguageProfile kC{proto::C, "c", "main.c",
                         "gcc -O2 -o {bin}/a.out {src} && {bin}/a.out", true};
const LanguageProfile kJavaScript{proto::JAVASCRIPT, "javascript", "main.js",
                                  "node {src}", false};

std::string ShellQuote(const std::string& s) {
  return "'" + absl::StrReplaceAll(s, {{"'", "'\\''"}}) + "'";
}

}  // namespace

std::string LanguageProfile::Image() const {
  return FLAGS_image_prefix + name + ":latest";
}

std::string LanguageProfile::RunCommand(const std::string& source_dir,
                                        const std::string& scratch_dir) const {
  return absl::StrReplaceAll(
      run_command_template,
      {{"{src}", ShellQuote(util::File::JoinPath(source_dir, source_filename))},
       {"{bin}", ShellQuote(scratch_dir)}});
}

proto::Language ParseLanguage(const std::string& language) {
  std::string name =
      absl::AsciiStrToLower(absl::StripAsciiWhitespace(language));
  if (name == "python" || name == "python3" || name == "py") {
    return proto::PYTHON;
  }
  if (name == "java") return proto::JAVA;
  if (name == "cpp" || name == "c++") return proto::CPP;
  if (name == "c") return proto::C;
  if (name == "javascript" || name == "js" || name == "node") {
    return proto::JAVASCRIPT;
  }
  VLOG(1) << "Unsupported language \"" << language << "\", using python";
  return proto::PYTHON;
}

const LanguageProfile& ProfileFor(proto::Language language) {
  switch (language) {
    case proto::JAVA:
      return kJava;
    case proto::CPP:
      return kCpp;
    case proto::C:
      return kC;
    case proto::JAVASCRIPT:
      return kJavaScript;
    case proto::PYTHON:
    default:
      return kPython;
  }
}

const LanguageProfile& Resolve(const std::string& language) {
  return ProfileFor(ParseLanguage(language));
}

std::vector<LanguageInfo> SupportedLanguages() {
  return {{"Python", "python", ".py"},
          {"Java", "java", ".java"},
          {"C++", "cpp", ".cpp"},
          {"C", "c", ".c"},
          {"JavaScript", "javascript", ".js"}};
}

}  // namespace language
