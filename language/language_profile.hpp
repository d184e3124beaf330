#ifndef LANGUAGE_LANGUAGE_PROFILE_HPP
#define LANGUAGE_LANGUAGE_PROFILE_HPP

#include <string>
#include <vector>

#include "proto/language.pb.h"

namespace language {

// How a source file of some language is stored and run.
struct LanguageProfile {
  proto::Language language;
  // Lowercase canonical name, also used to build the image name.
  std::string name;
  std::string source_filename;
  // Shell command; {src} is replaced by the source path and {bin} by a
  // writable scratch directory. Compiled languages chain the compilation and
  // the execution with &&.
  std::string run_command_template;
  // Whether the runtime tolerates an address space limit equal to the memory
  // ceiling. Runtimes that reserve large virtual areas up front do not.
  bool limit_address_space;

  // Container image that provides the toolchain.
  std::string Image() const;

  // Expands run_command_template. Paths are shell-quoted.
  std::string RunCommand(const std::string& source_dir,
                         const std::string& scratch_dir) const;
};

struct LanguageInfo {
  std::string display_name;
  std::string value;
  std::string extension;
};

// Maps a free-form language name (case insensitive, with aliases such as
// "c++" or "js") to a Language. Unknown and empty names map to PYTHON.
proto::Language ParseLanguage(const std::string& language);

const LanguageProfile& ProfileFor(proto::Language language);

// Never fails: unknown languages get the Python profile.
const LanguageProfile& Resolve(const std::string& language);

std::vector<LanguageInfo> SupportedLanguages();

}  // namespace language

#endif
