#pragma once

#include <set>
#include <vector>

#include "FilenameGenerator.hpp"
#include "MetadataProvider.hpp"
#include "types.hpp"

// Renames batches of media files after a naming scheme built from literal
// text and per-file metadata.
//
//   Renamer renamer;
//   renamer.set_naming_scheme(json::array({"Test-", {{"key", "date_time"}}}));
//   RenamePlan plan = renamer.generate(files);
//   renamer.overwrite(plan);
//
// generate() only plans; overwrite() changes file names on disk. Files that
// cannot be renamed are logged and left out, the batch always continues.
// Not synchronized: callers sharing an instance across threads must lock.
class Renamer {
 public:
  explicit Renamer(
      MetadataProvider provider = MetadataProvider::with_default_extractors());
  explicit Renamer(
      const Config& config,
      MetadataProvider provider = MetadataProvider::with_default_extractors());

  Renamer(const Renamer&) = delete;
  Renamer& operator=(const Renamer&) = delete;

  // Compiles and stores the default scheme; invalid tokens are dropped.
  void set_naming_scheme(const json& raw_scheme);
  const Scheme& naming_scheme() const { return m_naming_scheme; }

  char substitution_char() const { return m_substitution_char; }
  void set_substitution_char(char c) { m_substitution_char = c; }

  // Maps each renamable path to its new bare file name, in input order.
  // A non-empty array in scheme_override replaces the default scheme for
  // this call only.
  RenamePlan generate(const std::vector<fs::path>& paths,
                      const json& scheme_override = nullptr) const;

  // Same, for a path list given as JSON. Throws InvalidArgumentError when
  // path_list is not an array; non-string entries are skipped.
  RenamePlan generate_from_json(const json& path_list,
                                const json& scheme_override = nullptr) const;

  // Writes the new names. NOTE: this changes file names on disk.
  void overwrite(const RenamePlan& plan) const;

 private:
  Scheme effective_scheme(const json& scheme_override) const;
  void plan_file(const fs::path& path, const Scheme& scheme, RenamePlan& plan,
                 std::set<fs::path>& seen) const;
  void log_summary(size_t requested, const RenamePlan& plan) const;

  MetadataProvider m_provider;
  FilenameGenerator m_generator;
  Scheme m_naming_scheme;
  char m_substitution_char = '_';
};
