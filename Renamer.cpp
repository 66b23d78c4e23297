#include "Renamer.hpp"

#include <format>

#include "IOManager.hpp"
#include "RenameExecutor.hpp"
#include "SchemeCompiler.hpp"
#include "utils.hpp"

Renamer::Renamer(MetadataProvider provider)
    : Renamer(Config{}, std::move(provider)) {}

Renamer::Renamer(const Config& config, MetadataProvider provider)
    : m_provider(std::move(provider)),
      m_generator(m_provider),
      m_naming_scheme(SchemeCompiler::compile(config.naming_scheme)),
      m_substitution_char(config.substitution_char) {}

void Renamer::set_naming_scheme(const json& raw_scheme) {
  m_naming_scheme = SchemeCompiler::compile(raw_scheme);
  IOManager::log(std::format("Naming scheme set to '{}'",
                             SchemeCompiler::describe(m_naming_scheme)));
}

Scheme Renamer::effective_scheme(const json& scheme_override) const {
  if (scheme_override.is_array() && !scheme_override.empty()) {
    return SchemeCompiler::compile(scheme_override);
  }
  return m_naming_scheme;
}

void Renamer::plan_file(const fs::path& path, const Scheme& scheme,
                        RenamePlan& plan, std::set<fs::path>& seen) const {
  // A repeated path is resolved, and logged, only once.
  if (!seen.insert(path).second) {
    return;
  }
  auto new_name = m_generator.resolve(path, scheme, m_substitution_char);
  if (new_name && !new_name->empty()) {
    plan.push_back({path, std::move(*new_name)});
  }
}

void Renamer::log_summary(size_t requested, const RenamePlan& plan) const {
  IOManager::log(std::format("Planned {} of {} files, {} skipped.",
                             plan.size(), requested,
                             requested - plan.size()));
}

RenamePlan Renamer::generate(const std::vector<fs::path>& paths,
                             const json& scheme_override) const {
  const Scheme scheme = effective_scheme(scheme_override);
  IOManager::log(std::format("Generating names for {} files with scheme '{}'",
                             paths.size(), SchemeCompiler::describe(scheme)));

  RenamePlan plan;
  std::set<fs::path> seen;
  for (const auto& path : paths) {
    plan_file(path, scheme, plan, seen);
  }

  log_summary(paths.size(), plan);
  return plan;
}

RenamePlan Renamer::generate_from_json(const json& path_list,
                                       const json& scheme_override) const {
  if (!path_list.is_array()) {
    throw InvalidArgumentError(std::format(
        "Invalid arguments provided. Expected an array of paths, got {}",
        path_list.type_name()));
  }

  const Scheme scheme = effective_scheme(scheme_override);
  IOManager::log(std::format("Generating names for {} files with scheme '{}'",
                             path_list.size(),
                             SchemeCompiler::describe(scheme)));

  RenamePlan plan;
  std::set<fs::path> seen;
  for (const auto& element : path_list) {
    if (!element.is_string()) {
      IOManager::log(std::format("Ignoring file {} [{}]: not a path",
                                 element.dump(),
                                 error_kind_name(ErrorKind::FileNotValid)));
      continue;
    }
    plan_file(path_from_utf8(element.get<std::string>()), scheme, plan, seen);
  }

  log_summary(path_list.size(), plan);
  return plan;
}

void Renamer::overwrite(const RenamePlan& plan) const {
  RenameExecutor::execute(plan);
}
