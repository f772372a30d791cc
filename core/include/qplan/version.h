#pragma once

#include <string>

namespace qplan {

/// Build version and source provenance of the planner core.
struct VersionInfo {
  std::string version;
  std::string git_commit;
  bool git_dirty = false;
};

/// Returns compile-time version/provenance for the current core build.
/// MUST not perform IO.
VersionInfo get_version_info();
/// Returns "<version> (<commit>[-dirty])".
std::string version_string();

}  // namespace qplan
