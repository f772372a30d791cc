#include "qplan/version.h"

namespace qplan {

namespace {

#ifndef QPLAN_VERSION
#define QPLAN_VERSION "0.0.0"
#endif

#ifndef QPLAN_GIT_COMMIT
#define QPLAN_GIT_COMMIT "unknown"
#endif

#ifndef QPLAN_GIT_DIRTY
#define QPLAN_GIT_DIRTY 0
#endif

}  // namespace

VersionInfo get_version_info() {
  VersionInfo info;
  info.version = QPLAN_VERSION;
  info.git_commit = QPLAN_GIT_COMMIT;
  info.git_dirty = (QPLAN_GIT_DIRTY != 0);
  return info;
}

std::string version_string() {
  VersionInfo info = get_version_info();
  std::string out = info.version + " (" + info.git_commit;
  if (info.git_dirty) out += "-dirty";
  out += ")";
  return out;
}

}  // namespace qplan
