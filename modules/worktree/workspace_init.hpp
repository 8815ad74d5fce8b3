#pragma once

#include <string>

#include <cereal/cereal.hpp>
#include <cereal/types/string.hpp>

#include "flotilla/common/status.h"

namespace flot::worktree {
struct Worktree;

/** @brief Project metadata kept in <config dir>/project.json. */
struct ProjectFile {
  std::string name;
  std::string parentProjectPath;

  template<class Archive>
  void serialize(Archive& ar) {
    ar(cereal::make_nvp("name", name),
       cereal::make_nvp("parent_project_path", parentProjectPath));
  }
};

/** @brief Prepares a fresh worktree for a worker.
 *
 * Copies the project file of the main repository, pointing it back to the
 * repository, and installs the hook scripts found in <config dir>/hooks.
 */
flot_status
InitializeWorkspace(const Worktree& worktree,
                    const std::string& repoPath,
                    const std::string& configDir,
                    const std::string& projectName,
                    std::string& error);
}
