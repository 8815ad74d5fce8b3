#include <boost/filesystem/operations.hpp>

#include <flotilla/common/log.h>
#include <flotilla/util/json_file.hpp>
#include <flotilla/worktree/worktree.hpp>

#include "workspace_init.hpp"

namespace fs = boost::filesystem;

namespace flot::worktree {
static flot_status
InstallHooks(const fs::path& from, const fs::path& to, std::string& error) {
  boost::system::error_code ec;
  if(!fs::is_directory(from, ec))
    return FLOT_OK;

  fs::create_directories(to, ec);
  if(ec) {
    error = "Could not create hook directory " + to.string() + ": " +
            ec.message();
    return FLOT_IO_ERROR;
  }

  for(fs::directory_iterator it(from, ec), end; !ec && it != end;
      it.increment(ec)) {
    if(!fs::is_regular_file(it->path()))
      continue;
    fs::path target = to / it->path().filename();
    fs::copy_file(
      it->path(), target, fs::copy_options::overwrite_existing, ec);
    if(ec) {
      error = "Could not install hook " + it->path().filename().string() +
              ": " + ec.message();
      return FLOT_IO_ERROR;
    }
    fs::permissions(target,
                    fs::add_perms | fs::owner_exe | fs::group_exe |
                      fs::others_exe,
                    ec);
    flot_log(FLOT_WORKTREE, FLOT_TRACE, "Installed hook {}", target.string());
  }
  if(ec) {
    error = "Could not list hooks in " + from.string() + ": " + ec.message();
    return FLOT_IO_ERROR;
  }
  return FLOT_OK;
}

flot_status
InitializeWorkspace(const Worktree& worktree,
                    const std::string& repoPath,
                    const std::string& configDir,
                    const std::string& projectName,
                    std::string& error) {
  const fs::path source = fs::path(repoPath) / configDir;
  const fs::path target = fs::path(worktree.path) / configDir;

  ProjectFile project;
  project.name = projectName;
  flot_status s =
    util::LoadJson(source / "project.json", "project", project);
  if(s != FLOT_OK && s != FLOT_FILE_NOT_FOUND_ERROR) {
    error = "Could not read project file of " + repoPath;
    return s;
  }
  project.parentProjectPath = repoPath;

  s = util::SaveJson(target / "project.json", "project", project);
  if(s != FLOT_OK) {
    error = "Could not write project file into worktree " + worktree.path;
    return s;
  }

  s = InstallHooks(source / "hooks", target / "hooks", error);
  if(s != FLOT_OK)
    return s;

  flot_log(FLOT_WORKTREE,
           FLOT_DEBUG,
           "Initialized workspace {} for project {}",
           worktree.path,
           project.name);
  return FLOT_OK;
}
}
