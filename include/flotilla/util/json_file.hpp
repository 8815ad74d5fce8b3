#pragma once

#include <cstdint>
#include <ctime>
#include <fstream>

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>

#include <cereal/archives/json.hpp>

#include <flotilla/common/log.h>
#include <flotilla/common/status.h>

namespace flot::util {
/** @brief Last observed modification time and size of a file, used to notice
 * writes from other processes. */
struct FileStamp {
  std::time_t writeTime = 0;
  uintmax_t size = 0;

  bool changed(const boost::filesystem::path& path) const {
    boost::system::error_code ec;
    auto t = boost::filesystem::last_write_time(path, ec);
    if(ec)
      return false;
    auto s = boost::filesystem::file_size(path, ec);
    if(ec)
      return false;
    return t != writeTime || s != size;
  }
  void remember(const boost::filesystem::path& path) {
    boost::system::error_code ec;
    writeTime = boost::filesystem::last_write_time(path, ec);
    size = boost::filesystem::file_size(path, ec);
  }
};

/** @brief Reads a value stored under the given name from a JSON file. */
template<typename T>
flot_status
LoadJson(const boost::filesystem::path& path, const char* name, T& value) {
  boost::system::error_code ec;
  if(!boost::filesystem::exists(path, ec))
    return FLOT_FILE_NOT_FOUND_ERROR;

  std::ifstream in(path.string());
  if(!in) {
    flot_log(FLOT_STATE,
             FLOT_LOCALERROR,
             "Could not open {} for reading!",
             path.string());
    return FLOT_IO_ERROR;
  }

  try {
    cereal::JSONInputArchive ar(in);
    ar(cereal::make_nvp(name, value));
  } catch(const std::exception& e) {
    flot_log(FLOT_STATE,
             FLOT_LOCALERROR,
             "Could not parse {}! Error: {}",
             path.string(),
             e.what());
    return FLOT_PARSE_ERROR;
  }
  return FLOT_OK;
}

/** @brief Writes a value under the given name into a JSON file.
 *
 * The document is written to a sibling temporary file first and renamed over
 * the target afterwards.
 */
template<typename T>
flot_status
SaveJson(const boost::filesystem::path& path,
         const char* name,
         const T& value) {
  boost::system::error_code ec;
  if(path.has_parent_path()) {
    boost::filesystem::create_directories(path.parent_path(), ec);
    if(ec) {
      flot_log(FLOT_STATE,
               FLOT_LOCALERROR,
               "Could not create directory {}! Error: {}",
               path.parent_path().string(),
               ec.message());
      return FLOT_IO_ERROR;
    }
  }

  boost::filesystem::path tmp = path;
  tmp += ".tmp";

  {
    std::ofstream out(tmp.string(), std::ios::trunc);
    if(!out) {
      flot_log(FLOT_STATE,
               FLOT_LOCALERROR,
               "Could not open {} for writing!",
               tmp.string());
      return FLOT_IO_ERROR;
    }
    try {
      cereal::JSONOutputArchive ar(out);
      ar(cereal::make_nvp(name, value));
    } catch(const std::exception& e) {
      flot_log(FLOT_STATE,
               FLOT_LOCALERROR,
               "Could not serialize {}! Error: {}",
               path.string(),
               e.what());
      return FLOT_IO_ERROR;
    }
    out.flush();
    if(!out) {
      return FLOT_IO_ERROR;
    }
  }

  boost::filesystem::rename(tmp, path, ec);
  if(ec) {
    flot_log(FLOT_STATE,
             FLOT_LOCALERROR,
             "Could not move {} to {}! Error: {}",
             tmp.string(),
             path.string(),
             ec.message());
    return FLOT_IO_ERROR;
  }
  return FLOT_OK;
}
}
