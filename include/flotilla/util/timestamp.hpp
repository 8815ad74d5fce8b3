#pragma once

#include <optional>
#include <string>

#include <boost/date_time/posix_time/posix_time.hpp>

namespace flot::util {
/** @brief Current UTC time as ISO 8601 string, e.g. 2024-01-01T10:00:00.123Z */
inline std::string
NowIso() {
  return boost::posix_time::to_iso_extended_string(
           boost::posix_time::microsec_clock::universal_time()) +
         "Z";
}

inline std::optional<boost::posix_time::ptime>
ParseIso(std::string s) {
  if(s.empty())
    return std::nullopt;
  if(s.back() == 'Z')
    s.pop_back();
  try {
    auto t = boost::posix_time::from_iso_extended_string(s);
    if(t.is_not_a_date_time())
      return std::nullopt;
    return t;
  } catch(const std::exception& e) {
    return std::nullopt;
  }
}
}
