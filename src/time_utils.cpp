#include "foxess/time_utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace foxess {

namespace {

std::string trim(const std::string &s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

} // namespace

std::string timezone_from_zoneinfo_path(const std::string &path) {
  static const std::string marker = "zoneinfo/";
  const auto pos = path.rfind(marker);
  if (pos == std::string::npos)
    return {};
  return path.substr(pos + marker.size());
}

std::string local_timezone_id(const std::string &override_id) {
  if (!override_id.empty())
    return override_id;

  if (const char *tz = std::getenv("TZ")) {
    std::string v = trim(tz);
    // POSIX допускает ":Europe/Berlin"
    if (!v.empty() && v.front() == ':')
      v.erase(0, 1);
    if (!v.empty())
      return v;
  }

  {
    std::ifstream f("/etc/timezone");
    std::string line;
    if (f && std::getline(f, line)) {
      line = trim(line);
      if (!line.empty())
        return line;
    }
  }

  std::error_code ec;
  const auto target = std::filesystem::read_symlink("/etc/localtime", ec);
  if (!ec) {
    auto id = timezone_from_zoneinfo_path(target.string());
    if (!id.empty())
      return id;
  }

  return "UTC";
}

} // namespace foxess
