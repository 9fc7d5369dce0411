#pragma once

#include <cstdio>
#include <string>

#include "lazyhold/common/Platform.hpp"

#if defined(__LINUX__)
# include <sys/stat.h>
# include <sys/types.h>
# include <unistd.h>
#elif defined(__WIN__)
# include <direct.h>
# include <io.h>
# include <sys/stat.h>
#endif

namespace os_api
{
namespace detail
{
static int mkdir(const std::string &dirname) {
#if defined(__LINUX__)
  if (::access(dirname.c_str(), F_OK) == 0) {
    return 0;
  }
  return ::mkdir(dirname.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
#elif defined(__WIN__)
  if (::_access(dirname.c_str(), 0) == 0) {
    return 0;
  }
  return ::_mkdir(dirname.c_str());
#endif
}
}  // namespace detail

static bool exist(const std::string &path, bool is_dir) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0) {
    return false;
  }
#if defined(__LINUX__)
  return !is_dir || S_ISDIR(st.st_mode);
#elif defined(__WIN__)
  return !is_dir || (st.st_mode & _S_IFDIR);
#endif
}
static bool exist_file(const std::string &path) { return exist(path, false); }
static bool exist_dir(const std::string &path) { return exist(path, true); }

// mkdir -p
static bool mkdir(const std::string &dirname) {
  if (dirname.empty()) return false;
  if (exist_dir(dirname)) return true;

  for (size_t pos = dirname.find_first_of("/\\", 1); pos != std::string::npos;
       pos = dirname.find_first_of("/\\", pos + 1)) {
    if (detail::mkdir(dirname.substr(0, pos)) != 0) {
      return false;
    }
  }
  return detail::mkdir(dirname) == 0;
}

static bool rm(const std::string &path) {
  if (!exist_file(path)) return true;
  return std::remove(path.c_str()) == 0;
}
}  // namespace os_api
