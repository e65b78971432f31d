#include <cstdlib>
#include <filesystem>

#include "titlefs/private/utils.hpp"

namespace titlefs {

std::filesystem::path getexepath() {
  return std::filesystem::canonical("/proc/self/exe");
}

std::filesystem::path get_home() {
  const char *home = std::getenv("HOME");
  if (!home) {
    return {};
  }
  return home;
}

}  // namespace titlefs
