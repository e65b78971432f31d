#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include "titlefs/container.hpp"
#include "titlefs/utils.hpp"
#include "titlefs/vfs.hpp"

namespace titlefs {

enum class package_kind : unsigned char {
  unsupported = 0,
  single_container = 1,  // .nca
  multi_container = 2,   // .nsp .pfs0 .xci
};

// Classified by the lower-cased extension.
package_kind package_kind_of(const std::filesystem::path &path);

inline bool can_extract(const std::filesystem::path &path) {
  return package_kind_of(path) != package_kind::unsupported;
}

// The read-only tree of one section, ready to be copied.
struct section_view {
  std::unique_ptr<filesystem> fs;
  // the base + patch composition was selected
  bool patched = false;
  // containers the view was built from
  std::vector<std::shared_ptr<container>> sources;
};

class section_resolver {
 public:
  explicit section_resolver(container_library &library) : m_library{library} {}

  /**
   * @brief Pick the base and patch containers of a package and open one of
   * its sections.
   *
   * Patch sources are tried in order and the first one found wins:
   * - a patch container inside the package,
   * - the update the container library knows for the base container.
   *
   * @return errc::not_supported for an unknown package extension,
   *         errc::main_container_missing when an archive holds no base
   *         program container, errc::section_missing when neither the base
   *         nor the patch holds the section. Container library failures are
   *         forwarded as is.
   */
  result<section_view> resolve(const std::filesystem::path &package_path,
                               section_type section, integrity_level level,
                               int program_index = 0);

 private:
  container_library &m_library;

  struct package_containers {
    std::shared_ptr<container> base;
    std::shared_ptr<container> patch;
  };

  result<package_containers> open_multi_(const std::filesystem::path &path);

  result<package_containers> open_single_(const std::filesystem::path &path);
};

}  // namespace titlefs
