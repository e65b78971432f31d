#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "titlefs/utils.hpp"
#include "titlefs/vfs.hpp"

namespace titlefs {

enum class content_type : unsigned char {
  program = 0,
  meta = 1,
  control = 2,
  manual = 3,
  data = 4,
  public_data = 5,
};

enum class section_type : unsigned char {
  code = 0,
  data = 1,
  logo = 2,
};

// How hard section decoding checks its input. error_on_invalid makes a
// failed check an errc::integrity_error.
enum class integrity_level : unsigned char {
  none = 0,
  error_on_invalid = 1,
};

const char *content_type_name(content_type type) noexcept;

const char *section_type_name(section_type type) noexcept;

// Section table index of `section` in a container of `type`, -1 if such a
// container cannot hold it. Program: code 0, data 1, logo 2. Others: data 0.
int section_index(section_type section, content_type type) noexcept;

// Entry names ending in ".nca", any case.
bool is_container_name(const std::string &name);

/**
 * @brief A sealed container with a table of sections.
 *
 * Implemented by a container library. Instances are shared: section views
 * keep the containers they were opened from alive.
 */
class container {
 public:
  virtual ~container() = default;

  virtual content_type type() const = 0;

  virtual uint64_t title_id() const = 0;

  virtual bool section_exists(int index) const = 0;

  // The section at `index` is a patch to be applied over a base container.
  virtual bool is_patch_section(int index) const = 0;

  virtual result<std::unique_ptr<filesystem>> open_section(
      int index, integrity_level level) = 0;

  // Section `index` of this container overlaid by the same section of
  // `patch`.
  virtual result<std::unique_ptr<filesystem>> open_section_with_patch(
      const std::shared_ptr<container> &patch, int index,
      integrity_level level) = 0;

  /**
   * @brief Find the update for this container through the library's own
   * update tracking.
   *
   * @return success with a null container when no update is known.
   * @return failure when an update is known but cannot be opened.
   */
  virtual result<std::shared_ptr<container>> resolve_update(
      int program_index, integrity_level level) = 0;
};

class container_library {
 public:
  virtual ~container_library() = default;

  // Filesystem of a multi-container package (nsp, pfs0, xci).
  virtual result<std::shared_ptr<filesystem>> open_package(
      const std::filesystem::path &path) = 0;

  virtual result<std::shared_ptr<container>> open_container(
      std::unique_ptr<file> storage) = 0;
};

}  // namespace titlefs
