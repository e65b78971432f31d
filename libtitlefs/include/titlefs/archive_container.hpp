#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

#include "titlefs/archive_fs.hpp"
#include "titlefs/container.hpp"

namespace titlefs {

const char CONTAINER_HEADER[] = "header.json";
const char SECTION_DIR_PREFIX[] = "section";

// Title id bits that select the program inside an application.
constexpr uint64_t PROGRAM_INDEX_MASK = 0xF;
// Title id bits cleared to get the id shared by a program and its updates.
constexpr uint64_t PROGRAM_ID_BASE_MASK = 0x1FFF;

constexpr uint64_t program_id_base(uint64_t title_id) noexcept {
  return title_id & ~PROGRAM_ID_BASE_MASK;
}

constexpr int program_index_of(uint64_t title_id) noexcept {
  return static_cast<int>(title_id & PROGRAM_INDEX_MASK);
}

/**
 * @brief Container stored as an archive.
 *
 * The archive holds @c header.json and one @c section<N>/ directory per
 * section:
 * @code{.unparsed}
 * {
 *   "content_type": "program",
 *   "title_id": "0100000000010000",
 *   "sections": [ { "index": 0 }, { "index": 1, "patch": true } ]
 * }
 * @endcode
 */
class archive_container : public container {
 private:
  struct passkey {
    explicit passkey() = default;
  };

 public:
  struct section_info {
    bool patch = false;
  };

  archive_container(passkey, std::shared_ptr<archive_fs> fs,
                    std::filesystem::path updates_dir);

  // Parse the header of an already opened container archive.
  static result<std::shared_ptr<archive_container>> open(
      std::shared_ptr<archive_fs> fs, std::filesystem::path updates_dir);

  content_type type() const override { return m_type; }

  uint64_t title_id() const override { return m_title_id; }

  bool section_exists(int index) const override;

  bool is_patch_section(int index) const override;

  result<std::unique_ptr<filesystem>> open_section(
      int index, integrity_level level) override;

  result<std::unique_ptr<filesystem>> open_section_with_patch(
      const std::shared_ptr<container> &patch, int index,
      integrity_level level) override;

  // Looks for <updates_dir>/<program id base>.nsp
  result<std::shared_ptr<container>> resolve_update(
      int program_index, integrity_level level) override;

 private:
  std::shared_ptr<archive_fs> m_fs;
  std::filesystem::path m_updates_dir;
  content_type m_type = content_type::program;
  uint64_t m_title_id = 0;
  std::map<int, section_info> m_sections;

};

// `container_library` reading packages and containers with libarchive.
class archive_container_library : public container_library {
 public:
  explicit archive_container_library(std::filesystem::path updates_dir);

  const std::filesystem::path &updates_dir() const noexcept {
    return m_updates_dir;
  }

  result<std::shared_ptr<filesystem>> open_package(
      const std::filesystem::path &path) override;

  result<std::shared_ptr<container>> open_container(
      std::unique_ptr<file> storage) override;

 private:
  const std::filesystem::path m_updates_dir;
};

// "/section1"
std::string section_dir(int index);

}  // namespace titlefs
