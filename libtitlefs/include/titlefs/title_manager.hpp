#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "titlefs/archive_container.hpp"
#include "titlefs/cancel.hpp"
#include "titlefs/container.hpp"
#include "titlefs/copier.hpp"
#include "titlefs/resolver.hpp"
#include "titlefs/save_index.hpp"
#include "titlefs/save_locator.hpp"
#include "titlefs/utils.hpp"

namespace titlefs {

// Account the saves are created for when the caller names none.
constexpr user_id DEFAULT_USER{.high = 1, .low = 0};

struct manager_config {
  std::filesystem::path cfg_dir;
  std::filesystem::path db_path;
  std::filesystem::path nand_dir;
  std::filesystem::path updates_dir;
  integrity_level integrity = integrity_level::error_on_invalid;
  user_id default_user = DEFAULT_USER;

  // Everything under `cfg_dir`, with the default file names.
  static manager_config from_dir(const std::filesystem::path &cfg_dir);

  // $HOME/.config/titlefs_cfg, or titlefs_cfg beside the executable.
  static manager_config defaults();
};

// Which save data entries make sense for a title.
struct save_menu_state {
  bool user = false;
  bool device = false;
  bool bcat = false;
};

class title_manager {
 public:
  /**
   * @brief Open the save index and the container library described by
   * @c cfg.
   *
   * Side effect: creates @c cfg_dir, @c nand_dir and @c updates_dir when
   * missing, and the SQLite database at @c db_path.
   *
   * @exception std::exception if a directory or the database cannot be
   * created or opened.
   */
  TITLEFS_API explicit title_manager(manager_config cfg);

  title_manager(const title_manager &) = delete;
  title_manager &operator=(const title_manager &) = delete;
  title_manager(title_manager &&) = delete;
  title_manager &operator=(title_manager &&) = delete;

  TITLEFS_API ~title_manager();

  const manager_config &config() const noexcept { return m_cfg; }

  /**
   * @brief Copy one section of a package into @c destination.
   *
   * @param package_path .nca, .nsp, .pfs0 or .xci file
   * @param destination directory on disk, created when missing
   * @param cancel polled before every entry copied
   * @param program_index which program of a multi-program title to look up
   * updates for
   */
  TITLEFS_API copy_outcome extract_section(
      const std::filesystem::path &package_path, section_type section,
      const std::filesystem::path &destination, const cancel_token &cancel,
      int program_index = 0);

  /**
   * @brief Directory backing the save data selected by @c filter, created
   * together with its index record when missing.
   *
   * Saves are provisioned for the configured default user. Save index
   * failures come back as errc::database_error, nothing is thrown.
   */
  TITLEFS_API result<std::filesystem::path> locate_save_directory(
      uint64_t title_id, const std::string &title_name,
      const control_property &control, const save_data_filter &filter);

  TITLEFS_API static save_menu_state save_menu(const control_property &control);

  save_index &index() noexcept { return m_index; }

 private:
  const manager_config m_cfg;
  archive_container_library m_library;
  save_index m_index;
  save_locator m_locator;
  section_resolver m_resolver;
};

}  // namespace titlefs
