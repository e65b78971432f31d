#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "titlefs/save_index.hpp"
#include "titlefs/utils.hpp"

namespace titlefs {

const char COMMITTED_DIR[] = "0";
const char WORKING_DIR[] = "1";

// Save and journal size given to titles that ship no control data.
constexpr int64_t DUMMY_SAVE_SIZE = 0x4000;

/**
 * @brief Find, or provision, the directory that backs a title's save data.
 *
 * Save data lives in <nand>/user/save/<save id, 16 hex digits>/ with a
 * committed revision in @c 0 and a working revision in @c 1. Nothing is ever
 * deleted here.
 */
class save_locator {
 public:
  save_locator(save_store &index, std::filesystem::path nand_dir);

  std::filesystem::path save_root(uint64_t save_data_id) const;

  /**
   * @return the committed revision directory if present, otherwise the
   * working one, created when missing.
   * @return errc::provision_failed when the save did not exist and could not
   * be provisioned, errc::save_not_found_after_provision when provisioning
   * succeeded but the lookup still fails, errc::database_error when the index
   * throws (native: the SQLite error code), errc::io_error when a directory
   * cannot be checked or created.
   */
  result<std::filesystem::path> open_or_create(
      uint64_t title_id, const std::string &title_name,
      const control_property &control, const save_data_filter &filter,
      const user_id &user);

 private:
  save_store &m_index;
  const std::filesystem::path m_nand_dir;

  result<save_data_info> find_or_provision_(uint64_t title_id,
                                            const std::string &title_name,
                                            const control_property &control,
                                            const save_data_filter &filter,
                                            const user_id &user);
};

}  // namespace titlefs
