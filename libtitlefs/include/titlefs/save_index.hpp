#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "titlefs/utils.hpp"

namespace titlefs {

enum class save_type : unsigned char {
  account = 1,  // per user
  bcat = 2,
  device = 3,
};

const char *save_type_name(save_type type) noexcept;

struct user_id {
  uint64_t high = 0;
  uint64_t low = 0;

  bool is_zero() const noexcept { return high == 0 && low == 0; }

  bool operator==(const user_id &) const = default;
};

// Parse 32 hex digits, high half first.
bool parse_user_id(std::string_view sv, user_id &out);

std::string to_string(const user_id &user);

// Unset fields match anything.
struct save_data_filter {
  std::optional<uint64_t> title_id;
  std::optional<save_type> type;
  std::optional<user_id> user;
  std::optional<uint64_t> save_data_id;
  std::optional<uint16_t> index;

  static save_data_filter make_user(uint64_t title_id, const user_id &user);

  static save_data_filter make_device(uint64_t title_id);

  static save_data_filter make_bcat(uint64_t title_id);
};

struct [[nodiscard]] save_data_info {
  uint64_t save_data_id;
  uint64_t title_id;
  save_type type;
  user_id user{};
  uint16_t index = 0;
  int64_t size = 0;
  int64_t journal_size = 0;
};

// Save sizes a title declares in its control data.
struct control_property {
  int64_t user_account_save_data_size = 0;
  int64_t user_account_save_data_journal_size = 0;
  int64_t device_save_data_size = 0;
  int64_t device_save_data_journal_size = 0;
  int64_t bcat_delivery_cache_storage_size = 0;

  // No control data at all.
  bool is_zeros() const noexcept;
};

// What locating a save directory needs from an index of save records.
class save_store {
 public:
  virtual ~save_store() = default;

  // Lowest id matching `filter`, errc::save_not_found if none.
  virtual result<save_data_info> find(const save_data_filter &filter) = 0;

  /**
   * @brief Make sure the saves `control` asks for exist.
   *
   * Account save for `user` (skipped for the zero user), device save, bcat
   * storage, each only when its size is nonzero. Existing records are kept.
   *
   * @return the records ensured, errc::invalid_argument when the control
   * declares no save size.
   */
  virtual result<std::vector<save_data_info>> provision(
      uint64_t title_id, const control_property &control,
      const user_id &user) = 0;
};

/**
 * @brief Index of the save data known on this system, kept in SQLite.
 *
 * SQLite errors are thrown as SQLite::Exception, lookups that find nothing
 * are failed results.
 */
class save_index : public save_store {
 private:
  // SQLite::Database wrapper, for hiding SQLiteCpp/Database.hpp header
  struct db_wrap;

 public:
  explicit save_index(const std::string &path);

  save_index(const save_index &) = delete;
  save_index &operator=(const save_index &) = delete;

  save_index(save_index &&) = default;
  save_index &operator=(save_index &&) = default;

  ~save_index() override;

  result<save_data_info> find(const save_data_filter &filter) override;

  result<std::vector<save_data_info>> provision(
      uint64_t title_id, const control_property &control,
      const user_id &user) override;

  std::vector<save_data_info> query_saves(uint64_t title_id);

  // Number of records removed.
  int delete_save(uint64_t save_data_id);

 private:
  std::unique_ptr<db_wrap> m_dr;

  save_data_info insert_save_(uint64_t title_id, save_type type,
                              const user_id &user, int64_t size,
                              int64_t journal_size);

  save_data_info ensure_save_(uint64_t title_id, save_type type,
                              const user_id &user, int64_t size,
                              int64_t journal_size);
};

}  // namespace titlefs
