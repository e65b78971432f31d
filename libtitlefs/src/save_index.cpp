#include "titlefs/save_index.hpp"

#include <SQLiteCpp/Database.h>
#include <SQLiteCpp/Savepoint.h>
#include <SQLiteCpp/Statement.h>

#include <string>
#include <utility>

namespace titlefs {

static const char CREATE_T_SAVE_DATA[] =
    "CREATE TABLE if not exists save_data (id integer primary key, title_id "
    "integer, type integer, user_hi integer, user_lo integer, idx integer, "
    "size integer, journal_size integer)";
static const char CREATE_IX_SAVE_DATA[] =
    "CREATE INDEX if not exists ix_save_data on save_data (title_id, type, "
    "user_hi, user_lo, id)";

static const char QUERY_SAVES[] =
    "select id, title_id, type, user_hi, user_lo, idx, size, journal_size "
    "from save_data";
static const char INSERT_SAVE[] =
    "insert into save_data (title_id, type, user_hi, user_lo, idx, size, "
    "journal_size) values (?,?,?,?,?,?,?)";
static const char DELETE_SAVE[] = "delete from save_data where id=?";

// Columns are signed in SQLite, ids and user halves are stored bit for bit.
static int64_t to_col(uint64_t v) { return static_cast<int64_t>(v); }

static uint64_t from_col(int64_t v) { return static_cast<uint64_t>(v); }

static std::string buildstr_find(const save_data_filter &filter) {
  std::string str{QUERY_SAVES};
  str += " where 1=1";
  if (filter.title_id) {
    str += " and title_id=?";
  }
  if (filter.type) {
    str += " and type=?";
  }
  if (filter.user) {
    str += " and user_hi=? and user_lo=?";
  }
  if (filter.save_data_id) {
    str += " and id=?";
  }
  if (filter.index) {
    str += " and idx=?";
  }
  str += " order by id limit 1";
  return str;
}

static save_data_info save_from_stmt(SQLite::Statement &stmt) {
  return save_data_info{
      .save_data_id = from_col(stmt.getColumn(0).getInt64()),
      .title_id = from_col(stmt.getColumn(1).getInt64()),
      .type = static_cast<save_type>(stmt.getColumn(2).getInt()),
      .user = {.high = from_col(stmt.getColumn(3).getInt64()),
               .low = from_col(stmt.getColumn(4).getInt64())},
      .index = static_cast<uint16_t>(stmt.getColumn(5).getInt()),
      .size = stmt.getColumn(6).getInt64(),
      .journal_size = stmt.getColumn(7).getInt64()};
}

static void init_db(SQLite::Database &db) {
  if (!db.tableExists("save_data")) {
    db.exec(CREATE_T_SAVE_DATA);
    db.exec(CREATE_IX_SAVE_DATA);
  }
}

const char *save_type_name(save_type type) noexcept {
  switch (type) {
    case save_type::account:
      return "user";
    case save_type::bcat:
      return "bcat";
    case save_type::device:
      return "device";
  }
  return "unknown";
}

bool parse_user_id(std::string_view sv, user_id &out) {
  if (sv.starts_with("0x") || sv.starts_with("0X")) {
    sv.remove_prefix(2);
  }
  if (sv.size() != 32) {
    return false;
  }
  user_id user;
  if (!parse_hex64(sv.substr(0, 16), user.high) ||
      !parse_hex64(sv.substr(16), user.low)) {
    return false;
  }
  out = user;
  return true;
}

std::string to_string(const user_id &user) {
  return to_hex16(user.high) + to_hex16(user.low);
}

save_data_filter save_data_filter::make_user(uint64_t title_id,
                                             const user_id &user) {
  return {.title_id = title_id, .user = user};
}

save_data_filter save_data_filter::make_device(uint64_t title_id) {
  return {.title_id = title_id, .type = save_type::device};
}

save_data_filter save_data_filter::make_bcat(uint64_t title_id) {
  return {.title_id = title_id, .type = save_type::bcat};
}

bool control_property::is_zeros() const noexcept {
  return user_account_save_data_size == 0 &&
         user_account_save_data_journal_size == 0 &&
         device_save_data_size == 0 && device_save_data_journal_size == 0 &&
         bcat_delivery_cache_storage_size == 0;
}

struct save_index::db_wrap {
  SQLite::Database db;
};

save_index::save_index(const std::string &path)
    : m_dr{std::make_unique<db_wrap>(SQLite::Database(
          path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE))} {
  init_db(m_dr->db);
}

save_index::~save_index() = default;

result<save_data_info> save_index::find(const save_data_filter &filter) {
  SQLite::Statement stmt{m_dr->db, buildstr_find(filter)};
  int i = 0;
  if (filter.title_id) {
    stmt.bind(++i, to_col(*filter.title_id));
  }
  if (filter.type) {
    stmt.bind(++i, static_cast<int>(*filter.type));
  }
  if (filter.user) {
    stmt.bind(++i, to_col(filter.user->high));
    stmt.bind(++i, to_col(filter.user->low));
  }
  if (filter.save_data_id) {
    stmt.bind(++i, to_col(*filter.save_data_id));
  }
  if (filter.index) {
    stmt.bind(++i, static_cast<int>(*filter.index));
  }

  if (stmt.executeStep()) {
    result<save_data_info> ret{{.success = true}};
    ret.data = save_from_stmt(stmt);
    return ret;
  }
  return forward_fail<save_data_info>(
      make_fail(errc::save_not_found, "no matching save data"));
}

save_data_info save_index::insert_save_(uint64_t title_id, save_type type,
                                        const user_id &user, int64_t size,
                                        int64_t journal_size) {
  SQLite::Statement stmt{m_dr->db, INSERT_SAVE};
  stmt.bind(1, to_col(title_id));
  stmt.bind(2, static_cast<int>(type));
  stmt.bind(3, to_col(user.high));
  stmt.bind(4, to_col(user.low));
  stmt.bind(5, 0);
  stmt.bind(6, size);
  stmt.bind(7, journal_size);
  stmt.exec();

  return save_data_info{
      .save_data_id = from_col(m_dr->db.getLastInsertRowid()),
      .title_id = title_id,
      .type = type,
      .user = user,
      .size = size,
      .journal_size = journal_size};
}

save_data_info save_index::ensure_save_(uint64_t title_id, save_type type,
                                        const user_id &user, int64_t size,
                                        int64_t journal_size) {
  save_data_filter filter{.title_id = title_id, .type = type, .user = user};
  if (auto found = find(filter); found.success) {
    return found.data;
  }
  return insert_save_(title_id, type, user, size, journal_size);
}

result<std::vector<save_data_info>> save_index::provision(
    uint64_t title_id, const control_property &control, const user_id &user) {
  if (control.user_account_save_data_size <= 0 &&
      control.device_save_data_size <= 0 &&
      control.bcat_delivery_cache_storage_size <= 0) {
    return forward_fail<std::vector<save_data_info>>(make_fail(
        errc::invalid_argument, "control declares no save data for " +
                                    to_hex16(title_id)));
  }

  result<std::vector<save_data_info>> ret{{.success = true}};
  SQLite::Savepoint tx{m_dr->db, TITLEFS};

  if (control.user_account_save_data_size > 0 && !user.is_zero()) {
    ret.data.push_back(ensure_save_(
        title_id, save_type::account, user,
        control.user_account_save_data_size,
        control.user_account_save_data_journal_size));
  }
  if (control.device_save_data_size > 0) {
    ret.data.push_back(ensure_save_(title_id, save_type::device, user_id{},
                                    control.device_save_data_size,
                                    control.device_save_data_journal_size));
  }
  if (control.bcat_delivery_cache_storage_size > 0) {
    ret.data.push_back(ensure_save_(title_id, save_type::bcat, user_id{},
                                    control.bcat_delivery_cache_storage_size,
                                    0));
  }

  tx.release();
  return ret;
}

std::vector<save_data_info> save_index::query_saves(uint64_t title_id) {
  SQLite::Statement stmt{m_dr->db,
                         std::string{QUERY_SAVES} +
                             " where title_id=? order by id"};
  stmt.bind(1, to_col(title_id));

  std::vector<save_data_info> saves;
  while (stmt.executeStep()) {
    saves.push_back(save_from_stmt(stmt));
  }
  return saves;
}

int save_index::delete_save(uint64_t save_data_id) {
  SQLite::Statement stmt{m_dr->db, DELETE_SAVE};
  stmt.bind(1, to_col(save_data_id));
  return stmt.exec();
}

}  // namespace titlefs
