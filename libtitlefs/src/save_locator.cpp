#include "titlefs/save_locator.hpp"

#include <SQLiteCpp/Exception.h>

#include <system_error>
#include <utility>

#include "titlefs/log.hpp"

namespace titlefs {

// Whether a directory is at `path`. Nothing there is not an error.
static result<bool> dir_exists(const std::filesystem::path &path) {
  std::error_code ec;
  auto st = std::filesystem::status(path, ec);
  if (!std::filesystem::status_known(st)) {
    return forward_fail<bool>(make_fail(errc::io_error,
                                        "cannot check " +
                                            path_to_utf8str(path) + ": " +
                                            ec.message(),
                                        ec.value()));
  }
  result<bool> ret{{.success = true}};
  ret.data = std::filesystem::is_directory(st);
  return ret;
}

static result_base create_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return make_fail(errc::io_error,
                     "cannot create " + path_to_utf8str(path) + ": " +
                         ec.message(),
                     ec.value());
  }
  return make_ok();
}

save_locator::save_locator(save_store &index, std::filesystem::path nand_dir)
    : m_index{index}, m_nand_dir{std::move(nand_dir)} {}

std::filesystem::path save_locator::save_root(uint64_t save_data_id) const {
  return m_nand_dir / "user" / "save" / to_hex16(save_data_id);
}

result<save_data_info> save_locator::find_or_provision_(
    uint64_t title_id, const std::string &title_name,
    const control_property &control, const save_data_filter &filter,
    const user_id &user) {
  try {
    auto found = m_index.find(filter);
    if (found.success || found.code != errc::save_not_found) {
      return found;
    }

    log_info("creating save directory for title %s [%s]", title_name.c_str(),
             to_hex16(title_id).c_str());

    auto effective = control;
    if (effective.is_zeros()) {
      effective.user_account_save_data_size = DUMMY_SAVE_SIZE;
      effective.user_account_save_data_journal_size = DUMMY_SAVE_SIZE;
      log_warn("no control data for title %s [%s], using dummy save sizes",
               title_name.c_str(), to_hex16(title_id).c_str());
    }

    auto provisioned = m_index.provision(title_id, effective, user);
    if (!provisioned.success) {
      log_error("cannot create save data for %s: %s",
                to_hex16(title_id).c_str(), provisioned.msg.c_str());
      return forward_fail<save_data_info>(make_fail(
          errc::provision_failed,
          "cannot create save data: " + describe(provisioned),
          provisioned.native));
    }

    found = m_index.find(filter);
    if (!found.success) {
      return forward_fail<save_data_info>(
          make_fail(errc::save_not_found_after_provision,
                    "save data for " + to_hex16(title_id) +
                        " not found after creating it"));
    }
    return found;
  } catch (SQLite::Exception &ex) {
    log_error("save index failure for %s: %s", to_hex16(title_id).c_str(),
              ex.what());
    return forward_fail<save_data_info>(
        make_fail(errc::database_error, ex.what(), ex.getErrorCode()));
  }
}

result<std::filesystem::path> save_locator::open_or_create(
    uint64_t title_id, const std::string &title_name,
    const control_property &control, const save_data_filter &filter,
    const user_id &user) {
  auto info = find_or_provision_(title_id, title_name, control, filter, user);
  if (!info.success) {
    return forward_fail<std::filesystem::path>(info);
  }

  auto root = save_root(info.data.save_data_id);
  auto root_exists = dir_exists(root);
  if (!root_exists.success) {
    return forward_fail<std::filesystem::path>(root_exists);
  }
  if (!root_exists.data) {
    if (auto r = create_dir(root); !r.success) {
      return forward_fail<std::filesystem::path>(r);
    }
  }

  result<std::filesystem::path> ret{{.success = true}};

  // only a directory counts as a revision, a stray file named 0 does not
  auto committed = root / COMMITTED_DIR;
  auto has_committed = dir_exists(committed);
  if (!has_committed.success) {
    return forward_fail<std::filesystem::path>(has_committed);
  }
  if (has_committed.data) {
    ret.data = std::move(committed);
    return ret;
  }

  auto working = root / WORKING_DIR;
  auto has_working = dir_exists(working);
  if (!has_working.success) {
    return forward_fail<std::filesystem::path>(has_working);
  }
  if (!has_working.data) {
    if (auto r = create_dir(working); !r.success) {
      return forward_fail<std::filesystem::path>(r);
    }
  }
  ret.data = std::move(working);
  return ret;
}

}  // namespace titlefs
