#include "titlefs/title_manager.hpp"

#include <system_error>
#include <utility>

#include "titlefs/local_fs.hpp"
#include "titlefs/log.hpp"

namespace titlefs {

manager_config manager_config::from_dir(const std::filesystem::path &cfg_dir) {
  return manager_config{.cfg_dir = cfg_dir,
                        .db_path = cfg_dir / DBFILE,
                        .nand_dir = cfg_dir / NANDDIR,
                        .updates_dir = cfg_dir / UPDATESDIR};
}

manager_config manager_config::defaults() {
  auto cfg = from_dir(get_config_dir());
  cfg.db_path = get_db_path();
  cfg.nand_dir = get_nand_dir();
  cfg.updates_dir = get_updates_dir();
  return cfg;
}

// Directories must exist before the database file is created in them.
static manager_config prepare_dirs(manager_config &&cfg) {
  std::filesystem::create_directories(cfg.cfg_dir);
  std::filesystem::create_directories(cfg.nand_dir);
  std::filesystem::create_directories(cfg.updates_dir);
  return std::move(cfg);
}

title_manager::title_manager(manager_config cfg)
    : m_cfg{prepare_dirs(std::move(cfg))},
      m_library{m_cfg.updates_dir},
      m_index{path_to_utf8str(m_cfg.db_path)},
      m_locator{m_index, m_cfg.nand_dir},
      m_resolver{m_library} {}

title_manager::~title_manager() = default;

copy_outcome title_manager::extract_section(
    const std::filesystem::path &package_path, section_type section,
    const std::filesystem::path &destination, const cancel_token &cancel,
    int program_index) {
  auto view =
      m_resolver.resolve(package_path, section, m_cfg.integrity, program_index);
  if (!view.success) {
    log_error("cannot open %s section of %s: %s", section_type_name(section),
              path_to_utf8str(package_path).c_str(), describe(view).c_str());
    return {view, false};
  }

  std::error_code ec;
  std::filesystem::create_directories(destination, ec);
  if (ec) {
    auto ret = make_fail(errc::io_error,
                         "cannot create " + path_to_utf8str(destination) +
                             ": " + ec.message(),
                         ec.value());
    log_error("%s", describe(ret).c_str());
    return {ret, false};
  }

  local_fs dest{destination};
  auto outcome = copy_directory(*view.data.fs, "/", dest, "/", cancel);
  if (outcome.cancelled) {
    log_info("extraction of %s cancelled",
             path_to_utf8str(package_path).c_str());
  } else if (!outcome.ret.success) {
    log_error("extraction of %s failed: %s",
              path_to_utf8str(package_path).c_str(),
              describe(outcome.ret).c_str());
  } else {
    log_info("extracted %s section%s to %s", section_type_name(section),
             view.data.patched ? " (patched)" : "",
             path_to_utf8str(destination).c_str());
  }
  return outcome;
}

result<std::filesystem::path> title_manager::locate_save_directory(
    uint64_t title_id, const std::string &title_name,
    const control_property &control, const save_data_filter &filter) {
  auto ret = m_locator.open_or_create(title_id, title_name, control, filter,
                                      m_cfg.default_user);
  if (!ret.success) {
    log_error("cannot open save directory of %s: %s",
              to_hex16(title_id).c_str(), describe(ret).c_str());
  }
  return ret;
}

save_menu_state title_manager::save_menu(const control_property &control) {
  if (control.is_zeros()) {
    return {};
  }
  return {.user = control.user_account_save_data_size > 0,
          .device = control.device_save_data_size > 0,
          .bcat = control.bcat_delivery_cache_storage_size > 0};
}

}  // namespace titlefs
