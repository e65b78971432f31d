#include "titlefs/utils.hpp"

#include <cctype>
#include <cinttypes>
#include <cstdio>
#include <filesystem>
#include <string>

#include "titlefs/private/utils.hpp"

namespace titlefs {

const char *errc_name(errc code) noexcept {
  switch (code) {
    case errc::ok:
      return "ok";
    case errc::invalid_argument:
      return "invalid argument";
    case errc::not_supported:
      return "not supported";
    case errc::path_not_found:
      return "path not found";
    case errc::path_exists:
      return "path already exists";
    case errc::io_error:
      return "i/o error";
    case errc::read_only:
      return "read-only filesystem";
    case errc::main_container_missing:
      return "main container not present";
    case errc::section_missing:
      return "section not present";
    case errc::container_error:
      return "container error";
    case errc::integrity_error:
      return "integrity check failed";
    case errc::save_not_found:
      return "save data not found";
    case errc::provision_failed:
      return "save data provisioning failed";
    case errc::save_not_found_after_provision:
      return "save data not found after provisioning";
    case errc::database_error:
      return "database error";
  }
  return "unknown";
}

std::string describe(const result_base &ret) {
  std::string str{errc_name(ret.code)};
  if (!ret.msg.empty()) {
    str += ": ";
    str += ret.msg;
  }
  if (ret.native) {
    str += " (native ";
    str += std::to_string(ret.native);
    str += ')';
  }
  return str;
}

std::filesystem::path get_exe_dir() {
  return (getexepath().parent_path() /= CONFIGDIR);
}

std::filesystem::path get_home_cfg_dir() {
  std::filesystem::path dir = get_home();
  if (dir.empty()) {
    return dir;
  }

  dir /= ".config";
  dir /= CONFIGDIR;

  return dir;
}

std::filesystem::path get_config_dir() {
  if (auto home_dir = get_home_cfg_dir(); !home_dir.empty()) {
    return home_dir;
  }
  return get_exe_dir();
}

std::filesystem::path get_db_path() { return get_config_dir() /= DBFILE; }

std::filesystem::path get_nand_dir() { return get_config_dir() /= NANDDIR; }

std::filesystem::path get_updates_dir() {
  return get_config_dir() /= UPDATESDIR;
}

std::string to_hex16(uint64_t value) {
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016" PRIx64, value);
  return buf;
}

bool parse_hex64(std::string_view sv, uint64_t &out) {
  if (sv.size() > 2 && sv[0] == '0' && (sv[1] == 'x' || sv[1] == 'X')) {
    sv.remove_prefix(2);
  }
  if (sv.empty() || sv.size() > 16) {
    return false;
  }

  uint64_t value = 0;
  for (char c : sv) {
    int digit;
    if (c >= '0' && c <= '9') {
      digit = c - '0';
    } else if (c >= 'a' && c <= 'f') {
      digit = c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
      digit = c - 'A' + 10;
    } else {
      return false;
    }
    value = (value << 4) | static_cast<uint64_t>(digit);
  }
  out = value;
  return true;
}

std::string to_lower(std::string_view sv) {
  std::string str{sv};
  for (auto &c : str) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return str;
}

}  // namespace titlefs
