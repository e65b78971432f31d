#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

// https://gcc.gnu.org/wiki/Visibility
// Generic helper definitions for shared library support
#if defined _WIN32 || defined __CYGWIN__
#define TITLEFS_HELPER_DLL_IMPORT __declspec(dllimport)
#define TITLEFS_HELPER_DLL_EXPORT __declspec(dllexport)
#define TITLEFS_HELPER_DLL_LOCAL
#else
#if __GNUC__ >= 4
#define TITLEFS_HELPER_DLL_IMPORT __attribute__((visibility("default")))
#define TITLEFS_HELPER_DLL_EXPORT __attribute__((visibility("default")))
#define TITLEFS_HELPER_DLL_LOCAL __attribute__((visibility("hidden")))
#else
#define TITLEFS_HELPER_DLL_IMPORT
#define TITLEFS_HELPER_DLL_EXPORT
#define TITLEFS_HELPER_DLL_LOCAL
#endif
#endif

// TITLEFS_API is used for the public API symbols. It either DLL imports or
// DLL exports (or does nothing for static build). TITLEFS_LOCAL is used for
// non-api symbols.
#ifdef TITLEFS_DLL          // defined if TITLEFS is compiled as a DLL
#ifdef TITLEFS_DLL_EXPORTS  // defined if we are building the TITLEFS DLL
#define TITLEFS_API TITLEFS_HELPER_DLL_EXPORT
#else
#define TITLEFS_API TITLEFS_HELPER_DLL_IMPORT
#endif  // TITLEFS_DLL_EXPORTS
#define TITLEFS_LOCAL TITLEFS_HELPER_DLL_LOCAL
#else  // TITLEFS_DLL is not defined: this means TITLEFS is a static lib.
#define TITLEFS_API
#define TITLEFS_LOCAL
#endif  // TITLEFS_DLL

namespace titlefs {

enum class errc : int {
  ok = 0,
  invalid_argument,
  not_supported,
  path_not_found,
  path_exists,
  io_error,
  read_only,
  main_container_missing,
  section_missing,
  container_error,
  integrity_error,
  save_not_found,
  provision_failed,
  save_not_found_after_provision,
  database_error,
};

const char *errc_name(errc code) noexcept;

struct result_base {
  bool success;
  std::string msg;
  errc code = errc::ok;
  // error code of the underlying library or OS, 0 if none
  int native = 0;
};

template <typename T>
struct result : result_base {
  T data;
};

inline result_base make_ok() { return {.success = true}; }

inline result_base make_fail(errc code, std::string msg, int native = 0) {
  return {.success = false, .msg = std::move(msg), .code = code,
          .native = native};
}

// Copy the failure of `from` into a result of another type.
template <typename T>
result<T> forward_fail(const result_base &from) {
  result<T> ret{};
  ret.success = false;
  ret.msg = from.msg;
  ret.code = from.code;
  ret.native = from.native;
  return ret;
}

// "<errc name>: <msg> (native <n>)"
std::string describe(const result_base &ret);

const char DBFILE[] = "titlefs.db";
const char TITLEFS[] = "titlefs";
const char CONFIGDIR[] = "titlefs_cfg";
const char NANDDIR[] = "nand";
const char UPDATESDIR[] = "updates";

std::filesystem::path get_exe_dir();

std::filesystem::path get_home_cfg_dir();

std::filesystem::path get_config_dir();

std::filesystem::path get_db_path();

std::filesystem::path get_nand_dir();

std::filesystem::path get_updates_dir();

// lower case 16 digit hex, the way title and save ids are written on disk
std::string to_hex16(uint64_t value);

// Parse hex with or without "0x" prefix. Returns false on garbage.
bool parse_hex64(std::string_view sv, uint64_t &out);

std::string to_lower(std::string_view sv);

inline std::filesystem::path utf8str_to_path(std::string_view sv) {
  return std::filesystem::path(sv);
}

inline std::string path_to_utf8str(const std::filesystem::path &path) {
  return path.string();
}

}  // namespace titlefs
