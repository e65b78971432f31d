#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "titlefs/utils.hpp"

namespace titlefs {

// Paths handed to a `filesystem` are '/' rooted and '/' separated UTF-8
// strings, relative to the root of that filesystem: "/", "/a", "/a/b.bin".

enum class entry_type : unsigned char {
  directory = 0,
  file = 1,
};

struct dir_entry {
  std::string name;
  entry_type type;
  int64_t size;  // 0 for directories
};

enum class open_mode : unsigned char {
  read = 1,
  write = 2,
  read_write = 3,
};

constexpr bool has_mode(open_mode mode, open_mode flag) noexcept {
  return (static_cast<unsigned char>(mode) &
          static_cast<unsigned char>(flag)) != 0;
}

// An open file. Released by its destructor.
class file {
 public:
  virtual ~file() = default;

  // Read up to `buf.size()` bytes at `offset`, returns the number of bytes
  // read. Fewer bytes only at end of file.
  virtual result<size_t> read(int64_t offset, std::span<char> buf) = 0;

  virtual result_base write(int64_t offset, std::span<const char> buf) = 0;

  virtual result<int64_t> get_size() = 0;

  virtual result_base set_size(int64_t size) = 0;

  virtual result_base flush() = 0;
};

// An open directory. Released by its destructor.
class directory {
 public:
  virtual ~directory() = default;

  // Immediate children, sorted by name.
  virtual result<std::vector<dir_entry>> read_entries() = 0;
};

class filesystem {
 public:
  virtual ~filesystem() = default;

  virtual result<std::unique_ptr<directory>> open_directory(
      const std::string &path) = 0;

  virtual result<std::unique_ptr<file>> open_file(const std::string &path,
                                                  open_mode mode) = 0;

  // Create `path`, or truncate an existing file, with the given size.
  // The parent directory must exist.
  virtual result_base create_file(const std::string &path, int64_t size) = 0;

  // Fails with errc::path_exists if anything exists at `path`.
  virtual result_base create_directory(const std::string &path) = 0;

  // errc::path_not_found if nothing exists at `path`.
  virtual result<entry_type> get_entry_type(const std::string &path) = 0;
};

// A directory whose entries were listed when it was opened.
class snapshot_directory : public directory {
 public:
  explicit snapshot_directory(std::vector<dir_entry> &&entries)
      : m_entries{std::move(entries)} {}

  result<std::vector<dir_entry>> read_entries() override {
    result<std::vector<dir_entry>> ret{{.success = true}};
    ret.data = m_entries;
    return ret;
  }

 private:
  std::vector<dir_entry> m_entries;
};

// Collapse duplicate separators, "." and "..", force a leading '/' and drop a
// trailing one. Returns false when ".." climbs above the root.
bool normalize_path(std::string_view path, std::string &out);

// combine_path("/a", "b") == "/a/b", combine_path("/", "b") == "/b"
std::string combine_path(std::string_view base, std::string_view name);

// Create `path` and every missing ancestor. Existing directories are fine,
// an existing file in the way is errc::path_exists.
result_base ensure_directory_exists(filesystem &fs, const std::string &path);

// A view of the subtree `root` of another filesystem.
class subdir_fs : public filesystem {
 public:
  subdir_fs(std::shared_ptr<filesystem> base, std::string root);

  const std::string &root() const noexcept { return m_root; }

  result<std::unique_ptr<directory>> open_directory(
      const std::string &path) override;

  result<std::unique_ptr<file>> open_file(const std::string &path,
                                          open_mode mode) override;

  result_base create_file(const std::string &path, int64_t size) override;

  result_base create_directory(const std::string &path) override;

  result<entry_type> get_entry_type(const std::string &path) override;

 private:
  std::shared_ptr<filesystem> m_base;
  std::string m_root;

  std::string full_path_(const std::string &path) const;
};

}  // namespace titlefs
