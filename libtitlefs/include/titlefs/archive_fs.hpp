#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "titlefs/vfs.hpp"

struct archive;

namespace titlefs {

// Read-only `filesystem` over an archive libarchive can read (zip, tar, rar,
// optionally gzip compressed). The whole archive is decoded when opened.
//
// Entries whose data libarchive flagged while decoding (a bad CRC for
// instance) are kept with whatever data was produced and remembered as
// damaged, see `verify`.
class archive_fs : public filesystem {
 private:
  struct passkey {
    explicit passkey() = default;
  };

 public:
  explicit archive_fs(passkey);

  archive_fs(const archive_fs &) = delete;
  archive_fs &operator=(const archive_fs &) = delete;

  static result<std::shared_ptr<archive_fs>> open(
      const std::filesystem::path &path);

  static result<std::shared_ptr<archive_fs>> open_memory(
      const std::vector<char> &bytes);

  // errc::integrity_error naming the first damaged file under `root`.
  result_base verify(const std::string &root) const;

  result<std::unique_ptr<directory>> open_directory(
      const std::string &path) override;

  result<std::unique_ptr<file>> open_file(const std::string &path,
                                          open_mode mode) override;

  result_base create_file(const std::string &path, int64_t size) override;

  result_base create_directory(const std::string &path) override;

  result<entry_type> get_entry_type(const std::string &path) override;

 private:
  struct node {
    entry_type type;
    std::shared_ptr<const std::vector<char>> data;
    bool damaged = false;
    std::string error;
    int native = 0;
  };

  // key: normalized path
  std::map<std::string, node> m_nodes;
  // key: normalized directory path, value: child names
  std::map<std::string, std::set<std::string>> m_children;

  result_base load_(archive *a);

  void add_dir_(const std::string &path);

  void add_file_(const std::string &path, node &&n);

  const node *find_(const std::string &path) const;
};

}  // namespace titlefs
