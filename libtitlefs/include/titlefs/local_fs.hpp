#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "titlefs/vfs.hpp"

namespace titlefs {

// `filesystem` backed by a directory on disk. The root must exist.
class local_fs : public filesystem {
 public:
  explicit local_fs(std::filesystem::path root);

  const std::filesystem::path &root() const noexcept { return m_root; }

  result<std::unique_ptr<directory>> open_directory(
      const std::string &path) override;

  result<std::unique_ptr<file>> open_file(const std::string &path,
                                          open_mode mode) override;

  result_base create_file(const std::string &path, int64_t size) override;

  result_base create_directory(const std::string &path) override;

  result<entry_type> get_entry_type(const std::string &path) override;

 private:
  const std::filesystem::path m_root;

  // Empty if `path` escapes the root.
  std::filesystem::path to_native_(const std::string &path) const;
};

}  // namespace titlefs
