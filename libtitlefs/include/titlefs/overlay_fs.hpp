#pragma once

#include <memory>
#include <string>
#include <vector>

#include "titlefs/vfs.hpp"

namespace titlefs {

// Read-only union of several filesystems. Layers are ordered from highest to
// lowest priority: the first layer holding a path decides its type and, for
// files, its content. Directories present in several layers are merged.
class overlay_fs : public filesystem {
 public:
  explicit overlay_fs(std::vector<std::shared_ptr<filesystem>> layers);

  size_t layer_count() const noexcept { return m_layers.size(); }

  result<std::unique_ptr<directory>> open_directory(
      const std::string &path) override;

  result<std::unique_ptr<file>> open_file(const std::string &path,
                                          open_mode mode) override;

  result_base create_file(const std::string &path, int64_t size) override;

  result_base create_directory(const std::string &path) override;

  result<entry_type> get_entry_type(const std::string &path) override;

 private:
  std::vector<std::shared_ptr<filesystem>> m_layers;
};

}  // namespace titlefs
