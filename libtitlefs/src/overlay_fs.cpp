#include "titlefs/overlay_fs.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace titlefs {

static result_base fail_read_only() {
  return make_fail(errc::read_only, "overlay is read-only");
}

overlay_fs::overlay_fs(std::vector<std::shared_ptr<filesystem>> layers)
    : m_layers{std::move(layers)} {}

result<std::unique_ptr<directory>> overlay_fs::open_directory(
    const std::string &path) {
  // name -> entry, the first layer to list a name keeps it
  std::map<std::string, dir_entry> merged;
  bool found = false;

  for (auto &layer : m_layers) {
    auto type_ret = layer->get_entry_type(path);
    if (!type_ret.success) {
      if (type_ret.code == errc::path_not_found) {
        continue;
      }
      return forward_fail<std::unique_ptr<directory>>(type_ret);
    }
    if (type_ret.data != entry_type::directory) {
      // a file in an upper layer hides directories below it
      break;
    }

    auto dir_ret = layer->open_directory(path);
    if (!dir_ret.success) {
      return forward_fail<std::unique_ptr<directory>>(dir_ret);
    }
    auto entries_ret = dir_ret.data->read_entries();
    if (!entries_ret.success) {
      return forward_fail<std::unique_ptr<directory>>(entries_ret);
    }

    found = true;
    for (auto &entry : entries_ret.data) {
      merged.try_emplace(entry.name, std::move(entry));
    }
  }

  if (!found) {
    return forward_fail<std::unique_ptr<directory>>(
        make_fail(errc::path_not_found, "no such directory: " + path));
  }

  std::vector<dir_entry> entries;
  entries.reserve(merged.size());
  for (auto &[_, entry] : merged) {
    entries.push_back(std::move(entry));
  }

  result<std::unique_ptr<directory>> ret{{.success = true}};
  ret.data = std::make_unique<snapshot_directory>(std::move(entries));
  return ret;
}

result<std::unique_ptr<file>> overlay_fs::open_file(const std::string &path,
                                                    open_mode mode) {
  if (has_mode(mode, open_mode::write)) {
    return forward_fail<std::unique_ptr<file>>(fail_read_only());
  }

  for (auto &layer : m_layers) {
    auto type_ret = layer->get_entry_type(path);
    if (!type_ret.success) {
      if (type_ret.code == errc::path_not_found) {
        continue;
      }
      return forward_fail<std::unique_ptr<file>>(type_ret);
    }
    if (type_ret.data != entry_type::file) {
      break;
    }
    return layer->open_file(path, mode);
  }
  return forward_fail<std::unique_ptr<file>>(
      make_fail(errc::path_not_found, "no such file: " + path));
}

result_base overlay_fs::create_file(const std::string &, int64_t) {
  return fail_read_only();
}

result_base overlay_fs::create_directory(const std::string &) {
  return fail_read_only();
}

result<entry_type> overlay_fs::get_entry_type(const std::string &path) {
  for (auto &layer : m_layers) {
    auto type_ret = layer->get_entry_type(path);
    if (type_ret.success || type_ret.code != errc::path_not_found) {
      return type_ret;
    }
  }
  return forward_fail<entry_type>(
      make_fail(errc::path_not_found, "not found: " + path));
}

}  // namespace titlefs
