#include "titlefs/vfs.hpp"

#include <string>
#include <utility>
#include <vector>

namespace titlefs {

bool normalize_path(std::string_view path, std::string &out) {
  std::vector<std::string_view> parts;

  size_t pos = 0;
  while (pos <= path.size()) {
    size_t next = path.find('/', pos);
    if (next == std::string_view::npos) {
      next = path.size();
    }
    auto part = path.substr(pos, next - pos);
    pos = next + 1;

    if (part.empty() || part == ".") {
      continue;
    }
    if (part == "..") {
      if (parts.empty()) {
        return false;
      }
      parts.pop_back();
      continue;
    }
    parts.push_back(part);
  }

  out.clear();
  for (auto part : parts) {
    out += '/';
    out += part;
  }
  if (out.empty()) {
    out = "/";
  }
  return true;
}

std::string combine_path(std::string_view base, std::string_view name) {
  std::string str{base};
  if (str.empty() || str.back() != '/') {
    str += '/';
  }
  while (!name.empty() && name.front() == '/') {
    name.remove_prefix(1);
  }
  str += name;
  return str;
}

result_base ensure_directory_exists(filesystem &fs, const std::string &path) {
  std::string norm;
  if (!normalize_path(path, norm)) {
    return make_fail(errc::invalid_argument, "invalid path: " + path);
  }
  if (norm == "/") {
    return make_ok();
  }

  // visit "/a", "/a/b", "/a/b/c"
  size_t pos = 0;
  while (pos != std::string::npos) {
    pos = norm.find('/', pos + 1);
    auto dir = norm.substr(0, pos);

    auto type_ret = fs.get_entry_type(dir);
    if (type_ret.success) {
      if (type_ret.data != entry_type::directory) {
        return make_fail(errc::path_exists, "not a directory: " + dir);
      }
      continue;
    }
    if (type_ret.code != errc::path_not_found) {
      return type_ret;
    }

    auto ret = fs.create_directory(dir);
    // lost a race against another creator, still fine
    if (!ret.success && ret.code != errc::path_exists) {
      return ret;
    }
  }
  return make_ok();
}

// subdir_fs

subdir_fs::subdir_fs(std::shared_ptr<filesystem> base, std::string root)
    : m_base{std::move(base)} {
  if (!normalize_path(root, m_root)) {
    m_root = "/";
  }
}

std::string subdir_fs::full_path_(const std::string &path) const {
  std::string norm;
  if (!normalize_path(path, norm)) {
    return {};
  }
  if (norm == "/") {
    return m_root;
  }
  return m_root == "/" ? norm : m_root + norm;
}

result<std::unique_ptr<directory>> subdir_fs::open_directory(
    const std::string &path) {
  auto full = full_path_(path);
  if (full.empty()) {
    return forward_fail<std::unique_ptr<directory>>(
        make_fail(errc::invalid_argument, "invalid path: " + path));
  }
  return m_base->open_directory(full);
}

result<std::unique_ptr<file>> subdir_fs::open_file(const std::string &path,
                                                   open_mode mode) {
  auto full = full_path_(path);
  if (full.empty()) {
    return forward_fail<std::unique_ptr<file>>(
        make_fail(errc::invalid_argument, "invalid path: " + path));
  }
  return m_base->open_file(full, mode);
}

result_base subdir_fs::create_file(const std::string &path, int64_t size) {
  auto full = full_path_(path);
  if (full.empty()) {
    return make_fail(errc::invalid_argument, "invalid path: " + path);
  }
  return m_base->create_file(full, size);
}

result_base subdir_fs::create_directory(const std::string &path) {
  auto full = full_path_(path);
  if (full.empty()) {
    return make_fail(errc::invalid_argument, "invalid path: " + path);
  }
  return m_base->create_directory(full);
}

result<entry_type> subdir_fs::get_entry_type(const std::string &path) {
  auto full = full_path_(path);
  if (full.empty()) {
    return forward_fail<entry_type>(
        make_fail(errc::invalid_argument, "invalid path: " + path));
  }
  return m_base->get_entry_type(full);
}

}  // namespace titlefs
