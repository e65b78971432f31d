#include "titlefs/archive_fs.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace titlefs {

using archive_ptr = std::unique_ptr<archive, void (*)(archive *)>;

static archive_ptr new_reader() {
  archive_ptr a{archive_read_new(), [](archive *a) {
                  archive_read_close(a);
                  archive_read_free(a);
                }};
  archive_read_support_format_zip(a.get());
  archive_read_support_format_tar(a.get());
  archive_read_support_format_rar(a.get());
  archive_read_support_format_rar5(a.get());
  archive_read_support_filter_gzip(a.get());
  return a;
}

static result_base fail_from_archive(archive *a, const std::string &what) {
  const char *err = archive_error_string(a);
  return make_fail(errc::container_error,
                   what + ": " + (err ? err : "unknown libarchive error"),
                   archive_errno(a));
}

static result_base fail_read_only() {
  return make_fail(errc::read_only, "archive is read-only");
}

class memory_file : public file {
 public:
  explicit memory_file(std::shared_ptr<const std::vector<char>> data)
      : m_data{std::move(data)} {}

  result<size_t> read(int64_t offset, std::span<char> buf) override {
    result<size_t> ret{{.success = true}};
    if (offset < 0) {
      return forward_fail<size_t>(
          make_fail(errc::invalid_argument, "negative offset"));
    }
    auto size = static_cast<int64_t>(m_data->size());
    if (offset >= size) {
      ret.data = 0;
      return ret;
    }
    auto len = std::min<int64_t>(size - offset,
                                 static_cast<int64_t>(buf.size()));
    std::memcpy(buf.data(), m_data->data() + offset, static_cast<size_t>(len));
    ret.data = static_cast<size_t>(len);
    return ret;
  }

  result_base write(int64_t, std::span<const char>) override {
    return fail_read_only();
  }

  result<int64_t> get_size() override {
    result<int64_t> ret{{.success = true}};
    ret.data = static_cast<int64_t>(m_data->size());
    return ret;
  }

  result_base set_size(int64_t) override { return fail_read_only(); }

  result_base flush() override { return make_ok(); }

 private:
  std::shared_ptr<const std::vector<char>> m_data;
};

archive_fs::archive_fs(passkey) {
  m_nodes.emplace("/", node{entry_type::directory});
}

result<std::shared_ptr<archive_fs>> archive_fs::open(
    const std::filesystem::path &path) {
  auto a = new_reader();
  int r = archive_read_open_filename(a.get(), path.c_str(), 10240);
  if (r != ARCHIVE_OK) {
    return forward_fail<std::shared_ptr<archive_fs>>(
        fail_from_archive(a.get(), "cannot open " + path_to_utf8str(path)));
  }

  auto fs = std::make_shared<archive_fs>(passkey{});
  if (auto ret = fs->load_(a.get()); !ret.success) {
    ret.msg = path_to_utf8str(path) + ": " + ret.msg;
    return forward_fail<std::shared_ptr<archive_fs>>(ret);
  }

  result<std::shared_ptr<archive_fs>> ret{{.success = true}};
  ret.data = std::move(fs);
  return ret;
}

result<std::shared_ptr<archive_fs>> archive_fs::open_memory(
    const std::vector<char> &bytes) {
  auto a = new_reader();
  int r = archive_read_open_memory(a.get(), bytes.data(), bytes.size());
  if (r != ARCHIVE_OK) {
    return forward_fail<std::shared_ptr<archive_fs>>(
        fail_from_archive(a.get(), "cannot open archive"));
  }

  auto fs = std::make_shared<archive_fs>(passkey{});
  if (auto ret = fs->load_(a.get()); !ret.success) {
    return forward_fail<std::shared_ptr<archive_fs>>(ret);
  }

  result<std::shared_ptr<archive_fs>> ret{{.success = true}};
  ret.data = std::move(fs);
  return ret;
}

result_base archive_fs::load_(archive *a) {
  struct archive_entry *entry;
  int r;

  while (true) {
    r = archive_read_next_header(a, &entry);
    if (r == ARCHIVE_EOF) {
      break;
    }
    if (r < ARCHIVE_OK && r != ARCHIVE_WARN) {
      return fail_from_archive(a, "bad entry header");
    }

    const char *original_path = archive_entry_pathname(entry);
    if (!original_path) {
      return fail_from_archive(a, "entry without name");
    }
    std::string path;
    if (!normalize_path(original_path, path)) {
      return make_fail(errc::container_error,
                       std::string{"entry escapes archive root: "} +
                           original_path);
    }

    auto filetype = archive_entry_filetype(entry);
    if (filetype == AE_IFDIR) {
      add_dir_(path);
      continue;
    }
    if (filetype != AE_IFREG || path == "/") {
      // links and devices have no meaning inside a section
      continue;
    }

    auto data = std::make_shared<std::vector<char>>();
    if (archive_entry_size_is_set(entry)) {
      data->reserve(static_cast<size_t>(archive_entry_size(entry)));
    }

    node n{entry_type::file};
    const void *buff;
    size_t size;
    la_int64_t offset;
    while (true) {
      r = archive_read_data_block(a, &buff, &size, &offset);
      if (r == ARCHIVE_EOF) {
        break;
      }
      if (r == ARCHIVE_FATAL) {
        return fail_from_archive(a, "cannot decode " + path);
      }
      if (r == ARCHIVE_OK || r == ARCHIVE_WARN) {
        auto end = static_cast<size_t>(offset) + size;
        if (data->size() < end) {
          // sparse regions read back as zeros
          data->resize(end);
        }
        if (size) {
          std::memcpy(data->data() + offset, buff, size);
        }
      }
      if (r < ARCHIVE_OK) {
        // ARCHIVE_WARN / ARCHIVE_FAILED: keep what we have, remember it
        const char *err = archive_error_string(a);
        n.damaged = true;
        n.error = err ? err : "damaged entry";
        n.native = archive_errno(a);
        break;
      }
    }

    n.data = std::move(data);
    add_file_(path, std::move(n));
  }
  return make_ok();
}

void archive_fs::add_dir_(const std::string &path) {
  if (path == "/") {
    return;
  }
  auto pos = path.rfind('/');
  auto parent = pos == 0 ? std::string{"/"} : path.substr(0, pos);
  add_dir_(parent);

  m_nodes.try_emplace(path, node{entry_type::directory});
  m_children[parent].insert(path.substr(pos + 1));
}

void archive_fs::add_file_(const std::string &path, node &&n) {
  auto pos = path.rfind('/');
  auto parent = pos == 0 ? std::string{"/"} : path.substr(0, pos);
  add_dir_(parent);

  // a later entry with the same name replaces the earlier one
  m_nodes.insert_or_assign(path, std::move(n));
  m_children[parent].insert(path.substr(pos + 1));
}

const archive_fs::node *archive_fs::find_(const std::string &path) const {
  std::string norm;
  if (!normalize_path(path, norm)) {
    return nullptr;
  }
  auto it = m_nodes.find(norm);
  return it == m_nodes.end() ? nullptr : &it->second;
}

result_base archive_fs::verify(const std::string &root) const {
  std::string norm;
  if (!normalize_path(root, norm)) {
    return make_fail(errc::invalid_argument, "invalid path: " + root);
  }
  auto prefix = norm == "/" ? norm : norm + '/';

  for (const auto &[path, n] : m_nodes) {
    if (path != norm && path.compare(0, prefix.size(), prefix) != 0) {
      continue;
    }
    if (n.damaged) {
      return make_fail(errc::integrity_error, path + ": " + n.error,
                       n.native);
    }
  }
  return make_ok();
}

result<std::unique_ptr<directory>> archive_fs::open_directory(
    const std::string &path) {
  std::string norm;
  if (!normalize_path(path, norm)) {
    return forward_fail<std::unique_ptr<directory>>(
        make_fail(errc::invalid_argument, "invalid path: " + path));
  }
  auto it = m_nodes.find(norm);
  if (it == m_nodes.end() || it->second.type != entry_type::directory) {
    return forward_fail<std::unique_ptr<directory>>(
        make_fail(errc::path_not_found, "no such directory: " + norm));
  }

  std::vector<dir_entry> entries;
  if (auto cit = m_children.find(norm); cit != m_children.end()) {
    for (const auto &name : cit->second) {
      const auto &n = m_nodes.at(combine_path(norm, name));
      entries.push_back(
          {name, n.type,
           n.data ? static_cast<int64_t>(n.data->size()) : int64_t{0}});
    }
  }

  result<std::unique_ptr<directory>> ret{{.success = true}};
  ret.data = std::make_unique<snapshot_directory>(std::move(entries));
  return ret;
}

result<std::unique_ptr<file>> archive_fs::open_file(const std::string &path,
                                                    open_mode mode) {
  if (has_mode(mode, open_mode::write)) {
    return forward_fail<std::unique_ptr<file>>(fail_read_only());
  }
  const auto *n = find_(path);
  if (!n || n->type != entry_type::file) {
    return forward_fail<std::unique_ptr<file>>(
        make_fail(errc::path_not_found, "no such file: " + path));
  }

  result<std::unique_ptr<file>> ret{{.success = true}};
  ret.data = std::make_unique<memory_file>(n->data);
  return ret;
}

result_base archive_fs::create_file(const std::string &, int64_t) {
  return fail_read_only();
}

result_base archive_fs::create_directory(const std::string &) {
  return fail_read_only();
}

result<entry_type> archive_fs::get_entry_type(const std::string &path) {
  const auto *n = find_(path);
  if (!n) {
    return forward_fail<entry_type>(
        make_fail(errc::path_not_found, "not found: " + path));
  }
  result<entry_type> ret{{.success = true}};
  ret.data = n->type;
  return ret;
}

}  // namespace titlefs
