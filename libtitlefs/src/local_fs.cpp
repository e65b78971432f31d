#include "titlefs/local_fs.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace titlefs {

static result_base fail_from_ec(const std::error_code &ec,
                                const std::filesystem::path &path) {
  errc code = errc::io_error;
  if (ec == std::errc::no_such_file_or_directory) {
    code = errc::path_not_found;
  } else if (ec == std::errc::file_exists) {
    code = errc::path_exists;
  }
  return make_fail(code, path_to_utf8str(path) + ": " + ec.message(),
                   ec.value());
}

static result_base fail_invalid(const std::string &path) {
  return make_fail(errc::invalid_argument, "invalid path: " + path);
}

class local_file : public file {
 public:
  local_file(std::filesystem::path path, std::fstream &&stream)
      : m_path{std::move(path)}, m_stream{std::move(stream)} {}

  result<size_t> read(int64_t offset, std::span<char> buf) override {
    m_stream.clear();
    m_stream.seekg(offset);
    m_stream.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    if (m_stream.bad()) {
      return forward_fail<size_t>(
          make_fail(errc::io_error, "read failed: " + path_to_utf8str(m_path)));
    }
    result<size_t> ret{{.success = true}};
    ret.data = static_cast<size_t>(m_stream.gcount());
    // eof is not an error, short reads are reported through the count
    m_stream.clear();
    return ret;
  }

  result_base write(int64_t offset, std::span<const char> buf) override {
    m_stream.clear();
    m_stream.seekp(offset);
    m_stream.write(buf.data(), static_cast<std::streamsize>(buf.size()));
    if (!m_stream) {
      return make_fail(errc::io_error,
                       "write failed: " + path_to_utf8str(m_path));
    }
    return make_ok();
  }

  result<int64_t> get_size() override {
    std::error_code ec;
    auto size = std::filesystem::file_size(m_path, ec);
    if (ec) {
      return forward_fail<int64_t>(fail_from_ec(ec, m_path));
    }
    result<int64_t> ret{{.success = true}};
    ret.data = static_cast<int64_t>(size);
    return ret;
  }

  result_base set_size(int64_t size) override {
    m_stream.flush();
    std::error_code ec;
    std::filesystem::resize_file(m_path, static_cast<uintmax_t>(size), ec);
    if (ec) {
      return fail_from_ec(ec, m_path);
    }
    return make_ok();
  }

  result_base flush() override {
    m_stream.clear();
    m_stream.flush();
    if (!m_stream) {
      return make_fail(errc::io_error,
                       "flush failed: " + path_to_utf8str(m_path));
    }
    return make_ok();
  }

 private:
  std::filesystem::path m_path;
  std::fstream m_stream;
};

class local_directory : public directory {
 public:
  explicit local_directory(std::filesystem::path path)
      : m_path{std::move(path)} {}

  result<std::vector<dir_entry>> read_entries() override {
    std::error_code ec;
    std::filesystem::directory_iterator it{m_path, ec};
    if (ec) {
      return forward_fail<std::vector<dir_entry>>(fail_from_ec(ec, m_path));
    }

    result<std::vector<dir_entry>> ret{{.success = true}};
    for (; it != std::filesystem::directory_iterator{}; it.increment(ec)) {
      if (ec) {
        break;
      }
      const auto &entry = *it;
      auto name = path_to_utf8str(entry.path().filename());
      // dangling symlinks and other file types are skipped
      std::error_code type_ec;
      if (entry.is_directory(type_ec)) {
        ret.data.push_back({std::move(name), entry_type::directory, 0});
      } else if (entry.is_regular_file(type_ec)) {
        auto size = entry.file_size(ec);
        if (ec) {
          break;
        }
        ret.data.push_back(
            {std::move(name), entry_type::file, static_cast<int64_t>(size)});
      }
    }
    if (ec) {
      return forward_fail<std::vector<dir_entry>>(fail_from_ec(ec, m_path));
    }

    std::sort(ret.data.begin(), ret.data.end(),
              [](const auto &a, const auto &b) { return a.name < b.name; });
    return ret;
  }

 private:
  std::filesystem::path m_path;
};

local_fs::local_fs(std::filesystem::path root) : m_root{std::move(root)} {}

std::filesystem::path local_fs::to_native_(const std::string &path) const {
  std::string norm;
  if (!normalize_path(path, norm)) {
    return {};
  }
  if (norm == "/") {
    return m_root;
  }
  return m_root / utf8str_to_path(std::string_view{norm}.substr(1));
}

result<std::unique_ptr<directory>> local_fs::open_directory(
    const std::string &path) {
  auto native = to_native_(path);
  if (native.empty()) {
    return forward_fail<std::unique_ptr<directory>>(fail_invalid(path));
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(native, ec)) {
    if (!ec) {
      ec = std::make_error_code(std::errc::no_such_file_or_directory);
    }
    return forward_fail<std::unique_ptr<directory>>(fail_from_ec(ec, native));
  }

  result<std::unique_ptr<directory>> ret{{.success = true}};
  ret.data = std::make_unique<local_directory>(std::move(native));
  return ret;
}

result<std::unique_ptr<file>> local_fs::open_file(const std::string &path,
                                                  open_mode mode) {
  auto native = to_native_(path);
  if (native.empty()) {
    return forward_fail<std::unique_ptr<file>>(fail_invalid(path));
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(native, ec)) {
    if (!ec) {
      ec = std::make_error_code(std::errc::no_such_file_or_directory);
    }
    return forward_fail<std::unique_ptr<file>>(fail_from_ec(ec, native));
  }

  std::ios_base::openmode flags = std::ios_base::binary;
  if (has_mode(mode, open_mode::read)) {
    flags |= std::ios_base::in;
  }
  if (has_mode(mode, open_mode::write)) {
    // in|out opens without truncating
    flags |= std::ios_base::in | std::ios_base::out;
  }

  std::fstream stream{native, flags};
  if (!stream.is_open()) {
    return forward_fail<std::unique_ptr<file>>(make_fail(
        errc::io_error, "cannot open: " + path_to_utf8str(native)));
  }

  result<std::unique_ptr<file>> ret{{.success = true}};
  ret.data = std::make_unique<local_file>(std::move(native), std::move(stream));
  return ret;
}

result_base local_fs::create_file(const std::string &path, int64_t size) {
  auto native = to_native_(path);
  if (native.empty() || native == m_root) {
    return fail_invalid(path);
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(native.parent_path(), ec)) {
    if (!ec) {
      ec = std::make_error_code(std::errc::no_such_file_or_directory);
    }
    return fail_from_ec(ec, native.parent_path());
  }
  if (std::filesystem::is_directory(native, ec)) {
    return make_fail(errc::path_exists,
                     "directory in the way: " + path_to_utf8str(native));
  }

  {
    std::ofstream out{native, std::ios_base::binary | std::ios_base::trunc};
    if (!out.is_open()) {
      return make_fail(errc::io_error,
                       "cannot create: " + path_to_utf8str(native));
    }
  }

  std::filesystem::resize_file(native, static_cast<uintmax_t>(size), ec);
  if (ec) {
    return fail_from_ec(ec, native);
  }
  return make_ok();
}

result_base local_fs::create_directory(const std::string &path) {
  auto native = to_native_(path);
  if (native.empty()) {
    return fail_invalid(path);
  }

  std::error_code ec;
  if (std::filesystem::exists(native, ec)) {
    return make_fail(errc::path_exists,
                     "already exists: " + path_to_utf8str(native));
  }
  std::filesystem::create_directory(native, ec);
  if (ec) {
    return fail_from_ec(ec, native);
  }
  return make_ok();
}

result<entry_type> local_fs::get_entry_type(const std::string &path) {
  auto native = to_native_(path);
  if (native.empty()) {
    return forward_fail<entry_type>(fail_invalid(path));
  }

  std::error_code ec;
  auto st = std::filesystem::status(native, ec);
  if (st.type() == std::filesystem::file_type::not_found) {
    return forward_fail<entry_type>(make_fail(
        errc::path_not_found, "not found: " + path_to_utf8str(native)));
  }
  if (ec) {
    return forward_fail<entry_type>(fail_from_ec(ec, native));
  }

  result<entry_type> ret{{.success = true}};
  ret.data = std::filesystem::is_directory(st) ? entry_type::directory
                                               : entry_type::file;
  return ret;
}

}  // namespace titlefs
