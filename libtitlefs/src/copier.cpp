#include "titlefs/copier.hpp"

#include <algorithm>
#include <span>
#include <string>
#include <utility>

namespace titlefs {

// buffer_pool

buffer_pool::lease::~lease() {
  if (m_pool && m_buf) {
    m_pool->release_(std::move(m_buf));
  }
}

buffer_pool::lease buffer_pool::acquire(size_t size) {
  {
    std::lock_guard lock{m_mutex};
    auto it = std::find_if(m_idle.begin(), m_idle.end(),
                           [size](const auto &buf) {
                             return buf->capacity() >= size;
                           });
    if (it != m_idle.end()) {
      auto buf = std::move(*it);
      m_idle.erase(it);
      buf->resize(size);
      return lease{this, std::move(buf)};
    }
  }
  return lease{this, std::make_unique<std::vector<char>>(size)};
}

void buffer_pool::release_(std::unique_ptr<std::vector<char>> &&buf) {
  std::lock_guard lock{m_mutex};
  if (m_idle.size() < m_max_idle) {
    m_idle.push_back(std::move(buf));
  }
}

size_t buffer_pool::idle_count() const {
  std::lock_guard lock{m_mutex};
  return m_idle.size();
}

buffer_pool &buffer_pool::shared() {
  static buffer_pool pool;
  return pool;
}

// copy

result_base copy_file(file &src, file &dest, int64_t total_size,
                      buffer_pool &pool) {
  if (total_size < 0) {
    return make_fail(errc::invalid_argument, "negative file size");
  }

  if (total_size > 0) {
    auto chunk_size =
        std::min<int64_t>(static_cast<int64_t>(MAX_CHUNK_SIZE), total_size);
    auto buf = pool.acquire(static_cast<size_t>(chunk_size));

    for (int64_t offset = 0; offset < total_size;) {
      auto len = std::min(total_size - offset, chunk_size);
      std::span<char> chunk{buf.data(), static_cast<size_t>(len)};

      auto rd = src.read(offset, chunk);
      if (!rd.success) {
        return rd;
      }
      if (rd.data != chunk.size()) {
        return make_fail(errc::io_error,
                         "short read at offset " + std::to_string(offset));
      }

      if (auto wr = dest.write(offset, chunk); !wr.success) {
        return wr;
      }
      offset += len;
    }
  }

  return dest.flush();
}

static result_base copy_entry_file(filesystem &src_fs,
                                   const std::string &src_path,
                                   filesystem &dest_fs,
                                   const std::string &dest_path) {
  auto src_ret = src_fs.open_file(src_path, open_mode::read);
  if (!src_ret.success) {
    return src_ret;
  }
  auto dest_ret = dest_fs.open_file(dest_path, open_mode::write);
  if (!dest_ret.success) {
    return dest_ret;
  }

  auto size_ret = src_ret.data->get_size();
  if (!size_ret.success) {
    return size_ret;
  }

  return copy_file(*src_ret.data, *dest_ret.data, size_ret.data);
}

copy_outcome copy_directory(filesystem &src_fs, const std::string &src_root,
                            filesystem &dest_fs, const std::string &dest_root,
                            const cancel_token &cancel) {
  auto dir_ret = src_fs.open_directory(src_root);
  if (!dir_ret.success) {
    return {dir_ret, false};
  }

  auto entries_ret = dir_ret.data->read_entries();
  if (!entries_ret.success) {
    return {entries_ret, false};
  }

  for (const auto &entry : entries_ret.data) {
    if (cancel.cancelled()) {
      return {make_ok(), true};
    }

    auto sub_src = combine_path(src_root, entry.name);
    auto sub_dest = combine_path(dest_root, entry.name);

    if (entry.type == entry_type::directory) {
      if (auto ret = ensure_directory_exists(dest_fs, sub_dest);
          !ret.success) {
        return {ret, false};
      }

      auto outcome =
          copy_directory(src_fs, sub_src, dest_fs, sub_dest, cancel);
      if (outcome.cancelled || !outcome.ret.success) {
        return outcome;
      }
    } else {
      if (auto ret = dest_fs.create_file(sub_dest, entry.size);
          !ret.success) {
        return {ret, false};
      }

      if (auto ret = copy_entry_file(src_fs, sub_src, dest_fs, sub_dest);
          !ret.success) {
        return {ret, false};
      }
    }
  }

  return {make_ok(), false};
}

}  // namespace titlefs
