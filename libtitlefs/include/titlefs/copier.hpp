#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "titlefs/cancel.hpp"
#include "titlefs/utils.hpp"
#include "titlefs/vfs.hpp"

namespace titlefs {

// Largest chunk `copy_file` moves at once.
constexpr size_t MAX_CHUNK_SIZE = 1024 * 1024;

// Reusable copy buffers, so that copying many large files does not allocate a
// fresh megabyte per file. Thread-safe.
class buffer_pool {
 public:
  // A buffer borrowed from the pool, handed back on destruction.
  class lease {
   public:
    lease(const lease &) = delete;
    lease &operator=(const lease &) = delete;
    lease(lease &&other) noexcept = default;
    lease &operator=(lease &&other) noexcept = default;
    ~lease();

    char *data() noexcept { return m_buf->data(); }

    size_t size() const noexcept { return m_buf->size(); }

   private:
    buffer_pool *m_pool;
    std::unique_ptr<std::vector<char>> m_buf;

    lease(buffer_pool *pool, std::unique_ptr<std::vector<char>> &&buf)
        : m_pool{pool}, m_buf{std::move(buf)} {}

    friend buffer_pool;
  };

  explicit buffer_pool(size_t max_idle = 4) : m_max_idle{max_idle} {}

  // A buffer of at least `size` bytes.
  lease acquire(size_t size);

  size_t idle_count() const;

  // Process-wide pool used by default.
  static buffer_pool &shared();

 private:
  mutable std::mutex m_mutex;
  std::vector<std::unique_ptr<std::vector<char>>> m_idle;
  const size_t m_max_idle;

  void release_(std::unique_ptr<std::vector<char>> &&buf);
};

/**
 * @brief Copy the first @c total_size bytes of @c src into @c dest.
 *
 * Chunks are min(MAX_CHUNK_SIZE, remaining) bytes, read and written at the
 * same offset. @c dest is flushed after the last chunk, also when
 * @c total_size is 0. The first failing read, write or flush is returned as
 * is, nothing is retried.
 */
result_base copy_file(file &src, file &dest, int64_t total_size,
                      buffer_pool &pool = buffer_pool::shared());

struct copy_outcome {
  // meaningful only when not cancelled
  result_base ret;
  bool cancelled;
};

/**
 * @brief Mirror the tree under @c src_root of @c src_fs onto @c dest_root of
 * @c dest_fs.
 *
 * Depth-first, entries in name order. @c cancel is checked before every
 * entry; a cancelled copy returns @c cancelled == true and leaves what was
 * already written in place. Missing destination directories are created,
 * existing files are overwritten. Stops at the first error.
 */
copy_outcome copy_directory(filesystem &src_fs, const std::string &src_root,
                            filesystem &dest_fs, const std::string &dest_root,
                            const cancel_token &cancel);

}  // namespace titlefs
