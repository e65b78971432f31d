#include <gtest/gtest.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "testhelper.hpp"
#include "titlefs/cancel.hpp"
#include "titlefs/copier.hpp"
#include "titlefs/local_fs.hpp"

// In-memory file recording every call made to it.
class recording_file : public titlefs::file {
 public:
  std::vector<char> content;
  std::vector<std::pair<int64_t, size_t>> reads;
  std::vector<std::pair<int64_t, size_t>> writes;
  int flushes = 0;
  // fail the n-th read / write, counting from 0
  int fail_read_at = -1;
  int fail_write_at = -1;
  bool short_reads = false;

  titlefs::result<size_t> read(int64_t offset, std::span<char> buf) override {
    if (static_cast<int>(reads.size()) == fail_read_at) {
      return titlefs::forward_fail<size_t>(
          titlefs::make_fail(titlefs::errc::io_error, "read failed", 5));
    }
    reads.emplace_back(offset, buf.size());
    auto avail = content.size() - std::min<size_t>(offset, content.size());
    auto len = std::min(avail, buf.size());
    if (short_reads && len > 1) {
      len /= 2;
    }
    std::memcpy(buf.data(), content.data() + offset, len);
    titlefs::result<size_t> ret{{.success = true}};
    ret.data = len;
    return ret;
  }

  titlefs::result_base write(int64_t offset,
                             std::span<const char> buf) override {
    if (static_cast<int>(writes.size()) == fail_write_at) {
      return titlefs::make_fail(titlefs::errc::io_error, "write failed", 28);
    }
    writes.emplace_back(offset, buf.size());
    auto end = static_cast<size_t>(offset) + buf.size();
    if (content.size() < end) {
      content.resize(end);
    }
    std::memcpy(content.data() + offset, buf.data(), buf.size());
    return titlefs::make_ok();
  }

  titlefs::result<int64_t> get_size() override {
    titlefs::result<int64_t> ret{{.success = true}};
    ret.data = static_cast<int64_t>(content.size());
    return ret;
  }

  titlefs::result_base set_size(int64_t size) override {
    content.resize(static_cast<size_t>(size));
    return titlefs::make_ok();
  }

  titlefs::result_base flush() override {
    ++flushes;
    return titlefs::make_ok();
  }
};

static std::vector<char> pattern(size_t size) {
  std::vector<char> v(size);
  for (size_t i = 0; i < size; ++i) {
    v[i] = static_cast<char>(i * 31 + 7);
  }
  return v;
}

constexpr size_t MiB = titlefs::MAX_CHUNK_SIZE;

TEST(CopyFileTest, chunks) {
  struct tcase {
    size_t size;
    std::vector<size_t> chunks;
  };
  const std::vector<tcase> cases = {
      {1, {1}},
      {MiB, {MiB}},
      {MiB + 1, {MiB, 1}},
      {MiB * 5 / 2, {MiB, MiB, MiB / 2}},
  };

  for (const auto &c : cases) {
    recording_file src;
    recording_file dest;
    src.content = pattern(c.size);

    auto ret = titlefs::copy_file(src, dest, static_cast<int64_t>(c.size));
    ASSERT_TRUE(ret.success) << ret.msg;

    ASSERT_EQ(c.chunks.size(), dest.writes.size()) << "size " << c.size;
    int64_t offset = 0;
    for (size_t i = 0; i < c.chunks.size(); ++i) {
      EXPECT_EQ(offset, src.reads[i].first);
      EXPECT_EQ(c.chunks[i], src.reads[i].second);
      EXPECT_EQ(offset, dest.writes[i].first);
      EXPECT_EQ(c.chunks[i], dest.writes[i].second);
      offset += static_cast<int64_t>(c.chunks[i]);
    }
    EXPECT_EQ(src.content, dest.content);
    EXPECT_EQ(1, dest.flushes);
  }
}

TEST(CopyFileTest, zero_size_still_flushes) {
  recording_file src;
  recording_file dest;

  auto ret = titlefs::copy_file(src, dest, 0);

  EXPECT_TRUE(ret.success);
  EXPECT_TRUE(src.reads.empty());
  EXPECT_TRUE(dest.writes.empty());
  EXPECT_EQ(1, dest.flushes);
}

TEST(CopyFileTest, read_error) {
  recording_file src;
  recording_file dest;
  src.content = pattern(MiB * 3);
  src.fail_read_at = 1;

  auto ret = titlefs::copy_file(src, dest, static_cast<int64_t>(MiB * 3));

  EXPECT_FALSE(ret.success);
  EXPECT_EQ(titlefs::errc::io_error, ret.code);
  EXPECT_EQ(5, ret.native);
  EXPECT_EQ(1, dest.writes.size());
  EXPECT_EQ(0, dest.flushes);
}

TEST(CopyFileTest, write_error) {
  recording_file src;
  recording_file dest;
  src.content = pattern(10);
  dest.fail_write_at = 0;

  auto ret = titlefs::copy_file(src, dest, 10);

  EXPECT_FALSE(ret.success);
  EXPECT_EQ(28, ret.native);
  EXPECT_EQ(0, dest.flushes);
}

TEST(CopyFileTest, short_read) {
  recording_file src;
  recording_file dest;
  src.content = pattern(100);
  src.short_reads = true;

  auto ret = titlefs::copy_file(src, dest, 100);

  EXPECT_FALSE(ret.success);
  EXPECT_EQ(titlefs::errc::io_error, ret.code);
}

TEST(BufferPoolTest, reuse) {
  titlefs::buffer_pool pool{1};
  {
    auto a = pool.acquire(64);
    auto b = pool.acquire(64);
    EXPECT_GE(a.size(), 64u);
    EXPECT_NE(a.data(), b.data());
    EXPECT_EQ(0, pool.idle_count());
  }
  // only one is kept
  EXPECT_EQ(1, pool.idle_count());

  auto c = pool.acquire(32);
  EXPECT_EQ(0, pool.idle_count());
  EXPECT_EQ(32u, c.size());
}

class CopyDirectoryTest : public TmpDirTest {
 public:
  CopyDirectoryTest() {
    make_file(m_src_dir / "a.txt", "alpha");
    make_file(m_src_dir / "sub" / "b.txt", "beta");
    make_file(m_src_dir / "sub" / "deep" / "c.bin", std::string(3000, 'c'));
    make_file(m_src_dir / "z_empty.txt", "");
    std::filesystem::create_directories(m_src_dir / "empty_dir");
    std::filesystem::create_directories(m_dest_dir);
  }

 protected:
  const std::filesystem::path m_src_dir{m_tmp_dir / "src"};
  const std::filesystem::path m_dest_dir{m_tmp_dir / "dest"};
  titlefs::local_fs m_src{m_src_dir};
  titlefs::local_fs m_dest{m_dest_dir};
  titlefs::cancel_token m_cancel;

  void expect_mirrored() {
    EXPECT_EQ("alpha", read_text(m_dest_dir / "a.txt"));
    EXPECT_EQ("beta", read_text(m_dest_dir / "sub" / "b.txt"));
    EXPECT_EQ(std::string(3000, 'c'),
              read_text(m_dest_dir / "sub" / "deep" / "c.bin"));
    EXPECT_TRUE(std::filesystem::exists(m_dest_dir / "z_empty.txt"));
    EXPECT_EQ(0u, std::filesystem::file_size(m_dest_dir / "z_empty.txt"));
    EXPECT_TRUE(std::filesystem::is_directory(m_dest_dir / "empty_dir"));
  }
};

TEST_F(CopyDirectoryTest, mirror) {
  auto outcome = titlefs::copy_directory(m_src, "/", m_dest, "/", m_cancel);

  EXPECT_FALSE(outcome.cancelled);
  ASSERT_TRUE(outcome.ret.success) << outcome.ret.msg;
  expect_mirrored();
}

TEST_F(CopyDirectoryTest, copy_twice_overwrites) {
  make_file(m_dest_dir / "a.txt", "a much longer stale content");

  auto first = titlefs::copy_directory(m_src, "/", m_dest, "/", m_cancel);
  auto second = titlefs::copy_directory(m_src, "/", m_dest, "/", m_cancel);

  EXPECT_TRUE(first.ret.success);
  EXPECT_TRUE(second.ret.success);
  expect_mirrored();
}

TEST_F(CopyDirectoryTest, into_subdirectory) {
  ASSERT_TRUE(titlefs::ensure_directory_exists(m_dest, "/x/y").success);

  auto outcome = titlefs::copy_directory(m_src, "/sub", m_dest, "/x/y",
                                         m_cancel);

  ASSERT_TRUE(outcome.ret.success) << outcome.ret.msg;
  EXPECT_EQ("beta", read_text(m_dest_dir / "x" / "y" / "b.txt"));
  EXPECT_FALSE(std::filesystem::exists(m_dest_dir / "x" / "y" / "a.txt"));
}

TEST_F(CopyDirectoryTest, cancelled_before_first_entry) {
  m_cancel.cancel();

  auto outcome = titlefs::copy_directory(m_src, "/", m_dest, "/", m_cancel);

  EXPECT_TRUE(outcome.cancelled);
  EXPECT_TRUE(outcome.ret.success);
  EXPECT_EQ(titlefs::errc::ok, outcome.ret.code);
  EXPECT_TRUE(std::filesystem::is_empty(m_dest_dir));
}

TEST_F(CopyDirectoryTest, missing_source) {
  auto outcome =
      titlefs::copy_directory(m_src, "/nothing", m_dest, "/", m_cancel);

  EXPECT_FALSE(outcome.cancelled);
  EXPECT_FALSE(outcome.ret.success);
  EXPECT_EQ(titlefs::errc::path_not_found, outcome.ret.code);
}

TEST_F(CopyDirectoryTest, file_in_the_way) {
  // destination has a file where the source has a directory
  make_file(m_dest_dir / "sub", "not a directory");

  auto outcome = titlefs::copy_directory(m_src, "/", m_dest, "/", m_cancel);

  EXPECT_FALSE(outcome.cancelled);
  EXPECT_FALSE(outcome.ret.success);
  EXPECT_EQ(titlefs::errc::path_exists, outcome.ret.code);
  // entries before "sub" were copied, later ones were not
  EXPECT_EQ("alpha", read_text(m_dest_dir / "a.txt"));
  EXPECT_FALSE(std::filesystem::exists(m_dest_dir / "z_empty.txt"));
}

// Source filesystem that cancels the token once a given file is opened.
class cancelling_fs : public titlefs::local_fs {
 public:
  cancelling_fs(std::filesystem::path root, titlefs::cancel_token &cancel,
                std::string trigger)
      : titlefs::local_fs{std::move(root)},
        m_cancel{cancel},
        m_trigger{std::move(trigger)} {}

  titlefs::result<std::unique_ptr<titlefs::file>> open_file(
      const std::string &path, titlefs::open_mode mode) override {
    if (path == m_trigger) {
      m_cancel.cancel();
    }
    return titlefs::local_fs::open_file(path, mode);
  }

 private:
  titlefs::cancel_token &m_cancel;
  std::string m_trigger;
};

TEST_F(CopyDirectoryTest, cancelled_midway) {
  cancelling_fs src{m_src_dir, m_cancel, "/sub/b.txt"};

  auto outcome = titlefs::copy_directory(src, "/", m_dest, "/", m_cancel);

  EXPECT_TRUE(outcome.cancelled);
  // the file being copied when the flag was raised is completed
  EXPECT_EQ("alpha", read_text(m_dest_dir / "a.txt"));
  EXPECT_EQ("beta", read_text(m_dest_dir / "sub" / "b.txt"));
  // nothing after it
  EXPECT_FALSE(std::filesystem::exists(m_dest_dir / "sub" / "deep" / "c.bin"));
  EXPECT_FALSE(std::filesystem::exists(m_dest_dir / "z_empty.txt"));
}
