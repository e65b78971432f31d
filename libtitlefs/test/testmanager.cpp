#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "testhelper.hpp"
#include "titlefs/title_manager.hpp"

using titlefs::errc;
using titlefs::section_type;

constexpr uint64_t TITLE_ID = 0x0100000000010000;

static std::string to_str(const std::vector<char> &bytes) {
  return {bytes.begin(), bytes.end()};
}

static std::vector<char> base_program() {
  return build_container(
      "program", TITLE_ID,
      {{.index = 0, .files = {{"main", "base code"}}},
       {.index = 1,
        .files = {{"data/a.txt", "base a"}, {"data/b.txt", "base b"}}}});
}

static std::vector<char> patch_program(const std::string &a_content) {
  return build_container(
      "program", TITLE_ID | 0x800,
      {{.index = 1, .patch = true, .files = {{"data/a.txt", a_content}}}});
}

class TitleManagerTest : public TmpDirTest {
 protected:
  const std::filesystem::path m_out_dir{m_tmp_dir / "out"};
  titlefs::title_manager m_manager{
      titlefs::manager_config::from_dir(m_tmp_dir / "cfg")};
  titlefs::cancel_token m_cancel;

  std::filesystem::path write_package(const std::string &name,
                                      const std::vector<archive_item> &items) {
    auto path = m_tmp_dir / name;
    write_bytes(path, build_archive(items));
    return path;
  }

  titlefs::copy_outcome extract(const std::filesystem::path &package) {
    return m_manager.extract_section(package, section_type::data, m_out_dir,
                                     m_cancel);
  }
};

TEST_F(TitleManagerTest, creates_directories) {
  const auto &cfg = m_manager.config();

  EXPECT_TRUE(std::filesystem::is_directory(cfg.nand_dir));
  EXPECT_TRUE(std::filesystem::is_directory(cfg.updates_dir));
  EXPECT_TRUE(std::filesystem::exists(cfg.db_path));
  EXPECT_EQ(titlefs::DEFAULT_USER, cfg.default_user);
}

TEST_F(TitleManagerTest, extract_base) {
  auto pkg = write_package("game.nsp", {{"base.nca", to_str(base_program())}});

  auto outcome = extract(pkg);

  EXPECT_FALSE(outcome.cancelled);
  ASSERT_TRUE(outcome.ret.success) << outcome.ret.msg;
  EXPECT_EQ("base a", read_text(m_out_dir / "data" / "a.txt"));
  EXPECT_EQ("base b", read_text(m_out_dir / "data" / "b.txt"));
  EXPECT_FALSE(std::filesystem::exists(m_out_dir / "main"));
}

TEST_F(TitleManagerTest, extract_with_embedded_patch) {
  auto pkg = write_package(
      "game.nsp",
      {{"meta.cnmt.nca", to_str(build_container("meta", TITLE_ID, {}))},
       {"base.nca", to_str(base_program())},
       {"patch.nca", to_str(patch_program("patched a"))}});

  auto outcome = extract(pkg);

  ASSERT_TRUE(outcome.ret.success) << outcome.ret.msg;
  EXPECT_EQ("patched a", read_text(m_out_dir / "data" / "a.txt"));
  EXPECT_EQ("base b", read_text(m_out_dir / "data" / "b.txt"));
}

TEST_F(TitleManagerTest, extract_single_container) {
  auto nca = m_tmp_dir / "base.nca";
  write_bytes(nca, base_program());

  auto outcome = m_manager.extract_section(nca, section_type::code, m_out_dir,
                                           m_cancel);

  ASSERT_TRUE(outcome.ret.success) << outcome.ret.msg;
  EXPECT_EQ("base code", read_text(m_out_dir / "main"));
}

TEST_F(TitleManagerTest, update_sidecar_applies) {
  auto pkg = write_package("game.xci", {{"base.nca", to_str(base_program())}});
  write_bytes(
      m_manager.config().updates_dir / (titlefs::to_hex16(TITLE_ID) + ".nsp"),
      build_archive({{"patch.nca", to_str(patch_program("updated a"))}}));

  auto outcome = extract(pkg);

  ASSERT_TRUE(outcome.ret.success) << outcome.ret.msg;
  EXPECT_EQ("updated a", read_text(m_out_dir / "data" / "a.txt"));
  EXPECT_EQ("base b", read_text(m_out_dir / "data" / "b.txt"));
}

TEST_F(TitleManagerTest, damaged_section) {
  auto damaged = base_program();
  ASSERT_TRUE(corrupt(damaged, "base b"));
  auto pkg = write_package("game.nsp", {{"base.nca", to_str(damaged)}});

  auto outcome = extract(pkg);

  EXPECT_FALSE(outcome.cancelled);
  EXPECT_FALSE(outcome.ret.success);
  EXPECT_EQ(errc::integrity_error, outcome.ret.code);
  EXPECT_FALSE(std::filesystem::exists(m_out_dir / "data" / "b.txt"));
}

TEST_F(TitleManagerTest, damage_ignored_without_integrity_checks) {
  auto cfg = titlefs::manager_config::from_dir(m_tmp_dir / "cfg2");
  cfg.integrity = titlefs::integrity_level::none;
  titlefs::title_manager manager{cfg};
  auto damaged = base_program();
  ASSERT_TRUE(corrupt(damaged, "base b"));
  auto pkg = write_package("game.nsp", {{"base.nca", to_str(damaged)}});

  auto outcome =
      manager.extract_section(pkg, section_type::data, m_out_dir, m_cancel);

  ASSERT_TRUE(outcome.ret.success) << outcome.ret.msg;
  EXPECT_EQ("base a", read_text(m_out_dir / "data" / "a.txt"));
}

TEST_F(TitleManagerTest, unsupported_package) {
  auto path = m_tmp_dir / "game.zip";
  write_bytes(path, base_program());

  auto outcome = extract(path);

  EXPECT_FALSE(outcome.ret.success);
  EXPECT_EQ(errc::not_supported, outcome.ret.code);
  EXPECT_FALSE(std::filesystem::exists(m_out_dir));
}

TEST_F(TitleManagerTest, no_main_container) {
  auto pkg = write_package(
      "game.nsp", {{"patch.nca", to_str(patch_program("patched a"))}});

  auto outcome = extract(pkg);

  EXPECT_FALSE(outcome.ret.success);
  EXPECT_EQ(errc::main_container_missing, outcome.ret.code);
}

TEST_F(TitleManagerTest, cancelled) {
  auto pkg = write_package("game.nsp", {{"base.nca", to_str(base_program())}});
  m_cancel.cancel();

  auto outcome = extract(pkg);

  EXPECT_TRUE(outcome.cancelled);
  EXPECT_TRUE(outcome.ret.success);
  EXPECT_FALSE(std::filesystem::exists(m_out_dir / "data"));
}

TEST_F(TitleManagerTest, save_menu) {
  auto none = titlefs::title_manager::save_menu({});
  EXPECT_FALSE(none.user);
  EXPECT_FALSE(none.device);
  EXPECT_FALSE(none.bcat);

  auto menu = titlefs::title_manager::save_menu(
      {.user_account_save_data_size = 0x1000,
       .bcat_delivery_cache_storage_size = 0x1000});
  EXPECT_TRUE(menu.user);
  EXPECT_FALSE(menu.device);
  EXPECT_TRUE(menu.bcat);
}

TEST_F(TitleManagerTest, locate_save_directory) {
  titlefs::control_property control{.user_account_save_data_size = 0x1000,
                                    .device_save_data_size = 0x1000};
  auto filter =
      titlefs::save_data_filter::make_user(TITLE_ID, titlefs::DEFAULT_USER);

  auto first =
      m_manager.locate_save_directory(TITLE_ID, "Test Game", control, filter);
  ASSERT_TRUE(first.success) << first.msg;
  EXPECT_TRUE(std::filesystem::is_directory(first.data));
  EXPECT_EQ(titlefs::WORKING_DIR, first.data.filename().string());
  EXPECT_EQ(2, m_manager.index().query_saves(TITLE_ID).size());

  auto device = m_manager.locate_save_directory(
      TITLE_ID, "Test Game", control,
      titlefs::save_data_filter::make_device(TITLE_ID));
  ASSERT_TRUE(device.success) << device.msg;
  EXPECT_NE(first.data, device.data);
}

TEST_F(TitleManagerTest, save_index_persists) {
  titlefs::control_property control{.user_account_save_data_size = 0x1000};
  auto filter =
      titlefs::save_data_filter::make_user(TITLE_ID, titlefs::DEFAULT_USER);
  auto cfg = titlefs::manager_config::from_dir(m_tmp_dir / "persist");

  std::filesystem::path first;
  {
    titlefs::title_manager manager{cfg};
    auto ret = manager.locate_save_directory(TITLE_ID, "Test Game", control,
                                             filter);
    ASSERT_TRUE(ret.success) << ret.msg;
    first = ret.data;
  }

  titlefs::title_manager manager{cfg};
  auto ret =
      manager.locate_save_directory(TITLE_ID, "Test Game", control, filter);
  ASSERT_TRUE(ret.success) << ret.msg;
  EXPECT_EQ(first, ret.data);
  EXPECT_EQ(1, manager.index().query_saves(TITLE_ID).size());
}
