#include "titlefs/archive_container.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <limits>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "titlefs/log.hpp"
#include "titlefs/overlay_fs.hpp"

namespace titlefs {

static result_base fail_header(const std::string &what) {
  return make_fail(errc::container_error,
                   std::string{"bad container header: "} + what);
}

static result<std::vector<char>> read_all(file &f) {
  auto size_ret = f.get_size();
  if (!size_ret.success) {
    return forward_fail<std::vector<char>>(size_ret);
  }

  result<std::vector<char>> ret{{.success = true}};
  ret.data.resize(static_cast<size_t>(size_ret.data));
  auto rd = f.read(0, ret.data);
  if (!rd.success) {
    return forward_fail<std::vector<char>>(rd);
  }
  if (rd.data != ret.data.size()) {
    return forward_fail<std::vector<char>>(
        make_fail(errc::io_error, "short read of container"));
  }
  return ret;
}

static bool parse_content_type(const std::string &str, content_type &out) {
  static const content_type all[] = {
      content_type::program, content_type::meta, content_type::control,
      content_type::manual,  content_type::data, content_type::public_data};
  for (auto type : all) {
    if (str == content_type_name(type)) {
      out = type;
      return true;
    }
  }
  return false;
}

static result<std::shared_ptr<archive_container>> open_from_storage(
    file &storage, const std::filesystem::path &updates_dir) {
  auto bytes = read_all(storage);
  if (!bytes.success) {
    return forward_fail<std::shared_ptr<archive_container>>(bytes);
  }
  auto fs = archive_fs::open_memory(bytes.data);
  if (!fs.success) {
    return forward_fail<std::shared_ptr<archive_container>>(fs);
  }
  return archive_container::open(std::move(fs.data), updates_dir);
}

std::string section_dir(int index) {
  return std::string{"/"} + SECTION_DIR_PREFIX + std::to_string(index);
}

// archive_container

archive_container::archive_container(passkey, std::shared_ptr<archive_fs> fs,
                                     std::filesystem::path updates_dir)
    : m_fs{std::move(fs)}, m_updates_dir{std::move(updates_dir)} {}

result<std::shared_ptr<archive_container>> archive_container::open(
    std::shared_ptr<archive_fs> fs, std::filesystem::path updates_dir) {
  using ret_t = std::shared_ptr<archive_container>;

  auto header_file = fs->open_file(std::string{"/"} + CONTAINER_HEADER,
                                   open_mode::read);
  if (!header_file.success) {
    return forward_fail<ret_t>(fail_header("missing " +
                                           std::string{CONTAINER_HEADER}));
  }
  auto text = read_all(*header_file.data);
  if (!text.success) {
    return forward_fail<ret_t>(text);
  }

  auto j = nlohmann::json::parse(text.data.begin(), text.data.end(), nullptr,
                                 false);
  if (j.is_discarded() || !j.is_object()) {
    return forward_fail<ret_t>(fail_header("not a json object"));
  }

  auto c = std::make_shared<archive_container>(passkey{}, std::move(fs),
                                               std::move(updates_dir));

  auto type_it = j.find("content_type");
  if (type_it == j.end() || !type_it->is_string() ||
      !parse_content_type(type_it->get<std::string>(), c->m_type)) {
    return forward_fail<ret_t>(fail_header("content_type"));
  }

  auto id_it = j.find("title_id");
  if (id_it == j.end() || !id_it->is_string() ||
      !parse_hex64(id_it->get<std::string>(), c->m_title_id)) {
    return forward_fail<ret_t>(fail_header("title_id"));
  }

  auto sections_it = j.find("sections");
  if (sections_it == j.end() || !sections_it->is_array()) {
    return forward_fail<ret_t>(fail_header("sections"));
  }
  for (const auto &section : *sections_it) {
    if (!section.is_object()) {
      return forward_fail<ret_t>(fail_header("section entry"));
    }
    auto index_it = section.find("index");
    if (index_it == section.end() || !index_it->is_number_integer()) {
      return forward_fail<ret_t>(fail_header("section index"));
    }
    // checked in 64 bits, get<int> would wrap a huge index into range
    constexpr auto max_index =
        static_cast<uint64_t>(std::numeric_limits<int>::max());
    bool in_range = index_it->is_number_unsigned()
                        ? index_it->get<uint64_t>() <= max_index
                        : index_it->get<int64_t>() >= 0 &&
                              static_cast<uint64_t>(
                                  index_it->get<int64_t>()) <= max_index;
    if (!in_range) {
      return forward_fail<ret_t>(fail_header("section index"));
    }
    auto index = index_it->get<int>();

    section_info info;
    if (auto patch_it = section.find("patch"); patch_it != section.end()) {
      if (!patch_it->is_boolean()) {
        return forward_fail<ret_t>(fail_header("section patch flag"));
      }
      info.patch = patch_it->get<bool>();
    }
    c->m_sections.insert_or_assign(index, info);
  }

  result<ret_t> ret{{.success = true}};
  ret.data = std::move(c);
  return ret;
}

bool archive_container::section_exists(int index) const {
  return m_sections.contains(index);
}

bool archive_container::is_patch_section(int index) const {
  auto it = m_sections.find(index);
  return it != m_sections.end() && it->second.patch;
}

result<std::unique_ptr<filesystem>> archive_container::open_section(
    int index, integrity_level level) {
  using ret_t = std::unique_ptr<filesystem>;

  if (!section_exists(index)) {
    return forward_fail<ret_t>(make_fail(
        errc::section_missing, "no section " + std::to_string(index)));
  }

  auto dir = section_dir(index);
  auto type_ret = m_fs->get_entry_type(dir);
  if (!type_ret.success || type_ret.data != entry_type::directory) {
    return forward_fail<ret_t>(make_fail(
        errc::container_error, "section data missing: " + dir));
  }

  if (level == integrity_level::error_on_invalid) {
    if (auto ret = m_fs->verify(dir); !ret.success) {
      return forward_fail<ret_t>(ret);
    }
  }

  result<ret_t> ret{{.success = true}};
  ret.data = std::make_unique<subdir_fs>(m_fs, dir);
  return ret;
}

result<std::unique_ptr<filesystem>> archive_container::open_section_with_patch(
    const std::shared_ptr<container> &patch, int index,
    integrity_level level) {
  using ret_t = std::unique_ptr<filesystem>;

  if (!patch) {
    return forward_fail<ret_t>(
        make_fail(errc::invalid_argument, "no patch container"));
  }

  auto patch_ret = patch->open_section(index, level);
  if (!patch_ret.success) {
    return forward_fail<ret_t>(patch_ret);
  }

  std::vector<std::shared_ptr<filesystem>> layers;
  layers.push_back(std::move(patch_ret.data));

  // a patch may bring a section the base never had
  if (section_exists(index)) {
    auto base_ret = open_section(index, level);
    if (!base_ret.success) {
      return forward_fail<ret_t>(base_ret);
    }
    layers.push_back(std::move(base_ret.data));
  }

  result<ret_t> ret{{.success = true}};
  ret.data = std::make_unique<overlay_fs>(std::move(layers));
  return ret;
}

result<std::shared_ptr<container>> archive_container::resolve_update(
    int program_index, integrity_level) {
  using ret_t = std::shared_ptr<container>;
  result<ret_t> ret{{.success = true}};

  if (m_updates_dir.empty()) {
    return ret;
  }

  auto base = program_id_base(m_title_id);
  auto sidecar = m_updates_dir / (to_hex16(base) + ".nsp");
  std::error_code ec;
  if (!std::filesystem::is_regular_file(sidecar, ec)) {
    return ret;
  }

  auto pkg = archive_fs::open(sidecar);
  if (!pkg.success) {
    return forward_fail<ret_t>(pkg);
  }
  auto dir = pkg.data->open_directory("/");
  if (!dir.success) {
    return forward_fail<ret_t>(dir);
  }
  auto entries = dir.data->read_entries();
  if (!entries.success) {
    return forward_fail<ret_t>(entries);
  }

  for (const auto &entry : entries.data) {
    if (entry.type != entry_type::file || !is_container_name(entry.name)) {
      continue;
    }
    auto storage = pkg.data->open_file(combine_path("/", entry.name),
                                       open_mode::read);
    if (!storage.success) {
      return forward_fail<ret_t>(storage);
    }
    // sidecars are not nested further, no updates dir for them
    auto c = open_from_storage(*storage.data, {});
    if (!c.success) {
      return forward_fail<ret_t>(c);
    }

    if (c.data->type() == content_type::program &&
        program_id_base(c.data->title_id()) == base &&
        program_index_of(c.data->title_id()) == program_index) {
      log_info("using update %s from %s", entry.name.c_str(),
               path_to_utf8str(sidecar).c_str());
      ret.data = std::move(c.data);
      return ret;
    }
  }

  log_warn("update package %s has no program %d",
           path_to_utf8str(sidecar).c_str(), program_index);
  return ret;
}

// archive_container_library

archive_container_library::archive_container_library(
    std::filesystem::path updates_dir)
    : m_updates_dir{std::move(updates_dir)} {}

result<std::shared_ptr<filesystem>> archive_container_library::open_package(
    const std::filesystem::path &path) {
  auto fs = archive_fs::open(path);
  if (!fs.success) {
    return forward_fail<std::shared_ptr<filesystem>>(fs);
  }
  result<std::shared_ptr<filesystem>> ret{{.success = true}};
  ret.data = std::move(fs.data);
  return ret;
}

result<std::shared_ptr<container>> archive_container_library::open_container(
    std::unique_ptr<file> storage) {
  if (!storage) {
    return forward_fail<std::shared_ptr<container>>(
        make_fail(errc::invalid_argument, "no container storage"));
  }
  auto c = open_from_storage(*storage, m_updates_dir);
  if (!c.success) {
    return forward_fail<std::shared_ptr<container>>(c);
  }
  result<std::shared_ptr<container>> ret{{.success = true}};
  ret.data = std::move(c.data);
  return ret;
}

}  // namespace titlefs
