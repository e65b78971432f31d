#include "titlefs/resolver.hpp"

#include <functional>
#include <string>
#include <utility>

#include "titlefs/local_fs.hpp"
#include "titlefs/log.hpp"

namespace titlefs {

package_kind package_kind_of(const std::filesystem::path &path) {
  auto ext = to_lower(path_to_utf8str(path.extension()));
  if (ext == ".nca") {
    return package_kind::single_container;
  }
  if (ext == ".nsp" || ext == ".pfs0" || ext == ".xci") {
    return package_kind::multi_container;
  }
  return package_kind::unsupported;
}

result<section_resolver::package_containers> section_resolver::open_multi_(
    const std::filesystem::path &path) {
  auto pkg = m_library.open_package(path);
  if (!pkg.success) {
    return forward_fail<package_containers>(pkg);
  }
  auto dir = pkg.data->open_directory("/");
  if (!dir.success) {
    return forward_fail<package_containers>(dir);
  }
  auto entries = dir.data->read_entries();
  if (!entries.success) {
    return forward_fail<package_containers>(entries);
  }

  const int data_index =
      section_index(section_type::data, content_type::program);
  result<package_containers> ret{{.success = true}};

  for (const auto &entry : entries.data) {
    if (entry.type != entry_type::file || !is_container_name(entry.name)) {
      continue;
    }

    auto storage =
        pkg.data->open_file(combine_path("/", entry.name), open_mode::read);
    if (!storage.success) {
      return forward_fail<package_containers>(storage);
    }
    auto c = m_library.open_container(std::move(storage.data));
    if (!c.success) {
      log_error("cannot open container %s: %s", entry.name.c_str(),
                c.msg.c_str());
      return forward_fail<package_containers>(c);
    }

    if (c.data->type() != content_type::program) {
      continue;
    }

    if (c.data->section_exists(data_index) &&
        c.data->is_patch_section(data_index)) {
      ret.data.patch = std::move(c.data);
    } else {
      if (ret.data.base) {
        log_warn("%s holds more than one program container, using %s",
                 path_to_utf8str(path).c_str(), entry.name.c_str());
      }
      ret.data.base = std::move(c.data);
    }
  }

  if (!ret.data.base) {
    return forward_fail<package_containers>(
        make_fail(errc::main_container_missing, "main container not present"));
  }
  return ret;
}

result<section_resolver::package_containers> section_resolver::open_single_(
    const std::filesystem::path &path) {
  auto parent = path.parent_path();
  if (parent.empty()) {
    parent = ".";
  }
  local_fs fs{parent};
  auto storage = fs.open_file("/" + path_to_utf8str(path.filename()),
                              open_mode::read);
  if (!storage.success) {
    return forward_fail<package_containers>(storage);
  }
  auto c = m_library.open_container(std::move(storage.data));
  if (!c.success) {
    return forward_fail<package_containers>(c);
  }

  result<package_containers> ret{{.success = true}};
  ret.data.base = std::move(c.data);
  return ret;
}

result<section_view> section_resolver::resolve(
    const std::filesystem::path &package_path, section_type section,
    integrity_level level, int program_index) {
  result<package_containers> opened;
  switch (package_kind_of(package_path)) {
    case package_kind::multi_container:
      opened = open_multi_(package_path);
      break;
    case package_kind::single_container:
      opened = open_single_(package_path);
      break;
    default:
      return forward_fail<section_view>(
          make_fail(errc::not_supported,
                    "unsupported package: " + path_to_utf8str(package_path)));
  }
  if (!opened.success) {
    return forward_fail<section_view>(opened);
  }

  auto base = std::move(opened.data.base);
  auto embedded = std::move(opened.data.patch);

  using patch_source = std::function<result<std::shared_ptr<container>>()>;
  const patch_source sources[] = {
      [&embedded]() {
        result<std::shared_ptr<container>> ret{{.success = true}};
        ret.data = embedded;
        return ret;
      },
      [&base, program_index, level]() {
        return base->resolve_update(program_index, level);
      },
  };

  std::shared_ptr<container> patch;
  for (const auto &source : sources) {
    auto ret = source();
    if (!ret.success) {
      return forward_fail<section_view>(ret);
    }
    if (ret.data) {
      patch = std::move(ret.data);
      break;
    }
  }

  const int index = section_index(section, base->type());
  if (index < 0) {
    return forward_fail<section_view>(make_fail(
        errc::section_missing,
        std::string{"section not present: "} + section_type_name(section)));
  }

  result<section_view> ret{{.success = true}};
  result<std::unique_ptr<filesystem>> fs;

  if (patch && patch->section_exists(index)) {
    log_info("opening %s section with patch %016llx",
             section_type_name(section),
             static_cast<unsigned long long>(patch->title_id()));
    fs = base->open_section_with_patch(patch, index, level);
    ret.data.patched = true;
  } else if (base->section_exists(index)) {
    fs = base->open_section(index, level);
  } else {
    return forward_fail<section_view>(make_fail(
        errc::section_missing,
        std::string{"section not present: "} + section_type_name(section)));
  }

  if (!fs.success) {
    return forward_fail<section_view>(fs);
  }

  ret.data.fs = std::move(fs.data);
  ret.data.sources.push_back(std::move(base));
  if (patch) {
    ret.data.sources.push_back(std::move(patch));
  }
  return ret;
}

}  // namespace titlefs
