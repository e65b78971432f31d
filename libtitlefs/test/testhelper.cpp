#include "testhelper.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <cstdio>
#include <iterator>
#include <stdexcept>

std::vector<char> build_archive(const std::vector<archive_item>& items) {
  size_t capacity = 64 * 1024;
  for (const auto& item : items) {
    capacity += item.path.size() * 3 + item.content.size() + 512;
  }
  std::vector<char> buf(capacity);
  size_t used = 0;

  struct archive* a = archive_write_new();
  archive_write_set_format_zip(a);
  archive_write_set_options(a, "zip:compression=store");
  archive_write_set_bytes_in_last_block(a, 1);

  int r = archive_write_open_memory(a, buf.data(), buf.size(), &used);
  if (ARCHIVE_OK != r) {
    fprintf(stderr, "%s\n", archive_error_string(a));
    archive_write_free(a);
    throw std::runtime_error("cannot open archive writer");
  }

  for (const auto& item : items) {
    struct archive_entry* entry = archive_entry_new();
    archive_entry_set_pathname(entry, item.path.c_str());
    if (item.dir) {
      archive_entry_set_filetype(entry, AE_IFDIR);
      archive_entry_set_perm(entry, 0755);
    } else {
      archive_entry_set_filetype(entry, AE_IFREG);
      archive_entry_set_perm(entry, 0644);
      archive_entry_set_size(entry, static_cast<la_int64_t>(item.content.size()));
    }
    archive_entry_set_mtime(entry, 1700000000, 0);

    r = archive_write_header(a, entry);
    if (ARCHIVE_OK == r && !item.dir && !item.content.empty()) {
      if (archive_write_data(a, item.content.data(), item.content.size()) < 0) {
        r = ARCHIVE_FATAL;
      }
    }
    archive_entry_free(entry);
    if (ARCHIVE_OK != r) {
      fprintf(stderr, "%s\n", archive_error_string(a));
      archive_write_free(a);
      throw std::runtime_error("cannot write " + item.path);
    }
  }

  archive_write_close(a);
  archive_write_free(a);
  buf.resize(used);
  return buf;
}

std::vector<char> build_container(const std::string& content_type,
                                  uint64_t title_id,
                                  const std::vector<section_spec>& sections) {
  std::string header = "{\"content_type\": \"" + content_type +
                       "\", \"title_id\": \"" + titlefs::to_hex16(title_id) +
                       "\", \"sections\": [";
  std::vector<archive_item> items;
  for (size_t i = 0; i < sections.size(); ++i) {
    const auto& section = sections[i];
    if (i) {
      header += ", ";
    }
    header += "{\"index\": " + std::to_string(section.index) +
              (section.patch ? ", \"patch\": true}" : "}");

    auto dir = "section" + std::to_string(section.index);
    items.push_back({dir + "/", "", true});
    for (const auto& f : section.files) {
      items.push_back({dir + "/" + f.path, f.content, f.dir});
    }
  }
  header += "]}";
  items.insert(items.begin(), archive_item{"header.json", header, false});

  return build_archive(items);
}

void write_bytes(const std::filesystem::path& path,
                 const std::vector<char>& bytes) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out{path, std::ios_base::binary};
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

std::string read_text(const std::filesystem::path& path) {
  std::ifstream in{path, std::ios_base::binary};
  return {std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

bool corrupt(std::vector<char>& bytes, const std::string& needle) {
  auto it = std::search(bytes.begin(), bytes.end(), needle.begin(), needle.end());
  if (it == bytes.end()) {
    return false;
  }
  *it = static_cast<char>(*it ^ 0x20);
  return true;
}
