#include "titlefs/container.hpp"

namespace titlefs {

const char *content_type_name(content_type type) noexcept {
  switch (type) {
    case content_type::program:
      return "program";
    case content_type::meta:
      return "meta";
    case content_type::control:
      return "control";
    case content_type::manual:
      return "manual";
    case content_type::data:
      return "data";
    case content_type::public_data:
      return "public_data";
  }
  return "unknown";
}

const char *section_type_name(section_type type) noexcept {
  switch (type) {
    case section_type::code:
      return "code";
    case section_type::data:
      return "data";
    case section_type::logo:
      return "logo";
  }
  return "unknown";
}

int section_index(section_type section, content_type type) noexcept {
  if (type == content_type::program) {
    switch (section) {
      case section_type::code:
        return 0;
      case section_type::data:
        return 1;
      case section_type::logo:
        return 2;
    }
    return -1;
  }
  return section == section_type::data ? 0 : -1;
}

bool is_container_name(const std::string &name) {
  return to_lower(path_to_utf8str(utf8str_to_path(name).extension())) ==
         ".nca";
}

}  // namespace titlefs
