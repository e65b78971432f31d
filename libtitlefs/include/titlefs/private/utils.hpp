#pragma once

#include <filesystem>

namespace titlefs {

// platform specific, see src/linux/utils.cpp

std::filesystem::path getexepath();

std::filesystem::path get_home();

}  // namespace titlefs
