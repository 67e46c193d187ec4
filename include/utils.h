#pragma once

#include <string>

namespace utl {
std::string read_file(const std::string &path);
std::string shader_path(const std::string &scene, const std::string &stage);
} // namespace utl
