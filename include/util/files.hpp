#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace files
{

bool        read_file(const std::string &path, std::vector<std::uint8_t> &out);
// Creates missing parent directories, replaces an existing file
bool        write_file(const std::string &path, const std::vector<std::uint8_t> &data);
std::string expand_user(const std::string &path);

}  // namespace files
