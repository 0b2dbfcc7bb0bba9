#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <string>       // for string
#include <string_view>  // for string_view

namespace strata::file_utils {

auto read_whole_file(std::string_view filepath) noexcept -> std::string;

// If the file doesn't exist, then it create one and write into it.
// If the file exists already, then it will overwrite file content with provided data.
// Missing parent directories are created.
auto create_file_for_overwrite(std::string_view filepath, std::string_view data) noexcept -> bool;

}  // namespace strata::file_utils

#endif  // FILE_UTILS_HPP
