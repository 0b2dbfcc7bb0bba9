#include "strata/file_utils.hpp"

#include <cerrno>   // for errno
#include <cstdio>   // for fopen, fread, fclose
#include <cstring>  // for strerror

#include <filesystem>  // for create_directories
#include <fstream>     // for ofstream

#include <spdlog/spdlog.h>

namespace strata::file_utils {

auto read_whole_file(std::string_view filepath) noexcept -> std::string {
    const std::string path{filepath};

    // Use std::fopen because it's faster than std::ifstream
    auto* file = std::fopen(path.c_str(), "rb");
    if (file == nullptr) {
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(errno));
        return {};
    }

    std::fseek(file, 0L, SEEK_END);
    const auto size = static_cast<std::size_t>(std::ftell(file));
    std::fseek(file, 0L, SEEK_SET);

    std::string buf;
    buf.resize(size);

    const std::size_t read = std::fread(buf.data(), sizeof(char), size, file);
    std::fclose(file);
    if (read != size) {
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(errno));
        return {};
    }

    return buf;
}

auto create_file_for_overwrite(std::string_view filepath, std::string_view data) noexcept -> bool {
    const std::filesystem::path path{filepath};

    std::error_code err{};
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), err);
        if (err) {
            spdlog::error("[WRITE_TO_FILE] '{}' cannot create parent: {}", filepath, err.message());
            return false;
        }
    }

    std::ofstream file{path, std::ios::out | std::ios::trunc};
    if (!file.is_open()) {
        spdlog::error("[WRITE_TO_FILE] '{}' open failed: {}", filepath, std::strerror(errno));
        return false;
    }
    file << data;
    return static_cast<bool>(file);
}

}  // namespace strata::file_utils
