#include "strata/string_utils.hpp"

namespace strata::utils {

auto join(const std::vector<std::string>& lines, std::string_view delim) noexcept -> std::string {
    std::string res{};
    for (const auto& line : lines) {
        if (&line != &lines.front()) {
            res += delim;
        }
        res += line;
    }
    return res;
}

}  // namespace strata::utils
