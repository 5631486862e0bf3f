#include <tabula/core/record.hpp>

#include <cctype>

namespace tabula {

auto is_system_group(std::string_view group) noexcept -> bool {
    if (group.size() != kSystemGroup.size()) {
        return false;
    }
    for (std::size_t i = 0; i < group.size(); ++i) {
        auto ch = static_cast<unsigned char>(group[i]);
        if (std::toupper(ch) != static_cast<unsigned char>(kSystemGroup[i])) {
            return false;
        }
    }
    return true;
}

}  // namespace tabula
