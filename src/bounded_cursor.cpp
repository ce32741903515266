#include "bounded_cursor.hpp"

namespace dslist {

void BoundedCursor::require(size_t count) const {
    if (count > remaining()) {
        throw BufferUnderrun(remaining(), count);
    }
}

std::string trim_padding(std::string_view field) {
    size_t end = field.find_last_not_of('\0');
    if (end == std::string_view::npos) return {};
    return std::string(field.substr(0, end + 1));
}

} // namespace dslist
