#include "printer_id.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>

namespace dslist {

constexpr size_t MAC_HEX_DIGITS = 12;

std::string compact_mac_address(std::string_view mac) {
    std::string compact;
    compact.reserve(mac.size());
    for (char c : mac) {
        if (c == ':' || c == '-') continue;
        compact.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return compact;
}

std::string normalize_printer_identifier(std::string_view mac) {
    std::string compact = compact_mac_address(mac);
    bool hex = std::all_of(compact.begin(), compact.end(),
                           [](unsigned char c) { return std::isxdigit(c) != 0; });
    if (compact.size() != MAC_HEX_DIGITS || !hex) {
        throw InvalidPrinterIdentifier(std::string(mac));
    }
    return compact;
}

} // namespace dslist
