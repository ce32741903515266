#pragma once
#include <string>
#include <string_view>

namespace dslist {

// Lowercases a MAC address and drops ':' and '-' separators.
std::string compact_mac_address(std::string_view mac);

// compact_mac_address() plus validation: the result must be exactly twelve
// hex digits. Throws InvalidPrinterIdentifier otherwise.
std::string normalize_printer_identifier(std::string_view mac);

} // namespace dslist
