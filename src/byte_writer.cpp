#include "byte_writer.hpp"
#include <algorithm>

namespace dslist {

void ByteWriter::emitWord(uint16_t word) {
    emit(static_cast<uint8_t>((word >> 8) & 0xFF));
    emit(static_cast<uint8_t>(word & 0xFF));
}

void ByteWriter::emitLong(uint32_t value) {
    emit(static_cast<uint8_t>((value >> 24) & 0xFF));
    emit(static_cast<uint8_t>((value >> 16) & 0xFF));
    emit(static_cast<uint8_t>((value >> 8) & 0xFF));
    emit(static_cast<uint8_t>(value & 0xFF));
}

void ByteWriter::emitBytes(std::span<const uint8_t> bytes) {
    buffer.insert(buffer.end(), bytes.begin(), bytes.end());
}

void ByteWriter::emitZeros(size_t count) {
    buffer.insert(buffer.end(), count, 0x00);
}

void ByteWriter::emitFixed(std::string_view text, size_t width) {
    size_t used = std::min(text.size(), width);
    for (size_t i = 0; i < used; ++i) {
        emit(static_cast<uint8_t>(text[i]));
    }
    emitZeros(width - used);
}

} // namespace dslist
