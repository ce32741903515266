#include "generation_counter.hpp"
#include "bounded_cursor.hpp"
#include "byte_writer.hpp"

namespace dslist {

std::vector<uint8_t> GenerationCounter::encode() const {
    ByteWriter out;
    out.emitLong(generationNumber);
    return out.take();
}

GenerationCounter GenerationCounter::decode(std::span<const uint8_t> data) {
    BoundedCursor cursor(data);
    auto [generation] = cursor.read<U32>();
    return GenerationCounter(generation);
}

std::ostream& operator<<(std::ostream& os, const GenerationCounter& counter) {
    return os << "GenerationCounter(generation_number = " << counter.generation_number() << ")";
}

} // namespace dslist
