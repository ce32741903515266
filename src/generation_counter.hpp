#pragma once
#include <cstdint>
#include <ostream>
#include <span>
#include <vector>

namespace dslist {

// The "Version" file: one big-endian word naming the current generation of
// a printer's target lists.
class GenerationCounter
{
    uint32_t generationNumber = 1;

public:
    GenerationCounter() = default;
    explicit GenerationCounter(uint32_t generation) : generationNumber(generation) {}

    uint32_t generation_number() const { return generationNumber; }
    void increase() { ++generationNumber; }

    std::vector<uint8_t> encode() const;
    static GenerationCounter decode(std::span<const uint8_t> data);

    bool operator==(const GenerationCounter&) const = default;
};

std::ostream& operator<<(std::ostream& os, const GenerationCounter& counter);

} // namespace dslist
