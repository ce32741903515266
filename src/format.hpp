/**
 * @file format.hpp
 * @brief On-disk layout of the Aficio delivery service target list files
 *
 * The printer keeps its delivery service address book in four files per
 * device (see target_list.hpp for the naming scheme). The layout is not
 * documented by the vendor; everything below was taken from files written
 * by the device itself and must be reproduced byte for byte.
 *
 * DESIGN PRINCIPLES:
 * - Magic blocks are literal byte arrays, never computed
 * - Record widths are derived from the field widths they contain
 * - Anything we do not understand is named after where it sits, not guessed at
 */

#ifndef DSLIST_FORMAT_HPP
#define DSLIST_FORMAT_HPP

#include <array>
#include <cstddef>
#include <cstdint>

// =============================================================================
// BYTE ORDERING
// =============================================================================

/**
 * @brief BYTE ORDER: ALL MULTI-BYTE VALUES ARE BIG-ENDIAN
 *
 * This applies to:
 * - The generation number in the version file
 * - The group discriminator and column numbers
 * - Entry counts, revision numbers, ids, frequency markers and group numbers
 *
 * Example: The value 0x1234 is stored as bytes [0x12, 0x34]
 */

namespace dslist::format {

// =============================================================================
// GROUP FILE (*.grp)
// =============================================================================

/**
 * @brief First word of a group file when columns use 4-byte names
 */
constexpr uint32_t GROUP_COMPACT_DISCRIMINATOR = 0x0000000B;

/**
 * @brief First word of a group file when columns use 8-byte names
 */
constexpr uint32_t GROUP_WIDE_DISCRIMINATOR = 0x00000006;

/**
 * @brief Constant block following the discriminator
 *
 * Contains the "Freq" pseudo column the printer always shows first. The
 * decoder skips it without looking at it, the encoder writes it verbatim.
 */
constexpr std::array<uint8_t, 32> GROUP_PREAMBLE = {
    0x00, 0x00, 0x00, 0x02,
    0x00, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x80, 0x01,
    'F',  'r',  'e',  'q',
    0x2E, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x00, 0x00,
};

constexpr size_t GROUP_HEADER_SIZE = 4 + GROUP_PREAMBLE.size();

// Column count limits. The device only ever stores max - 1 column records.
constexpr size_t COMPACT_MAX_COLUMNS = 10;
constexpr size_t WIDE_MAX_COLUMNS = 5;

constexpr size_t COMPACT_COLUMN_NAME_SIZE = 4;
constexpr size_t WIDE_COLUMN_NAME_SIZE = 8;

constexpr size_t COMPACT_COLUMN_PADDING = 16;
constexpr size_t WIDE_COLUMN_PADDING = 12;

/**
 * @brief Size of one column record
 *
 * Both modes trade name bytes for padding, so every record is 24 bytes.
 */
constexpr size_t COLUMN_RECORD_SIZE = 4 + COMPACT_COLUMN_NAME_SIZE + COMPACT_COLUMN_PADDING;
static_assert(COLUMN_RECORD_SIZE == 4 + WIDE_COLUMN_NAME_SIZE + WIDE_COLUMN_PADDING);

// =============================================================================
// IDENTIFIER FILES (*.dst, *.snd)
// =============================================================================

/**
 * @brief Header: { entry_count u32, 4 bytes padding, revision u32 }
 */
constexpr size_t IDENTIFIER_HEADER_SIZE = 12;

constexpr uint16_t FREQUENCY_MARKER_FREQUENT = 0x8001;
constexpr uint16_t FREQUENCY_MARKER_NORMAL = 0x0000;

constexpr size_t IDENTIFIER_RESERVED_SIZE = 4;

/**
 * @brief Seven zero bytes followed by the type byte
 *
 * The decoder skips all eight bytes as one block.
 */
constexpr size_t IDENTIFIER_TAG_SIZE = 7;
constexpr uint8_t IDENTIFIER_TYPE_BYTE = 0x02;

constexpr size_t IDENTIFIER_NAME_SIZE = 16;

/**
 * @brief Size of one identifier record
 *
 * { id u32, marker u16, group u16, reserved[4], tag[7], type u8, name[16] }
 */
constexpr size_t IDENTIFIER_RECORD_SIZE =
    4 + 2 + 2 + IDENTIFIER_RESERVED_SIZE + IDENTIFIER_TAG_SIZE + 1 + IDENTIFIER_NAME_SIZE;
static_assert(IDENTIFIER_RECORD_SIZE == 36);

// =============================================================================
// VERSION FILE (*.ver)
// =============================================================================

constexpr size_t GENERATION_SIZE = 4;

} // namespace dslist::format

#endif // DSLIST_FORMAT_HPP
