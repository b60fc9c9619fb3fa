#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace shelter {

// ============================================================================
// Basic Enums
// ============================================================================

// Values are the integers exchanged across the C boundary.
enum class QuoteType : uint8_t {
    NONE = 0,
    SINGLE = 1,
    DOUBLE = 2
};

enum class MaskMode : uint8_t {
    FULL = 0,
    PARTIAL = 1
};

[[nodiscard]] inline constexpr uint8_t to_code(QuoteType q) noexcept {
    return static_cast<uint8_t>(q);
}

// Any code other than 1 selects FULL.
[[nodiscard]] inline constexpr MaskMode mask_mode_from_code(uint8_t code) noexcept {
    return code == static_cast<uint8_t>(MaskMode::PARTIAL) ? MaskMode::PARTIAL : MaskMode::FULL;
}

// ============================================================================
// Parsed EDF Content
// ============================================================================

/**
 * @brief One key/value occurrence in EDF text.
 *
 * Offsets are byte positions into the parsed buffer. For quoted values
 * [value_start, value_end) includes both quote characters, so the raw span
 * can be rewritten without losing the delimiters.
 */
struct Entry {
    std::string key;
    std::string value;          // Decoded (quotes stripped, escapes resolved)

    size_t key_start = 0;
    size_t key_end = 0;
    size_t value_start = 0;
    size_t value_end = 0;

    size_t line_number = 0;     // 1-based line of the key
    size_t value_end_line = 0;  // 1-based line of the last value byte

    QuoteType quote_type = QuoteType::NONE;
    bool is_exported = false;
    bool is_comment = false;
};

struct ParseOptions {
    bool include_comments = true;
    bool track_positions = true;
};

struct ParseOutput {
    std::vector<Entry> entries;
    std::vector<size_t> line_offsets;   // offsets[i] = first byte of line i+1
};

/**
 * @brief Line/column of a byte offset (line 1-based, column 0-based bytes)
 */
struct Position {
    size_t line = 0;
    size_t column = 0;
};

// ============================================================================
// Masking Options
// ============================================================================

struct MaskOptions {
    int8_t mask_char = '*';
    size_t mask_length = 0;         // 0 = derive from the input
    MaskMode mode = MaskMode::FULL;
    size_t show_start = 3;          // PARTIAL only
    size_t show_end = 3;            // PARTIAL only
    size_t min_mask = 3;            // PARTIAL only
};

} // namespace shelter
