#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include <cstddef>
#include <string_view>
#include <vector>

namespace shelter {

/**
 * @brief EDF (.env dialect) parser
 *
 * Splits "KEY=value" text into entries with byte-exact spans and line
 * numbers, plus a table of line start offsets.
 *
 * Recognized syntax per physical line:
 * - `# ...`              comment (scanned for KEY=value when include_comments)
 * - `export KEY=value`   exported entry
 * - `KEY='literal'`      single-quoted, no escapes, may span lines
 * - `KEY="text\n"`       double-quoted, \" \\ \n \r \t resolved, may span lines
 * - `KEY=value # note`   unquoted, inline comment needs a blank before '#'
 *
 * A quote that is never closed takes the rest of the input as its value.
 *
 * Thread-safety: stateless, safe for concurrent use
 */
class EdfParser {
public:
    /**
     * @brief Parse a raw buffer
     * @param data Buffer start (nullptr = EMPTY_OR_NULL_INPUT)
     * @param len Buffer length in bytes
     * @return Entries and line offsets, or a single error
     */
    [[nodiscard]] static Result<ParseOutput> parse(
        const char* data,
        size_t len,
        const ParseOptions& options = {});

    /**
     * @brief Parse text; a view is always a present buffer, even when empty
     */
    [[nodiscard]] static Result<ParseOutput> parse(
        std::string_view content,
        const ParseOptions& options = {});

    /**
     * @brief Convert a byte offset to (1-based line, 0-based column)
     * @param line_offsets Offsets table produced by parse()
     */
    [[nodiscard]] static Position offset_to_position(
        const std::vector<size_t>& line_offsets,
        size_t offset);
};

} // namespace shelter
