#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "policy/pattern_cache.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace shelter {

/**
 * @brief Mask computed for one entry, positioned for overlaying the source
 */
struct MaskedLine {
    size_t line_number = 0;
    size_t value_end_line = 0;
    std::string mask;
    size_t value_start = 0;
    size_t value_end = 0;
    QuoteType quote_type = QuoteType::NONE;
    std::string value;
    bool is_comment = false;
};

struct MaskSet {
    std::vector<MaskedLine> masks;              // All masks, sorted by line
    std::vector<MaskedLine> masks_to_apply;     // Masks computed by this call
    std::vector<size_t> line_offsets;
};

// Inclusive 1-based line range
struct LineRange {
    size_t min_line = 1;
    size_t max_line = 1;

    [[nodiscard]] bool contains(size_t line) const {
        return line >= min_line && line <= max_line;
    }
};

/**
 * @brief Parses EDF content and masks each value per the configured modes
 *
 * Entries whose mask equals their value (mode "none") are dropped.
 * Comment entries are dropped when skip_comments is set.
 *
 * Thread-safety: immutable after construction
 */
class MaskGenerator {
public:
    explicit MaskGenerator(MaskConfig config = MaskConfig::defaults());

    /**
     * @brief Mask every entry in content
     * @param source Path or name of the file the content came from (may be empty)
     */
    [[nodiscard]] Result<MaskSet> generate_masks(
        std::string_view content,
        std::string_view source = {}) const;

    /**
     * @brief Recompute masks only for entries starting inside range
     *
     * Cached masks outside the range are carried over; masks_to_apply holds
     * only the recomputed ones.
     */
    [[nodiscard]] Result<MaskSet> generate_masks_incremental(
        std::string_view content,
        std::string_view source,
        const LineRange& range,
        const std::vector<MaskedLine>& cached_masks) const;

    /**
     * @brief Apply a named mode to a single value (unknown names mask fully)
     */
    [[nodiscard]] std::string apply_mode(const std::string& mode_name, std::string_view value) const;

    [[nodiscard]] const MaskConfig& config() const { return config_; }
    [[nodiscard]] const PatternCache& patterns() const { return patterns_; }

private:
    std::string apply(const ModeConfig& mode, std::string_view value, size_t depth) const;

    Result<MaskSet> build(
        std::string_view content,
        std::string_view source,
        const LineRange* range) const;

    MaskConfig config_;
    PatternCache patterns_;
};

} // namespace shelter
