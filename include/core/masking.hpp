#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace shelter {

/**
 * @brief Value masking primitives
 *
 * - FULL:    every byte replaced ("secret" -> "******")
 * - FIXED:   constant-length mask, input content ignored
 * - PARTIAL: keep a prefix and suffix, mask the middle ("sec*****lue")
 *
 * All functions are pure and thread-safe.
 */
class MaskingEngine {
public:
    // Defaults used by mask_with_mode() for PARTIAL
    static constexpr size_t kDefaultShowStart = 3;
    static constexpr size_t kDefaultShowEnd = 3;
    static constexpr size_t kDefaultMinMask = 3;

    /**
     * @brief Mask every byte
     * @param output_len Result length; nullopt = byte length of value
     */
    [[nodiscard]] static std::string mask_full(
        std::string_view value,
        char mask_char,
        std::optional<size_t> output_len = std::nullopt);

    /**
     * @brief Exactly `length` mask characters, regardless of value
     */
    [[nodiscard]] static std::string mask_fixed(
        std::string_view value,
        char mask_char,
        size_t length);

    /**
     * @brief Show the first show_start and last show_end characters
     *
     * Counts UTF-8 characters, not bytes. Falls back to mask_full() when the
     * value has at most show_start + show_end characters, or when fewer than
     * min_mask characters would be masked. output_len, when given, stretches
     * or shrinks only the masked middle.
     */
    [[nodiscard]] static std::string mask_partial(
        std::string_view value,
        char mask_char,
        size_t show_start,
        size_t show_end,
        size_t min_mask,
        std::optional<size_t> output_len = std::nullopt);

    /**
     * @brief Whether mask_partial() would keep prefix/suffix rather than fall back
     */
    [[nodiscard]] static bool partial_applies(
        std::string_view value,
        size_t show_start,
        size_t show_end,
        size_t min_mask,
        std::optional<size_t> output_len = std::nullopt);

    /**
     * @brief Dispatch on options.mode
     *
     * mask_length > 0 fixes the output length. mask_char is the low byte of
     * the signed code.
     */
    [[nodiscard]] static std::string mask_value(
        std::string_view value,
        const MaskOptions& options);

    /**
     * @brief FULL, or PARTIAL with 3/3/3 defaults
     */
    [[nodiscard]] static std::string mask_with_mode(
        std::string_view value,
        MaskMode mode,
        char mask_char);
};

} // namespace shelter
