#include "core/masking.hpp"
#include "core/utils.hpp"

#include <vector>

namespace shelter {

namespace {

/**
 * @brief Mask run length for a partial mask, or nullopt to fall back to full
 *
 * Compares without forming show_start + show_end first, so host-supplied
 * counts near SIZE_MAX cannot wrap.
 */
std::optional<size_t> masked_middle(
    size_t char_count,
    size_t show_start,
    size_t show_end,
    size_t min_mask,
    std::optional<size_t> output_len) {

    // Too short to show both ends without overlap
    if (show_start >= char_count || show_end >= char_count - show_start) {
        return std::nullopt;
    }
    const size_t shown = show_start + show_end;     // < char_count
    const size_t target = output_len.value_or(char_count);
    const size_t middle = target > shown ? target - shown : 0;
    if (middle < min_mask) {
        return std::nullopt;
    }
    return middle;
}

} // anonymous namespace

std::string MaskingEngine::mask_full(
    std::string_view value,
    char mask_char,
    std::optional<size_t> output_len) {

    return std::string(output_len.value_or(value.size()), mask_char);
}

std::string MaskingEngine::mask_fixed(
    std::string_view /*value*/,
    char mask_char,
    size_t length) {

    return std::string(length, mask_char);
}

bool MaskingEngine::partial_applies(
    std::string_view value,
    size_t show_start,
    size_t show_end,
    size_t min_mask,
    std::optional<size_t> output_len) {

    const size_t char_count = utils::utf8_boundaries(value).size() - 1;
    return masked_middle(char_count, show_start, show_end, min_mask, output_len).has_value();
}

std::string MaskingEngine::mask_partial(
    std::string_view value,
    char mask_char,
    size_t show_start,
    size_t show_end,
    size_t min_mask,
    std::optional<size_t> output_len) {

    // boundaries.back() == value.size(); char_count excludes that sentinel
    const std::vector<size_t> boundaries = utils::utf8_boundaries(value);
    const size_t char_count = boundaries.size() - 1;

    const auto masked = masked_middle(char_count, show_start, show_end, min_mask, output_len);
    if (!masked) {
        return mask_full(value, mask_char, output_len);
    }
    const size_t middle = *masked;

    const size_t prefix_bytes = boundaries[show_start];
    const size_t suffix_begin = boundaries[char_count - show_end];

    std::string result;
    result.reserve(prefix_bytes + middle + (value.size() - suffix_begin));
    result.append(value.data(), prefix_bytes);
    result.append(middle, mask_char);
    if (show_end > 0) {
        result.append(value.substr(suffix_begin));
    }
    return result;
}

std::string MaskingEngine::mask_value(
    std::string_view value,
    const MaskOptions& options) {

    const char mask_char = static_cast<char>(static_cast<uint8_t>(options.mask_char));
    const std::optional<size_t> output_len = options.mask_length > 0
        ? std::make_optional(options.mask_length)
        : std::nullopt;

    switch (options.mode) {
        case MaskMode::FULL:
            return mask_full(value, mask_char, output_len);

        case MaskMode::PARTIAL:
            return mask_partial(value, mask_char,
                                options.show_start, options.show_end,
                                options.min_mask, output_len);
    }
    return mask_full(value, mask_char, output_len);
}

std::string MaskingEngine::mask_with_mode(
    std::string_view value,
    MaskMode mode,
    char mask_char) {

    if (mode == MaskMode::PARTIAL) {
        return mask_partial(value, mask_char,
                            kDefaultShowStart, kDefaultShowEnd, kDefaultMinMask);
    }
    return mask_full(value, mask_char);
}

} // namespace shelter
