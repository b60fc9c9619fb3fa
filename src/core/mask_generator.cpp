#include "core/mask_generator.hpp"
#include "core/masking.hpp"
#include "core/utils.hpp"
#include "parser/edf_parser.hpp"

#include <algorithm>
#include <format>
#include <unordered_map>
#include <unordered_set>

namespace shelter {

MaskGenerator::MaskGenerator(MaskConfig config)
    : config_(std::move(config)),
      patterns_(config_) {}

std::string MaskGenerator::apply(
    const ModeConfig& mode, std::string_view value, size_t depth) const {

    switch (mode.type) {
        case ModeType::NONE:
            return std::string(value);

        case ModeType::FULL:
            return MaskingEngine::mask_full(
                value, mode.mask_char,
                mode.preserve_length ? std::nullopt : std::make_optional(mode.mask_length));

        case ModeType::PARTIAL: {
            if (MaskingEngine::partial_applies(value, mode.show_start, mode.show_end, mode.min_mask)) {
                return MaskingEngine::mask_partial(
                    value, mode.mask_char, mode.show_start, mode.show_end, mode.min_mask);
            }
            // Fallback chains are bounded by the number of modes
            const auto* fallback = config_.find_mode(mode.fallback_mode);
            if (fallback && fallback != &mode && depth < config_.modes.size()) {
                return apply(*fallback, value, depth + 1);
            }
            return MaskingEngine::mask_full(value, mode.mask_char);
        }
    }
    return MaskingEngine::mask_full(value, mode.mask_char);
}

std::string MaskGenerator::apply_mode(const std::string& mode_name, std::string_view value) const {
    if (const auto* mode = config_.find_mode(mode_name)) {
        return apply(*mode, value, 0);
    }
    return MaskingEngine::mask_full(value, config_.mask_char);
}

Result<MaskSet> MaskGenerator::build(
    std::string_view content,
    std::string_view source,
    const LineRange* range) const {

    ParseOptions options;
    options.include_comments = true;
    options.track_positions = true;

    auto parsed = EdfParser::parse(content, options);
    if (parsed.is_error()) {
        return Result<MaskSet>::error(parsed.error_category(), parsed.error_message());
    }
    auto& output = parsed.value();

    const std::string_view source_basename = utils::basename(source);

    // Per-call memo: key -> mode (nullptr = unknown mode name)
    std::unordered_map<std::string, const ModeConfig*> mode_memo;
    std::unordered_set<std::string> warned;

    MaskSet result;
    for (auto& entry : output.entries) {
        if (entry.is_comment && config_.skip_comments) continue;
        if (range && !range->contains(entry.line_number)) continue;

        auto memo_it = mode_memo.find(entry.key);
        if (memo_it == mode_memo.end()) {
            const std::string& mode_name = patterns_.determine_mode(entry.key, source_basename);
            const ModeConfig* mode = config_.find_mode(mode_name);
            if (!mode && warned.insert(mode_name).second) {
                utils::log::warn(std::format(
                    "Unknown masking mode \"{}\", masking fully", mode_name));
            }
            memo_it = mode_memo.emplace(entry.key, mode).first;
        }

        std::string mask = memo_it->second
            ? apply(*memo_it->second, entry.value, 0)
            : MaskingEngine::mask_full(entry.value, config_.mask_char);

        if (mask == entry.value) continue;

        MaskedLine line;
        line.line_number = entry.line_number;
        line.value_end_line = entry.value_end_line;
        line.mask = std::move(mask);
        line.value_start = entry.value_start;
        line.value_end = entry.value_end;
        line.quote_type = entry.quote_type;
        line.value = std::move(entry.value);
        line.is_comment = entry.is_comment;
        result.masks_to_apply.push_back(std::move(line));
    }

    result.line_offsets = std::move(output.line_offsets);
    return Result<MaskSet>::ok(std::move(result));
}

Result<MaskSet> MaskGenerator::generate_masks(
    std::string_view content,
    std::string_view source) const {

    auto built = build(content, source, nullptr);
    if (built.is_ok()) {
        auto& set = built.value();
        set.masks = set.masks_to_apply;
    }
    return built;
}

Result<MaskSet> MaskGenerator::generate_masks_incremental(
    std::string_view content,
    std::string_view source,
    const LineRange& range,
    const std::vector<MaskedLine>& cached_masks) const {

    auto built = build(content, source, &range);
    if (built.is_error()) return built;

    auto& set = built.value();
    set.masks.reserve(cached_masks.size() + set.masks_to_apply.size());
    for (const auto& cached : cached_masks) {
        if (!range.contains(cached.line_number)) {
            set.masks.push_back(cached);
        }
    }
    set.masks.insert(set.masks.end(), set.masks_to_apply.begin(), set.masks_to_apply.end());

    std::stable_sort(set.masks.begin(), set.masks.end(),
        [](const MaskedLine& a, const MaskedLine& b) {
            return a.line_number < b.line_number;
        });
    return built;
}

} // namespace shelter
