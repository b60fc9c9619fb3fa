#include "ffi/shelter_ffi.hpp"
#include "core/masking.hpp"
#include "core/utils.hpp"
#include "parser/edf_parser.hpp"

#include <cstring>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#ifndef SHELTER_VERSION
#define SHELTER_VERSION "0.0.0"
#endif

namespace {

using namespace shelter;

char* copy_string(std::string_view s) {
    auto* out = new char[s.size() + 1];
    std::memcpy(out, s.data(), s.size());
    out[s.size()] = '\0';
    return out;
}

// nullopt = invalid boundary input
std::optional<std::string_view> boundary_text(const char* input, size_t input_len) {
    if (input == nullptr) return std::nullopt;
    const std::string_view text(input, input_len);
    if (utils::find_invalid_utf8(text)) return std::nullopt;
    return text;
}

struct ResultDeleter {
    void operator()(ShelterResult* r) const { shelter_free_result(r); }
};
using ResultPtr = std::unique_ptr<ShelterResult, ResultDeleter>;

ResultPtr new_result() {
    return ResultPtr(new ShelterResult{nullptr, 0, nullptr, 0, nullptr});
}

ShelterResult* error_result(std::string_view message) {
    auto result = new_result();
    result->error = copy_string(message);
    return result.release();
}

ShelterResult* build_result(const ParseOutput& output) {
    auto result = new_result();

    // count is set before filling so a throw mid-way frees what was copied
    if (!output.entries.empty()) {
        result->entries = new ShelterEntry[output.entries.size()]();
        result->count = output.entries.size();
    }
    for (size_t i = 0; i < output.entries.size(); ++i) {
        const Entry& src = output.entries[i];
        ShelterEntry& dst = result->entries[i];
        dst.key = copy_string(src.key);
        dst.key_len = src.key.size();
        dst.value = copy_string(src.value);
        dst.value_len = src.value.size();
        dst.key_start = src.key_start;
        dst.key_end = src.key_end;
        dst.value_start = src.value_start;
        dst.value_end = src.value_end;
        dst.line_number = src.line_number;
        dst.value_end_line = src.value_end_line;
        dst.quote_type = to_code(src.quote_type);
        dst.is_exported = src.is_exported ? 1 : 0;
        dst.is_comment = src.is_comment ? 1 : 0;
    }

    result->line_offsets = new size_t[output.line_offsets.size()];
    result->line_count = output.line_offsets.size();
    std::memcpy(result->line_offsets, output.line_offsets.data(),
                output.line_offsets.size() * sizeof(size_t));

    return result.release();
}

template<typename MaskFn>
char* mask_boundary(const char* fn_name, const char* input, size_t input_len, MaskFn&& fn) {
    const auto text = boundary_text(input, input_len);
    if (!text) return nullptr;
    try {
        return copy_string(fn(*text));
    } catch (const std::exception& e) {
        utils::log::error(std::format("{} failed: {}", fn_name, e.what()));
        return nullptr;
    }
}

} // anonymous namespace

extern "C" {

ShelterResult* shelter_parse(const char* input, size_t input_len, ShelterParseOptions options) {
    try {
        ParseOptions opts;
        opts.include_comments = options.include_comments != 0;
        opts.track_positions = options.track_positions != 0;

        const auto parsed = EdfParser::parse(input, input_len, opts);
        if (parsed.is_error()) {
            return error_result(std::format("{}: {}",
                error_category_name(parsed.error_category()), parsed.error_message()));
        }
        return build_result(parsed.value());
    } catch (const std::exception& e) {
        utils::log::error(std::format("shelter_parse failed: {}", e.what()));
        try {
            return error_result(std::format("{}: {}",
                error_category_name(ErrorCategory::INTERNAL_ERROR), e.what()));
        } catch (const std::exception& inner) {
            // Out of memory even for the message
            utils::log::error(std::format("shelter_parse error result failed: {}", inner.what()));
            return nullptr;
        }
    }
}

void shelter_free_result(ShelterResult* result) {
    if (result == nullptr) return;
    for (size_t i = 0; i < result->count; ++i) {
        delete[] result->entries[i].key;
        delete[] result->entries[i].value;
    }
    delete[] result->entries;
    delete[] result->line_offsets;
    delete[] result->error;
    delete result;
}

char* shelter_mask_full(const char* input, size_t input_len, char mask_char) {
    return mask_boundary("shelter_mask_full", input, input_len, [&](std::string_view v) {
        return MaskingEngine::mask_full(v, mask_char);
    });
}

char* shelter_mask_partial(const char* input, size_t input_len, char mask_char,
                           size_t show_start, size_t show_end, size_t min_mask) {
    return mask_boundary("shelter_mask_partial", input, input_len, [&](std::string_view v) {
        return MaskingEngine::mask_partial(v, mask_char, show_start, show_end, min_mask);
    });
}

char* shelter_mask_fixed(const char* input, size_t input_len, char mask_char, size_t output_len) {
    return mask_boundary("shelter_mask_fixed", input, input_len, [&](std::string_view v) {
        return MaskingEngine::mask_fixed(v, mask_char, output_len);
    });
}

char* shelter_mask_value(const char* input, size_t input_len, ShelterMaskOptions options) {
    MaskOptions opts;
    opts.mask_char = options.mask_char;
    opts.mask_length = options.mask_length;
    opts.mode = mask_mode_from_code(options.mode);
    opts.show_start = options.show_start;
    opts.show_end = options.show_end;
    opts.min_mask = options.min_mask;

    return mask_boundary("shelter_mask_value", input, input_len, [&](std::string_view v) {
        return MaskingEngine::mask_value(v, opts);
    });
}

void shelter_free_string(char* str) {
    delete[] str;
}

const char* shelter_version(void) {
    return SHELTER_VERSION;
}

} // extern "C"
