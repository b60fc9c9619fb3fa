#pragma once

#include <cstddef>
#include <cstdint>

// C ABI for host plugins (LuaJIT FFI, dlopen/dlsym).
//
// Ownership: every ShelterResult* and char* returned here is owned by the
// caller and must be released exactly once with the matching free function.
// Releasing twice, or with the wrong function, is undefined behavior and is
// not detected. Passing nullptr to a free function is a no-op.

extern "C" {

// One parsed key/value entry. key/value are NUL-terminated; *_len exclude the NUL.
struct ShelterEntry {
    char* key;
    size_t key_len;
    char* value;
    size_t value_len;
    size_t key_start;
    size_t key_end;
    size_t value_start;
    size_t value_end;
    size_t line_number;
    size_t value_end_line;
    uint8_t quote_type;     // 0 = none, 1 = single, 2 = double
    uint8_t is_exported;
    uint8_t is_comment;
};

// Parse result. On failure error is set and entries/line_offsets are null.
struct ShelterResult {
    ShelterEntry* entries;
    size_t count;
    size_t* line_offsets;
    size_t line_count;
    char* error;
};

struct ShelterParseOptions {
    uint8_t include_comments;
    uint8_t track_positions;
};

struct ShelterMaskOptions {
    int8_t mask_char;
    size_t mask_length;     // 0 = derive from input
    uint8_t mode;           // 0 = full, 1 = partial (other values: full)
    size_t show_start;
    size_t show_end;
    size_t min_mask;
};

// Parsing. Returns null only when memory is exhausted.
ShelterResult* shelter_parse(const char* input, size_t input_len, ShelterParseOptions options);
void shelter_free_result(ShelterResult* result);

// Masking. Return null for a null input pointer or non-UTF-8 input.
char* shelter_mask_full(const char* input, size_t input_len, char mask_char);
char* shelter_mask_partial(const char* input, size_t input_len, char mask_char,
                           size_t show_start, size_t show_end, size_t min_mask);
char* shelter_mask_fixed(const char* input, size_t input_len, char mask_char, size_t output_len);
char* shelter_mask_value(const char* input, size_t input_len, ShelterMaskOptions options);
void shelter_free_string(char* str);

// Library-owned; never freed by the caller.
const char* shelter_version(void);

} // extern "C"
