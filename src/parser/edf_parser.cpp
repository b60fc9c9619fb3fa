#include "parser/edf_parser.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <iterator>
#include <string>

namespace shelter {

namespace {

constexpr std::string_view kExportPrefix = "export";
constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

[[nodiscard]] inline bool is_key_char(char c) noexcept {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_' || c == '.' || c == '-';
}

/**
 * @brief Single-pass cursor over the input
 *
 * line_ always holds the 1-based number of the line containing the byte
 * being scanned. Every '\n' crossed goes through newline_at() so the offsets
 * table and the counter cannot drift apart.
 */
class Scanner {
public:
    Scanner(std::string_view input, const ParseOptions& options, ParseOutput& out)
        : input_(input), options_(options), out_(out) {}

    void run() {
        out_.line_offsets.push_back(0);

        size_t pos = input_.starts_with(kUtf8Bom) ? kUtf8Bom.size() : 0;
        while (pos < input_.size()) {
            const size_t end = scan_line(pos);
            if (end >= input_.size()) break;
            newline_at(end);
            pos = end + 1;
        }
    }

private:
    void newline_at(size_t newline_pos) {
        out_.line_offsets.push_back(newline_pos + 1);
        ++line_;
    }

    [[nodiscard]] size_t line_end(size_t pos) const {
        const auto end = input_.find('\n', pos);
        return end == std::string_view::npos ? input_.size() : end;
    }

    [[nodiscard]] size_t skip_blanks(size_t pos, size_t limit) const {
        while (pos < limit && utils::is_blank(input_[pos])) ++pos;
        return pos;
    }

    /**
     * @return Offset of the '\n' (or input end) terminating the last line
     *         this logical line consumed
     */
    size_t scan_line(size_t pos) {
        const size_t eol = line_end(pos);
        const size_t p = skip_blanks(pos, eol);

        if (p < eol && input_[p] == '#') {
            if (options_.include_comments) {
                scan_assignment(skip_blanks(p + 1, eol), eol, true);
            }
            return eol;
        }
        return scan_assignment(p, eol, false);
    }

    size_t scan_assignment(size_t p, size_t eol, bool is_comment) {
        const size_t entry_line = line_;
        bool exported = false;

        const std::string_view rest = input_.substr(p, eol - p);
        if (rest.starts_with(kExportPrefix) && rest.size() > kExportPrefix.size()
            && utils::is_blank(rest[kExportPrefix.size()])) {
            const size_t q = skip_blanks(p + kExportPrefix.size(), eol);
            if (q < eol && is_key_char(input_[q])) {
                exported = true;
                p = q;
            }
        }

        const size_t key_start = p;
        while (p < eol && is_key_char(input_[p])) ++p;
        const size_t key_end = p;
        if (key_end == key_start) return eol;

        p = skip_blanks(p, eol);
        if (p >= eol || input_[p] != '=') return eol;
        p = skip_blanks(p + 1, eol);

        Entry entry;
        entry.key = std::string(input_.substr(key_start, key_end - key_start));
        entry.is_exported = exported;
        entry.is_comment = is_comment;
        entry.key_start = key_start;
        entry.key_end = key_end;
        entry.line_number = entry_line;

        size_t resume = eol;
        if (p < eol && (input_[p] == '"' || input_[p] == '\'')) {
            resume = scan_quoted(entry, p, is_comment ? eol : input_.size());
        } else {
            scan_unquoted(entry, p, eol);
        }
        entry.value_end_line = line_;

        if (!options_.track_positions) {
            entry.key_start = entry.key_end = 0;
            entry.value_start = entry.value_end = 0;
            entry.line_number = entry.value_end_line = 0;
        }
        out_.entries.push_back(std::move(entry));
        return resume;
    }

    // Quoted value starting at the opening quote; never reads past limit
    size_t scan_quoted(Entry& entry, size_t open, size_t limit) {
        const char quote = input_[open];
        const bool escapes = (quote == '"');
        entry.quote_type = escapes ? QuoteType::DOUBLE : QuoteType::SINGLE;
        entry.value_start = open;

        std::string value;
        size_t i = open + 1;
        bool closed = false;

        while (i < limit) {
            const char c = input_[i];
            if (c == quote) {
                closed = true;
                break;
            }
            if (escapes && c == '\\' && i + 1 < limit) {
                const char next = input_[i + 1];
                char decoded = 0;
                switch (next) {
                    case '"':  decoded = '"';  break;
                    case '\\': decoded = '\\'; break;
                    case 'n':  decoded = '\n'; break;
                    case 'r':  decoded = '\r'; break;
                    case 't':  decoded = '\t'; break;
                    default:   break;
                }
                if (decoded != 0) {
                    value += decoded;
                    i += 2;
                    continue;
                }
                // Unknown escape: keep the backslash, rescan next normally
                value += c;
                ++i;
                continue;
            }
            if (c == '\n') {
                newline_at(i);
            }
            value += c;
            ++i;
        }

        entry.value = std::move(value);
        if (closed) {
            entry.value_end = i + 1;
            return line_end(i + 1);
        }
        // Unterminated: synthetic close at the limit
        entry.value_end = limit;
        return limit;
    }

    void scan_unquoted(Entry& entry, size_t start, size_t eol) {
        size_t stop = start;
        while (stop < eol) {
            if (input_[stop] == '#' && stop > 0 && utils::is_blank(input_[stop - 1])) break;
            ++stop;
        }
        const std::string_view raw = utils::trim_right(input_.substr(start, stop - start));

        entry.quote_type = QuoteType::NONE;
        entry.value = std::string(raw);
        entry.value_start = start;
        entry.value_end = start + raw.size();
    }

    std::string_view input_;
    const ParseOptions& options_;
    ParseOutput& out_;
    size_t line_ = 1;
};

} // anonymous namespace

Result<ParseOutput> EdfParser::parse(
    const char* data,
    size_t len,
    const ParseOptions& options) {

    if (data == nullptr) {
        return Result<ParseOutput>::error(
            ErrorCategory::EMPTY_OR_NULL_INPUT, "input buffer is null");
    }

    const std::string_view input(data, len);
    if (const auto bad = utils::find_invalid_utf8(input)) {
        return Result<ParseOutput>::error(
            ErrorCategory::INVALID_ENCODING,
            std::format("invalid UTF-8 sequence at byte {}", *bad));
    }

    ParseOutput out;
    Scanner scanner(input, options, out);
    scanner.run();
    return Result<ParseOutput>::ok(std::move(out));
}

Result<ParseOutput> EdfParser::parse(
    std::string_view content,
    const ParseOptions& options) {

    // A default-constructed view has a null data(); it is still a present buffer
    const char* data = content.data() != nullptr ? content.data() : "";
    return parse(data, content.size(), options);
}

Position EdfParser::offset_to_position(
    const std::vector<size_t>& line_offsets,
    size_t offset) {

    if (line_offsets.empty()) {
        return {1, offset};
    }
    const auto it = std::upper_bound(line_offsets.begin(), line_offsets.end(), offset);
    const auto index = static_cast<size_t>(std::distance(line_offsets.begin(), it)) - 1;
    return {index + 1, offset - line_offsets[index]};
}

} // namespace shelter
