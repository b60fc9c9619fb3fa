#include <catch2/catch_test_macros.hpp>
#include "core/mask_generator.hpp"

#include <fstream>
#include <sstream>
#include <string>

using namespace shelter;

namespace {

std::string read_fixture(const std::string& name) {
    std::ifstream in(std::string(SHELTER_FIXTURES_DIR) + "/" + name, std::ios::binary);
    REQUIRE(in.good());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

MaskSet generate_ok(const MaskGenerator& gen, std::string_view content,
                    std::string_view source = {}) {
    auto result = gen.generate_masks(content, source);
    INFO(result.error_message());
    REQUIRE(result.is_ok());
    return std::move(result.value());
}

const MaskedLine* find_line(const std::vector<MaskedLine>& masks, size_t line) {
    for (const auto& m : masks) {
        if (m.line_number == line) return &m;
    }
    return nullptr;
}

} // namespace

// ============================================================================
// generate_masks
// ============================================================================

TEST_CASE("MaskGenerator: default config masks every value fully", "[mask_generator]") {
    const MaskGenerator gen;
    const std::string content = read_fixture("simple.env");
    const auto set = generate_ok(gen, content);

    // EMPTY_VALUE masks to itself and is dropped
    REQUIRE(set.masks.size() == 4);
    CHECK(set.masks.size() == set.masks_to_apply.size());

    for (const auto& m : set.masks) {
        INFO(m.value);
        CHECK(m.mask == std::string(m.value.size(), '*'));
        CHECK(m.value_end <= content.size());
        CHECK(m.value_start < m.value_end);
    }
    CHECK(set.line_offsets.front() == 0);
}

TEST_CASE("MaskGenerator: masks carry entry positions", "[mask_generator]") {
    const MaskGenerator gen;
    const std::string content = "A=plain\nB='quoted'\nC=\"multi\nline\"";
    const auto set = generate_ok(gen, content);
    REQUIRE(set.masks.size() == 3);

    CHECK(set.masks[0].line_number == 1);
    CHECK(set.masks[0].quote_type == QuoteType::NONE);
    CHECK(content.substr(set.masks[0].value_start,
                         set.masks[0].value_end - set.masks[0].value_start) == "plain");

    CHECK(set.masks[1].quote_type == QuoteType::SINGLE);
    CHECK(set.masks[1].mask == "******");

    CHECK(set.masks[2].line_number == 3);
    CHECK(set.masks[2].value_end_line == 4);
    CHECK(set.masks[2].value == "multi\nline");
    CHECK(set.line_offsets.size() == 4);
}

TEST_CASE("MaskGenerator: comment entries follow skip_comments", "[mask_generator]") {
    const std::string content = "#OLD_SECRET=hunter2\nNEW_SECRET=correct-horse";

    SECTION("skipped by default") {
        const MaskGenerator gen;
        const auto set = generate_ok(gen, content);
        REQUIRE(set.masks.size() == 1);
        CHECK(set.masks[0].line_number == 2);
        CHECK_FALSE(set.masks[0].is_comment);
    }

    SECTION("masked when skip_comments is off") {
        auto cfg = MaskConfig::defaults();
        cfg.skip_comments = false;
        const MaskGenerator gen(cfg);
        const auto set = generate_ok(gen, content);
        REQUIRE(set.masks.size() == 2);
        CHECK(set.masks[0].is_comment);
        CHECK(set.masks[0].mask == "*******");
    }
}

TEST_CASE("MaskGenerator: none mode drops the entry", "[mask_generator]") {
    auto cfg = MaskConfig::defaults();
    cfg.patterns = {{"DEBUG", "none"}};
    const MaskGenerator gen(cfg);

    const auto set = generate_ok(gen, "DEBUG=true\nTOKEN=abc123");
    REQUIRE(set.masks.size() == 1);
    CHECK(set.masks[0].value == "abc123");
}

TEST_CASE("MaskGenerator: source patterns use the file basename", "[mask_generator]") {
    auto cfg = MaskConfig::defaults();
    cfg.sources = {{".env.example", "none"}};
    const MaskGenerator gen(cfg);

    const std::string content = "API_KEY=placeholder";
    CHECK(generate_ok(gen, content, "/home/dev/project/.env.example").masks.empty());
    CHECK(generate_ok(gen, content, "/home/dev/project/.env").masks.size() == 1);
    CHECK(generate_ok(gen, content).masks.size() == 1);
}

TEST_CASE("MaskGenerator: partial mode and its fallback", "[mask_generator]") {
    auto cfg = MaskConfig::defaults();
    cfg.default_mode = "partial";

    SECTION("short values fall back to full") {
        const MaskGenerator gen(cfg);
        const auto set = generate_ok(gen, "A=short\nB=secretvalue");
        REQUIRE(set.masks.size() == 2);
        CHECK(set.masks[0].mask == "*****");
        CHECK(set.masks[1].mask == "sec*****lue");
    }

    SECTION("fallback to none leaves short values visible") {
        cfg.modes["partial"].fallback_mode = "none";
        const MaskGenerator gen(cfg);
        const auto set = generate_ok(gen, "A=short\nB=secretvalue");
        REQUIRE(set.masks.size() == 1);
        CHECK(set.masks[0].value == "secretvalue");
    }
}

TEST_CASE("MaskGenerator: fixed-length full mode", "[mask_generator]") {
    auto cfg = MaskConfig::defaults();
    ModeConfig fixed;
    fixed.name = "fixed8";
    fixed.type = ModeType::FULL;
    fixed.preserve_length = false;
    fixed.mask_length = 8;
    cfg.modes.emplace(fixed.name, fixed);
    cfg.default_mode = "fixed8";
    const MaskGenerator gen(cfg);

    const auto set = generate_ok(gen, "A=x\nB=a_much_longer_secret");
    REQUIRE(set.masks.size() == 2);
    CHECK(set.masks[0].mask == "********");
    CHECK(set.masks[1].mask == "********");
}

TEST_CASE("MaskGenerator: unknown mode name masks fully", "[mask_generator]") {
    auto cfg = MaskConfig::defaults();
    cfg.mask_char = '#';
    cfg.patterns = {{"TOKEN", "ghost"}};
    const MaskGenerator gen(cfg);

    const auto set = generate_ok(gen, "TOKEN=abc\nOTHER_TOKEN=def\nTOKEN=xyz1");
    REQUIRE(set.masks.size() == 3);
    CHECK(set.masks[0].mask == "###");
    CHECK(set.masks[2].mask == "####");
}

TEST_CASE("MaskGenerator: parse errors propagate", "[mask_generator]") {
    const MaskGenerator gen;
    const auto result = gen.generate_masks("KEY=\xFF");
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::INVALID_ENCODING);
}

TEST_CASE("MaskGenerator: empty content", "[mask_generator]") {
    const MaskGenerator gen;
    const auto set = generate_ok(gen, "");
    CHECK(set.masks.empty());
    CHECK(set.line_offsets == std::vector<size_t>{0});
}

TEST_CASE("MaskGenerator: apply_mode", "[mask_generator]") {
    const MaskGenerator gen;
    CHECK(gen.apply_mode("full", "secret") == "******");
    CHECK(gen.apply_mode("partial", "secretvalue") == "sec*****lue");
    CHECK(gen.apply_mode("none", "secret") == "secret");
    CHECK(gen.apply_mode("does_not_exist", "secret") == "******");
}

// ============================================================================
// generate_masks_incremental
// ============================================================================

TEST_CASE("MaskGenerator: incremental recomputes only the edited range", "[mask_generator][incremental]") {
    const MaskGenerator gen;
    const std::string before = "A=alpha1\nB=bravo22\nC=charlie\nD=delta44\n";
    const auto initial = generate_ok(gen, before);
    REQUIRE(initial.masks.size() == 4);

    const std::string after = "A=alpha1\nB=bravo22\nC=changed_value_x\nD=delta44\n";
    const auto result = gen.generate_masks_incremental(after, {}, LineRange{3, 3}, initial.masks);
    REQUIRE(result.is_ok());
    const auto& set = result.value();

    REQUIRE(set.masks_to_apply.size() == 1);
    CHECK(set.masks_to_apply[0].line_number == 3);
    CHECK(set.masks_to_apply[0].mask == std::string(15, '*'));

    REQUIRE(set.masks.size() == 4);
    for (size_t i = 0; i < set.masks.size(); ++i) {
        CHECK(set.masks[i].line_number == i + 1);
    }
    CHECK(set.masks[2].value == "changed_value_x");
    CHECK(set.masks[0].mask == initial.masks[0].mask);
    CHECK(set.line_offsets.size() == 5);
}

TEST_CASE("MaskGenerator: incremental drops masks removed from the range", "[mask_generator][incremental]") {
    const MaskGenerator gen;
    const auto initial = generate_ok(gen, "A=alpha1\nB=bravo22\nC=charlie\nD=delta44");

    const std::string after = "A=alpha1\nB=bravo22\n# gone\nD=delta44";
    const auto result = gen.generate_masks_incremental(after, {}, LineRange{3, 3}, initial.masks);
    REQUIRE(result.is_ok());
    const auto& set = result.value();

    CHECK(set.masks_to_apply.empty());
    REQUIRE(set.masks.size() == 3);
    CHECK(find_line(set.masks, 3) == nullptr);
    CHECK(find_line(set.masks, 4) != nullptr);
}

TEST_CASE("MaskGenerator: incremental over the whole file matches a full pass", "[mask_generator][incremental]") {
    const MaskGenerator gen;
    const std::string content = read_fixture("multiline.env");
    const auto full = generate_ok(gen, content);

    const auto result = gen.generate_masks_incremental(content, {}, LineRange{1, 100}, {});
    REQUIRE(result.is_ok());
    const auto& set = result.value();
    REQUIRE(set.masks.size() == full.masks.size());
    for (size_t i = 0; i < set.masks.size(); ++i) {
        CHECK(set.masks[i].line_number == full.masks[i].line_number);
        CHECK(set.masks[i].mask == full.masks[i].mask);
    }
}

TEST_CASE("MaskGenerator: incremental propagates parse errors", "[mask_generator][incremental]") {
    const MaskGenerator gen;
    const auto result = gen.generate_masks_incremental("A=\xC0\xAF", {}, LineRange{1, 1}, {});
    CHECK(result.is_error());
}
