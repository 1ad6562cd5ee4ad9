#include <gtest/gtest.h>
#include "protocols/shell/Parser.hpp"
#include "protocols/shell/Token.hpp"
#include "protocols/shell/util/argsHelpers.hpp"

#include <string>
#include <vector>

using namespace nf::shell;
using nf::fs::SortMode;

static CommandCall parse(const std::vector<std::string>& args) {
    std::vector<std::string> argv{"newestfiles"};
    argv.insert(argv.end(), args.begin(), args.end());
    return parseTokens(tokenize(argv));
}

TEST(TokenizerTest, ProgramNameIsAlwaysAWord) {
    const auto toks = tokenize(std::vector<std::string>{"-weird-name", "-j"});
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[0].type, TokenType::Word);
    EXPECT_EQ(toks[0].text, "-weird-name");
    EXPECT_EQ(toks[1].type, TokenType::Flag);
    EXPECT_EQ(toks[1].text, "j");
}

TEST(TokenizerTest, ExpandsShortBundles) {
    const auto toks = tokenize(std::vector<std::string>{"nf", "-jl"});
    EXPECT_EQ(to_string(toks), "Word(nf) Flag(j) Flag(l)");
}

TEST(TokenizerTest, LongFlagsAndSentinel) {
    const auto toks = tokenize(std::vector<std::string>{"nf", "--json", "--", "-md", "--oldest"});
    EXPECT_EQ(to_string(toks), "Word(nf) Flag(json) Word(--) Word(-md) Word(--oldest)");
}

TEST(TokenizerTest, FlagsKeepTheirTypedSpelling) {
    const auto toks = tokenize(std::vector<std::string>{"nf", "--x", "-ab"});
    ASSERT_EQ(toks.size(), 4u);
    EXPECT_EQ(toks[1].text, "x");
    EXPECT_EQ(toks[1].spelled, "--x");
    EXPECT_EQ(toks[2].spelled, "-a");
    EXPECT_EQ(toks[3].spelled, "-b");
}

TEST(TokenizerTest, LoneDashIsAWord) {
    const auto toks = tokenize(std::vector<std::string>{"nf", "-"});
    EXPECT_EQ(to_string(toks), "Word(nf) Word(-)");
}

TEST(ParserTest, FlagsAndExtensionsInAnyOrder) {
    const auto call = parse({".go", "-j", "txt", "-o"});
    EXPECT_EQ(call.name, "newestfiles");
    EXPECT_EQ(call.positionals, (std::vector<std::string>{".go", "txt"}));
    EXPECT_TRUE(hasFlag(call, "j"));
    EXPECT_TRUE(hasFlag(call, "o"));
    EXPECT_FALSE(hasFlag(call, "l"));
}

TEST(ParserTest, FlagsNeverConsumeFollowingWord) {
    const auto call = parse({"-j", "go"});
    EXPECT_TRUE(hasFlag(call, "j"));
    EXPECT_EQ(call.positionals, std::vector<std::string>{"go"});
}

TEST(ParserTest, RepeatedFlagIsStoredOnce) {
    const auto call = parse({"-o", "-o"});
    EXPECT_EQ(call.options.size(), 1u);
}

TEST(ParserTest, EverythingAfterSentinelIsPositional) {
    const auto call = parse({"-j", "--", "-l", "go"});
    EXPECT_TRUE(hasFlag(call, "j"));
    EXPECT_FALSE(hasFlag(call, "l"));
    EXPECT_EQ(call.positionals, (std::vector<std::string>{"-l", "go"}));
}

TEST(SortModeParseTest, DefaultsToNewest) {
    const auto r = parseSortMode(parse({"go"}));
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.value, SortMode::Newest);
}

TEST(SortModeParseTest, EachFlagSelectsItsMode) {
    EXPECT_EQ(parseSortMode(parse({"-o"})).value, SortMode::Oldest);
    EXPECT_EQ(parseSortMode(parse({"-l"})).value, SortMode::Largest);
    EXPECT_EQ(parseSortMode(parse({"-s"})).value, SortMode::Smallest);
    EXPECT_EQ(parseSortMode(parse({"--largest"})).value, SortMode::Largest);
}

TEST(SortModeParseTest, RejectsMoreThanOneSortFlag) {
    for (const auto& args : std::vector<std::vector<std::string>>{
             {"-o", "-l"}, {"-l", "-s"}, {"-o", "-s"}, {"-ols"}, {"-o", "--smallest"}}) {
        const auto r = parseSortMode(parse(args));
        EXPECT_FALSE(r.ok);
        EXPECT_NE(r.error.find("Only one sort option"), std::string::npos);
    }
}

TEST(SortModeParseTest, SameFlagTwiceIsNotAConflict) {
    const auto r = parseSortMode(parse({"-l", "-l"}));
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.value, SortMode::Largest);
}

TEST(ArgsHelpersTest, FirstUnknownFlagRendersDashes) {
    const std::vector<std::string> known{"j", "json"};
    EXPECT_FALSE(firstUnknownFlag(parse({"-j", "--json"}), known).has_value());
    EXPECT_EQ(firstUnknownFlag(parse({"-j", "-x"}), known), "-x");
    EXPECT_EQ(firstUnknownFlag(parse({"--verbose"}), known), "--verbose");
}

TEST(ArgsHelpersTest, FirstUnknownFlagKeepsLongFormOfSingleLetter) {
    const std::vector<std::string> known{"j", "json"};
    EXPECT_EQ(firstUnknownFlag(parse({"--x"}), known), "--x");
    EXPECT_EQ(firstUnknownFlag(parse({"-jq"}), known), "-q");
}
