#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "scribe/cli_config.hpp"
#include "scribe/params.hpp"

using scribe::CliConfig;
using scribe::CliConfigValidator;
using scribe::CliOption;
using scribe::CliParser;
using scribe::ErrorCode;
using scribe::ParamResolver;
using scribe::ParamType;
using scribe::ParamValue;

namespace {

const CliOption* findOption(const std::vector<CliOption>& options, const std::string& flag) {
    auto it = std::find_if(options.begin(), options.end(),
        [&](const CliOption& o) { return o.flag == flag; });
    return it == options.end() ? nullptr : &*it;
}

const std::optional<ParamValue>* argValue(const CliConfig& config, const std::string& name) {
    for (const auto& arg : config.engine_args) {
        if (arg.name == name) {
            return &arg.value;
        }
    }
    return nullptr;
}

}  // namespace

class CliParserTest : public ::testing::Test {
protected:
    CliParser parser;
    CliConfig config;

    scribe::ErrorInfo parse(const std::vector<std::string>& args) {
        config = CliConfig();
        return parser.parse(args, config);
    }
};

// ==== Option derivation (选项推导) ====

TEST(CliOptionsTest, DerivesFlagsFromSchemaAndMapping) {
    CliParser parser;
    const auto& options = parser.engineOptions();

    // mapped flat names use the external name
    const CliOption* threads = findOption(options, "--threads");
    ASSERT_NE(threads, nullptr);
    EXPECT_EQ(threads->dest, "threads");
    EXPECT_FALSE(threads->default_value.has_value());
    EXPECT_EQ(findOption(options, "--n-threads"), nullptr);

    // unmapped names keep the canonical name with hyphens
    const CliOption* ctx = findOption(options, "--n-max-text-ctx");
    ASSERT_NE(ctx, nullptr);
    EXPECT_EQ(*ctx->default_value, ParamValue(16384));

    // group fields only when mapped, help is the dotted path
    const CliOption* beam = findOption(options, "--beam-size");
    ASSERT_NE(beam, nullptr);
    EXPECT_EQ(beam->help, "beam_search.beam_size");
    EXPECT_EQ(beam->type, ParamType::INT);
    EXPECT_EQ(findOption(options, "--greedy"), nullptr);
    EXPECT_EQ(findOption(options, "--beam-search"), nullptr);
    EXPECT_NE(findOption(options, "--beam-patience"), nullptr);
    EXPECT_NE(findOption(options, "--best-of"), nullptr);
}

// ==== Parsing (解析) ====

TEST_F(CliParserTest, AppliesBuiltinDefaults) {
    ASSERT_TRUE(parse({"a.wav"}).isOk());

    EXPECT_EQ(config.media_files, std::vector<std::string>({"a.wav"}));
    EXPECT_EQ(config.model, "tiny");
    EXPECT_EQ(config.processors, 1);
    EXPECT_FALSE(config.outputs.any());
    EXPECT_EQ(config.engine_args.size(), parser.engineOptions().size());
    EXPECT_EQ(**argValue(config, "print_progress"), ParamValue(true));
}

TEST_F(CliParserTest, ParsesShortAndLongSpellings) {
    ASSERT_TRUE(parse({"-m", "base.en", "--processors=2", "-otxt", "--output-srt",
        "a.wav", "b.wav"}).isOk());

    EXPECT_EQ(config.model, "base.en");
    EXPECT_EQ(config.processors, 2);
    EXPECT_TRUE(config.outputs.txt);
    EXPECT_TRUE(config.outputs.srt);
    EXPECT_FALSE(config.outputs.vtt);
    EXPECT_FALSE(config.outputs.csv);
    EXPECT_EQ(config.media_files.size(), 2u);
}

TEST_F(CliParserTest, ParsesTypedEngineOptions) {
    ASSERT_TRUE(parse({"--beam-size", "5", "--temperature=0.3", "--language", "de",
        "--offset-ms", "-100", "a.wav"}).isOk());

    EXPECT_EQ(**argValue(config, "beam_size"), ParamValue(5));
    EXPECT_FLOAT_EQ(scribe::paramAsFloat(**argValue(config, "temperature")), 0.3f);
    EXPECT_EQ(**argValue(config, "language"), ParamValue(std::string("de")));
    EXPECT_EQ(**argValue(config, "offset_ms"), ParamValue(-100));
}

TEST_F(CliParserTest, BoolOptionTakesOptionalLiteral) {
    ASSERT_TRUE(parse({"--translate", "a.wav", "--print-progress", "false", "b.wav"}).isOk());

    EXPECT_EQ(**argValue(config, "translate"), ParamValue(true));
    EXPECT_EQ(**argValue(config, "print_progress"), ParamValue(false));
    EXPECT_EQ(config.media_files, std::vector<std::string>({"a.wav", "b.wav"}));
}

TEST_F(CliParserTest, InlineBoolValueKeepsNextMediaFile) {
    ASSERT_TRUE(parse({"--translate", "1", "2.wav"}).isOk());
    EXPECT_EQ(config.media_files, std::vector<std::string>({"2.wav"}));

    ASSERT_TRUE(parse({"--translate=true", "1", "2.wav"}).isOk());
    EXPECT_EQ(**argValue(config, "translate"), ParamValue(true));
    EXPECT_EQ(config.media_files, std::vector<std::string>({"1", "2.wav"}));
}

TEST_F(CliParserTest, AcceptsUniquePrefixes) {
    ASSERT_TRUE(parse({"--lang", "en", "--tiny", "--proc", "3", "a.wav"}).isOk());

    EXPECT_EQ(**argValue(config, "language"), ParamValue(std::string("en")));
    EXPECT_EQ(**argValue(config, "tinydiarize"), ParamValue(true));
    EXPECT_EQ(config.processors, 3);
}

TEST_F(CliParserTest, RejectsAmbiguousPrefix) {
    auto err = parse({"--beam", "2", "a.wav"});
    EXPECT_EQ(err.code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_NE(err.detail.find("--beam-size"), std::string::npos);
}

TEST_F(CliParserTest, CollectsUnknownOptions) {
    ASSERT_TRUE(parse({"--frobnicate", "-x", "a.wav"}).isOk());

    EXPECT_EQ(config.ignored_args, std::vector<std::string>({"--frobnicate", "-x"}));
    EXPECT_EQ(config.media_files, std::vector<std::string>({"a.wav"}));
}

TEST_F(CliParserTest, DoubleDashEndsOptions) {
    ASSERT_TRUE(parse({"--", "-otxt", "a.wav"}).isOk());

    EXPECT_FALSE(config.outputs.txt);
    EXPECT_EQ(config.media_files, std::vector<std::string>({"-otxt", "a.wav"}));
}

TEST_F(CliParserTest, ReportsBadValues) {
    EXPECT_EQ(parse({"--beam-size", "five", "a.wav"}).code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(parse({"a.wav", "--model"}).code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(parse({"--output-txt=yes", "a.wav"}).code, ErrorCode::INVALID_ARGUMENT);
}

TEST_F(CliParserTest, ResolvesIntoEngineParams) {
    ASSERT_TRUE(parse({"--threads", "4", "--best-of", "3", "a.wav"}).isOk());

    auto params = ParamResolver::resolve(config.engine_args);
    EXPECT_EQ(*params.find("n_threads"), ParamValue(4));
    EXPECT_EQ(*params.find("greedy", "best_of"), ParamValue(3));
    EXPECT_EQ(*params.find("beam_search", "beam_size"), ParamValue(-1));
    // no default and not given
    EXPECT_EQ(params.find("initial_prompt"), nullptr);
}

TEST_F(CliParserTest, UsageListsEngineOptions) {
    const std::string text = parser.usage("scribe");
    EXPECT_NE(text.find("usage: scribe"), std::string::npos);
    EXPECT_NE(text.find("--beam-patience"), std::string::npos);
    EXPECT_NE(text.find("--output-csv"), std::string::npos);
    EXPECT_NE(text.find("--flag=value"), std::string::npos);
}

// ==== Validation (验证) ====

TEST(CliConfigValidatorTest, RequiresMediaFile) {
    CliConfig config;
    EXPECT_EQ(CliConfigValidator::validate(config).code, ErrorCode::INVALID_CONFIG);

    config.show_help = true;
    EXPECT_TRUE(CliConfigValidator::validate(config).isOk());
}

TEST(CliConfigValidatorTest, RejectsNegativeProcessors) {
    CliConfig config;
    config.media_files.push_back("a.wav");
    EXPECT_TRUE(CliConfigValidator::validate(config).isOk());

    config.processors = -1;
    EXPECT_EQ(CliConfigValidator::validate(config).code, ErrorCode::INVALID_CONFIG);
}
