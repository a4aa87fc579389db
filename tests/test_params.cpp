#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "scribe/params.hpp"

using scribe::Argument;
using scribe::ArgumentSet;
using scribe::ErrorCode;
using scribe::ParamDescriptor;
using scribe::ParamField;
using scribe::ParamMapping;
using scribe::ParamPath;
using scribe::ParamResolver;
using scribe::ParamSchema;
using scribe::ParamType;
using scribe::ParamValue;
using scribe::ResolvedParams;

namespace {

ParamSchema vadSchema() {
    std::vector<ParamDescriptor> params;
    params.push_back({"n_threads", ParamType::INT, std::nullopt, "threads", {}});
    params.push_back({"translate", ParamType::BOOL, ParamValue(false), "translate", {}});
    std::vector<ParamField> vad_fields;
    vad_fields.push_back({"speed_up", ParamType::BOOL, ParamValue(false)});
    params.push_back({"vad", ParamType::GROUP, std::nullopt, "vad", vad_fields});
    return ParamSchema(params);
}

ParamMapping vadMapping() {
    std::vector<ParamMapping::Entry> entries;
    entries.emplace_back("vad.speed_up", "speed_up");
    return ParamMapping(entries);
}

}  // namespace

// ==== Value parsing (值解析) ====

TEST(ParamValueTest, ParsesBoolLiterals) {
    ParamValue v;
    ASSERT_TRUE(scribe::parseParamValue(ParamType::BOOL, "false", v).isOk());
    EXPECT_EQ(v, ParamValue(false));
    ASSERT_TRUE(scribe::parseParamValue(ParamType::BOOL, "ON", v).isOk());
    EXPECT_EQ(v, ParamValue(true));
    EXPECT_EQ(scribe::parseParamValue(ParamType::BOOL, "maybe", v).code,
        ErrorCode::INVALID_ARGUMENT);
}

TEST(ParamValueTest, RejectsTrailingGarbage) {
    ParamValue v;
    EXPECT_FALSE(scribe::parseParamValue(ParamType::INT, "4x", v).isOk());
    EXPECT_FALSE(scribe::parseParamValue(ParamType::INT, "", v).isOk());
    EXPECT_FALSE(scribe::parseParamValue(ParamType::FLOAT, "0.5.1", v).isOk());

    ASSERT_TRUE(scribe::parseParamValue(ParamType::INT, "-3", v).isOk());
    EXPECT_EQ(v, ParamValue(-3));
    ASSERT_TRUE(scribe::parseParamValue(ParamType::FLOAT, "0.25", v).isOk());
    EXPECT_FLOAT_EQ(scribe::paramAsFloat(v), 0.25f);
}

TEST(ParamValueTest, StringsArePrintedQuoted) {
    EXPECT_EQ(scribe::paramValueToString(ParamValue(std::string("en"))), "\"en\"");
    EXPECT_EQ(scribe::paramValueToString(ParamValue(true)), "true");
    EXPECT_EQ(scribe::paramValueToString(ParamValue(8)), "8");
}

// ==== Mapping (映射) ====

TEST(ParamPathTest, SplitsOnFirstDot) {
    ParamPath p = ParamPath::parse("beam_search.beam_size");
    EXPECT_EQ(p.group, "beam_search");
    EXPECT_EQ(p.field, "beam_size");
    EXPECT_TRUE(p.isNested());

    ParamPath flat = ParamPath::parse("n_threads");
    EXPECT_FALSE(flat.isNested());
    EXPECT_EQ(flat.toString(), "n_threads");
}

TEST(ParamMappingTest, BuiltinTablesAreConsistent) {
    EXPECT_TRUE(ParamMapping::whisper().validate(ParamSchema::whisper()).isOk());
    EXPECT_EQ(*ParamMapping::whisper().canonicalPath("beam_size"), "beam_search.beam_size");
    EXPECT_EQ(*ParamMapping::whisper().externalName("n_threads"), "threads");
    EXPECT_FALSE(ParamMapping::whisper().canonicalPath("language").has_value());
}

TEST(ParamMappingTest, RejectsDuplicateExternalNames) {
    std::vector<ParamMapping::Entry> entries;
    entries.emplace_back("greedy.best_of", "best");
    entries.emplace_back("beam_search.beam_size", "best");
    EXPECT_EQ(ParamMapping(entries).validate().code, ErrorCode::INVALID_CONFIG);
}

TEST(ParamMappingTest, RejectsMalformedPaths) {
    std::vector<ParamMapping::Entry> deep;
    deep.emplace_back("a.b.c", "abc");
    EXPECT_FALSE(ParamMapping(deep).validate().isOk());

    std::vector<ParamMapping::Entry> empty_field;
    empty_field.emplace_back("group.", "g");
    EXPECT_FALSE(ParamMapping(empty_field).validate().isOk());
}

TEST(ParamMappingTest, RejectsPathsOutsideSchema) {
    std::vector<ParamMapping::Entry> entries;
    entries.emplace_back("vad.threshold", "threshold");
    EXPECT_FALSE(ParamMapping(entries).validate(vadSchema()).isOk());
    EXPECT_TRUE(vadMapping().validate(vadSchema()).isOk());
}

// ==== Resolver (解析) ====

TEST(ParamResolverTest, MappedArgumentLandsInNestedGroup) {
    ArgumentSet args = {{"speed_up", ParamValue(true)}};
    ResolvedParams params = ParamResolver::resolve(args, vadSchema(), vadMapping());

    EXPECT_TRUE(params.values.empty());
    ASSERT_EQ(params.groups.size(), 1u);
    ASSERT_NE(params.find("vad", "speed_up"), nullptr);
    EXPECT_EQ(*params.find("vad", "speed_up"), ParamValue(true));
    EXPECT_EQ(params.toString(), "{\n  \"vad\": {\"speed_up\": true}\n}");
}

TEST(ParamResolverTest, UnknownNamesDoNotChangeResult) {
    ArgumentSet base = {
        {"threads", ParamValue(4)},
        {"beam_size", ParamValue(5)},
        {"language", ParamValue(std::string("de"))},
    };
    ArgumentSet noisy = base;
    noisy.push_back({"model", ParamValue(std::string("tiny"))});
    noisy.push_back({"output_txt", ParamValue(true)});
    noisy.push_back({"processors", ParamValue(2)});

    EXPECT_EQ(ParamResolver::resolve(base), ParamResolver::resolve(noisy));
}

TEST(ParamResolverTest, SchemaNamesAreCopiedVerbatim) {
    ArgumentSet args = {
        {"translate", ParamValue(true)},
        {"temperature", ParamValue(0.4f)},
        {"language", ParamValue(std::string("fr"))},
    };
    ResolvedParams params = ParamResolver::resolve(args);

    EXPECT_EQ(*params.find("translate"), ParamValue(true));
    EXPECT_FLOAT_EQ(scribe::paramAsFloat(*params.find("temperature")), 0.4f);
    EXPECT_EQ(scribe::paramAsString(*params.find("language")), "fr");
    EXPECT_TRUE(params.groups.empty());
}

TEST(ParamResolverTest, MappedFlatNameUsesCanonicalName) {
    ArgumentSet args = {
        {"threads", ParamValue(8)},
        {"prompt", ParamValue(std::string("Meeting notes."))},
        {"tinydiarize", ParamValue(true)},
    };
    ResolvedParams params = ParamResolver::resolve(args);

    EXPECT_EQ(*params.find("n_threads"), ParamValue(8));
    EXPECT_EQ(scribe::paramAsString(*params.find("initial_prompt")), "Meeting notes.");
    EXPECT_EQ(*params.find("tdrz_enable"), ParamValue(true));
    EXPECT_EQ(params.find("threads"), nullptr);
}

TEST(ParamResolverTest, GroupFieldsShareTheirGroup) {
    ArgumentSet args = {
        {"beam_size", ParamValue(5)},
        {"beam_patience", ParamValue(1.5f)},
        {"best_of", ParamValue(3)},
    };
    ResolvedParams params = ParamResolver::resolve(args);

    ASSERT_EQ(params.groups.size(), 2u);
    EXPECT_EQ(params.groups.at("beam_search").size(), 2u);
    EXPECT_EQ(*params.find("beam_search", "beam_size"), ParamValue(5));
    EXPECT_FLOAT_EQ(scribe::paramAsFloat(*params.find("beam_search", "patience")), 1.5f);
    EXPECT_EQ(*params.find("greedy", "best_of"), ParamValue(3));
}

TEST(ParamResolverTest, ArgumentsWithoutValueAreSkipped) {
    ArgumentSet args = {
        {"threads", std::nullopt},
        {"initial_prompt", std::nullopt},
        {"beam_size", ParamValue(2)},
    };
    ResolvedParams params = ParamResolver::resolve(args);

    EXPECT_EQ(params.find("n_threads"), nullptr);
    EXPECT_EQ(params.find("initial_prompt"), nullptr);
    EXPECT_EQ(*params.find("beam_search", "beam_size"), ParamValue(2));
}

TEST(ParamResolverTest, SchemaNameShadowsMappedName) {
    std::vector<ParamDescriptor> descriptors;
    descriptors.push_back({"x", ParamType::INT, std::nullopt, "x", {}});
    std::vector<ParamField> fields;
    fields.push_back({"f", ParamType::INT, ParamValue(0)});
    descriptors.push_back({"g", ParamType::GROUP, std::nullopt, "g", fields});
    ParamSchema schema(descriptors);

    std::vector<ParamMapping::Entry> entries;
    entries.emplace_back("g.f", "x");
    ParamMapping mapping(entries);

    ResolvedParams params = ParamResolver::resolve({{"x", ParamValue(1)}}, schema, mapping);
    ASSERT_NE(params.find("x"), nullptr);
    EXPECT_EQ(*params.find("x"), ParamValue(1));
    EXPECT_TRUE(params.groups.empty());

    // No value: skipped, not routed into g.f
    EXPECT_TRUE(ParamResolver::resolve({{"x", std::nullopt}}, schema, mapping).empty());
}

TEST(ParamResolverTest, LaterArgumentWins) {
    ArgumentSet args = {
        {"n_threads", ParamValue(2)},
        {"threads", ParamValue(6)},
    };
    EXPECT_EQ(*ParamResolver::resolve(args).find("n_threads"), ParamValue(6));
}

TEST(ParamResolverTest, EmptyInputGivesEmptyParams) {
    ResolvedParams params = ParamResolver::resolve({});
    EXPECT_TRUE(params.empty());
    EXPECT_EQ(params.toString(), "{}");
}
