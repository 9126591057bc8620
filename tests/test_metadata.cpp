#include <gtest/gtest.h>

#include "apg/metadata.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace apg {
namespace {

std::vector<std::string> Names(std::span<const FieldSpec> fields) {
    std::vector<std::string> out;
    for (const auto& f : fields) out.emplace_back(f.name);
    return out;
}

MetadataRecord CompleteRecord(FormatVersion version) {
    MetadataRecord rec;
    rec.version = version;
    for (const auto& f : RequiredFields(version)) {
        if (f.kind == FieldKind::Scalar) {
            rec.fields.emplace(std::string(f.name), std::string("x"));
        } else {
            rec.fields.emplace(std::string(f.name), std::vector<std::string>{"y"});
        }
    }
    return rec;
}

TEST(MetadataSchemaTest, V1RequiredFieldsInOrder) {
    const std::vector<std::string> expected = {
        "name", "version", "description", "maintainer", "homepage",
        "dependencies", "conflicts", "provides", "replaces",
    };
    EXPECT_EQ(Names(RequiredFields(FormatVersion::V1)), expected);
}

TEST(MetadataSchemaTest, V2ExtendsV1) {
    const auto v1 = Names(RequiredFields(FormatVersion::V1));
    const auto v2 = Names(RequiredFields(FormatVersion::V2));
    ASSERT_EQ(v2.size(), v1.size() + 3);
    EXPECT_TRUE(std::equal(v1.begin(), v1.end(), v2.begin()));
    EXPECT_EQ(v2[9], "type");
    EXPECT_EQ(v2[10], "tags");
    EXPECT_EQ(v2[11], "conf");
}

TEST(MetadataSchemaTest, FieldKinds) {
    for (const auto& f : RequiredFields(FormatVersion::V2)) {
        const bool is_list = f.name == "dependencies" || f.name == "conflicts" ||
                             f.name == "provides" || f.name == "replaces" ||
                             f.name == "tags" || f.name == "conf";
        EXPECT_EQ(f.kind, is_list ? FieldKind::List : FieldKind::Scalar) << f.name;
    }
}

TEST(MetadataSchemaTest, OptionalFieldsAreNotRequired) {
    const auto required = Names(RequiredFields(FormatVersion::V2));
    for (const auto& f : OptionalFields()) {
        EXPECT_EQ(std::find(required.begin(), required.end(), std::string(f.name)), required.end());
    }
    EXPECT_EQ(Names(OptionalFields()), (std::vector<std::string>{"architecture", "license"}));
}

TEST(MetadataSchemaTest, ParseFormatVersion) {
    EXPECT_EQ(ParseFormatVersion(1), FormatVersion::V1);
    EXPECT_EQ(ParseFormatVersion(2), FormatVersion::V2);
    EXPECT_FALSE(ParseFormatVersion(0).has_value());
    EXPECT_FALSE(ParseFormatVersion(3).has_value());

    EXPECT_EQ(ParseFormatVersion(std::string_view("1")), FormatVersion::V1);
    EXPECT_EQ(ParseFormatVersion(std::string_view("2")), FormatVersion::V2);
    EXPECT_FALSE(ParseFormatVersion(std::string_view("")).has_value());
    EXPECT_FALSE(ParseFormatVersion(std::string_view("2x")).has_value());
    EXPECT_FALSE(ParseFormatVersion(std::string_view("v2")).has_value());
    EXPECT_FALSE(ParseFormatVersion(std::string_view("-1")).has_value());
}

TEST(MetadataSchemaTest, CompleteRecordHasNoMissingFields) {
    EXPECT_TRUE(FindMissingFields(CompleteRecord(FormatVersion::V1)).empty());
    EXPECT_TRUE(FindMissingFields(CompleteRecord(FormatVersion::V2)).empty());
}

TEST(MetadataSchemaTest, V1RecordFailsV2Check) {
    auto rec = CompleteRecord(FormatVersion::V1);
    rec.version = FormatVersion::V2;
    EXPECT_EQ(FindMissingFields(rec), (std::vector<std::string>{"type", "tags", "conf"}));
}

TEST(MetadataSchemaTest, EmptyScalarIsMissingButEmptyListIsNot) {
    auto rec = CompleteRecord(FormatVersion::V1);
    rec.fields["maintainer"] = std::string();
    rec.fields["conflicts"] = std::vector<std::string>{};
    rec.fields.erase("dependencies");

    EXPECT_EQ(FindMissingFields(rec), (std::vector<std::string>{"maintainer", "dependencies"}));
}

TEST(MetadataSchemaTest, MissingFieldsReportedInSchemaOrder) {
    MetadataRecord rec;
    rec.fields.emplace("version", std::string("1.0"));
    const auto missing = FindMissingFields(rec);
    ASSERT_EQ(missing.size(), 8U);
    EXPECT_EQ(missing.front(), "name");
    EXPECT_EQ(missing[1], "description");
    EXPECT_EQ(missing.back(), "replaces");
}

TEST(MetadataSchemaTest, AccessorsRespectValueKind) {
    auto rec = CompleteRecord(FormatVersion::V1);
    ASSERT_NE(rec.GetString("name"), nullptr);
    EXPECT_EQ(*rec.GetString("name"), "x");
    EXPECT_EQ(rec.GetList("name"), nullptr);
    ASSERT_NE(rec.GetList("provides"), nullptr);
    EXPECT_EQ(rec.GetString("provides"), nullptr);
    EXPECT_FALSE(rec.Has("license"));
    EXPECT_EQ(rec.GetString("license"), nullptr);
}

} // namespace
} // namespace apg
