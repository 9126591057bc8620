#pragma once

#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace apg {

enum class FormatVersion : int {
    V1 = 1,
    V2 = 2,
};

std::optional<FormatVersion> ParseFormatVersion(int value);
std::optional<FormatVersion> ParseFormatVersion(std::string_view text);

enum class FieldKind {
    Scalar,
    List,
};

struct FieldSpec {
    std::string_view name;
    FieldKind kind;
};

// Ordered required fields for `version`; v2 extends v1.
std::span<const FieldSpec> RequiredFields(FormatVersion version);
// Fields that are type-checked when present but never required.
std::span<const FieldSpec> OptionalFields();

using MetadataValue = std::variant<std::string, std::vector<std::string>>;

// Parsed metadata.json. A key that is absent or null in the document has no
// entry here, so an empty list stays distinguishable from a missing one.
struct MetadataRecord {
    FormatVersion version = FormatVersion::V1;
    std::map<std::string, MetadataValue, std::less<>> fields;

    bool Has(std::string_view name) const { return fields.find(name) != fields.end(); }
    const std::string* GetString(std::string_view name) const;
    const std::vector<std::string>* GetList(std::string_view name) const;
};

// Names of required fields that are missing, in schema order. A scalar is
// missing when absent or empty; a list only when absent.
std::vector<std::string> FindMissingFields(const MetadataRecord& record);

} // namespace apg
