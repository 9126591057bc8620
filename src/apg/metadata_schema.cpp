#include "apg/metadata.hpp"

#include <array>
#include <charconv>

namespace apg {

namespace {

constexpr std::array<FieldSpec, 12> kFieldsV2 = {{
    {"name", FieldKind::Scalar},
    {"version", FieldKind::Scalar},
    {"description", FieldKind::Scalar},
    {"maintainer", FieldKind::Scalar},
    {"homepage", FieldKind::Scalar},
    {"dependencies", FieldKind::List},
    {"conflicts", FieldKind::List},
    {"provides", FieldKind::List},
    {"replaces", FieldKind::List},
    {"type", FieldKind::Scalar},
    {"tags", FieldKind::List},
    {"conf", FieldKind::List},
}};

// v1 is the leading part of the v2 list.
constexpr std::size_t kFieldCountV1 = 9;

constexpr std::array<FieldSpec, 2> kOptionalFields = {{
    {"architecture", FieldKind::Scalar},
    {"license", FieldKind::Scalar},
}};

} // namespace

std::optional<FormatVersion> ParseFormatVersion(int value) {
    switch (value) {
        case 1: return FormatVersion::V1;
        case 2: return FormatVersion::V2;
        default: return std::nullopt;
    }
}

std::optional<FormatVersion> ParseFormatVersion(std::string_view text) {
    int value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end) return std::nullopt;
    return ParseFormatVersion(value);
}

std::span<const FieldSpec> RequiredFields(FormatVersion version) {
    if (version == FormatVersion::V1) {
        return std::span<const FieldSpec>(kFieldsV2.data(), kFieldCountV1);
    }
    return std::span<const FieldSpec>(kFieldsV2.data(), kFieldsV2.size());
}

std::span<const FieldSpec> OptionalFields() {
    return std::span<const FieldSpec>(kOptionalFields.data(), kOptionalFields.size());
}

const std::string* MetadataRecord::GetString(std::string_view name) const {
    auto it = fields.find(name);
    if (it == fields.end()) return nullptr;
    return std::get_if<std::string>(&it->second);
}

const std::vector<std::string>* MetadataRecord::GetList(std::string_view name) const {
    auto it = fields.find(name);
    if (it == fields.end()) return nullptr;
    return std::get_if<std::vector<std::string>>(&it->second);
}

std::vector<std::string> FindMissingFields(const MetadataRecord& record) {
    std::vector<std::string> missing;
    for (const auto& field : RequiredFields(record.version)) {
        bool present = false;
        if (field.kind == FieldKind::Scalar) {
            const std::string* s = record.GetString(field.name);
            present = s && !s->empty();
        } else {
            // An explicitly empty list counts as present.
            present = record.GetList(field.name) != nullptr;
        }
        if (!present) missing.emplace_back(field.name);
    }
    return missing;
}

} // namespace apg
