#include "apg/metadata_parser.hpp"

#include <nlohmann/json.hpp>

namespace apg {

using json = nlohmann::json;

namespace {

std::expected<void, std::string> ReadField(const json& doc, const FieldSpec& field,
                                           MetadataRecord& out) {
    const std::string name(field.name);
    auto it = doc.find(name);
    if (it == doc.end() || it->is_null()) return {};

    if (field.kind == FieldKind::Scalar) {
        if (!it->is_string()) {
            return std::unexpected("field '" + name + "' must be a string");
        }
        out.fields.emplace(name, it->get<std::string>());
        return {};
    }

    if (!it->is_array()) {
        return std::unexpected("field '" + name + "' must be an array of strings");
    }
    std::vector<std::string> items;
    items.reserve(it->size());
    for (const auto& item : *it) {
        if (!item.is_string()) {
            return std::unexpected("field '" + name + "' must be an array of strings");
        }
        items.push_back(item.get<std::string>());
    }
    out.fields.emplace(name, std::move(items));
    return {};
}

} // namespace

std::expected<MetadataRecord, std::string> MetadataParser::Parse(const std::string& json_input,
                                                                 FormatVersion version) const {
    try {
        if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
            return std::unexpected("Empty input");
        }

        const auto doc = json::parse(json_input);
        if (!doc.is_object()) {
            return std::unexpected("JSON root must be an object");
        }

        MetadataRecord record;
        record.version = version;

        for (const auto& field : RequiredFields(version)) {
            auto res = ReadField(doc, field, record);
            if (!res) return std::unexpected(res.error());
        }
        for (const auto& field : OptionalFields()) {
            auto res = ReadField(doc, field, record);
            if (!res) return std::unexpected(res.error());
        }

        return record;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

} // namespace apg
