#include "apg/package_validator.hpp"

#include "apg/metadata_parser.hpp"
#include "util/logger.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace apg {

namespace fs = std::filesystem;

namespace {

enum class Expect { Directory, File };

std::optional<StructuralError> CheckRequiredEntry(const fs::path& root, const char* name, Expect expect) {
    std::error_code ec;
    const auto st = fs::status(root / name, ec);
    if (ec || !fs::exists(st)) {
        return StructuralError{name, std::string("a required file or folder is missing: ") + name};
    }
    if (expect == Expect::Directory && !fs::is_directory(st)) {
        return StructuralError{name, std::string("required entry is not a directory: ") + name};
    }
    if (expect == Expect::File && !fs::is_regular_file(st)) {
        return StructuralError{name, std::string("required entry is not a regular file: ") + name};
    }
    return std::nullopt;
}

Result ReadBoundedFile(const fs::path& path, std::uint64_t max_bytes, std::string& out) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Result::Fail(ErrorKind::Io, "Failed to read metadata: " + ec.message(), ec.value());
    }
    if (size > max_bytes) {
        return Result::Fail(ErrorKind::SizeLimit,
                            "Metadata too large: " + std::to_string(size) + " bytes (limit " +
                                std::to_string(max_bytes) + ")");
    }

    std::ifstream is(path, std::ios::binary);
    if (!is.good()) {
        return Result::Fail(ErrorKind::Io, "Failed to read metadata: cannot open " + path.string());
    }
    out.assign(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
    if (is.bad()) {
        return Result::Fail(ErrorKind::Io, "Failed to read metadata: read error");
    }
    return Result::Ok();
}

std::string JoinFields(const std::vector<std::string>& fields) {
    std::string out;
    for (const auto& f : fields) {
        if (!out.empty()) out += ", ";
        out += f;
    }
    return out;
}

} // namespace

std::string SchemaError::Message() const {
    if (parse_error) return *parse_error;
    return "Missing or empty fields in metadata: " + JoinFields(missing_fields);
}

ValidationResult ValidationResult::Good() { return ValidationResult(); }

ValidationResult ValidationResult::Structural(std::string path, std::string message) {
    ValidationResult r;
    r.status_ = ValidationStatus::Bad;
    r.structural_ = StructuralError{std::move(path), std::move(message)};
    return r;
}

ValidationResult ValidationResult::ParseFailure(std::string message) {
    ValidationResult r;
    r.status_ = ValidationStatus::Bad;
    r.schema_ = SchemaError{.parse_error = std::move(message), .missing_fields = {}};
    return r;
}

ValidationResult ValidationResult::MissingFields(std::vector<std::string> fields) {
    ValidationResult r;
    r.status_ = ValidationStatus::Bad;
    r.schema_ = SchemaError{.parse_error = std::nullopt, .missing_fields = std::move(fields)};
    return r;
}

Result ValidationResult::ToResult() const {
    if (structural_) return Result::Fail(ErrorKind::Structural, structural_->message);
    if (schema_) return Result::Fail(ErrorKind::Schema, schema_->Message());
    return Result::Ok();
}

ValidationResult PackageValidator::Validate(const std::string& root, FormatVersion version) const {
    const fs::path base(root);

    const struct {
        const char* name;
        Expect expect;
    } required[] = {
        {kDataDir, Expect::Directory},
        {kChecksumFile, Expect::File},
        {kMetadataFile, Expect::File},
    };
    for (const auto& r : required) {
        if (auto err = CheckRequiredEntry(base, r.name, r.expect)) {
            LogDebug("structural check failed: %s", err->message.c_str());
            return ValidationResult::Structural(std::move(err->path), std::move(err->message));
        }
    }

    std::string text;
    auto read_res = ReadBoundedFile(base / kMetadataFile, opt_.max_metadata_bytes, text);
    if (!read_res.is_ok()) {
        return ValidationResult::ParseFailure(read_res.msg);
    }

    MetadataParser parser;
    auto parsed = parser.Parse(text, version);
    if (!parsed) {
        return ValidationResult::ParseFailure("Metadata invalid JSON: " + parsed.error());
    }

    auto missing = FindMissingFields(*parsed);
    if (!missing.empty()) {
        LogDebug("metadata is missing %zu field(s)", missing.size());
        return ValidationResult::MissingFields(std::move(missing));
    }

    LogDebug("metadata valid for format version %d", static_cast<int>(version));
    return ValidationResult::Good();
}

} // namespace apg
