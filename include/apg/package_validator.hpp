#pragma once

#include "apg/metadata.hpp"
#include "apg/package_extractor.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace apg {

enum class ValidationStatus {
    Good,
    Bad,
};

struct StructuralError {
    std::string path;  // required top-level entry that is missing
    std::string message;
};

struct SchemaError {
    // Set when metadata.json could not be read or parsed; no field check ran.
    std::optional<std::string> parse_error;
    std::vector<std::string> missing_fields;

    std::string Message() const;
};

class ValidationResult {
  public:
    static ValidationResult Good();
    static ValidationResult Structural(std::string path, std::string message);
    static ValidationResult ParseFailure(std::string message);
    static ValidationResult MissingFields(std::vector<std::string> fields);

    ValidationStatus status() const { return status_; }
    bool is_good() const { return status_ == ValidationStatus::Good; }
    const std::optional<StructuralError>& structural_error() const { return structural_; }
    const std::optional<SchemaError>& schema_error() const { return schema_; }

    // Collapses the verdict into a Result carrying Structural or Schema.
    Result ToResult() const;

  private:
    ValidationResult() = default;

    ValidationStatus status_ = ValidationStatus::Good;
    std::optional<StructuralError> structural_;
    std::optional<SchemaError> schema_;
};

// Checks an extracted package tree: required top-level layout, then the
// metadata.json schema for the selected format version.
class PackageValidator {
  public:
    static constexpr const char* kDataDir = "data";
    static constexpr const char* kChecksumFile = "md5sums";
    static constexpr const char* kMetadataFile = "metadata.json";

    struct Options {
        std::uint64_t max_metadata_bytes = PackageExtractor::kDefaultMaxEntryBytes;
    };

    PackageValidator() = default;
    explicit PackageValidator(const Options& opt) : opt_(opt) {}

    ValidationResult Validate(const std::string& root, FormatVersion version) const;

  private:
    Options opt_{};
};

} // namespace apg
