#pragma once

#include "apg/metadata.hpp"
#include "apg/package_extractor.hpp"
#include "apg/package_validator.hpp"
#include "apg/scratch_directory.hpp"
#include "util/result.hpp"

#include <memory>
#include <optional>
#include <string>

namespace apg {

struct CheckReport {
    // Failure to set up the scratch directory; nothing else ran.
    Result setup;
    ExtractionOutcome extraction;
    // Only present when extraction succeeded.
    std::optional<ValidationResult> validation;
    // Set when the scratch directory could not be removed. Never affects
    // Passed().
    std::optional<Result> cleanup_failure;

    bool Passed() const;
    // First failure in pipeline order, or Ok.
    Result Verdict() const;
};

// Runs one extract-then-validate cycle in a private scratch directory and
// always removes that directory before returning.
class PackageChecker {
  public:
    struct Options {
        PackageExtractor::Options extract;
        PackageValidator::Options validate;
        std::string scratch_base_dir;  // empty: ScratchDirectory::DefaultBaseDir()
        std::shared_ptr<const ScratchDirectory::ISystemOps> system_ops;
    };

    PackageChecker() = default;
    explicit PackageChecker(Options opt) : opt_(std::move(opt)) {}

    CheckReport Run(const std::string& archive_path, FormatVersion version) const;

  private:
    Options opt_{};
};

} // namespace apg
