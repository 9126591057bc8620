#include "apg/package_checker.hpp"

#include "util/logger.hpp"

namespace apg {

bool CheckReport::Passed() const {
    return Verdict().is_ok();
}

Result CheckReport::Verdict() const {
    if (!setup.is_ok()) return setup;
    if (!extraction.is_ok()) return extraction.status;
    if (!validation) return Result::Fail(ErrorKind::Io, "validation did not run");
    return validation->ToResult();
}

CheckReport PackageChecker::Run(const std::string& archive_path, FormatVersion version) const {
    CheckReport report;

    ScratchDirectory scratch(opt_.system_ops);
    report.setup = ScratchDirectory::Create(opt_.scratch_base_dir, scratch);
    if (!report.setup.is_ok()) {
        LogError("cannot create scratch directory: %s", report.setup.msg.c_str());
        return report;
    }

    LogInfo("extracting %s into %s", archive_path.c_str(), scratch.Path().c_str());
    PackageExtractor extractor(opt_.extract);
    report.extraction = extractor.Extract(archive_path, scratch.Path());

    if (report.extraction.is_ok()) {
        LogInfo("extracted %llu entries (%llu bytes)",
                (unsigned long long)report.extraction.entries_written,
                (unsigned long long)report.extraction.bytes_written);
        PackageValidator validator(opt_.validate);
        report.validation = validator.Validate(scratch.Path(), version);
    } else {
        LogInfo("extraction failed: %s", report.extraction.status.msg.c_str());
    }

    auto cleanup = scratch.Remove();
    if (!cleanup.is_ok()) {
        LogWarn("%s", cleanup.msg.c_str());
        report.cleanup_failure = std::move(cleanup);
    }

    return report;
}

} // namespace apg
