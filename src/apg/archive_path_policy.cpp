#include "apg/archive_path_policy.hpp"

#include "util/path_utils.hpp"

#include <iterator>
#include <system_error>

namespace apg {

namespace fs = std::filesystem;

Result ArchivePathPolicy::SanitizeEntryName(std::string_view raw_name, std::string& out_relative) {
    out_relative.clear();
    const std::string shown(raw_name);

    if (IsAbsoluteTarPath(raw_name)) {
        return Result::Fail(ErrorKind::PathSecurity, "Archive contains absolute path: " + shown);
    }
    if (raw_name.find('\\') != std::string_view::npos) {
        return Result::Fail(ErrorKind::PathSecurity, "Archive contains backslash in path: " + shown);
    }

    std::string cleaned = CleanTarPath(raw_name);
    if (cleaned == ".." || HasParentSegment(cleaned)) {
        return Result::Fail(ErrorKind::PathSecurity,
                            "Archive contains path traversal attempt: " + shown);
    }
    if (cleaned.size() > kMaxNameLength) {
        return Result::Fail(ErrorKind::PathSecurity, "Path too long: " + shown);
    }
    if (cleaned.find('\0') != std::string::npos) {
        return Result::Fail(ErrorKind::PathSecurity, "Path contains null byte: " + shown);
    }

    out_relative = std::move(cleaned);
    return Result::Ok();
}

bool ArchivePathPolicy::IsWithin(const fs::path& root, const fs::path& p) {
    auto root_it = root.begin();
    auto p_it = p.begin();
    for (; root_it != root.end(); ++root_it, ++p_it) {
        // A trailing separator shows up as an empty final component.
        if (root_it->empty() && std::next(root_it) == root.end()) break;
        if (p_it == p.end() || *p_it != *root_it) return false;
    }
    return true;
}

Result ArchivePathPolicy::Resolve(std::string_view raw_name, SanitizedTarget& out) const {
    std::string rel;
    auto lexical = SanitizeEntryName(raw_name, rel);
    if (!lexical.is_ok()) return lexical;

    const fs::path joined = rel.empty() ? root_ : root_ / fs::path(rel);

    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(joined, ec);
    if (ec) {
        return Result::Fail(ErrorKind::PathSecurity,
                            "Cannot resolve target path for " + std::string(raw_name) + ": " +
                                ec.message(),
                            ec.value());
    }

    if (!IsWithin(root_, canonical)) {
        return Result::Fail(ErrorKind::PathSecurity,
                            "Path traversal detected, target path outside destination: " +
                                std::string(raw_name));
    }

    out.relative = std::move(rel);
    out.absolute = std::move(canonical);
    return Result::Ok();
}

} // namespace apg
