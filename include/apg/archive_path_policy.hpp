#pragma once

#include "util/result.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace apg {

// Where an archive entry may be written. Only produced once every guard in
// ArchivePathPolicy has passed.
struct SanitizedTarget {
    std::string relative;
    std::filesystem::path absolute;
};

class ArchivePathPolicy {
  public:
    static constexpr std::size_t kMaxNameLength = 255;

    // `canonical_root` must already be canonical (see std::filesystem::canonical).
    explicit ArchivePathPolicy(std::filesystem::path canonical_root)
        : root_(std::move(canonical_root)) {}

    // Lexical guards only. An empty `out_relative` means the entry names the
    // archive root itself.
    static Result SanitizeEntryName(std::string_view raw_name, std::string& out_relative);

    // Lexical guards followed by the canonical containment check.
    Result Resolve(std::string_view raw_name, SanitizedTarget& out) const;

    static bool IsWithin(const std::filesystem::path& root, const std::filesystem::path& p);

  private:
    std::filesystem::path root_;
};

} // namespace apg
