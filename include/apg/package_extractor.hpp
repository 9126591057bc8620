#pragma once

#include "io/io.hpp"
#include "io/xz_reader.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace apg {

enum class EntryKind {
    Regular,
    Directory,
    Symlink,
    Hardlink,
    Other,
};

struct ExtractionOutcome {
    Result status;
    // Raw name of the entry that caused the failure; empty when the failure
    // is not tied to an entry.
    std::string entry;
    // Entries that were skipped rather than extracted.
    std::vector<std::string> warnings;
    std::uint64_t entries_written = 0;
    std::uint64_t bytes_written = 0;

    bool is_ok() const { return status.is_ok(); }
};

// Extracts a single-stream .tar.xz into a directory, refusing anything that
// could end up outside it.
class PackageExtractor {
  public:
    static constexpr std::uint64_t kDefaultMaxEntryBytes = 500ULL * 1024 * 1024;

    struct Options {
        // May only lower the ceiling; larger values are clamped to it.
        std::uint64_t max_entry_bytes = kDefaultMaxEntryBytes;
        // Cumulative cap on regular file bytes; 0 disables it.
        std::uint64_t max_total_bytes = 0;
        std::uint64_t decoder_memlimit = XzReader::kDefaultMemlimit;
    };

    PackageExtractor() = default;
    explicit PackageExtractor(const Options& opt) : opt_(opt) {}

    // `archive_path` may be "-" for stdin. `destination_root` is created if
    // missing; an existing one should be empty.
    ExtractionOutcome Extract(const std::string& archive_path,
                              const std::string& destination_root) const;

    ExtractionOutcome ExtractStream(std::unique_ptr<IReader> compressed,
                                    const std::string& destination_root) const;

  private:
    Options opt_{};
};

} // namespace apg
