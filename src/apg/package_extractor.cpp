#include "apg/package_extractor.hpp"

#include "apg/archive_path_policy.hpp"
#include "apg/tar_reader_adapter.hpp"
#include "io/fd.hpp"
#include "io/file_reader.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <filesystem>
#include <string_view>
#include <sys/stat.h>
#include <unistd.h>

namespace apg {

namespace fs = std::filesystem;

namespace {

// Directories keep at most rwxr-xr-x from the archive and always stay
// owner-writable so the tree can be populated and removed again.
constexpr mode_t kDirPermMask = 0755;
constexpr mode_t kDirPermFloor = 0700;
// Directories the archive implies but never lists.
constexpr mode_t kParentDirMode = 0755;
constexpr mode_t kFileMode = 0644;

EntryKind ClassifyEntry(archive_entry* entry) {
    const char* hardlink = archive_entry_hardlink(entry);
    if (hardlink && *hardlink) return EntryKind::Hardlink;

    switch (archive_entry_filetype(entry)) {
        case AE_IFREG: return EntryKind::Regular;
        case AE_IFDIR: return EntryKind::Directory;
        case AE_IFLNK: return EntryKind::Symlink;
        default:       return EntryKind::Other;
    }
}

const char* DescribeFileType(archive_entry* entry) {
    switch (archive_entry_filetype(entry)) {
        case AE_IFCHR:  return "character device";
        case AE_IFBLK:  return "block device";
        case AE_IFIFO:  return "fifo";
        case AE_IFSOCK: return "socket";
        default:        return "unknown type";
    }
}

Result WriteAllToFd(int fd, const std::uint8_t* data, size_t len) {
    size_t off = 0;
    while (off < len) {
        const ssize_t n = ::write(fd, data + off, len - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int e = errno;
            return Result::Fail(ErrorKind::Io, std::string("write failed: ") + std::strerror(e), e);
        }
        off += static_cast<size_t>(n);
    }
    return Result::Ok();
}

// Creates every missing directory of `relative` below `root`, one component at
// a time, with kParentDirMode regardless of the umask. Existing components
// must be real directories.
Result MakeDirectoriesUnder(const fs::path& root, std::string_view relative) {
    fs::path current = root;
    for (const auto seg : SplitPathSegments(relative)) {
        current /= std::string(seg);
        if (::mkdir(current.c_str(), kParentDirMode) == 0) {
            if (::chmod(current.c_str(), kParentDirMode) != 0) {
                const int e = errno;
                return Result::Fail(ErrorKind::Io,
                                    "Failed to set mode of folder " + current.string() + ": " +
                                        std::strerror(e),
                                    e);
            }
            continue;
        }
        const int e = errno;
        if (e != EEXIST) {
            return Result::Fail(ErrorKind::Io,
                                "Failed to create folder " + current.string() + ": " + std::strerror(e),
                                e);
        }
        struct stat st{};
        if (::lstat(current.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
            return Result::Fail(ErrorKind::Io, "Not a directory: " + current.string(), ENOTDIR);
        }
    }
    return Result::Ok();
}

Result PrepareDestination(const std::string& dst_dir, fs::path& canonical_out) {
    if (dst_dir.empty()) {
        return Result::Fail(ErrorKind::Io, "Destination directory not specified");
    }

    const fs::path base(dst_dir);
    std::error_code ec;
    if (!fs::exists(base, ec)) {
        if (ec) {
            return Result::Fail(ErrorKind::Io,
                                "Cannot access destination " + dst_dir + ": " + ec.message(),
                                ec.value());
        }
        fs::create_directories(base, ec);
        if (!ec) fs::permissions(base, fs::perms::owner_all, ec);
        if (ec) {
            return Result::Fail(ErrorKind::Io,
                                "Cannot create destination " + dst_dir + ": " + ec.message(),
                                ec.value());
        }
    }
    if (!fs::is_directory(base, ec) || ec) {
        return Result::Fail(ErrorKind::Io, "Destination path is not a directory: " + dst_dir);
    }

    canonical_out = fs::canonical(base, ec);
    if (ec) {
        return Result::Fail(ErrorKind::Io,
                            "Cannot get absolute path of destination: " + ec.message(),
                            ec.value());
    }
    return Result::Ok();
}

// State for one Extract call.
class ExtractionRun {
  public:
    ExtractionRun(const PackageExtractor::Options& opt, const fs::path& root, XzReader& xz, archive* ar)
        : opt_(opt),
          root_(root),
          max_entry_bytes_(std::min(opt.max_entry_bytes, PackageExtractor::kDefaultMaxEntryBytes)),
          xz_(xz),
          ar_(ar),
          buf_(64 * 1024) {}

    // Maps a libarchive read failure to the layer that caused it.
    Result StreamError(const std::string& what) const {
        const Result& xz_err = xz_.LastError();
        if (!xz_err.is_ok()) {
            return Result::Fail(xz_err.kind, what + ": " + xz_err.msg, xz_err.err);
        }
        return Result::Fail(ErrorKind::ArchiveFormat, what + ": " + ArchiveErr(ar_));
    }

    Result ExtractDirectory(const SanitizedTarget& target, archive_entry* entry) {
        const mode_t perm = (archive_entry_perm(entry) & kDirPermMask) | kDirPermFloor;

        auto res = MakeDirectoriesUnder(root_, target.relative);
        if (!res.is_ok()) return res;

        if (::chmod(target.absolute.c_str(), perm) != 0) {
            const int e = errno;
            return Result::Fail(ErrorKind::Io,
                                "Failed to set mode of folder " + target.relative + ": " + std::strerror(e),
                                e);
        }
        return Result::Ok();
    }

    Result ExtractRegular(const SanitizedTarget& target, archive_entry* entry) {
        const la_int64_t declared = archive_entry_size(entry);
        if (declared < 0) {
            return Result::Fail(ErrorKind::ArchiveFormat, "Invalid size for entry: " + target.relative);
        }
        const auto size = static_cast<std::uint64_t>(declared);

        if (size > max_entry_bytes_) {
            return Result::Fail(ErrorKind::SizeLimit,
                                "File too large: " + target.relative + " (" + std::to_string(size) +
                                    " bytes, limit " + std::to_string(max_entry_bytes_) + ")");
        }
        if (opt_.max_total_bytes > 0 && total_declared_ + size > opt_.max_total_bytes) {
            return Result::Fail(ErrorKind::SizeLimit,
                                "Archive exceeds total size budget of " +
                                    std::to_string(opt_.max_total_bytes) + " bytes at " +
                                    target.relative);
        }
        total_declared_ += size;

        const std::string parent = fs::path(target.relative).parent_path().string();
        auto dir_res = MakeDirectoriesUnder(root_, parent);
        if (!dir_res.is_ok()) {
            return Result::Fail(ErrorKind::Io,
                                "Failed to create a file path for " + target.relative + ": " + dir_res.msg,
                                dir_res.err);
        }

        const int raw_fd = ::open(target.absolute.c_str(),
                                  O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC,
                                  kFileMode);
        if (raw_fd < 0) {
            const int e = errno;
            return Result::Fail(ErrorKind::Io,
                                "Failed to create file " + target.relative + ": " + std::strerror(e),
                                e);
        }
        Fd fd(raw_fd);

        std::uint64_t copied = 0;
        while (true) {
            const la_ssize_t n = archive_read_data(ar_, buf_.data(), buf_.size());
            if (n == 0) break;
            if (n < 0) return StreamError("Failed to read data of " + target.relative);

            const auto chunk = static_cast<std::uint64_t>(n);
            if (copied + chunk > size) {
                return Result::Fail(ErrorKind::ArchiveFormat,
                                    "Entry data exceeds declared size: " + target.relative);
            }
            auto wr = WriteAllToFd(fd.Get(), buf_.data(), static_cast<size_t>(n));
            if (!wr.is_ok()) {
                return Result::Fail(ErrorKind::Io,
                                    "Failed to write file " + target.relative + ": " + wr.msg, wr.err);
            }
            copied += chunk;
        }

        if (copied != size) {
            return Result::Fail(ErrorKind::ArchiveFormat,
                                "Truncated data for " + target.relative + " (" +
                                    std::to_string(copied) + " of " + std::to_string(size) +
                                    " bytes)");
        }
        if (const int e = fd.Close(); e != 0) {
            return Result::Fail(ErrorKind::Io,
                                "Failed to write file " + target.relative + ": " + std::strerror(e),
                                e);
        }

        bytes_written_ += copied;
        return Result::Ok();
    }

    std::uint64_t bytes_written() const { return bytes_written_; }

  private:
    const PackageExtractor::Options& opt_;
    const fs::path& root_;
    const std::uint64_t max_entry_bytes_;
    XzReader& xz_;
    archive* ar_;
    std::vector<std::uint8_t> buf_;
    std::uint64_t total_declared_ = 0;
    std::uint64_t bytes_written_ = 0;
};

} // namespace

ExtractionOutcome PackageExtractor::Extract(const std::string& archive_path,
                                            const std::string& destination_root) const {
    auto reader = std::make_unique<FileOrStdinReader>();
    auto open_res = FileOrStdinReader::Open(archive_path, *reader);
    if (!open_res.is_ok()) {
        ExtractionOutcome outcome;
        outcome.status = open_res;
        return outcome;
    }
    return ExtractStream(std::move(reader), destination_root);
}

ExtractionOutcome PackageExtractor::ExtractStream(std::unique_ptr<IReader> compressed,
                                                  const std::string& destination_root) const {
    ExtractionOutcome outcome;

    fs::path root;
    auto dst_res = PrepareDestination(destination_root, root);
    if (!dst_res.is_ok()) {
        outcome.status = dst_res;
        return outcome;
    }

    std::unique_ptr<XzReader> xz;
    try {
        xz = std::make_unique<XzReader>(std::move(compressed), opt_.decoder_memlimit);
    } catch (const std::exception& e) {
        outcome.status = Result::Fail(ErrorKind::Io, std::string("Cannot create the xz reader: ") + e.what());
        return outcome;
    }

    // Declared before the archive so it outlives archive_read_free().
    ArchiveReaderContext ctx(*xz);
    ArchiveReadPtr ar = NewTarOnlyReader();
    if (!ar) {
        outcome.status = Result::Fail(ErrorKind::Io, "archive_read_new failed");
        return outcome;
    }

    ExtractionRun run(opt_, root, *xz, ar.get());

    if (OpenArchiveFromReader(ar.get(), ctx) != ARCHIVE_OK) {
        outcome.status = run.StreamError("Cannot read archive");
        return outcome;
    }

    const ArchivePathPolicy policy(root);
    archive_entry* entry = nullptr;

    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) {
            outcome.status = run.StreamError("Error during reading archive");
            return outcome;
        }
        if (r == ARCHIVE_WARN) {
            // Typically a pax UTF-8 name that the current locale cannot represent.
            LogDebug("archive header warning: %s", ArchiveErr(ar.get()).c_str());
        }

        const char* raw_name = archive_entry_pathname(entry);
        if (!raw_name) raw_name = archive_entry_pathname_utf8(entry);
        if (!raw_name) {
            outcome.status = Result::Fail(ErrorKind::ArchiveFormat, "Archive entry has no readable name");
            return outcome;
        }
        const std::string name(raw_name);
        const EntryKind kind = ClassifyEntry(entry);

        SanitizedTarget target;
        Result res = policy.Resolve(name, target);
        if (res.is_ok() && target.relative.empty()) {
            if (kind == EntryKind::Directory) {
                LogDebug("skipping archive root entry: %s", name.c_str());
                continue;
            }
            res = Result::Fail(ErrorKind::PathSecurity, "Entry resolves to destination root: " + name);
        }

        if (res.is_ok()) {
            LogDebug("entry: %s -> %s", name.c_str(), target.absolute.c_str());

            switch (kind) {
                case EntryKind::Directory:
                    res = run.ExtractDirectory(target, entry);
                    break;
                case EntryKind::Regular:
                    res = run.ExtractRegular(target, entry);
                    break;
                case EntryKind::Symlink:
                case EntryKind::Hardlink:
                    res = Result::Fail(ErrorKind::PathSecurity,
                                       "Symbolic/hard links not allowed in archive: " + name);
                    break;
                case EntryKind::Other: {
                    std::string warning =
                        std::string("Skipping ") + DescribeFileType(entry) + " entry: " + name;
                    LogWarn("%s", warning.c_str());
                    outcome.warnings.push_back(std::move(warning));
                    if (archive_read_data_skip(ar.get()) != ARCHIVE_OK) {
                        res = run.StreamError("Failed to skip " + name);
                        break;
                    }
                    continue;
                }
            }
        }

        if (!res.is_ok()) {
            LogDebug("rejecting entry %s: %s", name.c_str(), res.msg.c_str());
            outcome.entry = name;
            outcome.status = std::move(res);
            outcome.bytes_written = run.bytes_written();
            return outcome;
        }
        ++outcome.entries_written;
    }

    outcome.bytes_written = run.bytes_written();
    return outcome;
}

} // namespace apg
