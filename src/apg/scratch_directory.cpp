#include "apg/scratch_directory.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace apg {

namespace {

class PosixSystemOps final : public ScratchDirectory::ISystemOps {
  public:
    Result CreateUniqueDir(std::string_view base_dir,
                           std::string_view prefix,
                           std::string& out_dir) const override {
        const fs::path base(base_dir);
        std::error_code ec;
        fs::create_directories(base, ec);
        if (ec) {
            return Result::Fail(ErrorKind::Io,
                                "Cannot create scratch base " + base.string() + ": " + ec.message(),
                                ec.value());
        }

        std::string tmpl = (base / (std::string(prefix) + "XXXXXX")).string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');

        // mkdtemp creates the directory with mode 0700.
        char* created = ::mkdtemp(buf.data());
        if (!created) {
            const int e = errno;
            return Result::Fail(ErrorKind::Io, "mkdtemp failed: " + std::string(std::strerror(e)), e);
        }

        out_dir = created;
        return Result::Ok();
    }

    Result RemoveTree(std::string_view dir) const override {
        std::error_code ec;
        fs::remove_all(fs::path(dir), ec);
        if (ec) {
            return Result::Fail(ErrorKind::Io,
                                "Failed to delete temp folder " + std::string(dir) + ": " + ec.message(),
                                ec.value());
        }
        return Result::Ok();
    }
};

} // namespace

std::shared_ptr<const ScratchDirectory::ISystemOps> ScratchDirectory::DefaultSystemOps() {
    static const std::shared_ptr<const ISystemOps> kDefault = std::make_shared<PosixSystemOps>();
    return kDefault;
}

std::string ScratchDirectory::DefaultBaseDir() {
    const char* tmpdir = std::getenv("TMPDIR");
    if (tmpdir && *tmpdir) return tmpdir;
    return "/tmp";
}

std::string ScratchDirectory::NamePrefix() {
    return "apgcheck-" + std::to_string(static_cast<long>(::getpid())) + "-";
}

ScratchDirectory::ScratchDirectory() : system_ops_(DefaultSystemOps()) {}

ScratchDirectory::ScratchDirectory(std::shared_ptr<const ISystemOps> system_ops)
    : system_ops_(system_ops ? std::move(system_ops) : DefaultSystemOps()) {}

ScratchDirectory::ScratchDirectory(ScratchDirectory&& other) noexcept
    : system_ops_(std::move(other.system_ops_)), dir_(std::move(other.dir_)) {
    other.dir_.clear();
    other.system_ops_ = DefaultSystemOps();
}

ScratchDirectory& ScratchDirectory::operator=(ScratchDirectory&& other) noexcept {
    if (this == &other)
        return *this;
    Cleanup();
    system_ops_ = std::move(other.system_ops_);
    dir_ = std::move(other.dir_);
    other.dir_.clear();
    other.system_ops_ = DefaultSystemOps();
    return *this;
}

ScratchDirectory::~ScratchDirectory() { Cleanup(); }

Result ScratchDirectory::Create(std::string_view base_dir, ScratchDirectory& out) {
    out.Cleanup();

    const std::string base = base_dir.empty() ? DefaultBaseDir() : std::string(base_dir);
    auto create_result = out.system_ops_->CreateUniqueDir(base, NamePrefix(), out.dir_);
    if (!create_result.is_ok()) {
        out.dir_.clear();
        return create_result;
    }

    LogDebug("scratch directory: %s", out.dir_.c_str());
    return Result::Ok();
}

Result ScratchDirectory::Remove() {
    if (dir_.empty())
        return Result::Ok();

    const std::string dir = std::move(dir_);
    dir_.clear();
    return system_ops_->RemoveTree(dir);
}

void ScratchDirectory::Cleanup() {
    auto res = Remove();
    if (!res.is_ok()) {
        LogWarn("%s", res.msg.c_str());
    }
}

} // namespace apg
