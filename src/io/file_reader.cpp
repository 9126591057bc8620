#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace apg {

Result FileOrStdinReader::Open(std::string path, FileOrStdinReader& out) {
    out.path_ = std::move(path);

    if (out.path_ == "-") {
        out.fd_.Reset(STDIN_FILENO);
        return Result::Ok();
    }

    int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int e = errno;
        return Result::Fail(ErrorKind::Io,
                            "Cannot open archive: " + out.path_ + " (" + std::strerror(e) + ")",
                            e);
    }
    out.fd_.Reset(fd);

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        const int e = errno;
        (void)out.fd_.Close();
        return Result::Fail(ErrorKind::Io,
                            "Cannot stat archive: " + out.path_ + " (" + std::strerror(e) + ")",
                            e);
    }
    if (S_ISDIR(st.st_mode)) {
        (void)out.fd_.Close();
        return Result::Fail(ErrorKind::Io, "Cannot open archive: " + out.path_ + " is a directory",
                            EISDIR);
    }

    return Result::Ok();
}

ssize_t FileOrStdinReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

} // namespace apg
