#include "io/xz_reader.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace apg {

namespace {

const char* DescribeLzmaError(lzma_ret ret) {
    switch (ret) {
        case LZMA_FORMAT_ERROR:   return "not an xz stream (bad header magic)";
        case LZMA_OPTIONS_ERROR:  return "unsupported xz stream options";
        case LZMA_DATA_ERROR:     return "corrupt xz data";
        case LZMA_BUF_ERROR:      return "truncated xz stream";
        case LZMA_MEMLIMIT_ERROR: return "xz decoder memory limit exceeded";
        case LZMA_MEM_ERROR:      return "out of memory in xz decoder";
        default:                  return "xz decoder error";
    }
}

} // namespace

XzReader::XzReader(std::unique_ptr<IReader> source, std::uint64_t memlimit)
    : source_(std::move(source)), in_buffer_(64 * 1024) {
    if (!source_) {
        throw std::invalid_argument("XzReader: null source");
    }
    // No LZMA_CONCATENATED: the decoder stops after the first stream.
    const lzma_ret ret = lzma_stream_decoder(&strm_, memlimit, 0);
    if (ret != LZMA_OK) {
        throw std::runtime_error(std::string("Failed to initialize xz decoder: ") +
                                 DescribeLzmaError(ret));
    }
}

XzReader::~XzReader() {
    lzma_end(&strm_);
}

ssize_t XzReader::Fail(lzma_ret ret) {
    error_ = Result::Fail(ErrorKind::ArchiveFormat, DescribeLzmaError(ret), static_cast<int>(ret));
    return -1;
}

ssize_t XzReader::Read(std::span<std::uint8_t> out) {
    if (!error_.is_ok()) return -1;
    if (finished_ || out.empty()) return 0;

    strm_.next_out = out.data();
    strm_.avail_out = out.size();

    while (strm_.avail_out > 0) {
        if (strm_.avail_in == 0 && !source_eof_) {
            const ssize_t n = source_->Read(std::span<std::uint8_t>(in_buffer_.data(), in_buffer_.size()));
            if (n < 0) {
                const int e = errno != 0 ? errno : EIO;
                error_ = Result::Fail(ErrorKind::Io,
                                      std::string("read error on compressed input: ") + std::strerror(e),
                                      e);
                return -1;
            }
            if (n == 0) {
                source_eof_ = true;
            } else {
                strm_.next_in = in_buffer_.data();
                strm_.avail_in = static_cast<size_t>(n);
            }
        }

        const lzma_action action = (source_eof_ && strm_.avail_in == 0) ? LZMA_FINISH : LZMA_RUN;
        const lzma_ret ret = lzma_code(&strm_, action);

        if (ret == LZMA_STREAM_END) {
            finished_ = true;
            break;
        }
        if (ret != LZMA_OK) {
            // With LZMA_FINISH a stream cut short reports LZMA_BUF_ERROR.
            return Fail(ret);
        }
    }

    return static_cast<ssize_t>(out.size() - strm_.avail_out);
}

} // namespace apg
