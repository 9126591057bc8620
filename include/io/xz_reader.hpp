#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <lzma.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace apg {

// Decodes exactly one .xz stream from `source`. Bytes after the end of the
// first stream are never read. Throws std::runtime_error if the decoder
// cannot be initialized.
class XzReader final : public IReader {
  public:
    static constexpr std::uint64_t kDefaultMemlimit = 256ULL * 1024 * 1024;

    explicit XzReader(std::unique_ptr<IReader> source, std::uint64_t memlimit = kDefaultMemlimit);
    ~XzReader() override;

    XzReader(const XzReader&) = delete;
    XzReader& operator=(const XzReader&) = delete;

    ssize_t Read(std::span<std::uint8_t> out) override;

    // Ok while no Read() has failed; afterwards describes the failure
    // (Io for the underlying source, ArchiveFormat for the xz layer).
    const Result& LastError() const { return error_; }
    bool Finished() const { return finished_; }

  private:
    ssize_t Fail(lzma_ret ret);

    std::unique_ptr<IReader> source_;
    lzma_stream strm_ = LZMA_STREAM_INIT;
    std::vector<std::uint8_t> in_buffer_;
    bool source_eof_ = false;
    bool finished_ = false;
    Result error_;
};

} // namespace apg
