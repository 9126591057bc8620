#include "apg/tar_reader_adapter.hpp"

namespace apg {

namespace {

la_ssize_t ReadCb(struct archive*, void* client_data, const void** out_buf) {
    auto* ctx = static_cast<ArchiveReaderContext*>(client_data);
    const ssize_t n = ctx->reader->Read(std::span<std::uint8_t>(ctx->buffer.data(), ctx->buffer.size()));
    if (n < 0) return -1;

    *out_buf = ctx->buffer.data();
    return static_cast<la_ssize_t>(n);
}

} // namespace

ArchiveReadPtr NewTarOnlyReader() {
    ArchiveReadPtr ar(archive_read_new());
    if (!ar) return ar;

    if (archive_read_support_filter_none(ar.get()) != ARCHIVE_OK ||
        archive_read_support_format_tar(ar.get()) != ARCHIVE_OK) {
        ar.reset();
    }
    return ar;
}

int OpenArchiveFromReader(struct archive* ar, ArchiveReaderContext& ctx) {
    // No close callback: the context is owned by the caller.
    return archive_read_open2(ar, &ctx, nullptr, ReadCb, nullptr, nullptr);
}

std::string ArchiveErr(struct archive* ar) {
    const char* s = ar ? archive_error_string(ar) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

} // namespace apg
