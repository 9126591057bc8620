#pragma once

#include "io/io.hpp"

#include <archive.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace apg {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

using ArchiveReadPtr = std::unique_ptr<archive, ArchiveReadDeleter>;

// Feeds an IReader to libarchive. Must outlive the archive it is opened on.
struct ArchiveReaderContext {
    IReader* reader = nullptr;
    std::vector<std::uint8_t> buffer;

    explicit ArchiveReaderContext(IReader& in, size_t buffer_size = 64 * 1024)
        : reader(&in), buffer(buffer_size) {}
};

// A reader restricted to tar container formats with no libarchive filters;
// decompression is the caller's business.
ArchiveReadPtr NewTarOnlyReader();

int OpenArchiveFromReader(struct archive* ar, ArchiveReaderContext& ctx);
std::string ArchiveErr(struct archive* ar);

} // namespace apg
