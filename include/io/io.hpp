#pragma once

#include <cstdint>
#include <span>
#include <sys/types.h>

namespace apg {

class IReader {
  public:
    virtual ~IReader() = default;
    // Returns bytes read, 0 at end of stream, -1 on error with errno set.
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
};

} // namespace apg
