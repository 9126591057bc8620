#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace apg {

// Reads a regular file, or stdin when the path is "-".
class FileOrStdinReader final : public IReader {
  public:
    static Result Open(std::string path, FileOrStdinReader &out);

    ssize_t Read(std::span<std::uint8_t> out) override;

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    Fd fd_;
};

} // namespace apg
