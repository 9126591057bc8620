#pragma once

#include "apg/package_checker.hpp"
#include "util/result.hpp"

#include <cstdio>
#include <string>
#include <string_view>

namespace apg {

// Prints the verdict of a check. Colour is decided once by the caller and
// passed in; nothing here consults global state.
class ConsoleReporter {
  public:
    ConsoleReporter(std::FILE* out, std::FILE* err, bool color)
        : out_(out), err_(err), color_(color) {}

    // Colour only when requested, `stream` is a terminal and NO_COLOR is unset.
    static bool ShouldUseColor(std::FILE* stream, bool requested);

    void Report(const CheckReport& report) const;

    void PrintSuccess(std::string_view text) const;
    void PrintFailure(ErrorKind kind, std::string_view text) const;
    void PrintWarning(std::string_view text) const;

  private:
    void PrintLine(std::FILE* stream, std::string_view color, std::string_view text) const;

    std::FILE* out_;
    std::FILE* err_;
    bool color_;
};

} // namespace apg
