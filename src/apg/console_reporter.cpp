#include "apg/console_reporter.hpp"

#include "util/color.hpp"

#include <cstdlib>
#include <unistd.h>

namespace apg {

bool ConsoleReporter::ShouldUseColor(std::FILE* stream, bool requested) {
    if (!requested || !stream) return false;
    const char* no_color = std::getenv("NO_COLOR");
    if (no_color && *no_color) return false;
    return ::isatty(::fileno(stream)) == 1;
}

void ConsoleReporter::PrintLine(std::FILE* stream, std::string_view color, std::string_view text) const {
    if (color_) {
        std::fprintf(stream, "%.*s%.*s%.*s\n",
                     (int)color.size(), color.data(),
                     (int)text.size(), text.data(),
                     (int)Color::RESET.size(), Color::RESET.data());
    } else {
        std::fprintf(stream, "%.*s\n", (int)text.size(), text.data());
    }
}

void ConsoleReporter::PrintSuccess(std::string_view text) const {
    PrintLine(out_, Color::GREEN, text);
}

void ConsoleReporter::PrintFailure(ErrorKind kind, std::string_view text) const {
    std::string line(ToString(kind));
    line += ": ";
    line += text;
    PrintLine(out_, Color::RED, line);
}

void ConsoleReporter::PrintWarning(std::string_view text) const {
    std::string line = "warning: ";
    line += text;
    PrintLine(err_, Color::YELLOW, line);
}

void ConsoleReporter::Report(const CheckReport& report) const {
    for (const auto& w : report.extraction.warnings) {
        PrintWarning(w);
    }

    if (report.validation && report.validation->schema_error()) {
        const auto& schema = *report.validation->schema_error();
        if (!schema.parse_error) {
            PrintFailure(ErrorKind::Schema, "Missing or empty fields in metadata:");
            for (const auto& field : schema.missing_fields) {
                PrintLine(out_, Color::RED, "  - " + field);
            }
        } else {
            PrintFailure(ErrorKind::Schema, *schema.parse_error);
        }
    } else if (const Result verdict = report.Verdict(); !verdict.is_ok()) {
        PrintFailure(verdict.kind, verdict.msg);
    } else {
        PrintSuccess("The file specified is the correct apg");
    }

    if (report.cleanup_failure) {
        PrintWarning(report.cleanup_failure->msg);
    }
}

} // namespace apg
