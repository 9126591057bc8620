#pragma once

#include "apg/metadata.hpp"

#include <expected>
#include <string>

namespace apg {

class MetadataParser {
  public:
    // Fails on malformed JSON, a non-object root, or a schema field of the
    // wrong JSON type. Missing fields are not an error here.
    std::expected<MetadataRecord, std::string> Parse(const std::string& json_input,
                                                     FormatVersion version) const;
};

} // namespace apg
