#pragma once

#include "cactisynth/core/Config.h"
#include "cactisynth/core/Project.h"

#include <filesystem>
#include <string>

namespace cactisynth::core {

class UstParser {
public:
    // text is already decoded to UTF-8. Throws ParseError when no VERSION, SETTING or note chunk is found.
    [[nodiscard]] Project parse(const std::string& text) const;

    // Decodes with config.textEncoding before parsing.
    [[nodiscard]] Project parseFile(const std::filesystem::path& filePath, const Config& config) const;
};

} // namespace cactisynth::core
