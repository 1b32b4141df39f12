#pragma once

#include <filesystem>
#include <string>

namespace cactisynth::core {

struct Config {
    std::string language = "en";
    // Relative to the working directory at the time of use.
    std::filesystem::path outputPath = "output";
    std::string projectExtension = ".okmt";

    // Legacy UTAU text files are Shift-JIS. Any name QStringDecoder accepts works.
    std::string textEncoding = "Shift_JIS";

    std::string sampleExtension = ".wav";

    // 0 = hardware concurrency, 1 = load oto.ini files on the calling thread.
    unsigned int voiceBankLoadThreads = 1;

    // Throws PreconditionError when path is an existing regular file.
    void setOutputPath(const std::filesystem::path& path, bool mkdir = true);

    [[nodiscard]] static Config fromIniFile(const std::filesystem::path& path);
};

} // namespace cactisynth::core
