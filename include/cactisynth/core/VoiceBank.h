#pragma once

#include "cactisynth/core/Config.h"
#include "cactisynth/core/OtoSetting.h"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace cactisynth::core {

struct VoiceBankLoadReport {
    std::size_t otoFilesFound = 0;
    std::size_t otoFilesLoaded = 0;
    std::size_t otoFilesSkipped = 0;
    std::size_t workerThreads = 1;
    double elapsedMs = 0.0;
};

class VoiceBank {
public:
    // Throws NotFoundError when rootDir is not a directory. A missing character.txt
    // or readme.txt, or an oto.ini that cannot be decoded, is logged and skipped.
    [[nodiscard]] static VoiceBank load(const std::filesystem::path& rootDir, const Config& config);

    [[nodiscard]] const std::string& name() const;
    [[nodiscard]] const std::string& author() const;
    [[nodiscard]] const std::string& image() const;
    [[nodiscard]] const std::string& sample() const;
    [[nodiscard]] const std::string& web() const;
    [[nodiscard]] const std::string& readme() const;
    [[nodiscard]] const std::filesystem::path& root() const;

    // Keyed by the name of the directory holding each oto.ini.
    [[nodiscard]] const std::map<std::string, OtoSetting>& otoSettings() const;
    // prefix.map support is not implemented; always empty.
    [[nodiscard]] const std::map<std::string, std::string>& prefixMap() const;

    [[nodiscard]] std::size_t otoCount() const;
    [[nodiscard]] std::size_t fileCount() const;
    [[nodiscard]] const VoiceBankLoadReport& loadReport() const;

    // Same contract as OtoSetting::findEntries, across every setting in key order.
    [[nodiscard]] std::vector<OtoEntry> findEntries(OtoField field, const OtoValue& value) const;
    [[nodiscard]] std::vector<OtoEntry> findEntries(std::string_view fieldName, const OtoValue& value) const;

    [[nodiscard]] const OtoEntry* lookup(const std::string& alias) const;

private:
    void readCharacterFile(const std::filesystem::path& path, const Config& config);
    void readReadme(const std::filesystem::path& path, const Config& config);
    void loadOtoSettings(const Config& config);
    void countSamples(const Config& config);

    std::filesystem::path m_root;
    std::string m_name;
    std::string m_author;
    std::string m_image;
    std::string m_sample;
    std::string m_web;
    std::string m_readme;
    std::map<std::string, OtoSetting> m_otoSettings;
    std::map<std::string, std::string> m_prefixMap;
    std::size_t m_otoCount = 0;
    std::size_t m_fileCount = 0;
    VoiceBankLoadReport m_report;
};

} // namespace cactisynth::core
