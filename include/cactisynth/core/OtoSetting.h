#pragma once

#include "cactisynth/core/Config.h"
#include "cactisynth/core/OtoEntry.h"

#include <cstddef>
#include <filesystem>
#include <string_view>
#include <vector>

namespace cactisynth::core {

// The entries of one oto.ini, in file order.
class OtoSetting {
public:
    OtoSetting() = default;
    explicit OtoSetting(std::filesystem::path path);

    [[nodiscard]] static OtoSetting load(const std::filesystem::path& path, const Config& config);
    void save(const std::filesystem::path& path, const Config& config) const;

    void addEntry(OtoEntry entry);

    // Every entry whose field equals value, in order. With no match the result is
    // a single default-constructed OtoEntry, never an empty vector.
    [[nodiscard]] std::vector<OtoEntry> findEntries(OtoField field, const OtoValue& value) const;
    [[nodiscard]] std::vector<OtoEntry> findEntries(std::string_view fieldName, const OtoValue& value) const;

    [[nodiscard]] const std::vector<OtoEntry>& entries() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] const std::filesystem::path& path() const;

private:
    std::filesystem::path m_path;
    std::vector<OtoEntry> m_entries;
};

} // namespace cactisynth::core
