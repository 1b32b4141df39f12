#include "cactisynth/core/OtoSetting.h"

#include "TextUtil.h"
#include "cactisynth/core/Logging.h"
#include "cactisynth/core/TextCodec.h"

#include <utility>

namespace cactisynth::core {

OtoSetting::OtoSetting(std::filesystem::path path)
    : m_path(std::move(path)) {
}

OtoSetting OtoSetting::load(const std::filesystem::path& path, const Config& config) {
    OtoSetting setting(path);
    for (const auto& line : readTextLines(path, config.textEncoding)) {
        if (detail::trim(line).empty()) {
            continue;
        }
        setting.addEntry(OtoEntry::fromLine(line));
    }

    qCInfo(lcOto).noquote() << "Loaded" << setting.size() << "OTO entries from" << qs(path);
    return setting;
}

void OtoSetting::save(const std::filesystem::path& path, const Config& config) const {
    std::vector<std::string> lines;
    lines.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        lines.push_back(entry.toLine());
    }

    writeTextLines(path, lines, config.textEncoding);
    qCInfo(lcOto).noquote() << "Saved" << lines.size() << "OTO entries to" << qs(path);
}

void OtoSetting::addEntry(OtoEntry entry) {
    m_entries.push_back(std::move(entry));
}

std::vector<OtoEntry> OtoSetting::findEntries(OtoField field, const OtoValue& value) const {
    requireOtoValueType(field, value);

    std::vector<OtoEntry> found;
    for (const auto& entry : m_entries) {
        if (otoFieldEquals(entry, field, value)) {
            found.push_back(entry);
        }
    }

    if (found.empty()) {
        found.emplace_back();
    }
    return found;
}

std::vector<OtoEntry> OtoSetting::findEntries(std::string_view fieldName, const OtoValue& value) const {
    return findEntries(otoFieldFromName(fieldName), value);
}

const std::vector<OtoEntry>& OtoSetting::entries() const {
    return m_entries;
}

std::size_t OtoSetting::size() const {
    return m_entries.size();
}

const std::filesystem::path& OtoSetting::path() const {
    return m_path;
}

} // namespace cactisynth::core
