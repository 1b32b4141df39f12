#include "cactisynth/core/VoiceBank.h"

#include "TextUtil.h"
#include "cactisynth/core/Error.h"
#include "cactisynth/core/Logging.h"
#include "cactisynth/core/TextCodec.h"

#include <algorithm>
#include <array>
#include <chrono>
#include <future>
#include <optional>
#include <system_error>
#include <thread>
#include <utility>

namespace cactisynth::core {
namespace {

using detail::startsWith;
using detail::toLowerAscii;
using detail::trim;

std::size_t resolveWorkerCount(unsigned int requested, std::size_t jobCount) {
    if (jobCount == 0) {
        return 1;
    }

    const auto hardware = std::max(1U, std::thread::hardware_concurrency());
    const auto wanted = requested == 0 ? hardware : requested;
    return std::clamp<std::size_t>(wanted, 1, jobCount);
}

template <typename Visitor>
void walkFiles(const std::filesystem::path& root, Visitor&& visit) {
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    const std::filesystem::recursive_directory_iterator end;

    while (!ec && it != end) {
        if (it->is_regular_file(ec)) {
            visit(it->path());
        }
        it.increment(ec);
    }

    if (ec) {
        qCWarning(lcVoiceBank).noquote() << "Directory walk under" << qs(root)
                                         << "stopped early:" << qs(ec.message());
    }
}

std::optional<OtoSetting> loadOtoFile(const std::filesystem::path& path, const Config& config) {
    try {
        return OtoSetting::load(path, config);
    } catch (const NotFoundError& ex) {
        qCWarning(lcVoiceBank).noquote() << "Skipping" << qs(path) << ":" << ex.what();
    } catch (const ParseError& ex) {
        qCWarning(lcVoiceBank).noquote() << "Skipping" << qs(path) << ":" << ex.what();
    } catch (const IoError& ex) {
        qCWarning(lcVoiceBank).noquote() << "Skipping" << qs(path) << ":" << ex.what();
    }
    return std::nullopt;
}

} // namespace

VoiceBank VoiceBank::load(const std::filesystem::path& rootDir, const Config& config) {
    if (!std::filesystem::is_directory(rootDir)) {
        throw NotFoundError("Voicebank directory not found: " + rootDir.string());
    }

    const auto started = std::chrono::steady_clock::now();

    VoiceBank bank;
    bank.m_root = std::filesystem::absolute(rootDir).lexically_normal();
    if (!bank.m_root.has_filename()) {
        bank.m_root = bank.m_root.parent_path();
    }

    bank.readCharacterFile(bank.m_root / "character.txt", config);
    bank.readReadme(bank.m_root / "readme.txt", config);
    if (bank.m_sample.empty()) {
        bank.m_sample = "Random";
    }

    bank.loadOtoSettings(config);
    bank.countSamples(config);

    const auto finished = std::chrono::steady_clock::now();
    bank.m_report.elapsedMs = std::chrono::duration<double, std::milli>(finished - started).count();

    qCInfo(lcVoiceBank).noquote() << "Loaded voicebank" << qs(bank.m_name) << "from" << qs(bank.m_root) << ":"
                                  << bank.m_otoSettings.size() << "OTO settings," << bank.m_otoCount
                                  << "entries," << bank.m_fileCount << "samples";
    return bank;
}

void VoiceBank::readCharacterFile(const std::filesystem::path& path, const Config& config) {
    // Matched in this order only. A line for any other field is skipped without
    // advancing, and the cursor stays on the last field once it gets there.
    const std::array<std::pair<const char*, std::string VoiceBank::*>, 5> fields{{
        {"name", &VoiceBank::m_name},
        {"author", &VoiceBank::m_author},
        {"image", &VoiceBank::m_image},
        {"sample", &VoiceBank::m_sample},
        {"web", &VoiceBank::m_web},
    }};

    std::vector<std::string> lines;
    try {
        lines = readTextLines(path, config.textEncoding);
    } catch (const NotFoundError&) {
        qCWarning(lcVoiceBank).noquote() << "No character.txt in" << qs(path.parent_path());
        return;
    } catch (const ParseError& ex) {
        qCWarning(lcVoiceBank).noquote() << "Ignoring unreadable" << qs(path) << ":" << ex.what();
        return;
    }

    std::size_t cursor = 0;
    for (const auto& line : lines) {
        const auto prefix = std::string(fields[cursor].first) + "=";
        if (!startsWith(line, prefix)) {
            continue;
        }
        this->*fields[cursor].second = trim(line.substr(prefix.size()));
        cursor = std::min(cursor + 1, fields.size() - 1);
    }
}

void VoiceBank::readReadme(const std::filesystem::path& path, const Config& config) {
    try {
        m_readme = readTextFile(path, config.textEncoding);
    } catch (const NotFoundError&) {
        qCDebug(lcVoiceBank).noquote() << "No readme.txt in" << qs(path.parent_path());
    } catch (const ParseError& ex) {
        qCWarning(lcVoiceBank).noquote() << "Ignoring unreadable" << qs(path) << ":" << ex.what();
    }
}

void VoiceBank::loadOtoSettings(const Config& config) {
    std::vector<std::filesystem::path> otoPaths;
    walkFiles(m_root, [&](const std::filesystem::path& path) {
        if (toLowerAscii(path.filename().string()) == "oto.ini") {
            otoPaths.push_back(path);
        }
    });
    std::sort(otoPaths.begin(), otoPaths.end());

    const auto workerCount = resolveWorkerCount(config.voiceBankLoadThreads, otoPaths.size());
    std::vector<std::optional<OtoSetting>> loaded(otoPaths.size());

    if (workerCount == 1) {
        for (std::size_t i = 0; i < otoPaths.size(); ++i) {
            loaded[i] = loadOtoFile(otoPaths[i], config);
        }
    } else {
        std::vector<std::future<void>> tasks;
        tasks.reserve(workerCount);
        for (std::size_t worker = 0; worker < workerCount; ++worker) {
            tasks.push_back(std::async(std::launch::async, [&, worker]() {
                for (std::size_t i = worker; i < otoPaths.size(); i += workerCount) {
                    loaded[i] = loadOtoFile(otoPaths[i], config);
                }
            }));
        }
        for (auto& task : tasks) {
            task.get();
        }
    }

    // Assembled in sorted path order so the result does not depend on scheduling.
    m_otoCount = 0;
    for (std::size_t i = 0; i < otoPaths.size(); ++i) {
        if (!loaded[i]) {
            ++m_report.otoFilesSkipped;
            continue;
        }

        auto key = otoPaths[i].parent_path().filename().string();
        const auto existing = m_otoSettings.find(key);
        if (existing != m_otoSettings.end()) {
            qCWarning(lcVoiceBank).noquote() << qs(otoPaths[i]) << "replaces" << qs(existing->second.path())
                                             << "under key" << qs(key);
        }
        m_otoSettings.insert_or_assign(std::move(key), std::move(*loaded[i]));
        ++m_report.otoFilesLoaded;
    }

    for (const auto& [key, setting] : m_otoSettings) {
        m_otoCount += setting.size();
    }

    m_report.otoFilesFound = otoPaths.size();
    m_report.workerThreads = workerCount;
}

void VoiceBank::countSamples(const Config& config) {
    const auto extension = toLowerAscii(config.sampleExtension);
    m_fileCount = 0;
    walkFiles(m_root, [&](const std::filesystem::path& path) {
        if (toLowerAscii(path.extension().string()) == extension) {
            ++m_fileCount;
        }
    });
}

const std::string& VoiceBank::name() const {
    return m_name;
}

const std::string& VoiceBank::author() const {
    return m_author;
}

const std::string& VoiceBank::image() const {
    return m_image;
}

const std::string& VoiceBank::sample() const {
    return m_sample;
}

const std::string& VoiceBank::web() const {
    return m_web;
}

const std::string& VoiceBank::readme() const {
    return m_readme;
}

const std::filesystem::path& VoiceBank::root() const {
    return m_root;
}

const std::map<std::string, OtoSetting>& VoiceBank::otoSettings() const {
    return m_otoSettings;
}

const std::map<std::string, std::string>& VoiceBank::prefixMap() const {
    return m_prefixMap;
}

std::size_t VoiceBank::otoCount() const {
    return m_otoCount;
}

std::size_t VoiceBank::fileCount() const {
    return m_fileCount;
}

const VoiceBankLoadReport& VoiceBank::loadReport() const {
    return m_report;
}

std::vector<OtoEntry> VoiceBank::findEntries(OtoField field, const OtoValue& value) const {
    requireOtoValueType(field, value);

    std::vector<OtoEntry> found;
    for (const auto& [key, setting] : m_otoSettings) {
        for (const auto& entry : setting.entries()) {
            if (otoFieldEquals(entry, field, value)) {
                found.push_back(entry);
            }
        }
    }

    if (found.empty()) {
        found.emplace_back();
    }
    return found;
}

std::vector<OtoEntry> VoiceBank::findEntries(std::string_view fieldName, const OtoValue& value) const {
    return findEntries(otoFieldFromName(fieldName), value);
}

const OtoEntry* VoiceBank::lookup(const std::string& alias) const {
    for (const auto& [key, setting] : m_otoSettings) {
        const auto found = std::ranges::find(setting.entries(), alias, &OtoEntry::alias);
        if (found != setting.entries().end()) {
            return &*found;
        }
    }
    return nullptr;
}

} // namespace cactisynth::core
