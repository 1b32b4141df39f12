#include "cactisynth/core/UstParser.h"

#include "TextUtil.h"
#include "cactisynth/core/Error.h"
#include "cactisynth/core/Logging.h"
#include "cactisynth/core/TextCodec.h"

#include <algorithm>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cactisynth::core {
namespace {

using detail::isDigits;
using detail::parseDouble;
using detail::parseInt;
using detail::startsWith;
using detail::toLowerAscii;
using detail::trim;

struct Chunk {
    std::string header;
    std::size_t headerLine = 0;
    std::vector<std::string> lines;
};

std::vector<Chunk> splitChunks(const std::vector<std::string>& lines) {
    std::vector<Chunk> chunks;
    std::unordered_map<std::string, std::size_t> byHeader;
    std::optional<std::size_t> current;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];

        if (startsWith(line, "[")) {
            auto header = trim(line);
            const auto found = byHeader.find(header);
            if (found != byHeader.end()) {
                // Same behaviour as a keyed chunk table: the later body wins.
                qCWarning(lcUst).noquote() << "Duplicate chunk" << qs(header) << "at line" << i + 1
                                           << "replaces the one at line" << chunks[found->second].headerLine;
                chunks[found->second].lines.clear();
                chunks[found->second].headerLine = i + 1;
                current = found->second;
            } else {
                byHeader.emplace(header, chunks.size());
                current = chunks.size();
                chunks.push_back({.header = std::move(header), .headerLine = i + 1, .lines = {}});
            }
            continue;
        }

        if (!current) {
            if (!trim(line).empty()) {
                qCWarning(lcUst).noquote() << "Ignoring line" << i + 1 << "before the first chunk:" << qs(line);
            }
            continue;
        }

        chunks[*current].lines.push_back(trim(line));
    }

    return chunks;
}

std::string chunkName(std::string header) {
    if (startsWith(header, "[")) {
        header.erase(header.begin());
    }
    if (!header.empty() && header.back() == ']') {
        header.pop_back();
    }
    const auto first = header.find_first_not_of('#');
    header.erase(0, first == std::string::npos ? header.size() : first);
    return toLowerAscii(header);
}

std::string parseVersion(const std::vector<std::string>& lines) {
    const auto found = std::ranges::find_if(lines, [](const std::string& line) { return !line.empty(); });
    return found == lines.end() ? std::string{} : *found;
}

void applySetting(Project& project, const std::string& key, const std::string& value) {
    if (key == "Tempo") {
        if (const auto tempo = parseDouble(value)) {
            project.setTempo(*tempo);
        } else {
            qCWarning(lcUst).noquote() << "Tempo =" << qs(value) << "is not a number, keeping" << project.tempo();
        }
    } else if (key == "Tracks") {
        if (const auto tracks = parseInt(value)) {
            project.setTrackCount(*tracks);
        } else {
            qCWarning(lcUst).noquote() << "Tracks =" << qs(value) << "is not an integer, keeping"
                                       << project.trackCount();
        }
    } else if (key == "ProjectName") {
        project.setName(value);
    } else if (key == "VoiceDir") {
        project.setVoiceDir(value);
    } else if (key == "OutFile") {
        project.setOutFile(value);
    } else if (key == "CacheDir") {
        project.setCacheDir(value);
    }
}

void parseSetting(Project& project, const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        if (line.empty()) {
            continue;
        }

        const auto sep = line.find('=');
        if (sep == std::string::npos) {
            qCWarning(lcUst).noquote() << "Skipping SETTING line without '=':" << qs(line);
            continue;
        }

        const auto key = trim(line.substr(0, sep));
        const auto value = trim(line.substr(sep + 1));

        if (startsWith(key, "Tool")) {
            project.addTool(value);
        } else if (startsWith(key, "Mode")) {
            project.addMode(value);
        } else if (startsWith(key, "Flags")) {
            project.addFlags(value);
        }

        applySetting(project, key, value);
    }
}

// Missing or empty -> 0. Anything else that is not a non-negative integer -> 0 with a warning.
int noteField(const std::map<std::string, std::string>& fields, const std::string& key, const std::string& chunk) {
    const auto found = fields.find(key);
    if (found == fields.end() || found->second.empty()) {
        return 0;
    }

    const auto value = parseInt(found->second);
    if (!value || *value < 0) {
        qCWarning(lcUst).noquote() << "Chunk" << qs(chunk) << ":" << qs(key) << "=" << qs(found->second)
                                   << "is not a non-negative integer, using 0";
        return 0;
    }
    return *value;
}

std::optional<Note> parseNote(const std::string& chunk, const std::vector<std::string>& lines) {
    std::map<std::string, std::string> fields;
    for (const auto& line : lines) {
        if (std::ranges::count(line, '=') != 1) {
            continue;
        }
        const auto sep = line.find('=');
        fields[trim(line.substr(0, sep))] = trim(line.substr(sep + 1));
    }

    if (fields.empty()) {
        const bool blank = std::ranges::all_of(lines, [](const std::string& line) { return line.empty(); });
        if (!blank) {
            qCWarning(lcUst).noquote() << "Chunk" << qs(chunk) << "has no Key=Value lines, no note created";
        }
        return std::nullopt;
    }

    Note note;
    note.length = noteField(fields, "Length", chunk);
    note.noteNum = noteField(fields, "NoteNum", chunk);
    note.preUtterance = noteField(fields, "PreUtterance", chunk);
    note.velocity = noteField(fields, "Velocity", chunk);
    note.intensity = noteField(fields, "Intensity", chunk);
    note.modulation = noteField(fields, "Modulation", chunk);
    note.startPoint = noteField(fields, "StartPoint", chunk);
    if (const auto lyric = fields.find("Lyric"); lyric != fields.end()) {
        note.lyric = lyric->second;
    }
    return note;
}

} // namespace

Project UstParser::parse(const std::string& text) const {
    const auto chunks = splitChunks(splitLines(text));
    if (chunks.empty()) {
        throw ParseError("No UST chunks found");
    }

    Project project;
    std::vector<Note> notes;
    bool recognized = false;

    for (const auto& chunk : chunks) {
        const auto name = chunkName(chunk.header);
        if (name == "version") {
            recognized = true;
            project.setVersion(parseVersion(chunk.lines));
        } else if (name == "setting") {
            recognized = true;
            parseSetting(project, chunk.lines);
        } else if (isDigits(name)) {
            recognized = true;
            if (auto note = parseNote(chunk.header, chunk.lines)) {
                notes.push_back(std::move(*note));
            }
        } else {
            qCDebug(lcUst).noquote() << "Ignoring chunk" << qs(chunk.header);
        }
    }

    if (!recognized) {
        throw ParseError("No recognizable UST chunks");
    }

    project.addNotes(std::move(notes));
    return project;
}

Project UstParser::parseFile(const std::filesystem::path& filePath, const Config& config) const {
    const auto text = readTextFile(filePath, config.textEncoding);

    Project project;
    try {
        project = parse(text);
    } catch (const ParseError& ex) {
        throw ParseError(filePath.string() + ": " + ex.what());
    }

    qCInfo(lcUst).noquote() << "Loaded" << project.noteCount() << "notes from" << qs(filePath);
    return project;
}

} // namespace cactisynth::core
