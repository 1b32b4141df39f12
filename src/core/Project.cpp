#include "cactisynth/core/Project.h"

#include "cactisynth/core/Error.h"

#include <algorithm>
#include <iterator>
#include <utility>

namespace cactisynth::core {

void Project::setVersion(std::string value) {
    m_version = std::move(value);
}

const std::string& Project::version() const {
    return m_version;
}

void Project::setTempo(double bpm) {
    m_tempo = bpm;
}

double Project::tempo() const {
    return m_tempo;
}

void Project::setTrackCount(int count) {
    m_trackCount = count;
}

int Project::trackCount() const {
    return m_trackCount;
}

void Project::setName(std::string value) {
    m_name = std::move(value);
}

const std::string& Project::name() const {
    return m_name;
}

void Project::setVoiceDir(std::filesystem::path value) {
    m_voiceDir = std::move(value);
}

const std::filesystem::path& Project::voiceDir() const {
    return m_voiceDir;
}

void Project::setOutFile(std::filesystem::path value) {
    m_outFile = std::move(value);
}

const std::filesystem::path& Project::outFile() const {
    return m_outFile;
}

void Project::setCacheDir(std::filesystem::path value) {
    m_cacheDir = std::move(value);
}

const std::filesystem::path& Project::cacheDir() const {
    return m_cacheDir;
}

void Project::addTool(std::string tool) {
    m_tools.push_back(std::move(tool));
}

void Project::addMode(std::string mode) {
    m_modes.push_back(std::move(mode));
}

void Project::addFlags(std::string flags) {
    m_flags.push_back(std::move(flags));
}

void Project::setTools(std::vector<std::string> tools) {
    m_tools = std::move(tools);
}

void Project::setModes(std::vector<std::string> modes) {
    m_modes = std::move(modes);
}

void Project::setFlags(std::vector<std::string> flags) {
    m_flags = std::move(flags);
}

const std::vector<std::string>& Project::tools() const {
    return m_tools;
}

const std::vector<std::string>& Project::modes() const {
    return m_modes;
}

const std::vector<std::string>& Project::flags() const {
    return m_flags;
}

Project& Project::addNote(Note note) {
    std::vector<Note> single;
    single.push_back(std::move(note));
    return addNotes(std::move(single));
}

Project& Project::addNotes(std::vector<Note> notes) {
    for (const auto& note : notes) {
        validateNote(note);
    }

    sortNotes();

    for (auto& note : notes) {
        const auto index = findNoteIndex(note.startPoint);
        m_notes.insert(m_notes.begin() + static_cast<std::ptrdiff_t>(index), std::move(note));
    }

    return *this;
}

Project& Project::removeNoteByIndex(std::size_t index) {
    if (index >= m_notes.size()) {
        throw NotFoundError("Note index " + std::to_string(index) + " out of range (project has "
                            + std::to_string(m_notes.size()) + " notes)");
    }

    m_notes.erase(m_notes.begin() + static_cast<std::ptrdiff_t>(index));
    return *this;
}

std::optional<Note> Project::noteAt(std::size_t index) const {
    if (index >= m_notes.size()) {
        return std::nullopt;
    }
    return m_notes[index];
}

Project& Project::sortNotes(bool descending) {
    if (descending) {
        std::ranges::stable_sort(m_notes, [](const Note& lhs, const Note& rhs) {
            return lhs.startPoint > rhs.startPoint;
        });
    } else {
        std::ranges::stable_sort(m_notes, {}, &Note::startPoint);
    }
    return *this;
}

std::size_t Project::findNoteIndex(int startPoint) const {
    if (m_notes.empty() || startPoint <= m_notes.front().startPoint) {
        return 0;
    }
    if (startPoint >= m_notes.back().startPoint) {
        return m_notes.size();
    }

    const auto next = std::ranges::upper_bound(m_notes, startPoint, {}, &Note::startPoint);
    return static_cast<std::size_t>(std::distance(m_notes.begin(), next));
}

const std::vector<Note>& Project::notes() const {
    return m_notes;
}

std::size_t Project::noteCount() const {
    return m_notes.size();
}

bool Project::isEmpty() const {
    return m_notes.empty();
}

} // namespace cactisynth::core
