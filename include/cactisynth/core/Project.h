#pragma once

#include "cactisynth/core/Note.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cactisynth::core {

class Project {
public:
    void setVersion(std::string value);
    [[nodiscard]] const std::string& version() const;

    void setTempo(double bpm);
    [[nodiscard]] double tempo() const;

    void setTrackCount(int count);
    [[nodiscard]] int trackCount() const;

    void setName(std::string value);
    [[nodiscard]] const std::string& name() const;

    void setVoiceDir(std::filesystem::path value);
    [[nodiscard]] const std::filesystem::path& voiceDir() const;

    void setOutFile(std::filesystem::path value);
    [[nodiscard]] const std::filesystem::path& outFile() const;

    void setCacheDir(std::filesystem::path value);
    [[nodiscard]] const std::filesystem::path& cacheDir() const;

    // Order is significant and duplicates are kept.
    void addTool(std::string tool);
    void addMode(std::string mode);
    void addFlags(std::string flags);
    void setTools(std::vector<std::string> tools);
    void setModes(std::vector<std::string> modes);
    void setFlags(std::vector<std::string> flags);
    [[nodiscard]] const std::vector<std::string>& tools() const;
    [[nodiscard]] const std::vector<std::string>& modes() const;
    [[nodiscard]] const std::vector<std::string>& flags() const;

    // Validates first; on ValidationError the project is left untouched.
    // Existing notes are re-sorted ascending, then each note goes to findNoteIndex().
    Project& addNote(Note note);
    Project& addNotes(std::vector<Note> notes);

    // Throws NotFoundError when index is out of range.
    Project& removeNoteByIndex(std::size_t index);

    [[nodiscard]] std::optional<Note> noteAt(std::size_t index) const;

    // Stable with respect to the current order for equal start points.
    Project& sortNotes(bool descending = false);

    // Insertion index for a note starting at startPoint, assuming ascending notes:
    //   empty or startPoint <= first -> 0
    //   startPoint >= last           -> size()
    //   otherwise                    -> index of the first start point strictly greater
    [[nodiscard]] std::size_t findNoteIndex(int startPoint) const;

    [[nodiscard]] const std::vector<Note>& notes() const;
    [[nodiscard]] std::size_t noteCount() const;
    [[nodiscard]] bool isEmpty() const;

    bool operator==(const Project&) const = default;

private:
    // Restores the stored note order verbatim.
    friend class ProjectFile;

    std::string m_version;
    double m_tempo = 120.0;
    int m_trackCount = 1;
    std::string m_name = "Untitled";
    std::filesystem::path m_voiceDir;
    std::filesystem::path m_outFile;
    std::filesystem::path m_cacheDir;
    std::vector<std::string> m_tools;
    std::vector<std::string> m_modes;
    std::vector<std::string> m_flags;
    std::vector<Note> m_notes;
};

} // namespace cactisynth::core
