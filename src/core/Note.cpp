#include "cactisynth/core/Note.h"

#include "cactisynth/core/Error.h"

#include <array>
#include <utility>

namespace cactisynth::core {

void validateNote(const Note& note) {
    const std::array<std::pair<const char*, int>, 7> fields{{
        {"Length", note.length},
        {"NoteNum", note.noteNum},
        {"PreUtterance", note.preUtterance},
        {"Velocity", note.velocity},
        {"Intensity", note.intensity},
        {"Modulation", note.modulation},
        {"StartPoint", note.startPoint},
    }};

    for (const auto& [name, value] : fields) {
        if (value < 0) {
            throw ValidationError(name,
                                  std::string(name) + " must be >= 0, got " + std::to_string(value)
                                      + " (lyric \"" + note.lyric + "\")");
        }
    }
}

} // namespace cactisynth::core
