#pragma once

#include <string>

namespace cactisynth::core {

struct Note {
    int length = 0; // ticks, 480 = quarter note
    std::string lyric;
    int noteNum = 0;
    int preUtterance = 0;
    int velocity = 100; // consonant speed
    int intensity = 0;
    int modulation = 0;
    int startPoint = 0; // absolute tick offset, sort key inside a Project

    bool operator==(const Note&) const = default;
};

// Throws ValidationError naming the first field that is below zero.
void validateNote(const Note& note);

} // namespace cactisynth::core
