#pragma once

#include "cactisynth/core/Note.h"
#include "cactisynth/core/OtoEntry.h"
#include "cactisynth/core/Project.h"
#include "cactisynth/core/VoiceBank.h"

#include <optional>
#include <string>
#include <vector>

namespace cactisynth::core {

struct PitchCurve {
    std::vector<double> timestamps; // seconds
    std::vector<double> frequencies; // Hz
};

// Pitch estimation and vocoder resynthesis live outside this library.
class VoiceRenderer {
public:
    virtual ~VoiceRenderer() = default;

    [[nodiscard]] virtual PitchCurve estimatePitch(const std::vector<float>& samples, int sampleRate) = 0;

    [[nodiscard]] virtual std::vector<float> resynthesize(const std::vector<float>& samples,
                                                          int sampleRate,
                                                          const PitchCurve& curve,
                                                          const std::vector<double>& targetPitch,
                                                          double speedRatio,
                                                          double formantShift) = 0;
};

struct RenderItem {
    Note note;
    double targetFrequencyHz = 0.0;
    std::optional<OtoEntry> oto;
};

struct RenderPlan {
    std::vector<RenderItem> items;

    // Lyrics with no OTO entry, in note order, without repeats.
    [[nodiscard]] std::vector<std::string> missingAliases() const;
};

[[nodiscard]] double noteFrequency(int noteNum);

// One item per note, in note order; the OTO entry is looked up by the note's lyric.
[[nodiscard]] RenderPlan buildRenderPlan(const Project& project, const VoiceBank& voiceBank);

} // namespace cactisynth::core
