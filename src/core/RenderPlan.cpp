#include "cactisynth/core/VoiceRenderer.h"

#include "cactisynth/core/Logging.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace cactisynth::core {

std::vector<std::string> RenderPlan::missingAliases() const {
    std::vector<std::string> missing;
    for (const auto& item : items) {
        if (!item.oto && std::ranges::find(missing, item.note.lyric) == missing.end()) {
            missing.push_back(item.note.lyric);
        }
    }
    return missing;
}

double noteFrequency(int noteNum) {
    return 440.0 * std::pow(2.0, (static_cast<double>(noteNum) - 69.0) / 12.0);
}

RenderPlan buildRenderPlan(const Project& project, const VoiceBank& voiceBank) {
    RenderPlan plan;
    plan.items.reserve(project.noteCount());

    for (const auto& note : project.notes()) {
        RenderItem item{.note = note, .targetFrequencyHz = noteFrequency(note.noteNum), .oto = std::nullopt};
        if (const auto* entry = voiceBank.lookup(note.lyric)) {
            item.oto = *entry;
        }
        plan.items.push_back(std::move(item));
    }

    const auto missing = plan.missingAliases();
    if (!missing.empty()) {
        qCWarning(lcVoiceBank).noquote() << missing.size() << "lyrics have no OTO entry in" << qs(voiceBank.root());
    }
    return plan;
}

} // namespace cactisynth::core
