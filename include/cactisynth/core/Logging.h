#pragma once

#include <QLoggingCategory>
#include <QString>

#include <filesystem>
#include <string>

Q_DECLARE_LOGGING_CATEGORY(lcUst)
Q_DECLARE_LOGGING_CATEGORY(lcOto)
Q_DECLARE_LOGGING_CATEGORY(lcVoiceBank)
Q_DECLARE_LOGGING_CATEGORY(lcProject)
Q_DECLARE_LOGGING_CATEGORY(lcConfig)

namespace cactisynth::core {

// Model strings are UTF-8 std::string; Qt logging wants QString.
[[nodiscard]] inline QString qs(const std::string& text) {
    return QString::fromStdString(text);
}

[[nodiscard]] inline QString qs(const std::filesystem::path& path) {
    return QString::fromStdString(path.string());
}

} // namespace cactisynth::core
