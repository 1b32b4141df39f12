#pragma once

#include <QByteArray>

#include <filesystem>
#include <string>
#include <vector>

namespace cactisynth::core {

// UTAU text files are stored in a legacy encoding (Shift-JIS in practice).
// Everything inside the model is UTF-8; conversion happens only here.

[[nodiscard]] std::string decodeText(const QByteArray& raw, const std::string& encoding);
[[nodiscard]] QByteArray encodeText(const std::string& utf8, const std::string& encoding);

// Splits on '\n' and drops a trailing '\r' from every line.
[[nodiscard]] std::vector<std::string> splitLines(const std::string& text);

[[nodiscard]] std::string readTextFile(const std::filesystem::path& path, const std::string& encoding);
[[nodiscard]] std::vector<std::string> readTextLines(const std::filesystem::path& path, const std::string& encoding);
void writeTextLines(const std::filesystem::path& path,
                    const std::vector<std::string>& lines,
                    const std::string& encoding);

} // namespace cactisynth::core
