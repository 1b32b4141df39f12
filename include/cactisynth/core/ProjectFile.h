#pragma once

#include "cactisynth/core/Config.h"
#include "cactisynth/core/Project.h"

#include <QByteArray>
#include <QtGlobal>

#include <filesystem>
#include <optional>
#include <string>

namespace cactisynth::core {

enum class ContainerType : quint8 {
    Project = 1,
};

// Versioned binary container for a Project (QDataStream, big-endian).
//   quint32 magic 'OKMT' | quint16 format version | quint8 ContainerType | payload
class ProjectFile {
public:
    static constexpr quint32 kMagic = 0x4F4B4D54;
    static constexpr quint16 kFormatVersion = 1;

    [[nodiscard]] static QByteArray toBytes(const Project& project);

    // Throws CorruptContainerError on a bad header, a non-Project container,
    // truncation, out-of-range note fields or trailing bytes.
    [[nodiscard]] static Project fromBytes(const QByteArray& bytes, const std::string& source = "<memory>");

    // Writes <directory>/<name>; directory defaults to config.outputPath and name to
    // project.name() + config.projectExtension. Returns the written path.
    static std::filesystem::path save(const Project& project,
                                      const Config& config,
                                      const std::optional<std::filesystem::path>& directory = std::nullopt,
                                      const std::optional<std::string>& name = std::nullopt);

    [[nodiscard]] static Project load(const std::filesystem::path& path);
};

} // namespace cactisynth::core
