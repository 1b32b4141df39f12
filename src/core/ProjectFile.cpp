#include "cactisynth/core/ProjectFile.h"

#include "cactisynth/core/Error.h"
#include "cactisynth/core/Logging.h"

#include <QDataStream>
#include <QFile>
#include <QSaveFile>
#include <QStringList>

#include <algorithm>
#include <vector>

namespace cactisynth::core {
namespace {

constexpr auto kStreamVersion = QDataStream::Qt_6_0;
constexpr qsizetype kMinNoteBytes = 7 * sizeof(qint32) + sizeof(quint32);

QStringList toStringList(const std::vector<std::string>& values) {
    QStringList list;
    list.reserve(static_cast<qsizetype>(values.size()));
    for (const auto& value : values) {
        list.append(qs(value));
    }
    return list;
}

std::vector<std::string> fromStringList(const QStringList& list) {
    std::vector<std::string> values;
    values.reserve(static_cast<std::size_t>(list.size()));
    for (const auto& value : list) {
        values.push_back(value.toStdString());
    }
    return values;
}

void writeNote(QDataStream& out, const Note& note) {
    out << qint32(note.length) << qint32(note.noteNum) << qint32(note.preUtterance) << qint32(note.velocity)
        << qint32(note.intensity) << qint32(note.modulation) << qint32(note.startPoint) << qs(note.lyric);
}

Note readNote(QDataStream& in) {
    qint32 length = 0;
    qint32 noteNum = 0;
    qint32 preUtterance = 0;
    qint32 velocity = 0;
    qint32 intensity = 0;
    qint32 modulation = 0;
    qint32 startPoint = 0;
    QString lyric;
    in >> length >> noteNum >> preUtterance >> velocity >> intensity >> modulation >> startPoint >> lyric;

    return {
        .length = length,
        .lyric = lyric.toStdString(),
        .noteNum = noteNum,
        .preUtterance = preUtterance,
        .velocity = velocity,
        .intensity = intensity,
        .modulation = modulation,
        .startPoint = startPoint,
    };
}

[[noreturn]] void corrupt(const std::string& source, const std::string& reason) {
    throw CorruptContainerError(source + " is not a valid project file: " + reason);
}

void requireReadable(const QDataStream& in, const std::string& source, const char* what) {
    if (in.status() != QDataStream::Ok) {
        corrupt(source, std::string("truncated or unreadable ") + what);
    }
}

} // namespace

QByteArray ProjectFile::toBytes(const Project& project) {
    QByteArray bytes;
    QDataStream out(&bytes, QIODevice::WriteOnly);
    out.setVersion(kStreamVersion);

    out << kMagic << kFormatVersion << static_cast<quint8>(ContainerType::Project);
    out << qs(project.version()) << qs(project.name()) << project.tempo() << qint32(project.trackCount());
    out << qs(project.voiceDir()) << qs(project.outFile()) << qs(project.cacheDir());
    out << toStringList(project.tools()) << toStringList(project.modes()) << toStringList(project.flags());

    out << quint32(project.noteCount());
    for (const auto& note : project.notes()) {
        writeNote(out, note);
    }
    return bytes;
}

Project ProjectFile::fromBytes(const QByteArray& bytes, const std::string& source) {
    QDataStream in(bytes);
    in.setVersion(kStreamVersion);

    quint32 magic = 0;
    quint16 formatVersion = 0;
    quint8 type = 0;
    in >> magic >> formatVersion >> type;
    requireReadable(in, source, "header");

    if (magic != kMagic) {
        corrupt(source, "bad magic number");
    }
    if (formatVersion != kFormatVersion) {
        corrupt(source, "unsupported format version " + std::to_string(formatVersion));
    }
    if (type != static_cast<quint8>(ContainerType::Project)) {
        corrupt(source, "top-level object is type " + std::to_string(type) + ", expected a Project");
    }

    QString version;
    QString name;
    double tempo = 0.0;
    qint32 trackCount = 0;
    QString voiceDir;
    QString outFile;
    QString cacheDir;
    QStringList tools;
    QStringList modes;
    QStringList flags;
    in >> version >> name >> tempo >> trackCount >> voiceDir >> outFile >> cacheDir >> tools >> modes >> flags;
    requireReadable(in, source, "project fields");

    quint32 noteCount = 0;
    in >> noteCount;
    requireReadable(in, source, "note count");

    std::vector<Note> notes;
    notes.reserve(std::min<std::size_t>(noteCount, static_cast<std::size_t>(bytes.size() / kMinNoteBytes)));
    for (quint32 i = 0; i < noteCount; ++i) {
        notes.push_back(readNote(in));
        requireReadable(in, source, "note record");
        try {
            validateNote(notes.back());
        } catch (const ValidationError& ex) {
            corrupt(source, "note " + std::to_string(i) + ": " + ex.what());
        }
    }

    if (!in.atEnd()) {
        corrupt(source, "unexpected trailing bytes");
    }

    Project project;
    project.setVersion(version.toStdString());
    project.setName(name.toStdString());
    project.setTempo(tempo);
    project.setTrackCount(trackCount);
    project.setVoiceDir(voiceDir.toStdString());
    project.setOutFile(outFile.toStdString());
    project.setCacheDir(cacheDir.toStdString());
    project.setTools(fromStringList(tools));
    project.setModes(fromStringList(modes));
    project.setFlags(fromStringList(flags));
    project.m_notes = std::move(notes);
    return project;
}

std::filesystem::path ProjectFile::save(const Project& project,
                                        const Config& config,
                                        const std::optional<std::filesystem::path>& directory,
                                        const std::optional<std::string>& name) {
    const auto targetDir = directory.value_or(config.outputPath);
    if (std::filesystem::is_regular_file(targetDir)) {
        throw PreconditionError("Output path (" + targetDir.string() + ") is not a directory");
    }

    const auto fileName = name.value_or(project.name() + config.projectExtension);
    if (fileName.empty() || fileName.find_first_of("/\\") != std::string::npos) {
        throw PreconditionError("Invalid project file name: \"" + fileName + "\"");
    }

    if (!std::filesystem::is_directory(targetDir)) {
        throw NotFoundError("Output directory does not exist: " + targetDir.string());
    }

    const auto target = targetDir / fileName;
    const auto bytes = toBytes(project);

    QSaveFile file(qs(target));
    if (!file.open(QIODevice::WriteOnly)) {
        throw IoError("Cannot open " + target.string() + " for writing: " + file.errorString().toStdString());
    }
    if (file.write(bytes) != bytes.size() || !file.commit()) {
        throw IoError("Failed while writing " + target.string() + ": " + file.errorString().toStdString());
    }

    qCInfo(lcProject).noquote() << "Saved project to" << qs(target);
    return target;
}

Project ProjectFile::load(const std::filesystem::path& path) {
    if (!std::filesystem::is_regular_file(path)) {
        throw NotFoundError(path.string() + " is not a file, or does not exist");
    }

    QFile file(qs(path));
    if (!file.open(QIODevice::ReadOnly)) {
        throw IoError("Cannot open " + path.string() + ": " + file.errorString().toStdString());
    }

    auto project = fromBytes(file.readAll(), path.string());
    qCInfo(lcProject).noquote() << "Loaded project" << qs(project.name()) << "from" << qs(path);
    return project;
}

} // namespace cactisynth::core
