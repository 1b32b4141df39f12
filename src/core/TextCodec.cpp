#include "cactisynth/core/TextCodec.h"

#include "cactisynth/core/Error.h"
#include "cactisynth/core/Logging.h"

#include <QFile>
#include <QSaveFile>
#include <QStringDecoder>
#include <QStringEncoder>

namespace cactisynth::core {

std::string decodeText(const QByteArray& raw, const std::string& encoding) {
    QStringDecoder decoder(encoding.c_str());
    if (!decoder.isValid()) {
        throw PreconditionError("Unsupported text encoding: " + encoding);
    }

    const QString text = decoder.decode(raw);
    if (decoder.hasError()) {
        throw ParseError("Input is not valid " + encoding + " text");
    }
    return text.toStdString();
}

QByteArray encodeText(const std::string& utf8, const std::string& encoding) {
    QStringEncoder encoder(encoding.c_str());
    if (!encoder.isValid()) {
        throw PreconditionError("Unsupported text encoding: " + encoding);
    }

    const QByteArray bytes = encoder.encode(QString::fromStdString(utf8));
    if (encoder.hasError()) {
        throw PreconditionError("Text cannot be represented in " + encoding);
    }
    return bytes;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t begin = 0;
    while (begin <= text.size()) {
        auto end = text.find('\n', begin);
        if (end == std::string::npos) {
            end = text.size();
        }

        auto line = text.substr(begin, end - begin);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        // A trailing newline does not start another line.
        if (end == text.size() && line.empty() && begin == text.size()) {
            break;
        }
        lines.push_back(std::move(line));
        begin = end + 1;
    }
    return lines;
}

std::string readTextFile(const std::filesystem::path& path, const std::string& encoding) {
    QFile file(qs(path));
    if (!file.exists()) {
        throw NotFoundError("File not found: " + path.string());
    }
    if (!file.open(QIODevice::ReadOnly)) {
        throw IoError("Cannot open " + path.string() + ": " + file.errorString().toStdString());
    }

    try {
        return decodeText(file.readAll(), encoding);
    } catch (const ParseError& ex) {
        throw ParseError(path.string() + ": " + ex.what());
    }
}

std::vector<std::string> readTextLines(const std::filesystem::path& path, const std::string& encoding) {
    return splitLines(readTextFile(path, encoding));
}

void writeTextLines(const std::filesystem::path& path,
                    const std::vector<std::string>& lines,
                    const std::string& encoding) {
    std::string joined;
    for (const auto& line : lines) {
        joined += line;
        joined += '\n';
    }
    const QByteArray bytes = encodeText(joined, encoding);

    QSaveFile file(qs(path));
    if (!file.open(QIODevice::WriteOnly)) {
        throw IoError("Cannot open " + path.string() + " for writing: " + file.errorString().toStdString());
    }
    if (file.write(bytes) != bytes.size() || !file.commit()) {
        throw IoError("Failed while writing " + path.string() + ": " + file.errorString().toStdString());
    }
}

} // namespace cactisynth::core
