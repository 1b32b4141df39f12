#include "cactisynth/core/Config.h"

#include "cactisynth/core/Error.h"
#include "cactisynth/core/Logging.h"

#include <QSettings>

#include <system_error>

namespace cactisynth::core {

void Config::setOutputPath(const std::filesystem::path& path, bool mkdir) {
    if (std::filesystem::is_regular_file(path)) {
        throw PreconditionError("Output path cannot be a file: " + path.string());
    }

    if (mkdir) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            throw IoError("Cannot create output directory " + path.string() + ": " + ec.message());
        }
    }

    outputPath = path;
}

Config Config::fromIniFile(const std::filesystem::path& path) {
    if (!std::filesystem::is_regular_file(path)) {
        throw NotFoundError("Config file not found: " + path.string());
    }

    QSettings ini(qs(path), QSettings::IniFormat);
    if (ini.status() != QSettings::NoError) {
        throw ParseError("Cannot read config file: " + path.string());
    }

    Config config;
    config.language = ini.value("general/language", qs(config.language)).toString().toStdString();
    config.projectExtension = ini.value("project/extension", qs(config.projectExtension)).toString().toStdString();
    config.textEncoding = ini.value("text/encoding", qs(config.textEncoding)).toString().toStdString();
    config.sampleExtension = ini.value("voicebank/sampleExtension", qs(config.sampleExtension)).toString().toStdString();

    if (ini.contains("paths/output")) {
        config.setOutputPath(ini.value("paths/output").toString().toStdString(), false);
    }

    if (ini.contains("voicebank/loadThreads")) {
        const auto raw = ini.value("voicebank/loadThreads").toString();
        bool ok = false;
        const auto threads = raw.toUInt(&ok);
        if (ok) {
            config.voiceBankLoadThreads = threads;
        } else {
            qCWarning(lcConfig).noquote() << "Ignoring voicebank/loadThreads =" << raw << "in" << qs(path)
                                          << "(expected a non-negative integer), keeping"
                                          << config.voiceBankLoadThreads;
        }
    }

    qCDebug(lcConfig).noquote() << "Loaded config from" << qs(path);
    return config;
}

} // namespace cactisynth::core
