#include <gtest/gtest.h>

#include "cactisynth/core/Error.h"
#include "cactisynth/core/VoiceBank.h"
#include "test_support/file_helpers.h"
#include "test_support/qt_message_capture.h"

#include <QTemporaryDir>

#include <filesystem>
#include <string>
#include <vector>

namespace cactisynth::core {
namespace {

namespace fs = std::filesystem;

Config utf8Config(unsigned int threads = 1) {
    Config config;
    config.textEncoding = "UTF-8";
    config.voiceBankLoadThreads = threads;
    return config;
}

// uta/
//   character.txt readme.txt oto.ini a.wav i.wav
//   A3/oto.ini A3/ka.WAV
//   C4/OTO.INI C4/sa.wav C4/notes.txt
fs::path makeBank(const fs::path& base) {
    const auto root = base / "uta";
    test::writeUtf8(root / "character.txt", "name=テストうた\nauthor=cacti\nimage=icon.bmp\nsample=a.wav\nweb=https://example.org\n");
    test::writeUtf8(root / "readme.txt", "Thanks for using\nthis voicebank.\n");
    test::writeUtf8(root / "oto.ini", "a.wav=あ,10,100,0,50,20\ni.wav=い,10,100,0,50,20\n");
    test::writeUtf8(root / "a.wav", "RIFF");
    test::writeUtf8(root / "i.wav", "RIFF");
    test::writeUtf8(root / "A3" / "oto.ini", "ka.wav=か,5,80,0,40,10\n");
    test::writeUtf8(root / "A3" / "ka.WAV", "RIFF");
    test::writeUtf8(root / "C4" / "OTO.INI", "sa.wav=さ,5,80,0,40,10\nsa.wav=- さ,0,80,0,40,10\n");
    test::writeUtf8(root / "C4" / "sa.wav", "RIFF");
    test::writeUtf8(root / "C4" / "notes.txt", "not a sample");
    return root;
}

std::vector<std::string> keys(const VoiceBank& bank) {
    std::vector<std::string> out;
    for (const auto& [key, setting] : bank.otoSettings()) {
        out.push_back(key);
    }
    return out;
}

// ============================================================================
// Metadata
// ============================================================================

TEST(VoiceBankTest, ReadsCharacterAndReadme) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto root = makeBank(test::toPath(dir.path()));

    const auto bank = VoiceBank::load(root, utf8Config());
    EXPECT_EQ(bank.name(), "テストうた");
    EXPECT_EQ(bank.author(), "cacti");
    EXPECT_EQ(bank.image(), "icon.bmp");
    EXPECT_EQ(bank.sample(), "a.wav");
    EXPECT_EQ(bank.web(), "https://example.org");
    EXPECT_EQ(bank.readme(), "Thanks for using\nthis voicebank.\n");
    EXPECT_EQ(bank.root(), fs::absolute(root).lexically_normal());
    EXPECT_TRUE(bank.prefixMap().empty());
}

TEST(VoiceBankTest, CharacterFieldsAreMatchedInOrder) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto root = test::toPath(dir.path()) / "quirk";
    // No author line, so the cursor never gets past author.
    test::writeUtf8(root / "character.txt", "name=Quirk\nimage=q.bmp\nsample=q.wav\nweb=w\n");

    const auto bank = VoiceBank::load(root, utf8Config());
    EXPECT_EQ(bank.name(), "Quirk");
    EXPECT_EQ(bank.author(), "");
    EXPECT_EQ(bank.image(), "");
    EXPECT_EQ(bank.sample(), "Random");
    EXPECT_EQ(bank.web(), "");
}

TEST(VoiceBankTest, LastCharacterFieldCanRepeat) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto root = test::toPath(dir.path()) / "repeat";
    test::writeUtf8(root / "character.txt", "name=n\nauthor=a\nimage=i\nsample=s\nweb=first\nweb=second\n");

    const auto bank = VoiceBank::load(root, utf8Config());
    EXPECT_EQ(bank.web(), "second");
}

TEST(VoiceBankTest, MissingMetadataFilesAreTolerated) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto root = test::toPath(dir.path()) / "bare";
    fs::create_directories(root);

    test::QtMessageCapture capture;
    const auto bank = VoiceBank::load(root, utf8Config());
    EXPECT_EQ(bank.name(), "");
    EXPECT_EQ(bank.sample(), "Random");
    EXPECT_EQ(bank.readme(), "");
    EXPECT_EQ(bank.otoCount(), 0u);
    EXPECT_EQ(bank.fileCount(), 0u);
    EXPECT_TRUE(capture.containsWarning("character.txt"));
}

TEST(VoiceBankTest, MissingRootIsNotFound) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    EXPECT_THROW(static_cast<void>(VoiceBank::load(test::toPath(dir.path()) / "nowhere", utf8Config())),
                 NotFoundError);

    const auto file = test::toPath(dir.path()) / "file";
    test::writeUtf8(file, "x");
    EXPECT_THROW(static_cast<void>(VoiceBank::load(file, utf8Config())), NotFoundError);
}

// ============================================================================
// OTO settings
// ============================================================================

TEST(VoiceBankTest, CollectsEveryOtoIni) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto root = makeBank(test::toPath(dir.path()));

    const auto bank = VoiceBank::load(root, utf8Config());
    EXPECT_EQ(keys(bank), (std::vector<std::string>{"A3", "C4", "uta"}));
    EXPECT_EQ(bank.otoSettings().at("uta").size(), 2u);
    EXPECT_EQ(bank.otoSettings().at("C4").size(), 2u);
    EXPECT_EQ(bank.otoCount(), 5u);
    EXPECT_EQ(bank.fileCount(), 4u);

    const auto& report = bank.loadReport();
    EXPECT_EQ(report.otoFilesFound, 3u);
    EXPECT_EQ(report.otoFilesLoaded, 3u);
    EXPECT_EQ(report.otoFilesSkipped, 0u);
    EXPECT_EQ(report.workerThreads, 1u);
}

TEST(VoiceBankTest, SampleExtensionFollowsConfig) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto root = makeBank(test::toPath(dir.path()));

    auto config = utf8Config();
    config.sampleExtension = ".txt";
    const auto bank = VoiceBank::load(root, config);
    // character.txt, readme.txt and notes.txt
    EXPECT_EQ(bank.fileCount(), 3u);
}

TEST(VoiceBankTest, ParallelLoadMatchesSequential) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto root = makeBank(test::toPath(dir.path()));
    for (int i = 0; i < 12; ++i) {
        const auto sub = root / ("extra" + std::to_string(i));
        test::writeUtf8(sub / "oto.ini", "x" + std::to_string(i) + ".wav=x" + std::to_string(i) + ",1,2,3,4,5\n");
    }

    const auto sequential = VoiceBank::load(root, utf8Config(1));
    const auto parallel = VoiceBank::load(root, utf8Config(4));

    EXPECT_EQ(parallel.loadReport().workerThreads, 4u);
    EXPECT_EQ(keys(parallel), keys(sequential));
    EXPECT_EQ(parallel.otoCount(), sequential.otoCount());
    for (const auto& [key, setting] : sequential.otoSettings()) {
        EXPECT_EQ(parallel.otoSettings().at(key).entries(), setting.entries()) << key;
    }
}

TEST(VoiceBankTest, DuplicateDirectoryNameLaterPathWins) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto root = test::toPath(dir.path()) / "dup";
    test::writeUtf8(root / "A3" / "oto.ini", "first.wav=first,0,0,0,0,0\n");
    test::writeUtf8(root / "x" / "A3" / "oto.ini", "second.wav=second,0,0,0,0,0\n");

    test::QtMessageCapture capture;
    const auto bank = VoiceBank::load(root, utf8Config());
    ASSERT_EQ(bank.otoSettings().size(), 1u);
    EXPECT_EQ(bank.otoSettings().at("A3").entries()[0].alias, "second");
    EXPECT_EQ(bank.otoCount(), 1u);
    EXPECT_TRUE(capture.containsWarning("replaces"));
}

TEST(VoiceBankTest, UndecodableOtoIsSkipped) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto root = makeBank(test::toPath(dir.path()));
    test::writeBytes(root / "bad" / "oto.ini", QByteArray("\xff\xfe=x\n", 5));

    test::QtMessageCapture capture;
    const auto bank = VoiceBank::load(root, utf8Config());
    EXPECT_EQ(bank.otoSettings().count("bad"), 0u);
    EXPECT_EQ(bank.loadReport().otoFilesFound, 4u);
    EXPECT_EQ(bank.loadReport().otoFilesSkipped, 1u);
    EXPECT_TRUE(capture.containsWarning("Skipping"));
}

// ============================================================================
// Lookup
// ============================================================================

TEST(VoiceBankTest, FindEntriesAcrossSettings) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto bank = VoiceBank::load(makeBank(test::toPath(dir.path())), utf8Config());

    const auto bySample = bank.findEntries(OtoField::File, std::string("sa.wav"));
    ASSERT_EQ(bySample.size(), 2u);
    EXPECT_EQ(bySample[0].alias, "さ");
    EXPECT_EQ(bySample[1].alias, "- さ");

    const auto byOffset = bank.findEntries("offset", 5.0);
    EXPECT_EQ(byOffset.size(), 2u);

    const auto none = bank.findEntries("alias", std::string("ん"));
    ASSERT_EQ(none.size(), 1u);
    EXPECT_EQ(none[0], OtoEntry{});

    EXPECT_THROW(static_cast<void>(bank.findEntries(OtoField::Alias, 1.0)), PreconditionError);
}

TEST(VoiceBankTest, LookupByAlias) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto bank = VoiceBank::load(makeBank(test::toPath(dir.path())), utf8Config());

    const auto* ka = bank.lookup("か");
    ASSERT_NE(ka, nullptr);
    EXPECT_EQ(ka->file, "ka.wav");
    EXPECT_DOUBLE_EQ(ka->preutter, 40.0);
    EXPECT_EQ(bank.lookup("ん"), nullptr);
}

} // namespace
} // namespace cactisynth::core
