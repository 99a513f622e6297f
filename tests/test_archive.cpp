#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include <cryptopp/filters.h>
#include <cryptopp/gzip.h>

#include "keypack/archive_reader.hpp"
#include "keypack/archive_writer.hpp"
#include "keypack/file_set.hpp"
#include "keypack/key_stream.hpp"
#include "keypack/progress_channel.hpp"
#include "temp_dir_test.hpp"

using namespace keypack;

namespace {

std::string Gunzipped(const std::string& archive) {
    std::string raw;
    CryptoPP::StringSource source(archive, true, new CryptoPP::Gunzip(new CryptoPP::StringSink(raw)));
    return raw;
}

std::string Gzipped(const std::string& raw) {
    std::string archive;
    CryptoPP::StringSource source(raw, true, new CryptoPP::Gzip(new CryptoPP::StringSink(archive)));
    return archive;
}

std::string Encrypted(std::string raw, const std::string& passphrase) {
    KeyStream key(passphrase);
    key.Encrypt(reinterpret_cast<std::uint8_t*>(raw.data()), raw.size());
    return raw;
}

std::string Decrypted(std::string raw, const std::string& passphrase) {
    KeyStream key(passphrase);
    key.Decrypt(reinterpret_cast<std::uint8_t*>(raw.data()), raw.size());
    return raw;
}

void AppendBig32(std::string& out, const std::uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        out.push_back(static_cast<char>((value >> shift) & 0xFFU));
    }
}

void AppendBig64(std::string& out, const std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<char>((value >> shift) & 0xFFU));
    }
}

// Unencrypted archive body holding one entry.
std::string RawEntry(const std::string& relative_path, const std::string& payload) {
    std::string raw;
    AppendBig32(raw, static_cast<std::uint32_t>(relative_path.size()));
    for (const char c : relative_path) {
        raw.push_back('\0');
        raw.push_back(c);
    }
    AppendBig64(raw, payload.size());
    raw += payload;
    return raw;
}

}  // namespace

class ArchiveTest : public TempDirTest {
   protected:
    void SetUp() override {
        TempDirTest::SetUp();
        fs::create_directories(Path("staging"));
        options_.staging_dir = PathString("staging");
    }

    void WriteSampleTree() {
        WriteText("in/a.txt", "hello");
        WriteText("in/b/c.txt", "world");
    }

    std::string PackToString(const std::string& target, const std::string& passphrase) {
        FileSet files;
        EXPECT_EQ(FileSet::Resolve(PathString(target), true, "*.*", files), PackStatus::Ok);
        KeyStream key(passphrase);
        ProgressChannel channel;
        std::ostringstream out(std::ios::binary);
        EXPECT_EQ(ArchiveWriter::Write(files, key, out, channel, options_), PackStatus::Ok);
        return out.str();
    }

    PackStatus UnpackString(const std::string& archive, const std::string& passphrase, ProgressChannel& channel) {
        KeyStream key(passphrase);
        std::istringstream in(archive, std::ios::binary);
        return ArchiveReader::Read(in, key, PathString("out"), channel, options_);
    }

    ArchiveOptions options_;
};

TEST_F(ArchiveTest, RoundTripsDirectoryTree) {
    WriteSampleTree();

    FileSet files;
    ASSERT_EQ(FileSet::Resolve(PathString("in"), true, "*.*", files), PackStatus::Ok);
    KeyStream write_key("secret");
    ProgressChannel write_channel;
    ASSERT_EQ(
        ArchiveWriter::WriteFile(files, write_key, PathString("packed.kpk"), write_channel, options_),
        PackStatus::Ok);
    EXPECT_NEAR(write_channel.Progress(), 1.0F, 1e-4F);
    ASSERT_TRUE(fs::exists(Path("packed.kpk")));

    KeyStream read_key("secret");
    ProgressChannel read_channel;
    ASSERT_EQ(
        ArchiveReader::ReadFile(PathString("packed.kpk"), read_key, PathString("out"), read_channel, options_),
        PackStatus::Ok);
    EXPECT_NEAR(read_channel.Progress(), 1.0F, 1e-4F);

    EXPECT_EQ(ReadText(Path("out/a.txt")), "hello");
    EXPECT_EQ(ReadText(Path("out/b/c.txt")), "world");
    EXPECT_TRUE(ListFiles(Path("staging")).empty());
}

TEST_F(ArchiveTest, RoundTripsBinaryAndEmptyFilesWithTinyBuffer) {
    std::string binary;
    for (int i = 0; i < 10000; ++i) {
        binary.push_back(static_cast<char>((i * 131) & 0xFF));
    }
    WriteText("in/blob.bin", binary);
    WriteText("in/empty.txt", "");
    WriteText("in/deep/er/name with spaces.txt", "spaced");
    options_.buffer_size = 3;

    const std::string archive = PackToString("in", "k");
    ProgressChannel channel;
    ASSERT_EQ(UnpackString(archive, "k", channel), PackStatus::Ok);

    EXPECT_EQ(ReadText(Path("out/blob.bin")), binary);
    EXPECT_TRUE(fs::exists(Path("out/empty.txt")));
    EXPECT_EQ(ReadText(Path("out/empty.txt")), "");
    EXPECT_EQ(ReadText(Path("out/deep/er/name with spaces.txt")), "spaced");
}

TEST_F(ArchiveTest, EmptyPassphraseStoresPlainBytesInsideGzip) {
    WriteText("in/a.txt", "hello");

    const std::string raw = Gunzipped(PackToString("in", ""));
    std::string expected;
    AppendBig32(expected, 1);
    expected += RawEntry("a.txt", "hello");
    EXPECT_EQ(raw, expected);
}

TEST_F(ArchiveTest, EncryptionIsTheInnerLayer) {
    WriteSampleTree();

    const std::string raw = Gunzipped(PackToString("in", "secret"));
    // count + (4 + 2*5 + 8 + 5) + (4 + 2*7 + 8 + 5)
    ASSERT_EQ(raw.size(), 62U);

    const std::string plain = Decrypted(raw, "secret");
    EXPECT_EQ(plain.substr(0, 4), std::string("\0\0\0\x02", 4));
    EXPECT_NE(raw.substr(0, 4), plain.substr(0, 4));
}

TEST_F(ArchiveTest, TruncatedPayloadFailsAndLeavesNoOutput) {
    WriteSampleTree();

    const std::string raw = Gunzipped(PackToString("in", "secret"));
    const std::string truncated = Gzipped(raw.substr(0, raw.size() - 3));

    ProgressChannel channel;
    EXPECT_EQ(UnpackString(truncated, "secret", channel), PackStatus::TruncatedArchive);
    EXPECT_TRUE(ListFiles(Path("out")).empty());
    EXPECT_TRUE(ListFiles(Path("staging")).empty());
    EXPECT_TRUE(channel.HasMessages());
}

TEST_F(ArchiveTest, CutCompressedStreamFailsAndLeavesNoOutput) {
    WriteSampleTree();

    const std::string archive = PackToString("in", "secret");
    ProgressChannel channel;
    EXPECT_NE(UnpackString(archive.substr(0, archive.size() / 2), "secret", channel), PackStatus::Ok);
    EXPECT_TRUE(ListFiles(Path("out")).empty());
    EXPECT_TRUE(ListFiles(Path("staging")).empty());
}

TEST_F(ArchiveTest, WrongKeyIsRejected) {
    WriteSampleTree();

    const std::string archive = PackToString("in", "secret");
    ProgressChannel channel;
    // 's' - 'w' makes the decoded count negative.
    EXPECT_EQ(UnpackString(archive, "wrong", channel), PackStatus::InvalidArchive);
    EXPECT_TRUE(ListFiles(Path("out")).empty());
}

TEST_F(ArchiveTest, NotAnArchiveIsInvalid) {
    ProgressChannel channel;
    EXPECT_EQ(UnpackString("definitely not gzip data", "secret", channel), PackStatus::InvalidArchive);
}

TEST_F(ArchiveTest, RelocationFailureStillMovesOtherFiles) {
    WriteSampleTree();
    const std::string archive = PackToString("in", "secret");

    // A file where directory "b" is needed.
    WriteText("out/b", "blocker");

    ProgressChannel channel;
    EXPECT_EQ(UnpackString(archive, "secret", channel), PackStatus::FileIOError);
    EXPECT_EQ(ReadText(Path("out/a.txt")), "hello");
    EXPECT_EQ(ReadText(Path("out/b")), "blocker");
    EXPECT_TRUE(ListFiles(Path("staging")).empty());
    EXPECT_NEAR(channel.Progress(), 1.0F, 1e-4F);
}

TEST_F(ArchiveTest, ExistingFilesAreReplaced) {
    WriteText("in/a.txt", "new content");
    const std::string archive = PackToString("in", "secret");
    WriteText("out/a.txt", "old");

    ProgressChannel channel;
    ASSERT_EQ(UnpackString(archive, "secret", channel), PackStatus::Ok);
    EXPECT_EQ(ReadText(Path("out/a.txt")), "new content");
}

TEST_F(ArchiveTest, EntryEscapingDestinationIsRejected) {
    std::string raw;
    AppendBig32(raw, 1);
    raw += RawEntry("../escaped.txt", "x");

    ProgressChannel channel;
    EXPECT_EQ(UnpackString(Gzipped(Encrypted(raw, "key")), "key", channel), PackStatus::InvalidArchive);
    EXPECT_FALSE(fs::exists(Path("escaped.txt")));
    EXPECT_TRUE(ListFiles(Path("staging")).empty());
}

TEST_F(ArchiveTest, ZeroEntryArchiveIsValid) {
    std::string raw;
    AppendBig32(raw, 0);

    ProgressChannel channel;
    EXPECT_EQ(UnpackString(Gzipped(Encrypted(raw, "key")), "key", channel), PackStatus::Ok);
    EXPECT_NEAR(channel.Progress(), 1.0F, 1e-4F);
    EXPECT_TRUE(ListFiles(Path("out")).empty());
}

TEST_F(ArchiveTest, TrailingBytesAreIgnored) {
    std::string raw;
    AppendBig32(raw, 1);
    raw += RawEntry("a.txt", "hello");
    raw += "trailing";

    ProgressChannel channel;
    ASSERT_EQ(UnpackString(Gzipped(Encrypted(raw, "key")), "key", channel), PackStatus::Ok);
    EXPECT_EQ(ReadText(Path("out/a.txt")), "hello");
}

TEST_F(ArchiveTest, UnreadableInputRollsBackArchive) {
    WriteText("in/a.txt", "hello");
    WriteText("in/b.txt", "world");

    FileSet files;
    ASSERT_EQ(FileSet::Resolve(PathString("in"), true, "*.*", files), PackStatus::Ok);
    ASSERT_EQ(files.Count(), 2U);
    fs::remove(files.files[1].path);

    KeyStream key("secret");
    ProgressChannel channel;
    EXPECT_EQ(
        ArchiveWriter::WriteFile(files, key, PathString("packed.kpk"), channel, options_),
        PackStatus::FileIOError);
    EXPECT_FALSE(fs::exists(Path("packed.kpk")));

    const std::vector<std::string> messages = channel.DrainMessages();
    ASSERT_FALSE(messages.empty());
    EXPECT_NE(messages.front().find("Encryption failed to process the file"), std::string::npos);
}

TEST_F(ArchiveTest, StagingReportsThreeQuartersBeforeRelocation) {
    WriteSampleTree();
    const std::string archive = PackToString("in", "k");

    KeyStream key("k");
    ProgressChannel channel;
    std::istringstream in(archive, std::ios::binary);
    std::vector<StagedFile> staged;
    ASSERT_EQ(ArchiveReader::Stage(in, key, PathString("out"), channel, options_, staged), PackStatus::Ok);
    ASSERT_EQ(staged.size(), 2U);
    EXPECT_NEAR(channel.Progress(), 0.75F, 1e-4F);
    EXPECT_FALSE(fs::exists(Path("out/a.txt")));

    ASSERT_EQ(ArchiveReader::Relocate(staged, channel), PackStatus::Ok);
    EXPECT_NEAR(channel.Progress(), 1.0F, 1e-4F);
    EXPECT_EQ(ReadText(Path("out/b/c.txt")), "world");
}

TEST_F(ArchiveTest, MissingMiddleInputStopsBeforeLaterFiles) {
    WriteText("in/a.txt", "one");
    WriteText("in/b.txt", "two");
    WriteText("in/c.txt", "three");

    FileSet files;
    ASSERT_EQ(FileSet::Resolve(PathString("in"), true, "*.*", files), PackStatus::Ok);
    ASSERT_EQ(files.Count(), 3U);
    fs::remove(files.files[1].path);

    KeyStream key("secret");
    ProgressChannel channel;
    EXPECT_EQ(
        ArchiveWriter::WriteFile(files, key, PathString("packed.kpk"), channel, options_),
        PackStatus::FileIOError);
    EXPECT_FALSE(fs::exists(Path("packed.kpk")));

    const std::vector<std::string> messages = channel.DrainMessages();
    const auto failures = std::count_if(messages.begin(), messages.end(), [](const std::string& message) {
        return message.find("Encryption failed") != std::string::npos;
    });
    EXPECT_EQ(failures, 1);
    EXPECT_NEAR(channel.Progress(), 1.0F / 3.0F, 1e-4F);
}

TEST_F(ArchiveTest, EmptyFileSetIsRefused) {
    FileSet files;
    KeyStream key("secret");
    ProgressChannel channel;
    std::ostringstream out(std::ios::binary);
    EXPECT_EQ(ArchiveWriter::Write(files, key, out, channel), PackStatus::NoFilesIdentified);
}

TEST(ArchivePathTest, ValidatesRelativePaths) {
    EXPECT_TRUE(ArchiveReader::ValidateRelativePath("a.txt"));
    EXPECT_TRUE(ArchiveReader::ValidateRelativePath("b/c.txt"));
    EXPECT_TRUE(ArchiveReader::ValidateRelativePath("dir/..name"));
    EXPECT_FALSE(ArchiveReader::ValidateRelativePath(""));
    EXPECT_FALSE(ArchiveReader::ValidateRelativePath("/etc/passwd"));
    EXPECT_FALSE(ArchiveReader::ValidateRelativePath("C:/windows"));
    EXPECT_FALSE(ArchiveReader::ValidateRelativePath("a\\b"));
    EXPECT_FALSE(ArchiveReader::ValidateRelativePath("../up"));
    EXPECT_FALSE(ArchiveReader::ValidateRelativePath("a/./b"));
    EXPECT_FALSE(ArchiveReader::ValidateRelativePath("a//b"));
}
