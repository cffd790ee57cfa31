// tests/ArchiveTest.cpp
#include "TestSupport.hpp"

#include <Zipkit/Archive.hpp>
#include <Zipkit/Transfer.hpp>
#include <Zipkit/Utils/ZipFile.hpp>
#include <fstream>
#include <sstream>

using namespace Zipkit;
using Zipkit::Testing::MemberList;
using Zipkit::Testing::TempDirTest;

namespace {

    const MemberList kHelloWorld = {
        {"a.txt", "hello"},
        {"sub/", ""},
        {"sub/b.txt", "world"},
    };

} // namespace

class ArchiveTest : public TempDirTest {
protected:
    std::vector<std::string> namesOnDisk(const std::filesystem::path &zip) {
        Archive reader(quietConfig());
        EXPECT_TRUE(reader.open(zip).ok()) << reader.getLastError();
        return reader.listNames();
    }

    // Central directory records keyed by normalized name
    static std::map<std::string, Utils::ZipMember> membersOnDisk(const std::filesystem::path &zip) {
        std::map<std::string, Utils::ZipMember> byName;
        Utils::ZipFile archive(zip);
        if (!archive.open()) {
            ADD_FAILURE() << archive.getLastError();
            return byName;
        }
        std::vector<Utils::ZipMember> members;
        EXPECT_TRUE(archive.members(members)) << archive.getLastError();
        for (auto &member : members) {
            byName[member.name] = member;
        }
        return byName;
    }

    bool scratchLeftovers() const {
        std::filesystem::path dir = quietConfig().scratchRoot / "zipkit";
        return std::filesystem::exists(dir) && !std::filesystem::is_empty(dir);
    }
};

TEST_F(ArchiveTest, OpenMirrorsStoredMemberOrder) {
    auto zip = buildArchive("order.zip", {{"z.txt", "z"}, {"a.txt", "a"}, {"m/", ""}, {"m/x.txt", "x"}});
    Archive archive(quietConfig());
    ASSERT_TRUE(archive.open(zip).ok()) << archive.getLastError();

    EXPECT_TRUE(archive.isOpen());
    EXPECT_FALSE(archive.hasChanged());
    EXPECT_FALSE(archive.isStreamBacked());
    EXPECT_EQ(archive.fileName(), zip);
    EXPECT_EQ(archive.listNames(), (std::vector<std::string>{"z.txt", "a.txt", "m/", "m/x.txt"}));
    EXPECT_EQ(archive.entries()[3].uncompressedSize, 1u);
    EXPECT_TRUE(archive.entries()[2].isDirectory());
}

TEST_F(ArchiveTest, ListNamesFiltersByPrefix) {
    auto zip = buildArchive("hello.zip", kHelloWorld);
    Archive archive(quietConfig());
    ASSERT_TRUE(archive.open(zip).ok());
    EXPECT_EQ(archive.listNames({"sub/"}), (std::vector<std::string>{"sub/", "sub/b.txt"}));
    EXPECT_EQ(archive.listNames({"a", "sub/b"}), (std::vector<std::string>{"a.txt", "sub/b.txt"}));
    EXPECT_TRUE(archive.listNames({"nothing"}).empty());
}

TEST_F(ArchiveTest, OpenMissingArchiveIsIoError) {
    Archive archive(quietConfig());
    Error err = archive.open(root() / "missing.zip");
    EXPECT_EQ(err.kind(), ErrorKind::Io);
    EXPECT_FALSE(archive.isOpen());
    EXPECT_FALSE(archive.getLastError().empty());
}

TEST_F(ArchiveTest, OpenTwiceIsInvalidState) {
    auto zip = buildArchive("hello.zip", kHelloWorld);
    Archive archive(quietConfig());
    ASSERT_TRUE(archive.open(zip).ok());
    EXPECT_EQ(archive.open(zip).kind(), ErrorKind::InvalidState);
}

TEST_F(ArchiveTest, ExtractToWritesHelloWorld) {
    auto zip = buildArchive("hello.zip", kHelloWorld);
    Archive archive(quietConfig());
    ASSERT_TRUE(archive.open(zip).ok());

    Error err = archive.extractTo(root() / "out");
    ASSERT_TRUE(err.ok()) << err.describe();
    EXPECT_EQ(readFile(root() / "out" / "a.txt"), "hello");
    EXPECT_EQ(readFile(root() / "out" / "sub" / "b.txt"), "world");
    EXPECT_TRUE(std::filesystem::is_directory(root() / "out" / "sub"));
}

TEST_F(ArchiveTest, ExtractToNormalizesSelectedNames) {
    auto zip = buildArchive("hello.zip", kHelloWorld);
    Archive archive(quietConfig());
    ASSERT_TRUE(archive.open(zip).ok());

    ASSERT_TRUE(archive.extractTo(root() / "out", {"sub\\b.txt"}).ok());
    EXPECT_EQ(snapshotTree(root() / "out"), (std::map<std::string, std::string>{{"sub/b.txt", "world"}}));
}

TEST_F(ArchiveTest, ExtractToFuncReturnsVisitorError) {
    auto zip = buildArchive("hello.zip", kHelloWorld);
    Archive archive(quietConfig());
    ASSERT_TRUE(archive.open(zip).ok());

    Error abort = Error::visitorAbort("no directories");
    Error err = archive.extractToFunc(root() / "out", [&abort](const std::string &, const EntryInfo &info) {
        return info.isDirectory ? abort : Error{};
    });
    EXPECT_EQ(err, abort);
    EXPECT_TRUE(std::filesystem::exists(root() / "out" / "a.txt"));
    EXPECT_FALSE(std::filesystem::exists(root() / "out" / "sub"));
}

TEST_F(ArchiveTest, AddEmptyDirCreatesParentMarkers) {
    Archive archive(quietConfig());
    EXPECT_TRUE(archive.addEmptyDir("a/b/c"));
    EXPECT_FALSE(archive.addEmptyDir("a/b/"));
    EXPECT_FALSE(archive.addEmptyDir("../up"));
    EXPECT_EQ(archive.listNames(), (std::vector<std::string>{"a/", "a/b/", "a/b/c/"}));
    EXPECT_TRUE(archive.hasChanged());
}

TEST_F(ArchiveTest, AddFileThenFlushRewritesArchive) {
    auto zip = buildArchive("hello.zip", kHelloWorld);
    auto extra = writeFile("src/c.txt", "added");

    Archive archive(quietConfig());
    ASSERT_TRUE(archive.open(zip).ok());
    ASSERT_TRUE(archive.addFile("new/c.txt", extra).ok()) << archive.getLastError();
    EXPECT_TRUE(archive.hasChanged());

    Error err = archive.flush();
    ASSERT_TRUE(err.ok()) << err.describe();
    EXPECT_FALSE(archive.hasChanged());
    EXPECT_TRUE(archive.isOpen());

    const std::vector<std::string> expected{"a.txt", "sub/", "sub/b.txt", "new/", "new/c.txt"};
    EXPECT_EQ(archive.listNames(), expected);
    EXPECT_EQ(namesOnDisk(zip), expected);

    // The session reads back the rewritten archive
    ASSERT_TRUE(archive.extractTo(root() / "out").ok());
    EXPECT_EQ(snapshotTree(root() / "out"), (std::map<std::string, std::string>{
                                                    {"a.txt", "hello"}, {"sub/b.txt", "world"}, {"new/c.txt", "added"}}));
    EXPECT_FALSE(scratchLeftovers());
}

TEST_F(ArchiveTest, AddFileRebindsExistingEntryInPlace) {
    auto zip = buildArchive("hello.zip", kHelloWorld);
    auto replacement = writeFile("src/a.txt", "hello again");

    Archive archive(quietConfig());
    ASSERT_TRUE(archive.open(zip).ok());
    ASSERT_TRUE(archive.addFile("a.txt", replacement).ok());
    EXPECT_EQ(archive.entryCount(), 3u);
    ASSERT_TRUE(archive.flush().ok());

    EXPECT_EQ(namesOnDisk(zip), (std::vector<std::string>{"a.txt", "sub/", "sub/b.txt"}));
    ASSERT_TRUE(archive.extractTo(root() / "out", {"a.txt"}).ok());
    EXPECT_EQ(readFile(root() / "out" / "a.txt"), "hello again");
}

TEST_F(ArchiveTest, AddFileValidatesItsArguments) {
    auto src = writeFile("src/file.txt", "x");
    Archive archive(quietConfig());

    EXPECT_EQ(archive.addFile("missing.txt", root() / "src" / "missing.txt").kind(), ErrorKind::NotFound);
    EXPECT_EQ(archive.addFile("dir.txt", root() / "src").kind(), ErrorKind::InvalidArgument);
    EXPECT_EQ(archive.addFile("../escape.txt", src).kind(), ErrorKind::InvalidArgument);
    EXPECT_EQ(archive.addFile("/abs.txt", src).kind(), ErrorKind::InvalidArgument);
    EXPECT_EQ(archive.addFile("folder/", src).kind(), ErrorKind::InvalidArgument);
    EXPECT_EQ(archive.entryCount(), 0u);
    EXPECT_FALSE(archive.hasChanged());
}

TEST_F(ArchiveTest, AddFileSkipsExcludedNames) {
    auto junk = writeFile("src/.DS_Store", "junk");
    Archive archive(quietConfig());
    EXPECT_TRUE(archive.addFile(".DS_Store", junk).ok());
    EXPECT_EQ(archive.entryCount(), 0u);
    EXPECT_FALSE(archive.hasChanged());
}

TEST_F(ArchiveTest, AddDirAddsTreeRecursively) {
    auto zip = buildArchive("hello.zip", kHelloWorld);
    writeFile("tree/readme.md", "# docs");
    writeFile("tree/img/logo.bin", "PNG");
    writeFile("tree/.git/HEAD", "ref: refs/heads/main");

    Archive archive(quietConfig());
    ASSERT_TRUE(archive.open(zip).ok());
    ASSERT_TRUE(archive.addDir("docs", root() / "tree").ok()) << archive.getLastError();
    ASSERT_TRUE(archive.close().ok());

    auto names = namesOnDisk(zip);
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names, (std::vector<std::string>{"a.txt", "docs/", "docs/img/", "docs/img/logo.bin", "docs/readme.md",
                                               "sub/", "sub/b.txt"}));
}

TEST_F(ArchiveTest, AddDirRejectsMissingAndNonDirectorySources) {
    auto file = writeFile("plain.txt", "x");
    Archive archive(quietConfig());
    EXPECT_EQ(archive.addDir("d", root() / "nope").kind(), ErrorKind::NotFound);
    EXPECT_EQ(archive.addDir("d", file).kind(), ErrorKind::InvalidArgument);
}

TEST_F(ArchiveTest, DeleteNameRemovesEntryOnFlush) {
    auto zip = buildArchive("hello.zip", kHelloWorld);
    Archive archive(quietConfig());
    ASSERT_TRUE(archive.open(zip).ok());

    ASSERT_TRUE(archive.deleteName("sub/b.txt").ok());
    EXPECT_TRUE(archive.hasChanged());
    ASSERT_TRUE(archive.flush().ok());
    EXPECT_EQ(namesOnDisk(zip), (std::vector<std::string>{"a.txt", "sub/"}));
}

TEST_F(ArchiveTest, DeleteRejectsUnknownEntries) {
    auto zip = buildArchive("hello.zip", kHelloWorld);
    Archive archive(quietConfig());
    ASSERT_TRUE(archive.open(zip).ok());

    EXPECT_EQ(archive.deleteName("nope.txt").kind(), ErrorKind::NotFound);
    EXPECT_EQ(archive.deleteIndex(3).kind(), ErrorKind::InvalidArgument);
    EXPECT_FALSE(archive.hasChanged());

    ASSERT_TRUE(archive.deleteIndex(0).ok());
    EXPECT_EQ(archive.listNames(), (std::vector<std::string>{"sub/", "sub/b.txt"}));
}

TEST_F(ArchiveTest, CleanFlushLeavesArchiveUntouched) {
    auto zip = buildArchive("hello.zip", kHelloWorld);
    auto extra = writeFile("src/c.txt", "c");

    Archive archive(quietConfig());
    ASSERT_TRUE(archive.open(zip).ok());
    ASSERT_TRUE(archive.addFile("c.txt", extra).ok());
    ASSERT_TRUE(archive.flush().ok());

    const std::string bytes = readFile(zip);
    const auto stamp = std::filesystem::last_write_time(zip);
    ASSERT_TRUE(archive.flush().ok());
    ASSERT_TRUE(archive.flush().ok());
    EXPECT_EQ(readFile(zip), bytes);
    EXPECT_EQ(std::filesystem::last_write_time(zip), stamp);
    EXPECT_FALSE(scratchLeftovers());
}

TEST_F(ArchiveTest, FailedFlushKeepsOriginalArchive) {
    auto zip = buildArchive("hello.zip", kHelloWorld);
    auto extra = writeFile("src/c.txt", "c");
    const std::string before = readFile(zip);

    Archive archive(quietConfig());
    ASSERT_TRUE(archive.open(zip).ok());
    ASSERT_TRUE(archive.addFile("c.txt", extra).ok());
    std::filesystem::remove(extra);

    Error err = archive.flush();
    EXPECT_EQ(err.kind(), ErrorKind::Io);
    EXPECT_TRUE(archive.hasChanged());
    EXPECT_TRUE(archive.isOpen());
    EXPECT_EQ(readFile(zip), before);
    EXPECT_FALSE(scratchLeftovers());

    // Reads still come from the untouched original
    ASSERT_TRUE(archive.extractTo(root() / "out").ok());
    EXPECT_EQ(readFile(root() / "out" / "a.txt"), "hello");

    // close() fails the same way and keeps the session usable
    EXPECT_EQ(archive.close().kind(), ErrorKind::Io);
    EXPECT_TRUE(archive.isOpen());
    ASSERT_TRUE(archive.deleteName("c.txt").ok());
    EXPECT_TRUE(archive.close().ok());
    EXPECT_FALSE(archive.isOpen());
}

TEST_F(ArchiveTest, FlushFailsWhenArchiveDirectoryIsGone) {
    auto zip = buildArchive("gone/hello.zip", kHelloWorld);
    auto extra = writeFile("src/c.txt", "c");

    Archive archive(quietConfig());
    ASSERT_TRUE(archive.open(zip).ok());
    ASSERT_TRUE(archive.addFile("c.txt", extra).ok());
    std::filesystem::remove_all(root() / "gone");

    Error err = archive.flush();
    EXPECT_EQ(err.kind(), ErrorKind::Io);
    EXPECT_TRUE(archive.hasChanged());
    EXPECT_FALSE(std::filesystem::exists(zip));
    EXPECT_FALSE(scratchLeftovers());
}

TEST_F(ArchiveTest, FlushWithoutSourceIsNoop) {
    Archive archive(quietConfig());
    EXPECT_TRUE(archive.addEmptyDir("pending"));
    EXPECT_TRUE(archive.flush().ok());
    EXPECT_TRUE(archive.hasChanged());
    EXPECT_FALSE(std::filesystem::exists(quietConfig().scratchRoot));
}

TEST_F(ArchiveTest, StreamBackedFlushWritesCompleteArchive) {
    auto src = writeFile("src/a.txt", "streamed");
    std::ostringstream out;

    Archive archive(out, quietConfig());
    EXPECT_TRUE(archive.isStreamBacked());
    EXPECT_TRUE(archive.isOpen());
    EXPECT_TRUE(archive.fileName().empty());
    ASSERT_TRUE(archive.addFile("docs/a.txt", src).ok());
    EXPECT_TRUE(archive.addEmptyDir("empty"));

    Error err = archive.flush();
    ASSERT_TRUE(err.ok()) << err.describe();
    EXPECT_FALSE(archive.hasChanged());
    ASSERT_FALSE(out.str().empty());

    auto zip = root() / "streamed.zip";
    {
        std::ofstream file(zip, std::ios::binary);
        file << out.str();
    }
    EXPECT_EQ(namesOnDisk(zip), (std::vector<std::string>{"docs/", "docs/a.txt", "empty/"}));

    Archive reader(quietConfig());
    ASSERT_TRUE(reader.open(zip).ok());
    ASSERT_TRUE(reader.extractTo(root() / "out").ok());
    EXPECT_EQ(readFile(root() / "out" / "docs" / "a.txt"), "streamed");
    EXPECT_FALSE(scratchLeftovers());
}

TEST_F(ArchiveTest, StreamBackedSessionCannotExtract) {
    std::ostringstream out;
    Archive archive(out, quietConfig());
    EXPECT_EQ(archive.extractTo(root() / "out").kind(), ErrorKind::InvalidState);
    EXPECT_EQ(archive.open(root() / "x.zip").kind(), ErrorKind::InvalidState);
}

TEST_F(ArchiveTest, StreamBackedCloseDetachesWriter) {
    auto src = writeFile("src/a.txt", "a");
    std::ostringstream out;
    Archive archive(out, quietConfig());
    ASSERT_TRUE(archive.addFile("a.txt", src).ok());
    ASSERT_TRUE(archive.close().ok());
    EXPECT_FALSE(archive.isOpen());

    const std::string written = out.str();
    EXPECT_FALSE(written.empty());
    ASSERT_TRUE(archive.addFile("b.txt", src).ok());
    EXPECT_TRUE(archive.flush().ok());
    EXPECT_EQ(out.str(), written);
}

TEST_F(ArchiveTest, CloseFlushesPendingChanges) {
    auto zip = buildArchive("hello.zip", kHelloWorld);
    auto extra = writeFile("src/c.txt", "c");

    Archive archive(quietConfig());
    ASSERT_TRUE(archive.open(zip).ok());
    ASSERT_TRUE(archive.addFile("c.txt", extra).ok());
    ASSERT_TRUE(archive.close().ok());
    EXPECT_FALSE(archive.isOpen());
    EXPECT_FALSE(archive.hasChanged());
    EXPECT_EQ(namesOnDisk(zip), (std::vector<std::string>{"a.txt", "sub/", "sub/b.txt", "c.txt"}));
}

TEST_F(ArchiveTest, CloseOnCleanSessionKeepsBytes) {
    auto zip = buildArchive("hello.zip", kHelloWorld);
    const std::string before = readFile(zip);

    Archive archive(quietConfig());
    ASSERT_TRUE(archive.open(zip).ok());
    ASSERT_TRUE(archive.close().ok());
    EXPECT_FALSE(archive.isOpen());
    EXPECT_EQ(readFile(zip), before);
    EXPECT_EQ(archive.extractTo(root() / "out").kind(), ErrorKind::InvalidState);
}

TEST_F(ArchiveTest, CreateWritesAnEmptyArchive) {
    auto zip = root() / "nested" / "dir" / "fresh.zip";
    auto src = writeFile("src/a.txt", "a");

    Archive archive(quietConfig());
    ASSERT_TRUE(archive.create(zip).ok()) << archive.getLastError();
    EXPECT_TRUE(std::filesystem::exists(zip));
    EXPECT_TRUE(archive.isOpen());
    EXPECT_EQ(archive.entryCount(), 0u);

    ASSERT_TRUE(archive.addFile("a.txt", src).ok());
    ASSERT_TRUE(archive.close().ok());
    EXPECT_EQ(namesOnDisk(zip), (std::vector<std::string>{"a.txt"}));
}

TEST_F(ArchiveTest, FlushAppliesConfiguredPermission) {
    auto zip = buildArchive("hello.zip", kHelloWorld);
    auto extra = writeFile("src/c.txt", "c");
    using std::filesystem::perms;

    Archive archive(quietConfig());
    ASSERT_TRUE(archive.open(zip, perms::owner_read | perms::owner_write).ok());
    ASSERT_TRUE(archive.addFile("c.txt", extra).ok());
    ASSERT_TRUE(archive.flush().ok());
    EXPECT_EQ(std::filesystem::status(zip).permissions() & perms::mask, perms::owner_read | perms::owner_write);
}

TEST_F(ArchiveTest, BackslashNamesAreNormalizedAndRewrittenWithSlashes) {
    auto zip = buildRawArchive("dos.zip", {{"dir\\f.txt", "from dos"}});
    ASSERT_NE(readFile(zip).find("dir\\f.txt"), std::string::npos);

    Archive archive(quietConfig());
    ASSERT_TRUE(archive.open(zip).ok()) << archive.getLastError();
    EXPECT_EQ(archive.listNames(), (std::vector<std::string>{"dir/f.txt"}));

    ASSERT_TRUE(archive.extractTo(root() / "out").ok()) << archive.getLastError();
    EXPECT_EQ(readFile(root() / "out" / "dir" / "f.txt"), "from dos");

    auto extra = writeFile("src/top.txt", "top");
    ASSERT_TRUE(archive.addFile("top.txt", extra).ok());
    ASSERT_TRUE(archive.flush().ok()) << archive.getLastError();

    auto members = membersOnDisk(zip);
    ASSERT_EQ(members.size(), 2u);
    EXPECT_EQ(members["dir/f.txt"].storedName, "dir/f.txt");
    EXPECT_EQ(members["top.txt"].storedName, "top.txt");
    EXPECT_EQ(readFile(zip).find("dir\\f.txt"), std::string::npos);

    ASSERT_TRUE(archive.extractTo(root() / "again").ok());
    EXPECT_EQ(readFile(root() / "again" / "dir" / "f.txt"), "from dos");
}

TEST_F(ArchiveTest, FlushKeepsModificationTimesOfUntouchedMembers) {
    const std::time_t stamp = 1577880000;
    auto zip = buildArchive("dated.zip", {{"a.txt", "a"}, {"d/", ""}, {"d/b.txt", "b"}}, stamp);
    const auto before = membersOnDisk(zip);
    ASSERT_EQ(before.size(), 3u);

    Archive archive(quietConfig());
    ASSERT_TRUE(archive.open(zip).ok());
    ASSERT_TRUE(archive.addFile("c.txt", writeFile("src/c.txt", "c")).ok());
    ASSERT_TRUE(archive.flush().ok()) << archive.getLastError();

    const auto after = membersOnDisk(zip);
    ASSERT_EQ(after.size(), 4u);
    for (const auto &[name, member] : before) {
        ASSERT_EQ(after.count(name), 1u) << name;
        EXPECT_EQ(after.at(name).modified, member.modified) << name;
    }
}

TEST_F(ArchiveTest, FlushKeepsStoredAttributesOfUntouchedMembers) {
    using std::filesystem::perms;
    auto script = writeFile("tree/run.sh", "#!/bin/sh\n");
    writeFile("tree/bin/tool", "tool");
    std::filesystem::permissions(script, perms::owner_all | perms::group_read | perms::group_exec |
                                                 perms::others_read | perms::others_exec);
    auto zip = root() / "modes.zip";
    ASSERT_TRUE(packTo(root() / "tree", zip, false, quietConfig()).ok());
    const auto before = membersOnDisk(zip);

    Archive archive(quietConfig());
    ASSERT_TRUE(archive.open(zip).ok());
    ASSERT_TRUE(archive.addFile("c.txt", writeFile("src/c.txt", "c")).ok());
    ASSERT_TRUE(archive.flush().ok()) << archive.getLastError();

    const auto after = membersOnDisk(zip);
    for (const auto &[name, member] : before) {
        ASSERT_EQ(after.count(name), 1u) << name;
        EXPECT_EQ(after.at(name).attributes.versionMadeBy, member.attributes.versionMadeBy) << name;
        EXPECT_EQ(after.at(name).attributes.external, member.attributes.external) << name;
        EXPECT_EQ(after.at(name).modified, member.modified) << name;
    }
#ifndef _WIN32
    EXPECT_EQ((after.at("run.sh").attributes.external >> 16) & 0777, 0755u);
#endif
}

TEST_F(ArchiveTest, FailedStreamFlushWritesNothing) {
    auto kept = writeFile("src/a.txt", "a");
    auto vanished = writeFile("src/b.txt", "b");
    std::ostringstream out;

    Archive archive(out, quietConfig());
    ASSERT_TRUE(archive.addFile("a.txt", kept).ok());
    ASSERT_TRUE(archive.addFile("b.txt", vanished).ok());
    std::filesystem::remove(vanished);

    EXPECT_FALSE(archive.flush().ok());
    EXPECT_TRUE(archive.hasChanged());
    EXPECT_TRUE(out.str().empty());
}
