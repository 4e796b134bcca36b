#include <gtest/gtest.h>

#include "corvus/tasks/task.hpp"

#include <string>

using namespace corvus::tasks;

TEST(TaskModel, DescribesTransfersBySourceNameAndTargetDirectory)
{
    EXPECT_EQ(describeTask(CopyOperation{"/home/me/a.txt", "/tmp/dir/a.txt"}), "Copy \"a.txt\" -> \"/tmp/dir\"");
    EXPECT_EQ(describeTask(MoveOperation{"notes.md", "archive/notes.md"}), "Move \"notes.md\" -> \"archive\"");
    EXPECT_EQ(describeTask(CopyOperation{"a.txt", "b.txt"}), "Copy \"a.txt\" -> \".\"");
}

TEST(TaskModel, DescribesRemainingOperations)
{
    EXPECT_EQ(describeTask(DeleteOperation{"/srv/old"}), "Delete \"old\"");
    EXPECT_EQ(describeTask(CreateFileOperation{"/srv/new.txt"}), "Create \"/srv/new.txt\"");
    EXPECT_EQ(describeTask(CreateDirectoryOperation{"/srv/new"}), "Create \"/srv/new\"");
    EXPECT_EQ(describeTask(ChmodOperation{"/srv/run.sh", 0755}), "Chmod \"run.sh\" to 755");
    EXPECT_EQ(describeTask(ChownOperation{"/srv/data", "www:www"}), "Chown \"data\" to www:www");
    EXPECT_EQ(describeTask(UnmountOperation{"/mnt/usb"}), "Unmount \"/mnt/usb\"");

    ArchiveOperation archive;
    archive.paths = {"/a", "/b"};
    archive.destination = "/out/backup.tar.gz";
    archive.format = "tar.gz";
    EXPECT_EQ(describeTask(archive), "Archive 2 items to \"/out/backup.tar.gz\"");
}

TEST(TaskModel, NamesEveryKind)
{
    EXPECT_STREQ(taskKindName(CopyOperation{}), "copy");
    EXPECT_STREQ(taskKindName(DeleteOperation{}), "delete");
    EXPECT_STREQ(taskKindName(CreateDirectoryOperation{}), "mkdir");
    EXPECT_STREQ(taskKindName(ArchiveOperation{}), "archive");
}

TEST(TaskModel, FormatsStatus)
{
    EXPECT_EQ(formatStatus(TaskStatus::pending()), "pending");
    EXPECT_EQ(formatStatus(TaskStatus::inProgress(0.0f)), "running 0%");
    EXPECT_EQ(formatStatus(TaskStatus::inProgress(0.5f)), "running 50%");
    EXPECT_EQ(formatStatus(TaskStatus::completed()), "done");
    EXPECT_EQ(formatStatus(TaskStatus::failed("disk full")), "failed: disk full");
}

TEST(TaskModel, OnlyCompletedAndFailedAreTerminal)
{
    EXPECT_FALSE(TaskStatus::pending().isTerminal());
    EXPECT_FALSE(TaskStatus::inProgress(0.9f).isTerminal());
    EXPECT_TRUE(TaskStatus::completed().isTerminal());
    EXPECT_TRUE(TaskStatus::failed("x").isTerminal());
}

TEST(TaskModel, ParsesArchiveFormatTagsExactly)
{
    EXPECT_EQ(parseArchiveFormat("zip"), ArchiveFormat::Zip);
    EXPECT_EQ(parseArchiveFormat("tar"), ArchiveFormat::Tar);
    EXPECT_EQ(parseArchiveFormat("tar.gz"), ArchiveFormat::TarGz);
    EXPECT_FALSE(parseArchiveFormat("ZIP").has_value());
    EXPECT_FALSE(parseArchiveFormat("tgz").has_value());
    EXPECT_FALSE(parseArchiveFormat("").has_value());

    EXPECT_STREQ(archiveFormatTag(ArchiveFormat::TarGz), "tar.gz");
    EXPECT_STREQ(archiveExtension(ArchiveFormat::Tar), ".tar");
}

TEST(TaskModel, BuildsArchiveDestinationFromFormat)
{
    EXPECT_EQ(archiveDestination("/out", "backup", "zip"), std::filesystem::path("/out/backup.zip"));
    EXPECT_EQ(archiveDestination("/out", "backup", "tar"), std::filesystem::path("/out/backup.tar"));
    EXPECT_EQ(archiveDestination("/out", "backup", "tar.gz"), std::filesystem::path("/out/backup.tar.gz"));
    EXPECT_EQ(archiveDestination("/out", "backup", "rar"), std::filesystem::path("/out/backup.zip"));
}

TEST(TaskModel, ParsesOctalModes)
{
    EXPECT_EQ(parseOctalMode("755"), 0755u);
    EXPECT_EQ(parseOctalMode("0644"), 0644u);
    EXPECT_EQ(parseOctalMode("4755"), 04755u);
    EXPECT_FALSE(parseOctalMode("").has_value());
    EXPECT_FALSE(parseOctalMode("789").has_value());
    EXPECT_FALSE(parseOctalMode("rwx").has_value());
    EXPECT_FALSE(parseOctalMode("777777777777").has_value());
}
