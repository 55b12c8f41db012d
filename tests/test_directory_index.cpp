#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "DirectoryIndex.h"
#include "TestSupport.h"

namespace {

QStringList fileNames(const DirectoryIndex &index)
{
    QStringList names;
    for (const MediaEntry &entry : index.entries()) {
        names.append(entry.fileName);
    }
    return names;
}

} // namespace

TEST(DirectoryIndexTest, KeepsOnlyMediaFiles) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    TestSupport::writeImage(dir.path(), "a.jpg");
    TestSupport::writeVideo(dir.path(), "b.mp4");
    TestSupport::writeGarbage(dir.path(), "notes.txt");
    QDir(dir.path()).mkdir("nested.jpg");

    const DirectoryScanResult result = DirectoryIndex::scan(dir.path(), SortOrder::Alphabetical);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(fileNames(result.index), QStringList({"a.jpg", "b.mp4"}));
    EXPECT_EQ(result.index.at(0).kind, MediaKind::Image);
    EXPECT_EQ(result.index.at(1).kind, MediaKind::Video);
}

TEST(DirectoryIndexTest, ScanningAFileListsItsFolder) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString a = TestSupport::writeImage(dir.path(), "a.png");
    TestSupport::writeImage(dir.path(), "b.png");

    const DirectoryScanResult result = DirectoryIndex::scan(a, SortOrder::Alphabetical);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.index.size(), 2);
    EXPECT_EQ(result.index.directory(), DirectoryIndex::normalizePath(dir.path()));
    EXPECT_EQ(result.index.indexOf(a), 0);
}

TEST(DirectoryIndexTest, AlphabeticalOrderIsCaseInsensitive) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    TestSupport::writeImage(dir.path(), "Charlie.png");
    TestSupport::writeImage(dir.path(), "alpha.png");
    TestSupport::writeImage(dir.path(), "Bravo.png");

    const DirectoryScanResult result = DirectoryIndex::scan(dir.path(), SortOrder::Alphabetical);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(fileNames(result.index), QStringList({"alpha.png", "Bravo.png", "Charlie.png"}));
}

TEST(DirectoryIndexTest, ModifiedOrderFollowsTimestamps) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QDateTime base = QDateTime::currentDateTime().addDays(-1);
    TestSupport::setModified(TestSupport::writeImage(dir.path(), "a.png"), base.addSecs(300));
    TestSupport::setModified(TestSupport::writeImage(dir.path(), "b.png"), base.addSecs(100));
    TestSupport::setModified(TestSupport::writeImage(dir.path(), "c.png"), base.addSecs(200));

    const DirectoryScanResult result = DirectoryIndex::scan(dir.path(), SortOrder::ModifiedDate);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.index.sortOrder(), SortOrder::ModifiedDate);
    EXPECT_EQ(fileNames(result.index), QStringList({"b.png", "c.png", "a.png"}));
}

TEST(DirectoryIndexTest, EmptyFolderGivesEmptyIndex) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const DirectoryScanResult result = DirectoryIndex::scan(dir.path(), SortOrder::Alphabetical);
    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.index.isEmpty());
}

TEST(DirectoryIndexTest, MissingPathIsAnError) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const DirectoryScanResult result = DirectoryIndex::scan(dir.filePath("gone"), SortOrder::Alphabetical);
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.error.isEmpty());
}

TEST(DirectoryIndexTest, IndexOfNormalizesPaths) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    TestSupport::writeImage(dir.path(), "a.png");
    TestSupport::writeImage(dir.path(), "b.png");

    const DirectoryScanResult result = DirectoryIndex::scan(dir.path(), SortOrder::Alphabetical);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.index.indexOf(dir.path() + "/./b.png"), 1);
    EXPECT_FALSE(result.index.contains(dir.filePath("missing.png")));
}

TEST(DirectoryIndexTest, FirstMediaOfAFolder) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    TestSupport::writeImage(dir.path(), "zeta.png");
    const QString first = TestSupport::writeImage(dir.path(), "alpha.png");

    const FirstMediaResult result = DirectoryIndex::scanFirstMedia(dir.path(), SortOrder::Alphabetical);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.path, first);
}

TEST(DirectoryIndexTest, FirstMediaOfAFolderWithoutMedia) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    TestSupport::writeGarbage(dir.path(), "notes.txt");

    const FirstMediaResult result = DirectoryIndex::scanFirstMedia(dir.path(), SortOrder::Alphabetical);
    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(result.path.isEmpty());
}
