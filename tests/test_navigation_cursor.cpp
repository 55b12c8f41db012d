#include <gtest/gtest.h>

#include <QFile>
#include <QTemporaryDir>

#include "NavigationCursor.h"
#include "TestSupport.h"

namespace {

class NavigationCursorTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
    }

    QString image(const QString &name)
    {
        return TestSupport::writeImage(m_dir.path(), name);
    }

    QString video(const QString &name)
    {
        return TestSupport::writeVideo(m_dir.path(), name);
    }

    void load(const QString &current = QString())
    {
        const DirectoryScanResult result = DirectoryIndex::scan(m_dir.path(), SortOrder::Alphabetical);
        ASSERT_TRUE(result.ok);
        m_cursor.setIndex(result.index);
        if (!current.isEmpty()) {
            m_cursor.confirmNavigation(current);
        }
    }

    QTemporaryDir m_dir;
    NavigationCursor m_cursor;
};

} // namespace

TEST_F(NavigationCursorTest, StartsUnresolved) {
    EXPECT_EQ(m_cursor.position().state(), CursorPosition::Unresolved);
    EXPECT_TRUE(m_cursor.currentPath().isEmpty());
    EXPECT_EQ(m_cursor.currentIndex(), -1);
    EXPECT_TRUE(m_cursor.peekNext().isEmpty());
}

TEST_F(NavigationCursorTest, PeekNextWrapsAround) {
    const QString a = image("a.png");
    const QString b = image("b.png");
    const QString c = image("c.png");
    load(c);

    EXPECT_EQ(m_cursor.peekNext(), a);
    EXPECT_EQ(m_cursor.peekPrevious(), b);
}

TEST_F(NavigationCursorTest, PeekPreviousWrapsAround) {
    const QString a = image("a.png");
    image("b.png");
    const QString c = image("c.png");
    load(a);

    EXPECT_EQ(m_cursor.peekPrevious(), c);
}

TEST_F(NavigationCursorTest, PeeksDoNotMove) {
    const QString a = image("a.png");
    image("b.png");
    image("c.png");
    load(a);

    const CursorPosition before = m_cursor.position();
    m_cursor.peekNext();
    m_cursor.peekPrevious();
    m_cursor.peekNthNext(2);
    m_cursor.peekNthPreviousImage(1);
    EXPECT_EQ(m_cursor.position(), before);
    EXPECT_EQ(m_cursor.currentPath(), a);
}

TEST_F(NavigationCursorTest, NthPeekCountsSteps) {
    const QString a = image("a.png");
    const QString b = image("b.png");
    const QString c = image("c.png");
    load(a);

    EXPECT_EQ(m_cursor.peekNthNext(1), b);
    EXPECT_EQ(m_cursor.peekNthNext(2), c);
    EXPECT_EQ(m_cursor.peekNthNext(3), a);
    EXPECT_TRUE(m_cursor.peekNthNext(4).isEmpty());
    EXPECT_TRUE(m_cursor.peekNthNext(0).isEmpty());
    EXPECT_EQ(m_cursor.peekNthPrevious(2), b);
}

TEST_F(NavigationCursorTest, ImagePeekStepsOverVideos) {
    const QString a = image("img_a.png");
    video("img_b.mp4");
    const QString c = image("img_c.png");
    load(a);

    EXPECT_EQ(m_cursor.peekNthNextImage(1), c);
    EXPECT_EQ(m_cursor.peekNthNextImage(2), a);
    EXPECT_EQ(m_cursor.peekNthPreviousImage(1), c);
}

TEST_F(NavigationCursorTest, ImagePeekWithoutImages) {
    const QString a = video("a.mp4");
    video("b.mp4");
    load(a);

    EXPECT_TRUE(m_cursor.peekNthNextImage(1).isEmpty());
    EXPECT_TRUE(m_cursor.peekNthPreviousImage(1).isEmpty());
}

TEST_F(NavigationCursorTest, FilteredPeekFollowsTypeFilter) {
    const QString a = image("a.png");
    const QString b = video("b.mp4");
    const QString c = image("c.png");
    const QString d = video("d.mp4");
    load(a);

    EXPECT_EQ(m_cursor.peekNthNextFiltered(1), b);

    m_cursor.setTypeFilter(MediaTypeFilter::VideosOnly);
    EXPECT_EQ(m_cursor.peekNthNextFiltered(1), b);
    EXPECT_EQ(m_cursor.peekNthNextFiltered(2), d);
    EXPECT_EQ(m_cursor.filteredCount(), 2);

    m_cursor.setTypeFilter(MediaTypeFilter::ImagesOnly);
    EXPECT_EQ(m_cursor.peekNthNextFiltered(1), c);
    EXPECT_EQ(m_cursor.peekNthPreviousFiltered(1), c);
}

TEST_F(NavigationCursorTest, FilteredPeekFollowsDateRange) {
    const QDateTime base(QDate(2024, 5, 1), QTime(12, 0));
    const QString a = image("a.png");
    const QString b = image("b.png");
    const QString c = image("c.png");
    const QString d = video("d.mp4");
    TestSupport::setModified(a, base);
    TestSupport::setModified(b, base.addDays(10));
    TestSupport::setModified(c, base.addDays(20));
    TestSupport::setModified(d, base.addDays(15));
    load(a);

    m_cursor.setDateFilter(DateRangeFilter(DateFilterField::Modified, base.addDays(5), base.addDays(20)));
    EXPECT_TRUE(m_cursor.filterActive());
    EXPECT_EQ(m_cursor.filteredCount(), 3);
    EXPECT_EQ(m_cursor.peekNthNextFiltered(1), b);
    EXPECT_EQ(m_cursor.peekNthNextFiltered(3), d);
    EXPECT_EQ(m_cursor.peekNthPreviousFiltered(1), d);
    EXPECT_TRUE(m_cursor.peekNthNextFiltered(4).isEmpty());
    EXPECT_TRUE(m_cursor.navigationInfo().filterActive);
}

TEST_F(NavigationCursorTest, DateRangeCombinesWithTypeFilter) {
    const QDateTime base(QDate(2024, 5, 1), QTime(12, 0));
    const QString a = image("a.png");
    const QString b = image("b.png");
    const QString c = video("c.mp4");
    const QString d = image("d.png");
    TestSupport::setModified(a, base);
    TestSupport::setModified(b, base.addDays(-3));
    TestSupport::setModified(c, base.addDays(2));
    TestSupport::setModified(d, base.addDays(4));
    load(a);

    m_cursor.setTypeFilter(MediaTypeFilter::ImagesOnly);
    m_cursor.setDateFilter(DateRangeFilter(DateFilterField::Modified, base, QDateTime()));
    EXPECT_EQ(m_cursor.filteredCount(), 2);
    EXPECT_EQ(m_cursor.peekNthNextFiltered(1), d);
    EXPECT_EQ(m_cursor.peekNthNextFiltered(2), a);

    m_cursor.setDateFilter(DateRangeFilter());
    EXPECT_EQ(m_cursor.peekNthNextFiltered(1), b);
}

TEST_F(NavigationCursorTest, ConfirmIsIdempotent) {
    image("a.png");
    const QString b = image("b.png");
    load();

    m_cursor.confirmNavigation(b);
    const CursorPosition once = m_cursor.position();
    m_cursor.confirmNavigation(b);
    EXPECT_EQ(m_cursor.position(), once);
    EXPECT_EQ(once, CursorPosition::indexed(1));
}

TEST_F(NavigationCursorTest, ConfirmUnknownPathLeavesCursorUnresolved) {
    image("a.png");
    load();

    const QString outside = m_dir.filePath("elsewhere.png");
    m_cursor.confirmNavigation(outside);
    EXPECT_EQ(m_cursor.position().state(), CursorPosition::Unresolved);
    EXPECT_EQ(m_cursor.currentPath(), DirectoryIndex::normalizePath(outside));
}

TEST_F(NavigationCursorTest, UnresolvedCursorPeeksFromTheEnds) {
    const QString a = image("a.png");
    image("b.png");
    const QString c = image("c.png");
    load();

    EXPECT_EQ(m_cursor.peekNext(), a);
    EXPECT_EQ(m_cursor.peekPrevious(), c);
}

TEST_F(NavigationCursorTest, SingleEntryNavigatesToItself) {
    const QString a = image("a.png");
    load(a);

    EXPECT_EQ(m_cursor.navigateNext(), a);
    EXPECT_EQ(m_cursor.navigatePrevious(), a);
    EXPECT_EQ(m_cursor.currentPath(), a);
}

TEST_F(NavigationCursorTest, EmptyIndexHasNothingToPeek) {
    load();

    EXPECT_TRUE(m_cursor.peekNext().isEmpty());
    EXPECT_TRUE(m_cursor.peekPrevious().isEmpty());
    EXPECT_TRUE(m_cursor.navigateNext().isEmpty());
    const NavigationInfo info = m_cursor.navigationInfo();
    EXPECT_FALSE(info.hasNext);
    EXPECT_EQ(info.totalCount, 0);
}

TEST_F(NavigationCursorTest, EagerNavigationMovesImmediately) {
    const QString a = image("a.png");
    const QString b = image("b.png");
    load(a);

    EXPECT_EQ(m_cursor.navigateNext(), b);
    EXPECT_EQ(m_cursor.currentPath(), b);
    EXPECT_EQ(m_cursor.navigatePrevious(), a);
}

TEST_F(NavigationCursorTest, RescanReResolvesByPath) {
    image("b.png");
    const QString c = image("c.png");
    load(c);
    ASSERT_EQ(m_cursor.currentIndex(), 1);

    image("a.png");
    const DirectoryScanResult result = m_cursor.rescan(SortOrder::Alphabetical);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(m_cursor.currentIndex(), 2);
    EXPECT_EQ(m_cursor.currentPath(), c);
}

TEST_F(NavigationCursorTest, RescanAfterDeletionFallsBackToUnresolved) {
    const QString a = image("a.png");
    const QString b = image("b.png");
    image("c.png");
    load(b);

    ASSERT_TRUE(QFile::remove(b));
    const DirectoryScanResult result = m_cursor.rescan(SortOrder::Alphabetical);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(m_cursor.position(), CursorPosition::unresolved(b));
    EXPECT_EQ(m_cursor.index().size(), 2);
    EXPECT_EQ(m_cursor.peekNext(), a);
}

TEST_F(NavigationCursorTest, RescanWithoutAnyPathFails) {
    const DirectoryScanResult result = m_cursor.rescan(SortOrder::Alphabetical);
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.error.isEmpty());
}

TEST_F(NavigationCursorTest, NavigationInfoReportsBounds) {
    const QString a = image("a.png");
    image("b.png");
    const QString c = image("c.png");
    load(a);

    NavigationInfo info = m_cursor.navigationInfo();
    EXPECT_TRUE(info.atFirst);
    EXPECT_FALSE(info.atLast);
    EXPECT_EQ(info.currentIndex, 0);
    EXPECT_EQ(info.totalCount, 3);
    EXPECT_FALSE(info.filterActive);

    m_cursor.confirmNavigation(c);
    info = m_cursor.navigationInfo();
    EXPECT_TRUE(info.atLast);
}
