#include <gtest/gtest.h>

#include "PrefetchCache.h"

namespace {

constexpr int side = 1024;

MediaPayload imagePayload(int width = side, int height = side)
{
    MediaPayload payload;
    payload.kind = MediaKind::Image;
    payload.image = QImage(width, height, QImage::Format_RGB32);
    payload.image.fill(Qt::black);
    payload.size = payload.image.size();
    return payload;
}

} // namespace

TEST(PrefetchCacheTest, BudgetIsClamped) {
    EXPECT_EQ(PrefetchCache(1).maxBytes(), PrefetchCache::minimumMaxBytes);
    EXPECT_EQ(PrefetchCache(qsizetype(1) << 40).maxBytes(), PrefetchCache::maximumMaxBytes);
    EXPECT_EQ(PrefetchCache().maxBytes(), PrefetchCache::defaultMaxBytes);
    EXPECT_EQ(PrefetchCache().prefetchCount(), PrefetchCache::defaultPrefetchCount);
}

TEST(PrefetchCacheTest, CostIsTheDecodedSize) {
    EXPECT_EQ(PrefetchCache::costOf(imagePayload(10, 20)), qsizetype(10 * 20 * 4));

    MediaPayload sizeOnly;
    sizeOnly.size = QSize(3, 5);
    EXPECT_EQ(PrefetchCache::costOf(sizeOnly), qsizetype(3 * 5 * 4));
}

TEST(PrefetchCacheTest, HitReturnsTheStoredImage) {
    PrefetchCache cache;
    ASSERT_TRUE(cache.insert("/photos/a.jpg", imagePayload(16, 9)));

    MediaPayload payload;
    ASSERT_TRUE(cache.lookup("/photos/./a.jpg", &payload));
    EXPECT_EQ(payload.size, QSize(16, 9));
    EXPECT_FALSE(cache.lookup("/photos/b.jpg", &payload));
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 1u);
}

TEST(PrefetchCacheTest, EvictsLeastRecentlyUsedPastTheBudget) {
    PrefetchCache cache(PrefetchCache::minimumMaxBytes);
    ASSERT_TRUE(cache.insert("/photos/a.jpg", imagePayload()));
    ASSERT_TRUE(cache.insert("/photos/b.jpg", imagePayload()));
    EXPECT_EQ(cache.totalBytes(), PrefetchCache::minimumMaxBytes);

    ASSERT_TRUE(cache.lookup("/photos/a.jpg", nullptr));
    ASSERT_TRUE(cache.insert("/photos/c.jpg", imagePayload()));

    EXPECT_EQ(cache.count(), 2);
    EXPECT_TRUE(cache.contains("/photos/a.jpg"));
    EXPECT_FALSE(cache.contains("/photos/b.jpg"));
    EXPECT_TRUE(cache.contains("/photos/c.jpg"));
    EXPECT_LE(cache.totalBytes(), cache.maxBytes());
}

TEST(PrefetchCacheTest, RefusesVideosAndOversizedImages) {
    PrefetchCache cache(PrefetchCache::minimumMaxBytes);

    MediaPayload video = imagePayload(4, 4);
    video.kind = MediaKind::Video;
    EXPECT_FALSE(cache.insert("/photos/clip.gif", video));
    EXPECT_FALSE(cache.insert("/photos/huge.png", imagePayload(2048, 1100)));
    EXPECT_FALSE(cache.insert("/photos/empty.png", MediaPayload()));
    EXPECT_EQ(cache.count(), 0);
}

TEST(PrefetchCacheTest, DisabledCacheHoldsNothing) {
    PrefetchCache cache;
    ASSERT_TRUE(cache.insert("/photos/a.jpg", imagePayload(4, 4)));

    cache.setEnabled(false);
    EXPECT_EQ(cache.count(), 0);
    EXPECT_FALSE(cache.insert("/photos/a.jpg", imagePayload(4, 4)));
    EXPECT_FALSE(cache.lookup("/photos/a.jpg", nullptr));
    EXPECT_TRUE(cache.pathsToPrefetch({"/photos/b.jpg"}).isEmpty());
}

TEST(PrefetchCacheTest, OnlyMissingPathsAreFetched) {
    PrefetchCache cache;
    ASSERT_TRUE(cache.insert("/photos/b.jpg", imagePayload(4, 4)));

    const QStringList paths = cache.pathsToPrefetch(
        {"/photos/a.jpg", "/photos/b.jpg", QString(), "/photos/c.jpg", "/photos/a.jpg"});
    EXPECT_EQ(paths, QStringList({"/photos/a.jpg", "/photos/c.jpg"}));
}
