#include <gtest/gtest.h>

#include <QEventLoop>
#include <QTemporaryDir>
#include <QTimer>

#include "MediaLoader.h"
#include "TestSupport.h"

namespace {

class MediaLoaderTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
    }

    QTemporaryDir m_dir;
};

} // namespace

TEST_F(MediaLoaderTest, DecodesAnImage) {
    const QString path = TestSupport::writeImage(m_dir.path(), "a.png");

    const MediaLoadResult result = MediaLoading::loadMedia(path);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.payload.kind, MediaKind::Image);
    EXPECT_EQ(result.payload.size, QSize(8, 6));
    EXPECT_FALSE(result.payload.image.isNull());
}

TEST_F(MediaLoaderTest, CorruptImageFailsToDecode) {
    const QString path = TestSupport::writeGarbage(m_dir.path(), "broken.png");

    const MediaLoadResult result = MediaLoading::loadMedia(path);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, LoadError::DecodeFailed);
    EXPECT_FALSE(result.message.isEmpty());
}

TEST_F(MediaLoaderTest, MissingFile) {
    const MediaLoadResult result = MediaLoading::loadMedia(m_dir.filePath("gone.png"));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, LoadError::FileNotFound);
}

TEST_F(MediaLoaderTest, UnsupportedExtension) {
    const QString path = TestSupport::writeGarbage(m_dir.path(), "notes.txt");

    const MediaLoadResult result = MediaLoading::loadMedia(path);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, LoadError::UnsupportedFormat);
}

TEST_F(MediaLoaderTest, VideoContainerIsAccepted) {
    const QString path = TestSupport::writeVideo(m_dir.path(), "clip.mp4");

    const MediaLoadResult result = MediaLoading::loadMedia(path);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.payload.kind, MediaKind::Video);
}

TEST_F(MediaLoaderTest, VideoWithoutContainerFails) {
    const QString path = TestSupport::writeGarbage(m_dir.path(), "clip.mkv");

    const MediaLoadResult result = MediaLoading::loadMedia(path);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, LoadError::DecodeFailed);
}

TEST_F(MediaLoaderTest, ThreadedLoaderReportsOnTheCallerThread) {
    const QString path = TestSupport::writeImage(m_dir.path(), "a.png");
    ThreadedMediaLoader loader;

    quint64 receivedId = 0;
    QString receivedPath;
    bool receivedOk = false;
    QEventLoop loop;
    QObject::connect(&loader, &MediaLoader::loadFinished, &loop,
                     [&](quint64 requestId, const QString &loadedPath, const MediaLoadResult &result) {
                         receivedId = requestId;
                         receivedPath = loadedPath;
                         receivedOk = result.ok;
                         loop.quit();
                     });
    QTimer::singleShot(5000, &loop, &QEventLoop::quit);

    loader.load(42, path);
    EXPECT_EQ(loader.pendingCount(), 1);
    loop.exec();

    EXPECT_EQ(receivedId, 42u);
    EXPECT_EQ(receivedPath, path);
    EXPECT_TRUE(receivedOk);
    EXPECT_EQ(loader.pendingCount(), 0);
}
