#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include "test_support.hpp"
#include "transfer/file_downloader.hpp"

namespace {

QByteArray pattern(int n)
{
    QByteArray b(n, '\0');
    for (int i = 0; i < n; ++i) b[i] = static_cast<char>('a' + i % 26);
    return b;
}

class FileDownloaderTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir_.isValid());
        ASSERT_TRUE(server_.start());
    }

    QString dest(const QString& name = QStringLiteral("out.bin")) const { return dir_.filePath(name); }

    int fileCount() const
    {
        return QDir(dir_.path()).entryList(QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot).size();
    }

    QTemporaryDir dir_;
    CannedHttpServer server_;
};

} // namespace

TEST_F(FileDownloaderTest, WritesBodyAndReportsPath)
{
    const QByteArray payload = pattern(4096);
    server_.route("/ok", CannedHttpServer::body(200, "OK", payload));

    const TransferOutcome o = runDownload(server_.url("/ok"), dest(), limitsOf(1 << 20));

    ASSERT_TRUE(o.success) << o.reason.toStdString();
    EXPECT_EQ(o.path, dest());
    QFile f(dest());
    ASSERT_TRUE(f.open(QIODevice::ReadOnly));
    EXPECT_EQ(f.readAll(), payload);
    EXPECT_EQ(fileCount(), 1);
}

TEST_F(FileDownloaderTest, ZeroByteResponseCreatesEmptyFile)
{
    server_.route("/empty", CannedHttpServer::body(200, "OK", QByteArray()));

    const TransferOutcome o = runDownload(server_.url("/empty"), dest(), limitsOf(1000));

    ASSERT_TRUE(o.success) << o.reason.toStdString();
    ASSERT_TRUE(QFileInfo::exists(dest()));
    EXPECT_EQ(QFileInfo(dest()).size(), 0);
}

TEST_F(FileDownloaderTest, NonSuccessStatusLeavesNoFile)
{
    server_.route("/missing", CannedHttpServer::body(404, "Not Found", "not found"));

    const TransferOutcome o = runDownload(server_.url("/missing"), dest(), limitsOf(1000));

    EXPECT_FALSE(o.success);
    EXPECT_EQ(o.kind, ErrorKind::HttpStatus);
    EXPECT_TRUE(o.reason.contains(QStringLiteral("404")));
    EXPECT_FALSE(QFileInfo::exists(dest()));
}

TEST_F(FileDownloaderTest, DeclaredLengthOverLimitFailsBeforeWriting)
{
    server_.route("/big", CannedHttpServer::body(200, "OK", pattern(2000)));

    const TransferOutcome o = runDownload(server_.url("/big"), dest(), limitsOf(1000));

    EXPECT_FALSE(o.success);
    EXPECT_EQ(o.kind, ErrorKind::SizeLimitExceeded);
    EXPECT_FALSE(QFileInfo::exists(dest()));
    EXPECT_EQ(fileCount(), 0);
}

TEST_F(FileDownloaderTest, UndeclaredLengthOverLimitAbortsMidStream)
{
    server_.route("/stream", CannedHttpServer::chunked({pattern(500), pattern(500), pattern(500)}));

    const TransferOutcome o = runDownload(server_.url("/stream"), dest(), limitsOf(1000));

    EXPECT_FALSE(o.success);
    EXPECT_EQ(o.kind, ErrorKind::SizeLimitExceeded);
    EXPECT_FALSE(QFileInfo::exists(dest()));
}

TEST_F(FileDownloaderTest, UndeclaredLengthUnderLimitSucceeds)
{
    server_.route("/stream", CannedHttpServer::chunked({pattern(300), pattern(300)}));

    const TransferOutcome o = runDownload(server_.url("/stream"), dest(), limitsOf(1000));

    ASSERT_TRUE(o.success) << o.reason.toStdString();
    EXPECT_EQ(QFileInfo(dest()).size(), 600);
}

TEST_F(FileDownloaderTest, BodyExactlyAtLimitIsAccepted)
{
    server_.route("/exact", CannedHttpServer::body(200, "OK", pattern(1000)));

    const TransferOutcome o = runDownload(server_.url("/exact"), dest(), limitsOf(1000));

    ASSERT_TRUE(o.success) << o.reason.toStdString();
    EXPECT_EQ(QFileInfo(dest()).size(), 1000);
}

TEST_F(FileDownloaderTest, TimeoutBeforeHeadersLeavesNoFile)
{
    server_.route("/silent", CannedHttpServer::silent());

    const TransferOutcome o = runDownload(server_.url("/silent"), dest(), limitsOf(1000, 200));

    EXPECT_FALSE(o.success);
    EXPECT_EQ(o.kind, ErrorKind::Timeout);
    EXPECT_FALSE(QFileInfo::exists(dest()));
}

TEST_F(FileDownloaderTest, TimeoutMidStreamRemovesPartial)
{
    // 声明 5000 字节，只发 100 字节后连接保持不动
    CannedResponse stall;
    stall.head = "HTTP/1.1 200 OK\r\n"
                 "Content-Type: application/octet-stream\r\n"
                 "Content-Length: 5000\r\n\r\n";
    stall.chunks << pattern(100);
    stall.closeAfter = false;
    server_.route("/stall", stall);

    FileDownloader dl;
    TransferOutcome result;
    bool done = false;
    bool partialSeen = false;
    QObject::connect(&dl, &FileDownloader::progress, [&](qint64, qint64) {
        partialSeen = partialSeen || QFileInfo::exists(dest());
    });
    QObject::connect(&dl, &FileDownloader::finished, [&](const TransferOutcome& o) {
        result = o;
        done = true;
    });
    dl.start(server_.url("/stall"), dest(), limitsOf(10000, 200));
    ASSERT_TRUE(waitUntil([&]() { return done; }));

    EXPECT_TRUE(partialSeen);
    EXPECT_EQ(dl.bytesReceived(), 100);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.kind, ErrorKind::Timeout);
    EXPECT_FALSE(QFileInfo::exists(dest()));
    EXPECT_EQ(fileCount(), 0);
}

#ifdef Q_OS_UNIX
TEST_F(FileDownloaderTest, ExclusiveCreateDoesNotFollowExistingLink)
{
    server_.route("/ok", CannedHttpServer::body(200, "OK", "attacker bytes"));

    QTemporaryDir outside;
    ASSERT_TRUE(outside.isValid());
    const QString victim = outside.filePath(QStringLiteral("victim.txt"));
    {
        QFile f(victim);
        ASSERT_TRUE(f.open(QIODevice::WriteOnly));
        f.write("precious");
    }
    ASSERT_TRUE(QFile::link(victim, dest()));

    FileDownloader dl;
    dl.setExclusiveCreate(true);
    TransferOutcome result;
    bool done = false;
    QObject::connect(&dl, &FileDownloader::finished, [&](const TransferOutcome& o) {
        result = o;
        done = true;
    });
    dl.start(server_.url("/ok"), dest(), limitsOf(1000));
    ASSERT_TRUE(waitUntil([&]() { return done; }));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.kind, ErrorKind::Filesystem);
    EXPECT_TRUE(QFileInfo(dest()).isSymLink()); // 不是自己建的，不删
    QFile f(victim);
    ASSERT_TRUE(f.open(QIODevice::ReadOnly));
    EXPECT_EQ(f.readAll(), QByteArray("precious"));
}
#endif

TEST_F(FileDownloaderTest, ConnectionRefusedIsTransportError)
{
    const QUrl url = server_.url("/ok");
    server_.stop();

    const TransferOutcome o = runDownload(url, dest(), limitsOf(1000));

    EXPECT_FALSE(o.success);
    EXPECT_EQ(o.kind, ErrorKind::Transport);
    EXPECT_FALSE(QFileInfo::exists(dest()));
}

TEST_F(FileDownloaderTest, TruncatedBodyIsTransportErrorAndCleansUp)
{
    CannedResponse r;
    r.head = "HTTP/1.1 200 OK\r\nContent-Length: 5000\r\nConnection: close\r\n\r\n";
    r.chunks << pattern(100);
    server_.route("/cut", r);

    const TransferOutcome o = runDownload(server_.url("/cut"), dest(), limitsOf(10000));

    EXPECT_FALSE(o.success);
    EXPECT_EQ(o.kind, ErrorKind::Transport);
    EXPECT_FALSE(QFileInfo::exists(dest()));
}

TEST_F(FileDownloaderTest, RejectsNonHttpSchemesWithoutTouchingDisk)
{
    const TransferOutcome ftp = runDownload(QUrl(QStringLiteral("ftp://example.com/a.png")), dest(), limitsOf(1000));
    EXPECT_EQ(ftp.kind, ErrorKind::Transport);

    const TransferOutcome local = runDownload(QUrl::fromLocalFile(QStringLiteral("/etc/hostname")), dest(), limitsOf(1000));
    EXPECT_EQ(local.kind, ErrorKind::Transport);

    const TransferOutcome relative = runDownload(QUrl(QStringLiteral("a/b.png")), dest(), limitsOf(1000));
    EXPECT_EQ(relative.kind, ErrorKind::Transport);

    EXPECT_EQ(fileCount(), 0);
}

TEST_F(FileDownloaderTest, FollowsRedirects)
{
    const QByteArray payload = pattern(256);
    server_.route("/moved", CannedHttpServer::redirect("/final"));
    server_.route("/final", CannedHttpServer::body(200, "OK", payload));

    const TransferOutcome o = runDownload(server_.url("/moved"), dest(), limitsOf(1000));

    ASSERT_TRUE(o.success) << o.reason.toStdString();
    EXPECT_EQ(server_.hits("/final"), 1);
    EXPECT_EQ(QFileInfo(dest()).size(), payload.size());
}

TEST_F(FileDownloaderTest, UnwritableDestinationIsFilesystemError)
{
    server_.route("/ok", CannedHttpServer::body(200, "OK", pattern(10)));
    const QString bad = dir_.filePath(QStringLiteral("no/such/dir/out.bin"));

    const TransferOutcome o = runDownload(server_.url("/ok"), bad, limitsOf(1000));

    EXPECT_FALSE(o.success);
    EXPECT_EQ(o.kind, ErrorKind::Filesystem);
    EXPECT_FALSE(QFileInfo::exists(bad));
}

TEST_F(FileDownloaderTest, CancelRemovesPartialAndReportsUserCanceled)
{
    server_.route("/silent", CannedHttpServer::silent());

    FileDownloader dl;
    TransferOutcome result;
    int calls = 0;
    QObject::connect(&dl, &FileDownloader::finished, [&](const TransferOutcome& o) {
        result = o;
        ++calls;
    });
    dl.start(server_.url("/silent"), dest(), limitsOf(1000));
    ASSERT_TRUE(dl.isRunning());

    dl.cancel();
    waitUntil([]() { return false; }, 100); // 确认之后不会再有 finished

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(result.kind, ErrorKind::UserCanceled);
    EXPECT_FALSE(dl.isRunning());
    EXPECT_FALSE(QFileInfo::exists(dest()));
}

TEST_F(FileDownloaderTest, ConcurrentTransfersAreIndependent)
{
    server_.route("/a", CannedHttpServer::body(200, "OK", pattern(300)));
    server_.route("/b", CannedHttpServer::body(200, "OK", pattern(5000)));

    FileDownloader a;
    FileDownloader b;
    TransferOutcome ra;
    TransferOutcome rb;
    int done = 0;
    QObject::connect(&a, &FileDownloader::finished, [&](const TransferOutcome& o) { ra = o; ++done; });
    QObject::connect(&b, &FileDownloader::finished, [&](const TransferOutcome& o) { rb = o; ++done; });

    a.start(server_.url("/a"), dest(QStringLiteral("a.bin")), limitsOf(1000));
    b.start(server_.url("/b"), dest(QStringLiteral("b.bin")), limitsOf(1000));
    ASSERT_TRUE(waitUntil([&]() { return done == 2; }));

    EXPECT_TRUE(ra.success);
    EXPECT_EQ(QFileInfo(dest(QStringLiteral("a.bin"))).size(), 300);
    EXPECT_EQ(rb.kind, ErrorKind::SizeLimitExceeded);
    EXPECT_FALSE(QFileInfo::exists(dest(QStringLiteral("b.bin"))));
}

TEST_F(FileDownloaderTest, ReportsProgressWithDeclaredTotal)
{
    server_.route("/ok", CannedHttpServer::body(200, "OK", pattern(2048)));

    FileDownloader dl;
    qint64 lastReceived = 0;
    qint64 lastTotal = 0;
    bool done = false;
    QObject::connect(&dl, &FileDownloader::progress, [&](qint64 r, qint64 t) {
        lastReceived = r;
        lastTotal = t;
    });
    QObject::connect(&dl, &FileDownloader::finished, [&](const TransferOutcome&) { done = true; });
    dl.start(server_.url("/ok"), dest(), limitsOf(1 << 20));
    ASSERT_TRUE(waitUntil([&]() { return done; }));

    EXPECT_EQ(lastReceived, 2048);
    EXPECT_EQ(lastTotal, 2048);
    EXPECT_EQ(dl.bytesReceived(), 2048);
}
