#include <gtest/gtest.h>

#include <QJsonObject>
#include <cstdio>
#include <string>

#include "common/logger.hpp"
#include "transfer/transfer_types.hpp"

namespace {

std::string readAll(FILE* f)
{
    std::rewind(f);
    std::string out;
    char buf[512];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) out.append(buf, n);
    return out;
}

// 测完恢复 test_main 里的设置
struct LoggerRestore {
    ~LoggerRestore() { Logger::init(LogLevel::WARN, stderr, false); }
};

} // namespace

TEST(LoggerTest, ParsesLevelNames)
{
    LogLevel lvl = LogLevel::ERROR;
    EXPECT_TRUE(Logger::parse_level(QStringLiteral(" Debug "), &lvl));
    EXPECT_EQ(lvl, LogLevel::DEBUG);
    EXPECT_TRUE(Logger::parse_level(QStringLiteral("warning"), &lvl));
    EXPECT_EQ(lvl, LogLevel::WARN);
    EXPECT_FALSE(Logger::parse_level(QStringLiteral("loud"), &lvl));
    EXPECT_EQ(lvl, LogLevel::WARN);
}

TEST(LoggerTest, FiltersByLevelAndStampsLocation)
{
    LoggerRestore restore;
    FILE* f = std::tmpfile();
    ASSERT_NE(f, nullptr);
    Logger::init(LogLevel::INFO, f, false);

    LOG_DEBUG("hidden %d", 1);
    LOG_WARN("disk %s", "full");
    qWarning("from qt");

    const std::string out = readAll(f);
    std::fclose(f);

    EXPECT_EQ(out.find("hidden"), std::string::npos);
    EXPECT_NE(out.find("[WARN]"), std::string::npos);
    EXPECT_NE(out.find("test_logger.cpp:"), std::string::npos);
    EXPECT_NE(out.find("disk full"), std::string::npos);
    EXPECT_NE(out.find("from qt"), std::string::npos);
}

TEST(TransferOutcomeTest, UiShapeIsUniform)
{
    const QJsonObject ok = TransferOutcome::ok(QStringLiteral("/tmp/a.png")).toJson();
    EXPECT_TRUE(ok.value("success").toBool());
    EXPECT_EQ(ok.value("path").toString(), QStringLiteral("/tmp/a.png"));
    EXPECT_FALSE(ok.contains("message"));

    const QJsonObject bad =
        TransferOutcome::failure(ErrorKind::SizeLimitExceeded, QStringLiteral("too big"), QStringLiteral("/tmp/x")).toJson();
    EXPECT_FALSE(bad.value("success").toBool());
    EXPECT_EQ(bad.value("message").toString(), QStringLiteral("too big"));
    EXPECT_EQ(bad.value("kind").toString(), QStringLiteral("SizeLimitExceeded"));
    EXPECT_FALSE(bad.contains("path"));
}
