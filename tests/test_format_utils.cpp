#include <gtest/gtest.h>

#include <QDateTime>
#include <QTimeZone>

#include "FormatUtils.h"

// ============================================================================
// Sizes and durations
// ============================================================================

TEST(FormatUtilsTest, FormatFileSize)
{
    EXPECT_EQ(FormatUtils::formatFileSize(0), QString("0 B"));
    EXPECT_EQ(FormatUtils::formatFileSize(512), QString("512 B"));
    EXPECT_EQ(FormatUtils::formatFileSize(1536), QString("1.5 KB"));
    EXPECT_EQ(FormatUtils::formatFileSize(1048576), QString("1.0 MB"));
    EXPECT_EQ(FormatUtils::formatFileSize(Q_INT64_C(5) * 1024 * 1024 * 1024), QString("5.0 GB"));
}

TEST(FormatUtilsTest, FormatDuration)
{
    EXPECT_EQ(FormatUtils::formatDuration(42), QString("42s"));
    EXPECT_EQ(FormatUtils::formatDuration(185), QString("3m 5s"));
    EXPECT_EQ(FormatUtils::formatDuration(7800), QString("2h 10m"));
    EXPECT_EQ(FormatUtils::formatDuration(-1), QString("Unknown"));
}

// ============================================================================
// Dates
// ============================================================================

TEST(FormatUtilsTest, FormatDateTime_ConvertsUtcToLocal)
{
    const QDateTime utc(QDate(2024, 3, 1), QTime(10, 15, 30), QTimeZone::utc());
    const QString expected = utc.toLocalTime().toString("yyyy-MM-dd HH:mm");

    EXPECT_EQ(FormatUtils::formatDateTime("2024-03-01T10:15:30.000Z"), expected);
    EXPECT_EQ(FormatUtils::formatDateTime("2024-03-01T10:15:30Z"), expected);
}

TEST(FormatUtilsTest, FormatDateTime_EmptyAndMalformed)
{
    EXPECT_EQ(FormatUtils::formatDateTime(QString()), QString("-"));
    EXPECT_EQ(FormatUtils::formatDateTime("not-a-dateTvalue-xyz"), QString("not-a-date value"));
}

// ============================================================================
// Types and names
// ============================================================================

TEST(FormatUtilsTest, FileTypeDescription)
{
    EXPECT_EQ(FormatUtils::fileTypeDescription("application/pdf"), QString("PDF Document"));
    EXPECT_EQ(FormatUtils::fileTypeDescription("application/vnd.google-apps.folder"), QString("Folder"));
    EXPECT_EQ(FormatUtils::fileTypeDescription("image/webp"), QString("Image File"));
    EXPECT_EQ(FormatUtils::fileTypeDescription("video/x-flv"), QString("Video File"));
    EXPECT_EQ(FormatUtils::fileTypeDescription("application/x-custom"), QString("X-Custom"));
    EXPECT_EQ(FormatUtils::fileTypeDescription(QString()), QString("Unknown"));
}

TEST(FormatUtilsTest, SanitizeFileName_ReplacesReservedCharacters)
{
    EXPECT_EQ(FormatUtils::sanitizeFileName("a<b>c:d\"e/f\\g|h?i*j"), QString("a_b_c_d_e_f_g_h_i_j"));
    EXPECT_EQ(FormatUtils::sanitizeFileName(QString("tab\tname")), QString("tab_name"));
}

TEST(FormatUtilsTest, SanitizeFileName_TrimsAndFallsBack)
{
    EXPECT_EQ(FormatUtils::sanitizeFileName("  report.pdf. "), QString("report.pdf"));
    EXPECT_EQ(FormatUtils::sanitizeFileName("..."), QString("untitled"));
    EXPECT_EQ(FormatUtils::sanitizeFileName(QString()), QString("untitled"));
}

TEST(FormatUtilsTest, SanitizeFileName_LimitsLengthKeepingExtension)
{
    const QString longName = QString(300, QLatin1Char('x')) + ".txt";
    const QString sanitized = FormatUtils::sanitizeFileName(longName);

    EXPECT_EQ(sanitized.size(), 255);
    EXPECT_TRUE(sanitized.endsWith(".txt"));
}

TEST(FormatUtilsTest, SanitizeFileName_LongSuffixIsTruncatedToo)
{
    const QString longSuffix = QStringLiteral("a.") + QString(300, QLatin1Char('y'));
    const QString sanitized = FormatUtils::sanitizeFileName(longSuffix);

    EXPECT_EQ(sanitized.size(), 255);
    EXPECT_TRUE(sanitized.startsWith("a.yyy"));
}

TEST(FormatUtilsTest, ItemCountText)
{
    EXPECT_EQ(FormatUtils::itemCountText(0, 0), QString("Empty"));
    EXPECT_EQ(FormatUtils::itemCountText(1, 0), QString("1 folder"));
    EXPECT_EQ(FormatUtils::itemCountText(0, 1), QString("1 file"));
    EXPECT_EQ(FormatUtils::itemCountText(2, 3), QString("2 folders, 3 files"));
}
