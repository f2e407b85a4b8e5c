#include <gtest/gtest.h>
#include "transferparser.h"

namespace {

QVector<Transfer> parseUtf8(const char *raw) {
    return TransferParser::parse(QString::fromUtf8(raw));
}

} // namespace

TEST(TransferParser, SimplifiedRow) {
    auto transfers = parseUtf8("1         ACTIVE    12%       /data/sample_file.zip");
    ASSERT_EQ(transfers.size(), 1);

    const Transfer& t = transfers.first();
    EXPECT_EQ(t.tag, "1");
    EXPECT_EQ(t.state, "ACTIVE");
    EXPECT_DOUBLE_EQ(t.progressPercent, 12.0);
    EXPECT_EQ(t.path, "/data/sample_file.zip");
    EXPECT_EQ(t.filename, "sample_file.zip");
    EXPECT_EQ(t.sizeDisplay, "Unknown");
    EXPECT_EQ(t.direction, Transfer::Direction::Unknown);
    EXPECT_EQ(t.progressText(), "12%");
}

TEST(TransferParser, NativeRow) {
    auto transfers = parseUtf8("⇓    76  /path/to/file.mkv  5.42% of  455.34 MB ACTIVE");
    ASSERT_EQ(transfers.size(), 1);

    const Transfer& t = transfers.first();
    EXPECT_EQ(t.tag, "76");
    EXPECT_EQ(t.state, "ACTIVE");
    EXPECT_DOUBLE_EQ(t.progressPercent, 5.42);
    EXPECT_EQ(t.path, "/path/to/file.mkv");
    EXPECT_EQ(t.filename, "file.mkv");
    EXPECT_EQ(t.sizeDisplay, "455.34 MB");
    EXPECT_EQ(t.direction, Transfer::Direction::Download);
    EXPECT_EQ(t.progressText(), "5% of 455.34 MB");
    EXPECT_EQ(t.knownState(), Transfer::State::Active);
}

TEST(TransferParser, SkipsHeaderAndBlankLines) {
    auto transfers = parseUtf8(
        "\n"
        "TYPE  TAG  SOURCEPATH  DESTINYPATH  PROGRESS  STATE\n"
        "\n"
        "⇓    12  /Downloads/a.iso  10.00% of  1.00 GB QUEUED\n"
        "\n");
    ASSERT_EQ(transfers.size(), 1);
    EXPECT_EQ(transfers.first().tag, "12");
    EXPECT_EQ(transfers.first().knownState(), Transfer::State::Queued);
}

TEST(TransferParser, GarbageYieldsNothing) {
    EXPECT_TRUE(TransferParser::parse(QString()).isEmpty());
    EXPECT_TRUE(TransferParser::parse("   \n \n").isEmpty());
    EXPECT_TRUE(TransferParser::parse("Not logged in.\nPlease login first").isEmpty());
    EXPECT_TRUE(TransferParser::parse("ACTIVE 12% /data/no_tag.zip").isEmpty());
}

TEST(TransferParser, MixedFormatsKeepOrder) {
    auto transfers = parseUtf8(
        "2 PAUSED 40% /data/first.bin\n"
        "↑ 9 /Uploads/second.mp4 78.50% of 1.23 GB ACTIVE\n");
    ASSERT_EQ(transfers.size(), 2);
    EXPECT_EQ(transfers.at(0).filename, "first.bin");
    EXPECT_EQ(transfers.at(0).knownState(), Transfer::State::Paused);
    EXPECT_EQ(transfers.at(1).filename, "second.mp4");
    EXPECT_EQ(transfers.at(1).direction, Transfer::Direction::Upload);
}

TEST(TransferParser, ParsingIsDeterministic) {
    const QString raw = QString::fromUtf8(
        "1 ACTIVE 12% /data/sample_file.zip\n"
        "⇓ 3456 /Downloads/large_archive.zip 12.8% of 8.91 GB RETRYING\n");
    EXPECT_EQ(TransferParser::parse(raw), TransferParser::parse(raw));
}

TEST(TransferParser, CarriageReturnsAreIgnored) {
    auto transfers = parseUtf8("1 ACTIVE 12% /data/a.zip\r\n2 QUEUED 0% /data/b.pdf\r\n");
    ASSERT_EQ(transfers.size(), 2);
    EXPECT_EQ(transfers.at(1).filename, "b.pdf");
}

TEST(TransferParser, UploadGlyphs) {
    auto transfers = parseUtf8(
        "⇑ 1 /Uploads/a.txt 1.00% of 10.0 KB ACTIVE\n"
        "↑ 2 /Uploads/b.txt 2.00% of 20.0 KB ACTIVE\n"
        "↓ 3 /Downloads/c.txt 3.00% of 30.0 KB ACTIVE\n");
    ASSERT_EQ(transfers.size(), 3);
    EXPECT_EQ(transfers.at(0).direction, Transfer::Direction::Upload);
    EXPECT_EQ(transfers.at(1).direction, Transfer::Direction::Upload);
    EXPECT_EQ(transfers.at(2).direction, Transfer::Direction::Download);
}

TEST(TransferParser, BareByteUnit) {
    auto transfers = parseUtf8("⇓ 5 /tmp/small.txt 100% of 512 B COMPLETED");
    ASSERT_EQ(transfers.size(), 1);
    EXPECT_EQ(transfers.first().sizeDisplay, "512 B");
    EXPECT_DOUBLE_EQ(transfers.first().progressPercent, 100.0);
    EXPECT_EQ(transfers.first().knownState(), Transfer::State::Completed);
}

TEST(TransferParser, UnknownStateIsKeptVerbatim) {
    auto transfers = parseUtf8("⇓ 8 /x/y.bin 1.5% of 2.0 KB VERIFYING");
    ASSERT_EQ(transfers.size(), 1);
    EXPECT_EQ(transfers.first().state, "VERIFYING");
    EXPECT_EQ(transfers.first().knownState(), Transfer::State::Other);
}

TEST(TransferParser, ProgressIsClamped) {
    auto transfers = parseUtf8("3 ACTIVE 150% /data/over.bin");
    ASSERT_EQ(transfers.size(), 1);
    EXPECT_DOUBLE_EQ(transfers.first().progressPercent, 100.0);
}

TEST(TransferParser, EmptyFilenameBecomesUnknown) {
    auto transfers = parseUtf8("4 ACTIVE 5% /data/");
    ASSERT_EQ(transfers.size(), 1);
    EXPECT_EQ(transfers.first().filename, "Unknown");
}

TEST(TransferParser, LongFilenamesAreElided) {
    const QString longName = QString(70, 'a') + ".bin";
    auto transfers = TransferParser::parse("6 ACTIVE 1% /data/" + longName);
    ASSERT_EQ(transfers.size(), 1);

    const QString filename = transfers.first().filename;
    EXPECT_EQ(filename.size(), TransferParser::MaxFilenameLength);
    EXPECT_TRUE(filename.endsWith("..."));
    EXPECT_EQ(filename.left(57), longName.left(57));
}

TEST(TransferParser, ShortenedPaths) {
    EXPECT_EQ(TransferParser::filenameFromPath("/first/par...t/file.ext"), "file.ext");
    EXPECT_EQ(TransferParser::filenameFromPath("/a/b/c.txt"), "c.txt");
    EXPECT_EQ(TransferParser::filenameFromPath("plainname"), "plainname");

    auto transfers = parseUtf8("⇓ 12 /very/long/pa...h/to/movie.mkv 50.00% of 1.00 GB ACTIVE");
    ASSERT_EQ(transfers.size(), 1);
    EXPECT_EQ(transfers.first().filename, "movie.mkv");
}

TEST(TransferParser, VariantMapForQml) {
    auto transfers = parseUtf8("⇓ 1234 /Downloads/ubuntu-22.04.iso 45.2% of 3.54 GB ACTIVE");
    ASSERT_EQ(transfers.size(), 1);

    const QVariantMap map = transfers.first().toVariantMap();
    EXPECT_EQ(map.value("tag").toString(), "1234");
    EXPECT_EQ(map.value("filename").toString(), "ubuntu-22.04.iso");
    EXPECT_NEAR(map.value("progress").toDouble(), 0.452, 1e-9);
    EXPECT_EQ(map.value("progressText").toString(), "45% of 3.54 GB");
    EXPECT_EQ(map.value("direction").toString(), "download");
}

TEST(TransferParser, ElisionCountsCodePoints) {
    const QString emoji = QString::fromUtf8("😀");

    // 44 characters, 84 UTF-16 units: under the limit.
    const QString shortName = emoji.repeated(40) + ".zip";
    auto kept = TransferParser::parse(QString::fromUtf8("⇓ 1 /d/") + shortName +
                                      " 1.0% of 1 KB ACTIVE");
    ASSERT_EQ(kept.size(), 1);
    EXPECT_EQ(kept.first().filename, shortName);

    // 74 characters: cut to 57 whole emoji plus "...".
    const QString longName = emoji.repeated(70) + ".zip";
    auto cut = TransferParser::parse(QString::fromUtf8("⇓ 2 /d/") + longName +
                                     " 1.0% of 1 KB ACTIVE");
    ASSERT_EQ(cut.size(), 1);
    const QString filename = cut.first().filename;
    EXPECT_EQ(filename, emoji.repeated(57) + "...");
    EXPECT_EQ(filename.toUcs4().size(), TransferParser::MaxFilenameLength);
    EXPECT_TRUE(filename.at(filename.size() - 4).isLowSurrogate());
}

TEST(TransferParser, NativeRowWithDownArrowAndWideSpacing) {
    auto transfers = parseUtf8("↓    1234  /Downloads/ubuntu-22.04.iso  45.2% of  3.54 GB ACTIVE");
    ASSERT_EQ(transfers.size(), 1);

    const Transfer& t = transfers.first();
    EXPECT_EQ(t.direction, Transfer::Direction::Download);
    EXPECT_EQ(t.tag, "1234");
    EXPECT_EQ(t.path, "/Downloads/ubuntu-22.04.iso");
    EXPECT_EQ(t.filename, "ubuntu-22.04.iso");
    EXPECT_DOUBLE_EQ(t.progressPercent, 45.2);
    EXPECT_EQ(t.sizeDisplay, "3.54 GB");
    EXPECT_EQ(t.state, "ACTIVE");
}
