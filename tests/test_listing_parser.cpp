#include <gtest/gtest.h>

#include "peel/listing_parser.hpp"

#include <string>
#include <vector>

namespace {

using peel::ListingFormat;
using peel::ParseListing;
using Names = std::vector<std::string>;

std::string SevenZipRow(const std::string& attrs, const std::string& name) {
    std::string row = "2023-05-01 10:20:30 " + attrs + "         1234          567";
    row.resize(53, ' ');
    return row + name + "\n";
}

TEST(ListingParserTests, PlainKeepsNonEmptyLines) {
    EXPECT_EQ(ParseListing(ListingFormat::Plain, "a.txt\n\ndir/\ndir/b.txt\n"),
              (Names{"a.txt", "dir/", "dir/b.txt"}));
    EXPECT_TRUE(ParseListing(ListingFormat::Plain, "").empty());
}

TEST(ListingParserTests, PlainHandlesCrLf) {
    EXPECT_EQ(ParseListing(ListingFormat::Plain, "one\r\ntwo\r\n"), (Names{"one", "two"}));
}

TEST(ListingParserTests, SevenZipNameColumn) {
    const std::string out = SevenZipRow("....A", "docs/read me.txt") +
                            SevenZipRow("D....", "docs");
    EXPECT_EQ(ParseListing(ListingFormat::SevenZip, out), (Names{"docs/read me.txt", "docs"}));
}

TEST(ListingParserTests, LsarSkipsHeaderAndAnnotations) {
    const char* out = "archive.rar: RAR\n"
                      "src/main.c\n"
                      "src/util.c  (encrypted)\n"
                      "README\n";
    EXPECT_EQ(ParseListing(ListingFormat::Lsar, out), (Names{"src/main.c", "src/util.c", "README"}));
}

TEST(ListingParserTests, CabextractRowsAfterBorder) {
    const char* out = "Viewing cabinet: driver.cab\n"
                      " File size | Date       Time     | Name\n"
                      "-----------+---------------------+-------------\n"
                      "     12345 | 01.02.2020 10:11:12 | setup.inf\n"
                      "       678 | 01.02.2020 10:11:12 | bin\\drv.sys\n"
                      "\n"
                      "All done, no errors.\n";
    EXPECT_EQ(ParseListing(ListingFormat::Cabextract, out), (Names{"setup.inf", "bin\\drv.sys"}));
}

TEST(ListingParserTests, LhaNameColumnFromBorder) {
    const std::string border =
        "---------- ----------- ------- ------ ------------ --------------------\n";
    const std::size_t name_column = border.rfind(' ') + 1;
    auto row = [&](std::string meta, const std::string& name) {
        meta.resize(name_column, ' ');
        return meta + name + "\n";
    };
    const std::string out = "PERMISSION  UID  GID      SIZE  RATIO     STAMP           NAME\n" +
                            border + row("[generic]                  120  60.0% Jan  1 2020", "hello.txt") +
                            row("[generic]                   33  90.0% Jan  1 2020", "sub/two words.txt") +
                            border + " Total         2 files     153  65.0% Jan  1 2020\n";
    EXPECT_EQ(ParseListing(ListingFormat::Lha, out), (Names{"hello.txt", "sub/two words.txt"}));
}

TEST(ListingParserTests, ArjNumberedEntries) {
    const char* out = "Processing archive: old.arj\n"
                      "Archive created: 2001-01-01 00:00:00\n"
                      "Sequence/Pathname/Comment/Chapters\n"
                      "Rev/Host OS    Original Compressed Ratio DateTime modified Attributes/GUA BPMGS\n"
                      "------------ ---------- ---------- ----- -----------------\n"
                      "001) readme.txt\n"
                      " 11 UNIX            300        200 0.667 01-01-01 00:00:00\n"
                      "002) src/app.c\n"
                      " 11 UNIX            900        500 0.556 01-01-01 00:00:00\n";
    EXPECT_EQ(ParseListing(ListingFormat::Arj, out), (Names{"readme.txt", "src/app.c"}));
}

TEST(ListingParserTests, UnshieldRowsUntilRule) {
    const char* out = "Cabinet: data1.cab\n"
                      " --------  -----------\n"
                      "     1024  Program/app.exe\n"
                      "       12  Program/readme.txt\n"
                      " --------  -----------\n"
                      "     1036  2 files\n";
    EXPECT_EQ(ParseListing(ListingFormat::Unshield, out),
              (Names{"Program/app.exe", "Program/readme.txt"}));
}

TEST(ListingParserTests, ColumnDialectsKeepSurroundingBlanks) {
    EXPECT_EQ(ParseListing(ListingFormat::SevenZip, SevenZipRow("....A", " lead.txt") +
                                                        SevenZipRow("....A", "trail.txt ")),
              (Names{" lead.txt", "trail.txt "}));

    const char* cab = "-----------+---------------------+-------------\n"
                      "       100 | 01.02.2020 10:11:12 |  padded \n";
    EXPECT_EQ(ParseListing(ListingFormat::Cabextract, cab), (Names{" padded "}));

    EXPECT_EQ(ParseListing(ListingFormat::Arj, "001)  spaced name \n"), (Names{" spaced name "}));

    const char* unshield = " --------  -----------\n"
                           "       12   odd.txt\n"
                           " --------  -----------\n";
    EXPECT_EQ(ParseListing(ListingFormat::Unshield, unshield), (Names{" odd.txt"}));
}

TEST(ListingParserTests, PlainKeepsBlanksInNames) {
    EXPECT_EQ(ParseListing(ListingFormat::Plain, " a.txt\nb.txt \n"), (Names{" a.txt", "b.txt "}));
}

} // namespace
