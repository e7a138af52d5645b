#include "print_sheet/print_sheet.hpp"
#include "card_render/card_render.hpp"
#include "test_images.hpp"

#include <gtest/gtest.h>
#include <zlib.h>
#include <cstdint>
#include <fstream>
#include <iterator>

namespace {

std::vector<std::string> names(int n)
{
    std::vector<std::string> v;
    for (int i = 0; i < n; ++i) v.push_back("card_" + std::to_string(100 + i) + ".png");
    return v;
}

const cv::Vec4b kWhite(255, 255, 255, 255);
const cv::Vec4b kPink(153, 51, 255, 255);

}

TEST(ChunkIntoSheets, ElevenImagesGiveOneSheetAndTwoLeftovers)
{
    auto files = names(11);
    SheetBatches b = chunkIntoSheets(files);
    ASSERT_EQ(b.sheets.size(), 1u);
    EXPECT_EQ(b.sheets[0], std::vector<std::string>(files.begin(), files.begin() + 9));
    ASSERT_EQ(b.leftover.size(), 2u);
    EXPECT_EQ(b.leftover[0], files[9]);
    EXPECT_EQ(b.leftover[1], files[10]);
}

TEST(ChunkIntoSheets, Boundaries)
{
    EXPECT_EQ(chunkIntoSheets(names(0)).sheets.size(), 0u);

    SheetBatches eight = chunkIntoSheets(names(8));
    EXPECT_TRUE(eight.sheets.empty());
    EXPECT_EQ(eight.leftover.size(), 8u);

    SheetBatches nine = chunkIntoSheets(names(9));
    EXPECT_EQ(nine.sheets.size(), 1u);
    EXPECT_TRUE(nine.leftover.empty());

    SheetBatches many = chunkIntoSheets(names(28));
    ASSERT_EQ(many.sheets.size(), 3u);
    for (const auto& s : many.sheets) EXPECT_EQ(s.size(), 9u);
    EXPECT_EQ(many.sheets[2].back(), "card_126.png");
    EXPECT_EQ(many.leftover, std::vector<std::string>{ "card_127.png" });
}

TEST(SanitizeNameComponent, CollapsesHostileCharacters)
{
    EXPECT_EQ(sanitizeNameComponent("/tmp/cards/My Card.v2.png"), "My_Card_v2");
    EXPECT_EQ(sanitizeNameComponent("a<>b?.jpg"), "a_b");
    EXPECT_EQ(sanitizeNameComponent("__x__.png"), "x");
    EXPECT_EQ(sanitizeNameComponent("___.png"), "file");
    EXPECT_EQ(sanitizeNameComponent("plain"), "plain");
}

TEST(SheetFileName, FirstAndLastStems)
{
    EXPECT_EQ(sheetFileName("/in/alpha.png", "/in/omega card.jpg", 1), "alpha_to_omega_card_sheet_1.png");
}

TEST(ListImageFiles, SortedCaseInsensitiveExtensions)
{
    testimg::TempDir dir;
    for (const char* n : { "b.PNG", "a.jpg", "c.txt", "d.tiff", "e.Jpeg", "f.gif" })
        std::ofstream(dir.file(n)) << "x";
    std::filesystem::create_directories(dir.path() / "sub.png");

    std::vector<std::string> files = listImageFiles(dir.path().string());
    std::vector<std::string> expected { dir.file("a.jpg"), dir.file("b.PNG"), dir.file("d.tiff"),
                                        dir.file("e.Jpeg"), dir.file("f.gif") };
    EXPECT_EQ(files, expected);
}

TEST(ListImageFiles, MissingFolderThrows)
{
    testimg::TempDir dir;
    EXPECT_THROW(listImageFiles(dir.file("missing")), std::runtime_error);
    std::ofstream(dir.file("plain.png")) << "x";
    EXPECT_THROW(listImageFiles(dir.file("plain.png")), std::runtime_error);
}

TEST(ComposeSheet, BlankCellsAndCutGuides)
{
    const PhysicalSpec spec = testimg::spec300();
    std::vector<cv::Mat> cards(9, cv::Mat(spec.cardHeightPx, spec.cardWidthPx, CV_8UC4, cv::Scalar(0, 0, 0, 255)));
    cards[4] = cv::Mat();

    cv::Mat sheet = composeSheet(cards, spec);
    ASSERT_EQ(sheet.size(), cv::Size(2550, 3300));
    ASSERT_EQ(sheet.type(), CV_8UC4);

    EXPECT_EQ(sheet.at<cv::Vec4b>(spec.cellY(0) + 100, spec.cellX(0) + 100), cv::Vec4b(0, 0, 0, 255));
    EXPECT_EQ(sheet.at<cv::Vec4b>(spec.cellY(1) + 500, spec.cellX(1) + 300), kWhite);   // skipped cell
    EXPECT_EQ(sheet.at<cv::Vec4b>(10, 10), kWhite);                                      // margin

    // Guides are centred half a line width before each interior boundary
    for (int c = 1; c < 3; ++c)
    {
        EXPECT_EQ(sheet.at<cv::Vec4b>(5, spec.cellX(c) - 2), kPink);
        EXPECT_EQ(sheet.at<cv::Vec4b>(spec.paperHeightPx - 1, spec.cellX(c) - 4), kPink);
    }
    for (int r = 1; r < 3; ++r)
    {
        EXPECT_EQ(sheet.at<cv::Vec4b>(spec.cellY(r) - 2, 5), kPink);
        EXPECT_EQ(sheet.at<cv::Vec4b>(spec.cellY(r) - 1, spec.paperWidthPx - 1), kPink);
    }
}

TEST(BuildSheet, NineMixedCardsEndToEnd)
{
    const PhysicalSpec spec = testimg::spec300();
    testimg::TempDir dir;
    std::vector<std::string> paths;
    for (int i = 0; i < 9; ++i)
    {
        cv::Mat img;
        switch (i % 3)
        {
        case 0: img = testimg::standardCard(); break;
        case 1: img = testimg::extendedArtCard(); break;
        default: img = testimg::borderlessCard(); break;
        }
        paths.push_back(dir.file("card_" + std::to_string(i) + ".png"));
        ASSERT_TRUE(cv::imwrite(paths.back(), img));
    }

    cv::Mat sheet;
    ASSERT_TRUE(buildSheet(paths, spec, sheet));
    ASSERT_EQ(sheet.size(), cv::Size(spec.paperWidthPx, spec.paperHeightPx));

    for (int i = 0; i < 9; ++i)
    {
        const int row = i / 3, col = i % 3;
        cv::Mat card;
        ASSERT_TRUE(renderCard(paths[i], spec, card));

        // Interior of the cell, clear of the guides, is exactly the rendered card
        cv::Rect inner(10, 10, spec.cardWidthPx - 20, spec.cardHeightPx - 20);
        cv::Mat onSheet = sheet(inner + cv::Point(spec.cellX(col), spec.cellY(row)));
        EXPECT_EQ(cv::norm(onSheet, card(inner), cv::NORM_INF), 0.0) << "cell " << i;
    }

    // Outside the grid the page stays white; the guides cross the margins
    EXPECT_EQ(sheet.at<cv::Vec4b>(spec.marginY / 2, spec.marginX / 2), kWhite);
    EXPECT_EQ(sheet.at<cv::Vec4b>(spec.marginY / 2, spec.cellX(1) - 2), kPink);
    EXPECT_EQ(sheet.at<cv::Vec4b>(spec.cellY(2) - 2, spec.marginX / 2), kPink);

    // Standard cards keep a black border at the cell corner
    EXPECT_EQ(sheet.at<cv::Vec4b>(spec.cellY(0) + 5, spec.cellX(0) + 5), cv::Vec4b(0, 0, 0, 255));
}

TEST(BuildSheet, UnreadableCardLeavesCellBlank)
{
    const PhysicalSpec spec = testimg::spec300();
    testimg::TempDir dir;
    std::vector<std::string> paths;
    for (int i = 0; i < 9; ++i)
    {
        paths.push_back(dir.file("c" + std::to_string(i) + ".png"));
        if (i != 4) ASSERT_TRUE(cv::imwrite(paths.back(), testimg::standardCard()));
    }

    cv::Mat sheet;
    ASSERT_TRUE(buildSheet(paths, spec, sheet));
    EXPECT_EQ(sheet.at<cv::Vec4b>(spec.cellY(1) + 500, spec.cellX(1) + 300), kWhite);
    EXPECT_EQ(sheet.at<cv::Vec4b>(spec.cellY(1) + 5, spec.cellX(0) + 5), cv::Vec4b(0, 0, 0, 255));
}

TEST(SaveSheet, PngCarriesDpi)
{
    testimg::TempDir dir;
    const std::string path = dir.file("sheet.png");
    cv::Mat sheet(40, 30, CV_8UC4, cv::Scalar(255, 255, 255, 255));
    ASSERT_TRUE(saveSheet(sheet, path, 300));

    std::ifstream in(path, std::ios::binary);
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    const auto pos = bytes.find("pHYs");
    ASSERT_NE(pos, std::string::npos);
    auto be32 = [&](std::size_t at) {
        return (static_cast<uint32_t>(static_cast<uint8_t>(bytes[at])) << 24) |
               (static_cast<uint32_t>(static_cast<uint8_t>(bytes[at + 1])) << 16) |
               (static_cast<uint32_t>(static_cast<uint8_t>(bytes[at + 2])) << 8) |
               static_cast<uint32_t>(static_cast<uint8_t>(bytes[at + 3]));
    };
    EXPECT_EQ(be32(pos + 4), 11811u);
    EXPECT_EQ(be32(pos + 8), 11811u);
    EXPECT_EQ(bytes[pos + 12], 1);
    // Chunk CRC covers type and data
    const uLong crc = crc32(0L, reinterpret_cast<const Bytef*>(bytes.data() + pos), 13);
    EXPECT_EQ(be32(pos + 13), static_cast<uint32_t>(crc));

    cv::Mat back = cv::imread(path, cv::IMREAD_UNCHANGED);
    EXPECT_EQ(back.size(), sheet.size());
}

TEST(SaveSheet, UnwritablePathFails)
{
    testimg::TempDir dir;
    cv::Mat sheet(4, 4, CV_8UC4, cv::Scalar(255, 255, 255, 255));
    EXPECT_FALSE(saveSheet(sheet, dir.file("missing/dir/sheet.png"), 300));
}
