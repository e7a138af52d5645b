// Batch CLI: folder of card images -> 3x3 print sheets
// Build via CMake target: card_sheet_cli

#include "models/PhysicalSpec.hpp"
#include "models/PrintSettings.hpp"
#include "print_sheet/print_sheet.hpp"

#include <opencv2/core.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static void usage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " [--input DIR] [--output DIR] [--dpi N] [--threshold N]\n"
                 "       [--edge-width PX] [--bottom-trim PX] [--brightness F] [--saturation F]\n"
                 "       [--force-standard]\n"
                 "Missing --input/--output are prompted for.\n";
}

static std::string prompt(const std::string& question)
{
    std::cout << question;
    std::string answer;
    std::getline(std::cin, answer);
    return answer;
}

int main(int argc, char** argv)
{
    std::string inputDir, outputDir;
    PrintSettings settings;

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            bool hasValue = i + 1 < argc;
            if (arg == "--help" || arg == "-h") { usage(argv[0]); return 0; }
            else if (arg == "--force-standard") settings.forceStandard = true;
            else if (!hasValue) { std::cerr << "Missing value for " << arg << "\n"; usage(argv[0]); return 1; }
            else if (arg == "--input") inputDir = argv[++i];
            else if (arg == "--output") outputDir = argv[++i];
            else if (arg == "--dpi") settings.dpi = std::stoi(argv[++i]);
            else if (arg == "--threshold") settings.blackThreshold = std::stoi(argv[++i]);
            else if (arg == "--edge-width") settings.edgeCheckWidthPx = std::stoi(argv[++i]);
            else if (arg == "--bottom-trim") settings.fullArtBottomCropPx = std::stoi(argv[++i]);
            else if (arg == "--brightness") settings.brightness = std::stod(argv[++i]);
            else if (arg == "--saturation") settings.saturation = std::stod(argv[++i]);
            else { std::cerr << "Unknown option " << arg << "\n"; usage(argv[0]); return 1; }
        }
    }
    catch (const std::logic_error& e)
    {
        std::cerr << "Invalid numeric argument (" << e.what() << ")\n";
        return 1;
    }
    if (settings.dpi <= 0) { std::cerr << "DPI must be positive\n"; return 1; }

    if (inputDir.empty()) inputDir = prompt("Enter the path to the folder containing card images: ");
    if (outputDir.empty()) outputDir = prompt("Enter the path to the output directory for the print sheets: ");

    std::vector<std::string> files;
    try
    {
        files = listImageFiles(inputDir);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << ". Exiting.\n";
        return 1;
    }

    std::error_code ec;
    if (!fs::exists(outputDir, ec))
    {
        if (!fs::create_directories(outputDir, ec) || ec)
        {
            std::cerr << "Error creating output directory '" << outputDir << "': " << ec.message() << ". Exiting.\n";
            return 1;
        }
        std::cout << "Created output directory: '" << outputDir << "'\n";
    }
    else if (!fs::is_directory(outputDir, ec))
    {
        std::cerr << "Error: output path '" << outputDir << "' exists but is not a directory. Exiting.\n";
        return 1;
    }

    std::cout << "\nFound " << files.size() << " image(s) in '" << inputDir << "'.\n";
    if (files.empty()) { std::cerr << "No images found in the input folder. Exiting.\n"; return 1; }
    if (files.size() < kCardsPerSheet)
    {
        std::cerr << "Only " << files.size() << " image(s) found. Need at least " << kCardsPerSheet
                  << " images to create a full print sheet. Exiting.\n";
        return 1;
    }

    const PhysicalSpec spec = makePhysicalSpec(settings);
    if (spec.forceStandard)
        std::cout << "\nAll cards will be processed as 'standard' frame type (--force-standard).\n";

    SheetBatches batches = chunkIntoSheets(files);
    int created = 0;
    for (std::size_t i = 0; i < batches.sheets.size(); ++i)
    {
        const auto& chunk = batches.sheets[i];
        const std::string name = sheetFileName(chunk.front(), chunk.back(), static_cast<int>(i) + 1);
        const std::string outPath = (fs::path(outputDir) / name).string();
        std::cout << "\n--- Processing batch " << i + 1 << " for " << name << " ---\n";

        cv::Mat sheet;
        if (!buildSheet(chunk, spec, sheet))
            std::cerr << "Warning: no card in batch " << i + 1 << " could be rendered\n";
        if (saveSheet(sheet, outPath, spec.dpi)) ++created;
        else std::cerr << "Error saving sheet " << outPath << "\n";
    }

    std::cout << "\n--- Summary ---\n";
    std::cout << "Created " << created << " print sheet(s) in '" << outputDir << "'.\n";
    if (!batches.leftover.empty())
    {
        std::cout << "Note: " << batches.leftover.size()
                  << " image(s) were left over as they did not form a full batch of " << kCardsPerSheet << ".\n";
        std::cout << "Leftover files:\n";
        for (const auto& f : batches.leftover)
            std::cout << "  - " << fs::path(f).filename().string() << "\n";
    }
    return created == static_cast<int>(batches.sheets.size()) ? 0 : 1;
}
