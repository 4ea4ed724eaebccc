#pragma once

#include "models.hpp"
#include "page_layout.hpp"

#include <filesystem>
#include <string>
#include <vector>

class QPDF;
class QPDFObjectHandle;

struct AssemblerOptions {
    int max_page_height = 14400;   // 200in, the usual viewer limit
    int max_pages_per_file = 500;
    int max_width = 0;             // 0 keeps native width
    bool grayscale = false;
};

// Turns the ordered images of one chapter into one or more PDF files.
class PdfAssembler {
public:
    explicit PdfAssembler(AssemblerOptions options = {});

    // Writes `outPath`, plus "<stem> (part N).pdf" files when the page
    // ceiling is hit. Returns the written paths in reading order (empty for
    // a chapter without images). On failure nothing written for this call
    // remains on disk and AssemblyError is thrown.
    std::vector<std::filesystem::path> assemble(const std::vector<ImageAsset>& images,
                                                const std::string& chapterTitle,
                                                const std::filesystem::path& outPath) const;

    // Layout the assembler would use for these images.
    std::vector<PageSpec> layout(const std::vector<ImageAsset>& images) const;

private:
    void write_file(const std::vector<ImageAsset>& images,
                    const std::vector<ImageExtent>& extents,
                    const std::vector<PageSpec>& pages,
                    size_t firstPage,
                    size_t lastPage,
                    const std::string& title,
                    const std::filesystem::path& path) const;

    QPDFObjectHandle make_image(QPDF& pdf, const ImageAsset& image) const;

    AssemblerOptions options_;
};
