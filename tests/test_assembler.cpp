#include <catch2/catch.hpp>

#include "test_helpers.hpp"

#include "errors.hpp"
#include "pdf_assembler.hpp"

#include <qpdf/Buffer.hh>

#include <stdexcept>

namespace {

AssemblerOptions options(int maxHeight, int maxPages = 500) {
    AssemblerOptions o;
    o.max_page_height = maxHeight;
    o.max_pages_per_file = maxPages;
    return o;
}

bool has_part_files(const fs::path& dir) {
    for (const auto& e : fs::directory_iterator(dir)) {
        if (e.path().extension() == ".part") return true;
    }
    return false;
}

} // namespace

TEST_CASE("Short images are stacked onto shared pages", "[assembler]") {
    TempDir tmp;
    PdfAssembler assembler(options(1000));
    std::vector<ImageAsset> images = {make_asset(300, 400), make_asset(300, 400), make_asset(300, 400)};
    const fs::path out = tmp.path / "Chapter_001 - Test.pdf";

    auto files = assembler.assemble(images, "Test Chapter 1", out);

    REQUIRE(files.size() == 1);
    CHECK(files[0].string() == out.string());
    auto heights = page_heights(out);
    REQUIRE(heights.size() == 2);
    CHECK(heights[0] == Approx(800));
    CHECK(heights[1] == Approx(400));
    CHECK_FALSE(has_part_files(tmp.path));
}

TEST_CASE("A very tall image is sliced across pages", "[assembler]") {
    TempDir tmp;
    PdfAssembler assembler(options(1000));
    const fs::path out = tmp.path / "Chapter_002.pdf";

    auto files = assembler.assemble({make_asset(200, 2500)}, "", out);

    REQUIRE(files.size() == 1);
    auto heights = page_heights(out);
    REQUIRE(heights.size() == 3);
    CHECK(heights[0] == Approx(1000));
    CHECK(heights[1] == Approx(1000));
    CHECK(heights[2] == Approx(500));
}

TEST_CASE("Hitting the page ceiling starts continuation files", "[assembler]") {
    TempDir tmp;
    PdfAssembler assembler(options(100, 2));
    std::vector<ImageAsset> images;
    for (int i = 0; i < 5; ++i) images.push_back(make_asset(50, 100));
    const fs::path out = tmp.path / "Chapter_003 - Long.pdf";

    auto files = assembler.assemble(images, "Long", out);

    REQUIRE(files.size() == 3);
    CHECK(files[0].string() == out.string());
    CHECK(files[1].string() == (tmp.path / "Chapter_003 - Long (part 2).pdf").string());
    CHECK(files[2].string() == (tmp.path / "Chapter_003 - Long (part 3).pdf").string());
    CHECK(page_heights(files[0]).size() == 2);
    CHECK(page_heights(files[1]).size() == 2);
    CHECK(page_heights(files[2]).size() == 1);
}

TEST_CASE("Wide images are scaled to the configured width", "[assembler]") {
    TempDir tmp;
    AssemblerOptions o = options(5000);
    o.max_width = 100;
    PdfAssembler assembler(o);
    const fs::path out = tmp.path / "scaled.pdf";

    assembler.assemble({make_asset(400, 800)}, "", out);

    QPDF q;
    q.processFile(out.string().c_str());
    auto pages = QPDFPageDocumentHelper(q).getAllPages();
    REQUIRE(pages.size() == 1);
    auto box = pages[0].getObjectHandle().getKey("/MediaBox");
    CHECK(box.getArrayItem(2).getNumericValue() == Approx(100));
    CHECK(box.getArrayItem(3).getNumericValue() == Approx(200));
}

TEST_CASE("Grayscale output accepts colour and gray sources", "[assembler]") {
    TempDir tmp;
    AssemblerOptions o = options(2000);
    o.grayscale = true;
    PdfAssembler assembler(o);

    ImageAsset gray;
    gray.bytes = make_pnm(30, 40, 60, true);
    gray.width = 30;
    gray.height = 40;

    auto files = assembler.assemble({make_asset(30, 40), gray}, "", tmp.path / "gray.pdf");
    REQUIRE(files.size() == 1);
    CHECK(page_heights(files[0]).size() == 1);
}

TEST_CASE("JPEG pages are embedded without re-encoding", "[assembler]") {
    TempDir tmp;
    PdfAssembler assembler;
    const std::string jpeg = jpeg_2x2();

    auto files = assembler.assemble({asset_from(jpeg, 2, 2)}, "", tmp.path / "jpeg.pdf");
    REQUIRE(files.size() == 1);

    QPDF q;
    q.processFile(files[0].string().c_str());
    auto images = page_images(q);
    REQUIRE(images.size() == 1);
    auto dict = images[0].getDict();
    CHECK(dict.getKey("/Filter").getName() == "/DCTDecode");
    CHECK(dict.getKey("/ColorSpace").getName() == "/DeviceGray");
    CHECK(dict.getKey("/Width").getIntValue() == 2);
    auto raw = images[0].getRawStreamData();
    CHECK(std::string(reinterpret_cast<const char*>(raw->getBuffer()), raw->getSize()) == jpeg);
}

TEST_CASE("WebP pages are decoded", "[assembler]") {
    TempDir tmp;
    PdfAssembler assembler;

    auto files = assembler.assemble({asset_from(webp_1x1(), 1, 1), make_asset(1, 3)}, "", tmp.path / "webp.pdf");

    REQUIRE(files.size() == 1);
    auto heights = page_heights(files[0]);
    REQUIRE(heights.size() == 1);
    CHECK(heights[0] == Approx(4));

    QPDF q;
    q.processFile(files[0].string().c_str());
    auto images = page_images(q);
    REQUIRE(images.size() == 2);
    for (auto& img : images) CHECK(img.getDict().getKey("/ColorSpace").getName() == "/DeviceRGB");
}

TEST_CASE("Transparent pixels are flattened onto white", "[assembler]") {
    TempDir tmp;
    PdfAssembler assembler;

    unsigned char alpha = 0;
    unsigned char expected = 255;
    SECTION("fully transparent black") {
        alpha = 0;
        expected = 255;
    }
    SECTION("opaque black") {
        alpha = 255;
        expected = 0;
    }

    auto files = assembler.assemble({asset_from(make_tga(2, 2, 0, 0, 0, alpha), 2, 2)}, "", tmp.path / "alpha.pdf");
    REQUIRE(files.size() == 1);

    QPDF q;
    q.processFile(files[0].string().c_str());
    auto images = page_images(q);
    REQUIRE(images.size() == 1);
    auto data = images[0].getStreamData(qpdf_dl_generalized);
    REQUIRE(data->getSize() == 12);
    const unsigned char* px = data->getBuffer();
    for (size_t i = 0; i < data->getSize(); ++i) CHECK(static_cast<int>(px[i]) == static_cast<int>(expected));
}

TEST_CASE("No images means no file", "[assembler]") {
    TempDir tmp;
    PdfAssembler assembler;
    auto files = assembler.assemble({}, "Empty", tmp.path / "Chapter_009.pdf");
    CHECK(files.empty());
    CHECK(pdf_names(tmp.path).empty());
}

TEST_CASE("A failed assembly leaves nothing behind", "[assembler]") {
    TempDir tmp;
    PdfAssembler assembler(options(100, 1));

    ImageAsset broken;
    broken.source_url = "https://img.test/broken.png";
    broken.bytes = "definitely not pixels";
    broken.width = 50;
    broken.height = 80;

    // The first file is complete before the broken image is reached.
    std::vector<ImageAsset> images = {make_asset(50, 80), broken};
    CHECK_THROWS_AS(assembler.assemble(images, "", tmp.path / "Chapter_004.pdf"), AssemblyError);
    CHECK(pdf_names(tmp.path).empty());
    CHECK_FALSE(has_part_files(tmp.path));
}

TEST_CASE("Layout matches what gets written", "[assembler]") {
    PdfAssembler assembler(options(1000));
    std::vector<ImageAsset> images = {make_asset(300, 600), make_asset(300, 600), make_asset(300, 1500)};
    auto pages = assembler.layout(images);
    REQUIRE(pages.size() == 4);
    CHECK(pages[0].height == 600);
    CHECK(pages[1].height == 600);
    CHECK(pages[2].height == 1000);
    CHECK(pages[3].height == 500);
}

TEST_CASE("Invalid assembler limits are rejected", "[assembler]") {
    CHECK_THROWS_AS(PdfAssembler(options(0)), std::invalid_argument);
    CHECK_THROWS_AS(PdfAssembler(options(1000, 0)), std::invalid_argument);
}
