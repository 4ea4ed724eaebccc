#include "pdf_assembler.hpp"

#include "chapter_naming.hpp"
#include "errors.hpp"
#include "image_decode.hpp"

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>

#include <algorithm>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

PdfAssembler::PdfAssembler(AssemblerOptions options)
    : options_(options) {
    if (options_.max_page_height <= 0) throw std::invalid_argument("max_page_height must be positive");
    if (options_.max_pages_per_file <= 0) throw std::invalid_argument("max_pages_per_file must be positive");
}

std::vector<PageSpec> PdfAssembler::layout(const std::vector<ImageAsset>& images) const {
    std::vector<ImageExtent> extents;
    extents.reserve(images.size());
    for (const auto& img : images) extents.push_back(display_extent(img.width, img.height, options_.max_width));
    return plan_pages(extents, options_.max_page_height);
}

QPDFObjectHandle PdfAssembler::make_image(QPDF& pdf, const ImageAsset& image) const {
    QPDFObjectHandle stream = QPDFObjectHandle::newStream(&pdf);
    QPDFObjectHandle dict = stream.getDict();
    dict.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
    dict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Image"));
    dict.replaceKey("/BitsPerComponent", QPDFObjectHandle::newInteger(8));

    // JPEG goes in untouched when the colour model already fits.
    auto info = probe_image(image.bytes);
    if (is_jpeg(image.bytes) && info && (info->components == 1 || (info->components == 3 && !options_.grayscale))) {
        dict.replaceKey("/Width", QPDFObjectHandle::newInteger(info->width));
        dict.replaceKey("/Height", QPDFObjectHandle::newInteger(info->height));
        dict.replaceKey("/ColorSpace", QPDFObjectHandle::newName(info->components == 1 ? "/DeviceGray" : "/DeviceRGB"));
        stream.replaceStreamData(image.bytes, QPDFObjectHandle::newName("/DCTDecode"), QPDFObjectHandle::newNull());
        return stream;
    }

    DecodedImage decoded = decode_image(image.bytes, options_.grayscale ? 1 : 3);
    dict.replaceKey("/Width", QPDFObjectHandle::newInteger(decoded.width));
    dict.replaceKey("/Height", QPDFObjectHandle::newInteger(decoded.height));
    dict.replaceKey("/ColorSpace", QPDFObjectHandle::newName(decoded.components == 1 ? "/DeviceGray" : "/DeviceRGB"));
    // raw samples; the writer flate-compresses them
    stream.replaceStreamData(decoded.pixels, QPDFObjectHandle::newNull(), QPDFObjectHandle::newNull());
    return stream;
}

void PdfAssembler::write_file(const std::vector<ImageAsset>& images,
                              const std::vector<ImageExtent>& extents,
                              const std::vector<PageSpec>& pages,
                              size_t firstPage,
                              size_t lastPage,
                              const std::string& title,
                              const fs::path& path) const {
    QPDF pdf;
    pdf.emptyPDF();
    QPDFPageDocumentHelper doc(pdf);

    // An image cut across several pages is embedded once per file.
    std::map<size_t, QPDFObjectHandle> xobjects;

    for (size_t n = firstPage; n < lastPage; ++n) {
        const PageSpec& page = pages[n];
        QPDFObjectHandle xobjectDict = QPDFObjectHandle::newDictionary();
        std::ostringstream content;

        int yTop = 0;
        for (const Placement& p : page.placements) {
            auto it = xobjects.find(p.image_index);
            if (it == xobjects.end()) {
                it = xobjects.emplace(p.image_index, make_image(pdf, images[p.image_index])).first;
            }
            const std::string name = "/Im" + std::to_string(p.image_index);
            xobjectDict.replaceKey(name, it->second);

            // Clip to the band, then draw the whole image shifted so that
            // rows [src_y, src_y + height) land inside it.
            const ImageExtent& ext = extents[p.image_index];
            int x = (page.width - p.width) / 2;
            int bandBottom = page.height - yTop - p.height;
            int imageBottom = bandBottom + p.height + p.src_y - ext.height;
            content << "q " << x << " " << bandBottom << " " << p.width << " " << p.height << " re W n "
                    << ext.width << " 0 0 " << ext.height << " " << x << " " << imageBottom << " cm "
                    << name << " Do Q\n";
            yTop += p.height;
        }

        QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
        resources.replaceKey("/XObject", xobjectDict);

        QPDFObjectHandle pageDict = QPDFObjectHandle::newDictionary();
        pageDict.replaceKey("/Type", QPDFObjectHandle::newName("/Page"));
        pageDict.replaceKey("/MediaBox", QPDFObjectHandle::newArray(std::vector<QPDFObjectHandle>{
            QPDFObjectHandle::newInteger(0), QPDFObjectHandle::newInteger(0),
            QPDFObjectHandle::newInteger(page.width), QPDFObjectHandle::newInteger(page.height)}));
        pageDict.replaceKey("/Resources", resources);
        pageDict.replaceKey("/Contents", QPDFObjectHandle::newStream(&pdf, content.str()));
        doc.addPage(QPDFPageObjectHelper(pdf.makeIndirectObject(pageDict)), false);
    }

    QPDFObjectHandle info = QPDFObjectHandle::newDictionary();
    if (!title.empty()) info.replaceKey("/Title", QPDFObjectHandle::newUnicodeString(title));
    info.replaceKey("/Producer", QPDFObjectHandle::newUnicodeString("chapterpdf"));
    pdf.getTrailer().replaceKey("/Info", pdf.makeIndirectObject(info));

    QPDFWriter writer(pdf, path.string().c_str());
    writer.write();
}

std::vector<fs::path> PdfAssembler::assemble(const std::vector<ImageAsset>& images,
                                             const std::string& chapterTitle,
                                             const fs::path& outPath) const {
    std::vector<fs::path> written;
    if (images.empty()) return written;

    std::vector<ImageExtent> extents;
    extents.reserve(images.size());
    for (const auto& img : images) extents.push_back(display_extent(img.width, img.height, options_.max_width));

    fs::path tmp;
    try {
        std::vector<PageSpec> pages = plan_pages(extents, options_.max_page_height);
        const size_t perFile = static_cast<size_t>(options_.max_pages_per_file);
        if (!outPath.parent_path().empty()) fs::create_directories(outPath.parent_path());

        int part = 1;
        for (size_t first = 0; first < pages.size(); first += perFile, ++part) {
            size_t last = std::min(pages.size(), first + perFile);
            fs::path target = part == 1 ? outPath : continuation_path(outPath, part);
            tmp = target;
            tmp += ".part";
            write_file(images, extents, pages, first, last, chapterTitle, tmp);
            fs::rename(tmp, target);
            tmp.clear();
            written.push_back(target);
            std::cout << "  PDF written: " << target.string() << " (" << (last - first) << " pages)" << std::endl;
        }
    } catch (const std::exception& e) {
        std::error_code ec;
        if (!tmp.empty()) fs::remove(tmp, ec);
        for (const auto& f : written) fs::remove(f, ec);
        throw AssemblyError("PDF assembly failed for " + outPath.string() + ": " + e.what());
    }
    return written;
}
