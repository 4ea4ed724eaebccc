#pragma once

#include "content_provider.hpp"
#include "errors.hpp"
#include "http_transport.hpp"
#include "models.hpp"

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <algorithm>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

// Unique scratch directory, removed on scope exit.
struct TempDir {
    fs::path path;

    TempDir() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        std::uniform_int_distribution<unsigned long long> dist;
        for (int i = 0; i < 5; ++i) {
            path = fs::temp_directory_path() / ("chapterpdf-test-" + std::to_string(dist(gen)));
            if (!fs::exists(path)) break;
        }
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
};

// Binary PPM (P6) or PGM (P5) with a flat colour.
inline std::string make_pnm(int width, int height, unsigned char shade = 128, bool gray = false) {
    std::string out = std::string(gray ? "P5" : "P6") + "\n" + std::to_string(width) + " " +
                      std::to_string(height) + "\n255\n";
    out.append(static_cast<size_t>(width) * static_cast<size_t>(height) * (gray ? 1u : 3u),
               static_cast<char>(shade));
    return out;
}

// Uncompressed 32-bit TGA, top row first, every pixel the same RGBA value.
inline std::string make_tga(int width, int height, unsigned char r, unsigned char g, unsigned char b,
                            unsigned char alpha) {
    std::string out(18, '\0');
    out[2] = 2;   // true colour, no colour map
    out[12] = static_cast<char>(width & 0xFF);
    out[13] = static_cast<char>((width >> 8) & 0xFF);
    out[14] = static_cast<char>(height & 0xFF);
    out[15] = static_cast<char>((height >> 8) & 0xFF);
    out[16] = 32;
    out[17] = 0x28;   // 8 alpha bits, top-left origin
    for (int i = 0; i < width * height; ++i) {
        out += static_cast<char>(b);
        out += static_cast<char>(g);
        out += static_cast<char>(r);
        out += static_cast<char>(alpha);
    }
    return out;
}

// 2x2 baseline JPEG, one gray component.
inline std::string jpeg_2x2() {
    static const char bytes[] =
        "\xff\xd8\xff\xe0\x00\x10\x4a\x46\x49\x46\x00\x01\x01\x00\x00\x01\x00\x01\x00\x00\xff\xdb\x00\x43"
        "\x00\x08\x06\x06\x07\x06\x05\x08\x07\x07\x07\x09\x09\x08\x0a\x0c\x14\x0d\x0c\x0b\x0b\x0c\x19\x12"
        "\x13\x0f\x14\x1d\x1a\x1f\x1e\x1d\x1a\x1c\x1c\x20\x24\x2e\x27\x20\x22\x2c\x23\x1c\x1c\x28\x37\x29"
        "\x2c\x30\x31\x34\x34\x34\x1f\x27\x39\x3d\x38\x32\x3c\x2e\x33\x34\x32\xff\xc0\x00\x0b\x08\x00\x02"
        "\x00\x02\x01\x01\x11\x00\xff\xc4\x00\x1f\x00\x00\x01\x05\x01\x01\x01\x01\x01\x01\x00\x00\x00\x00"
        "\x00\x00\x00\x00\x01\x02\x03\x04\x05\x06\x07\x08\x09\x0a\x0b\xff\xc4\x00\xb5\x10\x00\x02\x01\x03"
        "\x03\x02\x04\x03\x05\x05\x04\x04\x00\x00\x01\x7d\x01\x02\x03\x00\x04\x11\x05\x12\x21\x31\x41\x06"
        "\x13\x51\x61\x07\x22\x71\x14\x32\x81\x91\xa1\x08\x23\x42\xb1\xc1\x15\x52\xd1\xf0\x24\x33\x62\x72"
        "\x82\x09\x0a\x16\x17\x18\x19\x1a\x25\x26\x27\x28\x29\x2a\x34\x35\x36\x37\x38\x39\x3a\x43\x44\x45"
        "\x46\x47\x48\x49\x4a\x53\x54\x55\x56\x57\x58\x59\x5a\x63\x64\x65\x66\x67\x68\x69\x6a\x73\x74\x75"
        "\x76\x77\x78\x79\x7a\x83\x84\x85\x86\x87\x88\x89\x8a\x92\x93\x94\x95\x96\x97\x98\x99\x9a\xa2\xa3"
        "\xa4\xa5\xa6\xa7\xa8\xa9\xaa\xb2\xb3\xb4\xb5\xb6\xb7\xb8\xb9\xba\xc2\xc3\xc4\xc5\xc6\xc7\xc8\xc9"
        "\xca\xd2\xd3\xd4\xd5\xd6\xd7\xd8\xd9\xda\xe1\xe2\xe3\xe4\xe5\xe6\xe7\xe8\xe9\xea\xf1\xf2\xf3\xf4"
        "\xf5\xf6\xf7\xf8\xf9\xfa\xff\xda\x00\x08\x01\x01\x00\x00\x3f\x00\x2b\xff\xd9";
    return std::string(bytes, sizeof(bytes) - 1);
}

// 1x1 lossy WebP.
inline std::string webp_1x1() {
    static const char bytes[] =
        "\x52\x49\x46\x46\x22\x00\x00\x00\x57\x45\x42\x50\x56\x50\x38\x20\x16\x00\x00\x00\x30\x01\x00\x9d"
        "\x01\x2a\x01\x00\x01\x00\x0e\xc0\xfe\x25\xa4\x00\x03\x70\x00\x00\x00\x00";
    return std::string(bytes, sizeof(bytes) - 1);
}

inline ImageAsset make_asset(int width, int height, const std::string& url = "https://img.test/a.pnm") {
    ImageAsset a;
    a.source_url = url;
    a.bytes = make_pnm(width, height);
    a.width = width;
    a.height = height;
    return a;
}

inline ImageAsset asset_from(std::string bytes, int width, int height) {
    ImageAsset a;
    a.source_url = "https://img.test/fixture";
    a.bytes = std::move(bytes);
    a.width = width;
    a.height = height;
    return a;
}

// The image XObjects of every page, in page order.
inline std::vector<QPDFObjectHandle> page_images(QPDF& q) {
    std::vector<QPDFObjectHandle> images;
    for (auto& page : QPDFPageDocumentHelper(q).getAllPages()) {
        for (auto& entry : page.getImages()) images.push_back(entry.second);
    }
    return images;
}

inline void write_file(const fs::path& path, const std::string& data) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << data;
}

inline std::vector<double> page_heights(const fs::path& pdf) {
    QPDF q;
    q.processFile(pdf.string().c_str());
    std::vector<double> heights;
    for (auto& page : QPDFPageDocumentHelper(q).getAllPages()) {
        heights.push_back(page.getObjectHandle().getKey("/MediaBox").getArrayItem(3).getNumericValue());
    }
    return heights;
}

inline std::vector<std::string> pdf_names(const fs::path& dir) {
    std::vector<std::string> names;
    for (const auto& e : fs::directory_iterator(dir)) {
        if (e.path().extension() == ".pdf") names.push_back(e.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

inline HttpResponse ok(std::string body) {
    HttpResponse r;
    r.status = 200;
    r.body = std::move(body);
    return r;
}

inline HttpResponse http_status(long code) {
    HttpResponse r;
    r.status = code;
    return r;
}

inline HttpResponse network_error() {
    HttpResponse r;
    r.transport_error = true;
    r.error_message = "connection reset";
    return r;
}

// Scripted responses per URL. The last scripted response repeats; unknown
// URLs get 404.
class FakeTransport : public HttpTransport {
public:
    void serve(const std::string& url, HttpResponse response) {
        std::lock_guard<std::mutex> lk(mtx_);
        scripts_[url] = {std::move(response)};
    }

    void script(const std::string& url, std::vector<HttpResponse> responses) {
        std::lock_guard<std::mutex> lk(mtx_);
        scripts_[url] = std::deque<HttpResponse>(responses.begin(), responses.end());
    }

    HttpResponse get(const std::string& url, const HeaderMap& headers) override {
        std::lock_guard<std::mutex> lk(mtx_);
        ++calls_[url];
        lastHeaders_ = headers;
        auto it = scripts_.find(url);
        if (it == scripts_.end() || it->second.empty()) return http_status(404);
        HttpResponse r = it->second.front();
        if (it->second.size() > 1) it->second.pop_front();
        return r;
    }

    int calls(const std::string& url) {
        std::lock_guard<std::mutex> lk(mtx_);
        return calls_[url];
    }

    HeaderMap last_headers() {
        std::lock_guard<std::mutex> lk(mtx_);
        return lastHeaders_;
    }

private:
    std::mutex mtx_;
    std::map<std::string, std::deque<HttpResponse>> scripts_;
    std::map<std::string, int> calls_;
    HeaderMap lastHeaders_;
};

// Serves canned chapter pages and records what was asked for.
class FakeProvider : public ContentProvider {
public:
    std::map<std::string, ChapterContent> pages;
    std::vector<std::string> visited;
    std::function<void(const ChapterRef&)> on_fetch;
    int close_calls = 0;

    ChapterContent fetch(const ChapterRef& ref) override {
        visited.push_back(ref.url);
        if (on_fetch) on_fetch(ref);
        auto it = pages.find(ref.url);
        if (it == pages.end()) throw ProviderError("HTTP 404 for " + ref.url, false);
        return it->second;
    }

    void close() override { ++close_calls; }
};
