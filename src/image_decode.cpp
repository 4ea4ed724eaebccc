#include "image_decode.hpp"

#include <limits>
#include <memory>
#include <stdexcept>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_STDIO
#include <stb_image.h>

#include <webp/decode.h>

namespace {

using PixelBuffer = std::unique_ptr<unsigned char, void (*)(void*)>;

const stbi_uc* as_buffer(const std::string& bytes) {
    return reinterpret_cast<const stbi_uc*>(bytes.data());
}

bool has_prefix(const std::string& bytes, const char* magic, size_t len, size_t offset = 0) {
    return bytes.size() >= offset + len && bytes.compare(offset, len, magic, len) == 0;
}

bool is_webp(const std::string& bytes) {
    return has_prefix(bytes, "RIFF", 4) && has_prefix(bytes, "WEBP", 4, 8);
}

bool usable_size(const std::string& bytes) {
    return !bytes.empty() && bytes.size() <= static_cast<size_t>(std::numeric_limits<int>::max());
}

// RGBA, whatever the source format. Throws std::runtime_error.
PixelBuffer load_rgba(const std::string& bytes, int& w, int& h) {
    if (is_webp(bytes)) {
        uint8_t* data = WebPDecodeRGBA(as_buffer(bytes), bytes.size(), &w, &h);
        if (!data) throw std::runtime_error("image decode failed: invalid WebP data");
        return PixelBuffer(data, WebPFree);
    }
    int comp = 0;
    stbi_uc* data = stbi_load_from_memory(as_buffer(bytes), static_cast<int>(bytes.size()), &w, &h, &comp, 4);
    if (!data) {
        const char* reason = stbi_failure_reason();
        throw std::runtime_error(std::string("image decode failed: ") + (reason ? reason : "unknown"));
    }
    return PixelBuffer(data, stbi_image_free);
}

// Composites a channel over a white background.
unsigned char over_white(unsigned char c, unsigned char alpha) {
    return static_cast<unsigned char>((c * alpha + 255 * (255 - alpha) + 127) / 255);
}

} // namespace

std::optional<ImageInfo> inspect_image(const std::string& bytes) {
    if (!usable_size(bytes)) return std::nullopt;
    int w = 0, h = 0, comp = 0;
    if (is_webp(bytes)) {
        uint8_t* data = WebPDecodeRGBA(as_buffer(bytes), bytes.size(), &w, &h);
        if (!data) return std::nullopt;
        WebPFree(data);
        comp = 4;
    } else {
        stbi_uc* data = stbi_load_from_memory(as_buffer(bytes), static_cast<int>(bytes.size()), &w, &h, &comp, 0);
        if (!data) return std::nullopt;
        stbi_image_free(data);
    }
    if (w <= 0 || h <= 0) return std::nullopt;
    return ImageInfo{w, h, comp};
}

DecodedImage decode_image(const std::string& bytes, int components) {
    if (components != 1 && components != 3) throw std::invalid_argument("decode_image supports 1 or 3 components");
    if (!usable_size(bytes)) throw std::runtime_error("empty or oversized image payload");

    int w = 0, h = 0;
    PixelBuffer rgba = load_rgba(bytes, w, h);

    DecodedImage img;
    img.width = w;
    img.height = h;
    img.components = components;
    const size_t count = static_cast<size_t>(w) * static_cast<size_t>(h);
    img.pixels.resize(count * static_cast<size_t>(components));

    const unsigned char* src = rgba.get();
    for (size_t i = 0; i < count; ++i, src += 4) {
        unsigned char r = over_white(src[0], src[3]);
        unsigned char g = over_white(src[1], src[3]);
        unsigned char b = over_white(src[2], src[3]);
        if (components == 1) {
            // same weights stb uses for its own gray conversion
            img.pixels[i] = static_cast<char>((r * 77 + g * 150 + b * 29) >> 8);
        } else {
            img.pixels[i * 3] = static_cast<char>(r);
            img.pixels[i * 3 + 1] = static_cast<char>(g);
            img.pixels[i * 3 + 2] = static_cast<char>(b);
        }
    }
    return img;
}

bool is_jpeg(const std::string& bytes) {
    return has_prefix(bytes, "\xFF\xD8\xFF", 3);
}

std::string image_extension(const std::string& bytes) {
    if (is_jpeg(bytes)) return "jpg";
    if (has_prefix(bytes, "\x89PNG", 4)) return "png";
    if (has_prefix(bytes, "GIF8", 4)) return "gif";
    if (is_webp(bytes)) return "webp";
    if (has_prefix(bytes, "BM", 2)) return "bmp";
    if (has_prefix(bytes, "P5", 2) || has_prefix(bytes, "P6", 2)) return "pnm";
    return "img";
}

std::optional<ImageInfo> probe_image(const std::string& bytes) {
    if (!usable_size(bytes)) return std::nullopt;
    int w = 0, h = 0, comp = 0;
    if (is_webp(bytes)) {
        if (!WebPGetInfo(as_buffer(bytes), bytes.size(), &w, &h)) return std::nullopt;
        return ImageInfo{w, h, 4};
    }
    if (!stbi_info_from_memory(as_buffer(bytes), static_cast<int>(bytes.size()), &w, &h, &comp)) return std::nullopt;
    return ImageInfo{w, h, comp};
}
