#pragma once

#include <optional>
#include <string>

struct ImageInfo {
    int width = 0;
    int height = 0;
    int components = 0;
};

struct DecodedImage {
    int width = 0;
    int height = 0;
    int components = 0;
    std::string pixels;   // row-major, top row first
};

// Fully decodes the payload (stb formats and WebP); nullopt if it is not a
// usable image.
std::optional<ImageInfo> inspect_image(const std::string& bytes);

// Decodes to `components` channels (1 = gray, 3 = RGB). Transparent areas are
// flattened onto white. Throws std::runtime_error.
DecodedImage decode_image(const std::string& bytes, int components);

bool is_jpeg(const std::string& bytes);

// File extension (without dot) guessed from magic bytes.
std::string image_extension(const std::string& bytes);

// Header-only probe (no pixel decode); nullopt if the format is unknown.
std::optional<ImageInfo> probe_image(const std::string& bytes);
