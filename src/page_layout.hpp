#pragma once

#include <cstddef>
#include <vector>

// Size of an image as it will be drawn, in PDF points.
struct ImageExtent {
    int width = 0;
    int height = 0;
};

// A horizontal band [src_y, src_y + height) of one image placed on a page.
struct Placement {
    std::size_t image_index = 0;
    int src_y = 0;
    int height = 0;
    int width = 0;
};

struct PageSpec {
    std::vector<Placement> placements;
    int width = 0;
    int height = 0;
};

// Greedy vertical packing. Consecutive images share a page while their
// summed height stays within max_page_height; an image taller than the
// budget is cut into bands of at most max_page_height, one band per page.
// Throws std::invalid_argument on a non-positive budget or extent.
std::vector<PageSpec> plan_pages(const std::vector<ImageExtent>& images, int max_page_height);

// Scales an image down to max_width (0 = unlimited), keeping the aspect ratio.
ImageExtent display_extent(int width, int height, int max_width);
