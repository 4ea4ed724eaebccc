#include "page_layout.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

void flush(std::vector<PageSpec>& pages, PageSpec& current) {
    if (current.placements.empty()) return;
    pages.push_back(std::move(current));
    current = PageSpec{};
}

void place(PageSpec& page, const Placement& p) {
    page.placements.push_back(p);
    page.height += p.height;
    page.width = std::max(page.width, p.width);
}

} // namespace

std::vector<PageSpec> plan_pages(const std::vector<ImageExtent>& images, int max_page_height) {
    if (max_page_height <= 0) {
        throw std::invalid_argument("max page height must be positive");
    }

    std::vector<PageSpec> pages;
    PageSpec current;
    for (size_t i = 0; i < images.size(); ++i) {
        const ImageExtent& img = images[i];
        if (img.width <= 0 || img.height <= 0) {
            throw std::invalid_argument("image " + std::to_string(i) + " has no area");
        }

        if (img.height > max_page_height) {
            flush(pages, current);
            for (int y = 0; y < img.height; y += max_page_height) {
                PageSpec band;
                place(band, Placement{i, y, std::min(max_page_height, img.height - y), img.width});
                pages.push_back(std::move(band));
            }
            continue;
        }

        if (current.height + img.height > max_page_height) flush(pages, current);
        place(current, Placement{i, 0, img.height, img.width});
    }
    flush(pages, current);
    return pages;
}

ImageExtent display_extent(int width, int height, int max_width) {
    if (max_width <= 0 || width <= max_width) return ImageExtent{width, height};
    double scale = static_cast<double>(max_width) / static_cast<double>(width);
    int h = static_cast<int>(std::lround(static_cast<double>(height) * scale));
    return ImageExtent{max_width, std::max(1, h)};
}
