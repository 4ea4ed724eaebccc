#pragma once

#include "image_fetcher.hpp"
#include "models.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

// Fetches every image of one chapter, in source order. Up to four workers
// may fetch at once; they never touch the provider's session.
class ChapterDownloader {
public:
    explicit ChapterDownloader(ImageFetcher& fetcher, int maxParallel = 1);

    // Returns the assets in the order of content.image_urls. When `destDir`
    // is non-empty the raw bytes are also written there as NNN.<ext>.
    // Throws AssetError for the first (lowest index) image that failed.
    std::vector<ImageAsset> download_chapter(const ChapterContent& content,
                                             const std::string& referer,
                                             const std::filesystem::path& destDir,
                                             const ImageFailureHandler& onFailure = {});

    void set_inter_image_delay(std::chrono::milliseconds delay) { fetcher_.set_inter_image_delay(delay); }
    int max_parallel() const { return maxParallel_; }

    static void remove_images(const std::filesystem::path& destDir);

private:
    void persist(ImageAsset& asset, size_t index, const std::filesystem::path& destDir) const;

    ImageFetcher& fetcher_;
    int maxParallel_;
};
