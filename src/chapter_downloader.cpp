#include "chapter_downloader.hpp"

#include "errors.hpp"
#include "image_decode.hpp"

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <thread>

namespace fs = std::filesystem;

static constexpr int kMaxParallelImages = 4;

ChapterDownloader::ChapterDownloader(ImageFetcher& fetcher, int maxParallel)
    : fetcher_(fetcher),
      maxParallel_(std::clamp(maxParallel, 1, kMaxParallelImages)) {}

void ChapterDownloader::persist(ImageAsset& asset, size_t index, const fs::path& destDir) const {
    char name[32];
    std::snprintf(name, sizeof(name), "%03zu.", index + 1);
    fs::path savePath = destDir / (std::string(name) + image_extension(asset.bytes));

    std::ofstream ofs(savePath, std::ios::binary | std::ios::trunc);
    ofs.write(asset.bytes.data(), static_cast<std::streamsize>(asset.bytes.size()));
    ofs.close();
    if (!ofs) {
        throw AssetError("could not write " + savePath.string(), asset.source_url, false);
    }
    asset.saved_path = savePath;
}

std::vector<ImageAsset> ChapterDownloader::download_chapter(const ChapterContent& content,
                                                            const std::string& referer,
                                                            const fs::path& destDir,
                                                            const ImageFailureHandler& onFailure) {
    const size_t total = content.image_urls.size();
    std::vector<ImageAsset> assets(total);
    if (total == 0) return assets;

    if (!destDir.empty()) {
        std::error_code ec;
        fs::create_directories(destDir, ec);
        if (ec) throw AssetError("could not create " + destDir.string() + ": " + ec.message(), {}, false);
    }

    std::atomic<size_t> next{0};
    std::atomic<bool> abort{false};
    std::mutex mtx;   // guards firstError and onFailure
    std::optional<std::pair<size_t, AssetError>> firstError;

    ImageFailureHandler serialized;
    if (onFailure) {
        serialized = [&](const std::string& url, int attempt, bool retry, const std::string& reason) {
            std::lock_guard<std::mutex> lk(mtx);
            onFailure(url, attempt, retry, reason);
        };
    }

    auto record = [&](size_t index, const AssetError& err) {
        std::lock_guard<std::mutex> lk(mtx);
        if (!firstError || index < firstError->first) firstError.emplace(index, err);
        abort = true;
    };

    auto worker = [&]() {
        for (;;) {
            if (abort) break;
            size_t i = next++;
            if (i >= total) break;
            const std::string& url = content.image_urls[i];
            try {
                ImageAsset asset = fetcher_.fetch(url, referer, serialized);
                if (!destDir.empty()) persist(asset, i, destDir);
                std::cout << "  " << (i + 1) << "/" << total << ": " << url
                          << " (" << asset.width << "x" << asset.height << ")" << std::endl;
                assets[i] = std::move(asset);
            } catch (const AssetError& e) {
                record(i, e);
            } catch (const std::exception& e) {
                record(i, AssetError(url + ": " + e.what(), url, false));
            }
        }
    };

    int threads = static_cast<int>(std::min<size_t>(static_cast<size_t>(maxParallel_), total));
    if (threads <= 1) {
        worker();
    } else {
        std::vector<std::thread> workers;
        workers.reserve(threads);
        for (int t = 0; t < threads; ++t) workers.emplace_back(worker);
        for (auto& t : workers) t.join();
    }

    if (firstError) throw firstError->second;
    return assets;
}

void ChapterDownloader::remove_images(const fs::path& destDir) {
    if (destDir.empty()) return;
    std::error_code ec;
    fs::remove_all(destDir, ec);
    if (ec) std::cerr << "  Could not remove " << destDir.string() << ": " << ec.message() << std::endl;
}
