#include "manifest.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <stdexcept>

using nlohmann::json;
namespace fs = std::filesystem;

std::string timestamp_now() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

SessionManifest::SessionManifest(fs::path path,
                                 std::string startUrl,
                                 std::string seriesTitle,
                                 std::string mode)
    : path_(std::move(path)),
      startUrl_(std::move(startUrl)),
      seriesTitle_(std::move(seriesTitle)),
      mode_(std::move(mode)),
      startedAt_(timestamp_now()) {}

void SessionManifest::add_chapter(ManifestChapter chapter) {
    chapters_.push_back(std::move(chapter));
}

fs::path SessionManifest::path_for(const fs::path& dir) {
    return dir / "manifest.json";
}

bool SessionManifest::write() const {
    json chapters = json::array();
    for (const auto& c : chapters_) {
        json files = json::array();
        for (const auto& f : c.pdf_files) files.push_back(f.string());
        chapters.push_back({
            {"index", c.index},
            {"url", c.url},
            {"chapter_number", c.chapter_number ? json(*c.chapter_number) : json(nullptr)},
            {"title", c.title},
            {"image_count", c.image_count},
            {"pdf_files", files},
            {"status", c.status}
        });
    }
    json j = {
        {"start_url", startUrl_},
        {"series_title", seriesTitle_},
        {"mode", mode_},
        {"started_at", startedAt_},
        {"status", status_},
        {"chapters", chapters}
    };

    // Titles come straight from page markup and need not be valid UTF-8.
    std::string text;
    try {
        text = j.dump(2, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        std::cerr << "  Could not serialise manifest " << path_.string() << ": " << e.what() << std::endl;
        return false;
    }

    std::error_code ec;
    if (!path_.parent_path().empty()) fs::create_directories(path_.parent_path(), ec);
    std::ofstream ofs(path_, std::ios::trunc);
    ofs << text;
    ofs.close();
    if (!ofs) {
        std::cerr << "  Could not write manifest " << path_.string() << std::endl;
        return false;
    }
    return true;
}

std::vector<fs::path> SessionManifest::read_pdf_files(const fs::path& manifestPath) {
    std::ifstream ifs(manifestPath);
    if (!ifs) throw std::runtime_error("manifest not found: " + manifestPath.string());

    json j;
    try {
        ifs >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("malformed manifest " + manifestPath.string() + ": " + e.what());
    }

    std::vector<fs::path> files;
    if (!j.contains("chapters") || !j["chapters"].is_array()) return files;
    for (const auto& c : j["chapters"]) {
        if (!c.contains("pdf_files") || !c["pdf_files"].is_array()) continue;
        for (const auto& f : c["pdf_files"]) {
            if (f.is_string()) files.emplace_back(f.get<std::string>());
        }
    }
    return files;
}
