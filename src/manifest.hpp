#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct ManifestChapter {
    int index = 0;
    std::string url;
    std::optional<double> chapter_number;
    std::string title;
    size_t image_count = 0;
    std::vector<std::filesystem::path> pdf_files;
    std::string status;
};

// manifest.json in a job's target directory: what this session produced.
// The merger can restrict itself to the PDFs listed here.
class SessionManifest {
public:
    SessionManifest(std::filesystem::path path,
                    std::string startUrl,
                    std::string seriesTitle,
                    std::string mode);

    void add_chapter(ManifestChapter chapter);
    void set_status(std::string status) { status_ = std::move(status); }

    // Rewrites the whole file. Failures are logged and reported as false.
    bool write() const;

    static std::filesystem::path path_for(const std::filesystem::path& dir);

    // Throws std::runtime_error when the file is missing or malformed.
    static std::vector<std::filesystem::path> read_pdf_files(const std::filesystem::path& manifestPath);

private:
    std::filesystem::path path_;
    std::string startUrl_;
    std::string seriesTitle_;
    std::string mode_;
    std::string startedAt_;
    std::string status_ = "running";
    std::vector<ManifestChapter> chapters_;
};

// Local time as "YYYY-mm-dd HH:MM:SS".
std::string timestamp_now();
