#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// One chapter to visit. Built from a start URL or from a provider's next link.
struct ChapterRef {
    std::string url;
    std::optional<int> ordinal;
    std::optional<std::string> title;
};

// What the provider found on a chapter page.
struct ChapterContent {
    std::string title;
    std::vector<std::string> image_urls;
    std::optional<std::string> next_url;
    std::optional<double> chapter_number;
};

struct ImageAsset {
    std::string source_url;
    std::string bytes;
    int width = 0;
    int height = 0;
    std::filesystem::path saved_path;
};

struct Pacing {
    std::chrono::milliseconds inter_image_delay{200};
    std::chrono::milliseconds inter_chapter_delay{2000};
};

struct ManualMode { int count = 1; };
struct AutomaticMode {};
using CrawlMode = std::variant<ManualMode, AutomaticMode>;

struct DownloadJob {
    std::vector<ChapterRef> chapter_refs;
    CrawlMode mode = AutomaticMode{};
    std::filesystem::path target_dir;
    std::string series_title;
    Pacing pacing;
    bool delete_images_after = false;
    bool persist_images = true;
    bool write_manifest = true;
    int max_chapters = 0;   // per start ref, 0 = unlimited
};

enum class RunStatus { Running, Completed, Cancelled, Failed };
enum class ErrorKind { None, Fetch, Asset, Assembly, EndOfSeries };

struct RunState {
    int current_chapter_index = 0;
    int chapters_completed = 0;
    RunStatus status = RunStatus::Running;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
    std::optional<int> failed_ordinal;
    std::string failed_url;
    std::vector<std::filesystem::path> output_files;
};

enum class ProgressEventType { ChapterStarted, ChapterCompleted, ImageFailed, RunFinished };

struct ProgressEvent {
    ProgressEventType type;
    int chapter_index = 0;
    std::string url;
    std::string message;
    int attempt = 0;
    bool retryable = false;
    RunStatus status = RunStatus::Running;
    std::vector<std::filesystem::path> files;
};

using ProgressSink = std::function<void(const ProgressEvent&)>;

const char* to_string(RunStatus status);
const char* to_string(ErrorKind kind);
