#pragma once

#include "cancellation.hpp"
#include "chapter_downloader.hpp"
#include "content_provider.hpp"
#include "models.hpp"
#include "pdf_assembler.hpp"

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

class SessionManifest;

enum class Continuation { Continue, Completed, EndOfSeries };

// Decides what happens after `count` chapters of the current start point.
// `seen` holds the normalized URLs already visited. Automatic mode ends
// when there is no next link or it points back to a visited chapter;
// manual mode ends at the requested count, and running out of chapters
// before that is EndOfSeries.
Continuation decide_continuation(const CrawlMode& mode,
                                 int count,
                                 const ChapterContent& content,
                                 const std::unordered_set<std::string>& seen);

// Drives one DownloadJob: visit chapter, download its images, write its
// PDF, move on. Chapters are strictly sequential because the provider's
// session is a single stateful resource.
class ChapterSequencer {
public:
    ChapterSequencer(ContentProvider& provider,
                     ChapterDownloader& downloader,
                     const PdfAssembler& assembler,
                     const CancellationToken& cancel,
                     ProgressSink sink = {});

    // Blocks until the job reaches a terminal status.
    RunState run(const DownloadJob& job);

private:
    struct ChapterResult {
        double number = 0;
        size_t image_count = 0;
        std::vector<std::filesystem::path> files;
    };

    RunStatus run_segment(const DownloadJob& job, const ChapterRef& start, SessionManifest* manifest);
    ChapterResult process_chapter(const DownloadJob& job, const ChapterRef& ref, const ChapterContent& content);

    RunStatus fail(const DownloadJob& job, ErrorKind kind, const std::string& message, const ChapterRef& ref);
    RunStatus cancel_at(const DownloadJob& job, const std::string& message, const ChapterRef& ref);
    void emit(const ProgressEvent& event) const;
    void log_error(const DownloadJob& job, const std::string& message) const;

    ContentProvider& provider_;
    ChapterDownloader& downloader_;
    const PdfAssembler& assembler_;
    const CancellationToken& cancel_;
    ProgressSink sink_;
    RunState state_;
    std::unordered_set<std::string> usedFileNames_;
    std::unordered_set<std::string> usedImageDirs_;
};
