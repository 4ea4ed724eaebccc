#include "sequencer.hpp"

#include "chapter_naming.hpp"
#include "errors.hpp"
#include "manifest.hpp"
#include "url_utils.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

Continuation decide_continuation(const CrawlMode& mode,
                                 int count,
                                 const ChapterContent& content,
                                 const std::unordered_set<std::string>& seen) {
    const bool hasNext = content.next_url && !content.next_url->empty();
    const bool loops = hasNext && seen.count(normalize_url(*content.next_url)) > 0;

    if (const auto* manual = std::get_if<ManualMode>(&mode)) {
        if (count >= manual->count) return Continuation::Completed;
        return (hasNext && !loops) ? Continuation::Continue : Continuation::EndOfSeries;
    }
    // Automatic: an empty chapter alone never ends the series.
    return (hasNext && !loops) ? Continuation::Continue : Continuation::Completed;
}

ChapterSequencer::ChapterSequencer(ContentProvider& provider,
                                   ChapterDownloader& downloader,
                                   const PdfAssembler& assembler,
                                   const CancellationToken& cancel,
                                   ProgressSink sink)
    : provider_(provider),
      downloader_(downloader),
      assembler_(assembler),
      cancel_(cancel),
      sink_(std::move(sink)) {}

void ChapterSequencer::emit(const ProgressEvent& event) const {
    if (sink_) sink_(event);
}

void ChapterSequencer::log_error(const DownloadJob& job, const std::string& message) const {
    std::cerr << "  Error: " << message << std::endl;
    std::error_code ec;
    fs::create_directories(job.target_dir, ec);
    std::ofstream ofs(job.target_dir / "error_log.txt", std::ios::app);
    if (ofs) ofs << "[" << timestamp_now() << "] " << message << "\n";
}

RunStatus ChapterSequencer::fail(const DownloadJob& job, ErrorKind kind, const std::string& message, const ChapterRef& ref) {
    state_.error_kind = kind;
    state_.error_message = message;
    state_.failed_ordinal = state_.current_chapter_index;
    state_.failed_url = ref.url;
    log_error(job, "Chapter " + std::to_string(state_.current_chapter_index) + " (" + ref.url + ") " +
                   to_string(kind) + ": " + message);
    return RunStatus::Failed;
}

RunStatus ChapterSequencer::cancel_at(const DownloadJob& job, const std::string& message, const ChapterRef& ref) {
    state_.error_message = message;
    state_.failed_ordinal = state_.current_chapter_index;
    state_.failed_url = ref.url;
    log_error(job, "Chapter " + std::to_string(state_.current_chapter_index) + " (" + ref.url +
                   ") discarded on cancel: " + message);
    return RunStatus::Cancelled;
}

ChapterSequencer::ChapterResult ChapterSequencer::process_chapter(const DownloadJob& job,
                                                                  const ChapterRef& ref,
                                                                  const ChapterContent& content) {
    ChapterResult result;
    const double ordinal = static_cast<double>(ref.ordinal.value_or(state_.current_chapter_index));
    if (content.chapter_number && plausible_chapter_number(*content.chapter_number)) {
        result.number = *content.chapter_number;
    } else {
        result.number = chapter_number_from_url(ref.url).value_or(ordinal);
    }

    // Two chapters of one run must never share an output file.
    const std::string& fileTitle = job.series_title.empty() ? content.title : job.series_title;
    std::string fileName = chapter_file_name(result.number, fileTitle);
    if (!usedFileNames_.insert(fileName).second) {
        std::cerr << "  " << fileName << " already written in this run, numbering this chapter "
                  << format_chapter_token(ordinal) << " instead" << std::endl;
        result.number = ordinal;
        fileName = chapter_file_name(result.number, fileTitle);
        if (!usedFileNames_.insert(fileName).second) {
            throw AssemblyError("chapter file name " + fileName + " already used by an earlier chapter of this run");
        }
    }

    const std::string token = format_chapter_token(result.number);
    std::string dirName = "Chapter_" + token;
    if (!usedImageDirs_.insert(dirName).second) {
        dirName += " (" + std::to_string(state_.current_chapter_index) + ")";
        usedImageDirs_.insert(dirName);
    }
    const fs::path imageDir = job.persist_images ? job.target_dir / dirName : fs::path();
    std::cout << "  Folder: " << dirName << ", " << content.image_urls.size() << " image(s)" << std::endl;

    const int index = state_.current_chapter_index;
    std::vector<ImageAsset> images = downloader_.download_chapter(
        content, ref.url, imageDir,
        [&](const std::string& url, int attempt, bool retry, const std::string& reason) {
            std::cerr << "  Image attempt " << attempt << " failed: " << url << " (" << reason << ")" << std::endl;
            ProgressEvent e{ProgressEventType::ImageFailed};
            e.chapter_index = index;
            e.url = url;
            e.attempt = attempt;
            e.retryable = retry;
            e.message = reason;
            emit(e);
        });
    result.image_count = images.size();

    if (images.empty()) {
        std::cout << "  No images in this chapter, no PDF written" << std::endl;
        return result;
    }

    const fs::path outPath = job.target_dir / fileName;
    result.files = assembler_.assemble(images, content.title, outPath);

    // Images go only once the PDF is safely on disk.
    if (job.delete_images_after && !imageDir.empty()) {
        ChapterDownloader::remove_images(imageDir);
        std::cout << "  Chapter images deleted" << std::endl;
    }
    return result;
}

RunStatus ChapterSequencer::run_segment(const DownloadJob& job, const ChapterRef& start, SessionManifest* manifest) {
    ChapterRef current = start;
    std::unordered_set<std::string> seen;
    int count = 0;

    auto record = [&](const ChapterRef& ref, const ChapterContent* content, const ChapterResult* result, const char* status) {
        if (!manifest) return;
        ManifestChapter c;
        c.index = state_.current_chapter_index;
        c.url = ref.url;
        if (content) {
            c.title = content->title;
            c.chapter_number = content->chapter_number;
        }
        if (result) {
            c.chapter_number = result->number;
            c.image_count = result->image_count;
            c.pdf_files = result->files;
        }
        c.status = status;
        manifest->add_chapter(std::move(c));
        manifest->write();
    };

    for (;;) {
        if (cancel_.cancelled()) {
            std::cout << "Cancelled before chapter " << (state_.current_chapter_index + 1) << std::endl;
            return RunStatus::Cancelled;
        }

        const int index = ++state_.current_chapter_index;
        if (!current.ordinal) current.ordinal = index;
        seen.insert(normalize_url(current.url));

        ProgressEvent started{ProgressEventType::ChapterStarted};
        started.chapter_index = index;
        started.url = current.url;
        emit(started);
        std::cout << "Chapter " << index << ": " << current.url << std::endl;

        ChapterContent content;
        try {
            content = provider_.fetch(current);
        } catch (const ProviderError& e) {
            record(current, nullptr, nullptr, "failed");
            if (cancel_.cancelled()) return cancel_at(job, e.what(), current);
            return fail(job, ErrorKind::Fetch, e.what(), current);
        }

        ChapterResult result;
        try {
            result = process_chapter(job, current, content);
        } catch (const AssetError& e) {
            record(current, &content, nullptr, "failed");
            if (cancel_.cancelled()) return cancel_at(job, e.what(), current);
            return fail(job, ErrorKind::Asset, e.what(), current);
        } catch (const AssemblyError& e) {
            record(current, &content, nullptr, "failed");
            return fail(job, ErrorKind::Assembly, e.what(), current);
        }

        ++count;
        ++state_.chapters_completed;
        state_.output_files.insert(state_.output_files.end(), result.files.begin(), result.files.end());
        record(current, &content, &result, "completed");

        ProgressEvent done{ProgressEventType::ChapterCompleted};
        done.chapter_index = index;
        done.url = current.url;
        done.files = result.files;
        done.message = result.image_count == 0 ? "no images" : std::to_string(result.image_count) + " images";
        emit(done);
        std::cout << "  Chapter " << index << " done (" << result.image_count << " images, "
                  << result.files.size() << " PDF)" << std::endl;

        switch (decide_continuation(job.mode, count, content, seen)) {
            case Continuation::Completed:
                std::cout << (std::holds_alternative<ManualMode>(job.mode) ? "Requested chapters done" : "No further chapter found")
                          << std::endl;
                return RunStatus::Completed;
            case Continuation::EndOfSeries:
                return fail(job, ErrorKind::EndOfSeries,
                            "no next chapter after " + std::to_string(count) + " of " +
                                std::to_string(std::get<ManualMode>(job.mode).count) + " requested",
                            current);
            case Continuation::Continue:
                break;
        }

        if (job.max_chapters > 0 && count >= job.max_chapters) {
            std::cout << "Safety limit reached: " << job.max_chapters << " chapters" << std::endl;
            return RunStatus::Completed;
        }
        if (cancel_.cancelled()) return RunStatus::Cancelled;

        ChapterRef next{*content.next_url, std::nullopt, std::nullopt};
        std::cout << "  Next chapter in " << job.pacing.inter_chapter_delay.count() << " ms" << std::endl;
        if (!cancel_.wait_for(job.pacing.inter_chapter_delay)) return RunStatus::Cancelled;
        current = std::move(next);
    }
}

RunState ChapterSequencer::run(const DownloadJob& job) {
    if (job.chapter_refs.empty()) throw std::invalid_argument("download job has no chapter to start from");
    if (const auto* manual = std::get_if<ManualMode>(&job.mode)) {
        if (manual->count < 1) throw std::invalid_argument("manual mode needs a chapter count of at least 1");
    }

    state_ = RunState{};
    state_.status = RunStatus::Running;
    usedFileNames_.clear();
    usedImageDirs_.clear();
    downloader_.set_inter_image_delay(job.pacing.inter_image_delay);

    std::error_code ec;
    fs::create_directories(job.target_dir, ec);

    const bool manualMode = std::holds_alternative<ManualMode>(job.mode);
    const std::string modeText = manualMode
        ? "manual (" + std::to_string(std::get<ManualMode>(job.mode).count) + " chapters)"
        : std::string("automatic");

    std::unique_ptr<SessionManifest> manifest;
    if (job.write_manifest) {
        manifest = std::make_unique<SessionManifest>(SessionManifest::path_for(job.target_dir),
                                                     job.chapter_refs.front().url, job.series_title, modeText);
        manifest->write();
    }

    std::cout << "Run started: " << modeText << ", " << job.chapter_refs.size()
              << " start point(s), target " << job.target_dir.string() << std::endl;

    RunStatus status = RunStatus::Completed;
    for (size_t i = 0; i < job.chapter_refs.size() && status == RunStatus::Completed; ++i) {
        if (i > 0 && !cancel_.wait_for(job.pacing.inter_chapter_delay)) {
            status = RunStatus::Cancelled;
            break;
        }
        status = run_segment(job, job.chapter_refs[i], manifest.get());
    }

    provider_.close();
    state_.status = status;
    if (manifest) {
        manifest->set_status(to_string(status));
        manifest->write();
    }

    ProgressEvent finished{ProgressEventType::RunFinished};
    finished.chapter_index = state_.current_chapter_index;
    finished.status = status;
    finished.message = state_.error_message;
    finished.files = state_.output_files;
    emit(finished);

    std::cout << std::string(60, '-') << "\n"
              << "Run " << to_string(status) << ": " << state_.chapters_completed << " chapter(s), "
              << state_.output_files.size() << " PDF file(s)" << std::endl;
    if (status == RunStatus::Failed) {
        std::cout << "Failed at chapter " << state_.failed_ordinal.value_or(0) << " (" << to_string(state_.error_kind)
                  << "): " << state_.failed_url << std::endl;
    }
    return state_;
}
