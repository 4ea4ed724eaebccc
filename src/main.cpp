#include "cancellation.hpp"
#include "chapter_downloader.hpp"
#include "content_provider.hpp"
#include "errors.hpp"
#include "http_transport.hpp"
#include "image_fetcher.hpp"
#include "pdf_assembler.hpp"
#include "pdf_merger.hpp"
#include "sequencer.hpp"
#include "settings.hpp"
#include "url_utils.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_sigint(int) { g_interrupted = 1; }

void usage() {
    std::cerr << "Usage:\n"
              << "  chapterpdf download <url[,url...]> [target_dir] [count|auto] [series_title]\n"
              << "  chapterpdf merge <dir> [chapters_per_pdf]\n";
}

std::vector<std::string> split_list(const std::string& list) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos != std::string::npos) {
        size_t comma = list.find(',', pos);
        std::string token = trim(comma == std::string::npos ? list.substr(pos) : list.substr(pos, comma - pos));
        if (!token.empty()) out.push_back(token);
        pos = (comma == std::string::npos) ? std::string::npos : comma + 1;
    }
    return out;
}

int report_merge(const MergeReport& report) {
    for (const auto& w : report.warnings) std::cerr << "Warning: " << w << std::endl;
    for (const auto& b : report.bundles) {
        std::cout << "Merged " << b.member_files.size() << " file(s) into " << b.output_path.string() << std::endl;
    }
    for (const auto& f : report.failures) {
        std::cerr << "Merge failed for '" << f.group << "': " << f.message << std::endl;
    }
    return report.failures.empty() ? 0 : 1;
}

MergeOptions merge_options(const Settings& settings, int chaptersPerPdf) {
    MergeOptions opts;
    opts.chapters_per_bundle = chaptersPerPdf;
    opts.move_originals = settings.move_originals;
    return opts;
}

int run_merge(const Settings& settings, int argc, char** argv) {
    if (argc < 3) {
        usage();
        return 1;
    }
    int perPdf = settings.chapters_per_pdf;
    if (argc > 3) perPdf = std::max(0, std::atoi(argv[3]));

    PdfMerger merger(merge_options(settings, perPdf));
    return report_merge(merger.merge(argv[2]));
}

int run_download(const Settings& settings, int argc, char** argv) {
    if (argc < 3) {
        usage();
        return 1;
    }

    DownloadJob job;
    for (const auto& url : split_list(argv[2])) job.chapter_refs.push_back(ChapterRef{url, std::nullopt, std::nullopt});
    if (job.chapter_refs.empty()) {
        usage();
        return 1;
    }
    job.target_dir = argc > 3 ? std::filesystem::path(argv[3]) : settings.download_dir;
    if (argc > 4 && to_lower(argv[4]) != "auto") {
        int count = std::atoi(argv[4]);
        if (count < 1) {
            std::cerr << "Error: chapter count must be a positive number or 'auto'" << std::endl;
            return 1;
        }
        job.mode = ManualMode{count};
    }
    if (argc > 5) job.series_title = argv[5];
    job.pacing = settings.pacing;
    job.delete_images_after = settings.delete_images_after;
    job.persist_images = settings.persist_images;
    job.max_chapters = settings.max_chapters;

    CancellationToken cancel;
    std::signal(SIGINT, on_sigint);
    std::atomic<bool> done{false};
    std::thread watcher([&] {
        while (!done.load()) {
            if (g_interrupted) {
                std::cerr << "\nInterrupt received, stopping after the current step..." << std::endl;
                cancel.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    ProviderConfig providerConfig;
    providerConfig.profile_path = settings.profile_path;
    providerConfig.post_load_wait = settings.post_load_wait;
    providerConfig.keep_session_open = settings.keep_session_open;
    providerConfig.retry = settings.retry;
    providerConfig.timeout_ms = settings.timeout_ms;
    providerConfig.user_agent = settings.user_agent;

    AssemblerOptions assemblerOptions;
    assemblerOptions.max_page_height = settings.max_page_height;
    assemblerOptions.max_pages_per_file = settings.max_pages_per_file;
    assemblerOptions.max_width = settings.max_width;
    assemblerOptions.grayscale = settings.grayscale;

    RunState state;
    try {
        CprTransport transport(settings.user_agent.empty() ? std::string(kDefaultUserAgent) : settings.user_agent,
                               settings.timeout_ms);
        ImageFetcher fetcher(transport, settings.retry, settings.pacing.inter_image_delay, &cancel);
        ChapterDownloader downloader(fetcher, settings.max_parallel_images);
        PdfAssembler assembler(assemblerOptions);
        HttpContentProvider provider(providerConfig, &cancel);
        ChapterSequencer sequencer(provider, downloader, assembler, cancel);
        state = sequencer.run(job);
    } catch (const std::exception& ex) {
        done = true;
        watcher.join();
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
    done = true;
    watcher.join();

    if (state.status == RunStatus::Completed && settings.merge_after_download && !state.output_files.empty()) {
        MergeOptions opts = merge_options(settings, settings.chapters_per_pdf);
        opts.only_session_manifest = true;
        try {
            report_merge(PdfMerger(opts).merge(job.target_dir));
        } catch (const MergeError& ex) {
            std::cerr << "Merge skipped: " << ex.what() << std::endl;
        }
    }

    switch (state.status) {
        case RunStatus::Completed: return 0;
        case RunStatus::Cancelled: return 2;
        default: return 1;
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 1;
    }

    Settings settings;
    try {
        const char* file = std::getenv("CHAPTERPDF_SETTINGS");
        settings = load_settings(file && *file ? file : "settings.json");
        apply_env_overrides(settings);
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }

    const std::string command = argv[1];
    try {
        if (command == "download") return run_download(settings, argc, argv);
        if (command == "merge") return run_merge(settings, argc, argv);
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
    usage();
    return 1;
}
