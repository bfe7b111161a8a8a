#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <thread>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_scanner.hpp"
#include "../utils/file_log_sink.hpp"
#include "../../libquarry/include/event_bus.hpp"
#include "../../libquarry/include/events.hpp"
#include "../../libquarry/include/extraction_executor.hpp"
#include "../../libquarry/include/logger.hpp"
#include "../../libquarry/include/mime_detector.hpp"

// simple progress bar printer
inline void print_progress_bar(const size_t done, const size_t total, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : (done > 0 ? 1.0 : 0.0);
    const unsigned pos = static_cast<unsigned>(bar_width * progress);

    double percent = progress * 100.0;
    if (done < total && percent >= 99.95) {
        percent = 99.9;
    }
    if (done == total) {
        percent = 100.0;
    }

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else if (i == pos && done == total) std::cerr << "=";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << percent << "%"
              << " (" << done << "/" << total << ")"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

using namespace quarry;
namespace fs = std::filesystem;

static volatile std::sig_atomic_t g_signal = 0;

// only sets a flag; the stop watcher thread does the work
extern "C" void signal_handler(const int sig) {
    g_signal = sig;
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "main");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8", ".UTF-8" /* Windows */};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "main");
            return;
        }
    }

    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.", "main");
}

int main(int argc, char* argv[]) {

    CLI::App app{"quarry: extract text, images, outlines and metadata from PDF and EPUB documents."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    // set loggers
    const LogLevel console_level = Logger::string_to_level(settings.log_level);
    Logger::clear_sinks();
    Logger::set_min_level(settings.log_file.empty() ? console_level : LogLevel::Debug);
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file, false);
        if (!fileSink->is_open()) {
            std::cerr << RED << "Cannot open log file: " << settings.log_file.string() << RESET << std::endl;
            return 1;
        }
        Logger::add_sink(std::move(fileSink));
    }
    if (!settings.quiet) {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = console_level;
        Logger::add_sink(std::move(consoleSink));
    }

    std::signal(SIGINT, signal_handler);
    init_utf8_locale();

    std::vector<fs::path> inputs;
    if (!settings.is_pipe) {
        inputs = collect_input_files(settings.inputs, settings);
        if (inputs.empty()) {
            Logger::log(LogLevel::Error, "No valid input files.", "main");
            std::cerr << RED << "No valid input files." << RESET << std::endl;
            return 1;
        }
    }

    EventBus bus;

    // results collected for reporting; handlers run on worker threads
    std::mutex results_mtx;
    std::vector<Result> results;
    bool any_failed = false;

    const size_t total = settings.is_pipe ? 1 : inputs.size();
    std::atomic<size_t> done{0};
    const auto start_total = std::chrono::steady_clock::now();

    auto on_finish = [&] {
        const size_t current = ++done;
        const double elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_total).count();
        if (!settings.quiet) {
            std::lock_guard lock(results_mtx);
            print_progress_bar(current, total, elapsed);
        }
    };

    auto mime_of = [&settings](const fs::path& p) {
        return settings.is_pipe ? std::string() : MimeDetector::detect(p);
    };

    bus.subscribe<DocumentCompleteEvent>([&](const DocumentCompleteEvent& e) {
        Result r;
        r.path = e.path;
        r.mime = mime_of(e.path);
        r.outcome = Outcome::Extracted;
        r.pages = e.pages;
        r.text_pages = e.text_pages;
        r.images = e.images;
        r.outline_entries = e.outline_entries;
        r.has_outline = e.has_outline;
        r.seconds = static_cast<double>(e.duration.count()) / 1000.0;
        {
            std::lock_guard lock(results_mtx);
            results.push_back(std::move(r));
        }
        on_finish();
    });

    bus.subscribe<DocumentErrorEvent>([&](const DocumentErrorEvent& e) {
        Logger::log(LogLevel::Error, e.path.filename().string() + " " + e.error_code + ": " + e.error_message, "main");

        Result r;
        r.path = e.path;
        r.mime = mime_of(e.path);
        r.outcome = Outcome::Failed;
        r.error_code = e.error_code;
        r.error_msg = e.error_message;
        {
            std::lock_guard lock(results_mtx);
            results.push_back(std::move(r));
            any_failed = true;
        }
        on_finish();
    });

    bus.subscribe<DocumentSkippedEvent>([&](const DocumentSkippedEvent& e) {
        Result r;
        r.path = e.path;
        r.outcome = Outcome::Skipped;
        r.error_msg = e.reason;
        {
            std::lock_guard lock(results_mtx);
            results.push_back(std::move(r));
        }
        on_finish();
    });

    std::unique_ptr<ExtractionExecutor> executor;
    try {
        executor = std::make_unique<ExtractionExecutor>(settings.extraction_settings(), bus, settings.num_threads);
    } catch (const std::exception& e) {
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        return 1;
    }

    std::atomic<bool> interrupted{false};
    std::jthread stop_watcher([&](const std::stop_token& st) {
        while (!st.stop_requested()) {
            if (g_signal != 0) {
                std::cerr << CYAN
                          << "\n[INTERRUPT] Stop detected. Waiting for threads to finish..."
                          << RESET << std::endl;
                interrupted.store(true);
                executor->request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    try {
        if (settings.is_pipe) {
            executor->process_stream(std::cin, "stdin");
        } else {
            executor->process(inputs);
        }
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Reading input failed: ") + e.what(), "main");
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        any_failed = true;
    }

    stop_watcher.request_stop();
    stop_watcher.join();

    const double total_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_total).count();

    if (!settings.quiet) {
        std::cerr << std::endl;
        print_console_report(results, settings.num_threads, total_seconds);
    }

    if (!settings.report_path.empty() && !export_csv_report(results, settings.report_path, total_seconds)) {
        any_failed = true;
    }

    if (interrupted.load()) {
        return 130; // standard exit code for SIGINT
    }
    return any_failed ? 1 : 0;
}
