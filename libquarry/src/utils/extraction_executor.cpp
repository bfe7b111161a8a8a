#include "../../include/extraction_executor.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"

#include <chrono>
#include <iomanip>
#include <memory>
#include <span>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace quarry {

    namespace {
        std::string numbered_name(const std::string_view prefix, const int number, const int width,
                                  const std::string_view extension) {
            std::ostringstream oss;
            oss << prefix << std::setw(width) << std::setfill('0') << number << extension;
            return oss.str();
        }
    } // namespace

    std::string format_outline(const std::vector<OutlineEntry>& entries) {
        std::ostringstream oss;
        for (const auto& entry : entries) {
            for (int i = 1; i < entry.level; ++i) oss << '\t';
            oss << entry.title << '\t';
            if (entry.page >= 0) {
                oss << entry.page + 1;
            } else {
                oss << '-';
            }
            oss << '\t' << entry.uri << '\n';
        }
        return oss.str();
    }

    std::string format_metadata(const Metadata& metadata) {
        std::ostringstream oss;
        for (const auto& field : kMetadataKeys) {
            const auto it = metadata.find(std::string(field.key));
            oss << field.key << ": " << (it != metadata.end() ? it->second : std::string()) << '\n';
        }
        return oss.str();
    }

    ExtractionExecutor::ExtractionExecutor(ExtractionSettings settings, EventBus& bus, const unsigned threads)
        : settings_(std::move(settings)),
          event_bus_(bus),
          pool_(threads) {
        std::error_code ec;
        fs::create_directories(settings_.output_dir, ec);
        if (ec) {
            Logger::log(LogLevel::Error, "Failed to create output directory: " + settings_.output_dir.string(), "executor");
            throw std::runtime_error("Failed to create output directory: " + settings_.output_dir.string());
        }
    }

    void ExtractionExecutor::process(const std::vector<fs::path>& inputs) {
        for (const auto& path : inputs) {
            if (stopping()) {
                event_bus_.publish(DocumentSkippedEvent{path, "Interrupted"});
                continue;
            }

            const auto mime = MimeDetector::detect(path);
            if (!MimeDetector::is_supported(mime)) {
                Logger::log(LogLevel::Warning, "Unsupported format: " + path.string(), "executor");
                event_bus_.publish(DocumentSkippedEvent{path, "Unsupported format"});
                continue;
            }
            Logger::log(LogLevel::Debug, "Queued " + path.string() + " (" + mime + ")", "executor");

            const OpenOptions options{settings_.password, 0, {}};
            try {
                pool_.enqueue([this, path, options](const std::stop_token& st) {
                    run_document(path, [&path, &options] { return Document::open(path, options); }, st);
                });
            } catch (const std::runtime_error& e) {
                Logger::log(LogLevel::Warning, "Cannot queue " + path.string() + ": " + e.what(), "executor");
                event_bus_.publish(DocumentSkippedEvent{path, "Interrupted"});
            }
        }
        pool_.wait_idle();
    }

    void ExtractionExecutor::process_stream(std::istream& in, const std::string& name) {
        if (stopping()) {
            event_bus_.publish(DocumentSkippedEvent{name, "Interrupted"});
            return;
        }

        auto bytes = std::make_shared<std::vector<unsigned char>>(read_all(in));
        const auto mime = MimeDetector::detect(std::span<const unsigned char>(*bytes));
        if (!MimeDetector::is_supported(mime)) {
            Logger::log(LogLevel::Warning, "Unsupported format on stream " + name, "executor");
            event_bus_.publish(DocumentSkippedEvent{name, "Unsupported format"});
            return;
        }

        const OpenOptions options{settings_.password, 0, std::string(mime)};
        try {
            pool_.enqueue([this, name, bytes, options](const std::stop_token& st) {
                run_document(name, [&bytes, &options] {
                    return Document::open_from_bytes(std::move(*bytes), options);
                }, st);
            });
        } catch (const std::runtime_error& e) {
            Logger::log(LogLevel::Warning, "Cannot queue " + name + ": " + e.what(), "executor");
            event_bus_.publish(DocumentSkippedEvent{name, "Interrupted"});
        }
        pool_.wait_idle();
    }

    void ExtractionExecutor::request_stop() {
        // queued documents still run and report themselves as interrupted
        stop_flag_.store(true, std::memory_order_relaxed);
        Logger::log(LogLevel::Info, "Stop requested", "executor");
    }

    bool ExtractionExecutor::stopping(const std::stop_token& st) const {
        return st.stop_requested() || stop_flag_.load(std::memory_order_relaxed);
    }

    fs::path ExtractionExecutor::claim_output_dir(const fs::path& source) {
        const std::string stem = source.stem().empty() ? std::string("document") : source.stem().string();
        std::lock_guard lock(dirs_mutex_);
        fs::path dir = settings_.output_dir / stem;
        for (int suffix = 2; claimed_dirs_.contains(dir); ++suffix) {
            dir = settings_.output_dir / (stem + "-" + std::to_string(suffix));
        }
        claimed_dirs_.insert(dir);
        return dir;
    }

    void ExtractionExecutor::run_document(const fs::path& source,
                                          const std::function<Document()>& open,
                                          const std::stop_token& st) {
        if (stopping(st)) {
            event_bus_.publish(DocumentSkippedEvent{source, "Interrupted"});
            return;
        }
        event_bus_.publish(DocumentStartEvent{source});
        const auto start = std::chrono::steady_clock::now();

        try {
            Document doc = open();
            const fs::path dir = claim_output_dir(source);
            fs::create_directories(dir);

            DocumentCompleteEvent result{source};
            result.pages = doc.page_count();
            if (!extract_into(doc, dir, result, st)) {
                Logger::log(LogLevel::Info, "Interrupted: " + source.string(), "executor");
                event_bus_.publish(DocumentSkippedEvent{source, "Interrupted"});
                return;
            }

            result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            Logger::log(LogLevel::Info, "Extracted " + source.string() + " into " + dir.string(), "executor");
            event_bus_.publish(result);
        } catch (const DocumentError& e) {
            Logger::log(LogLevel::Error, "error on " + source.string() + ": " + e.what(), "executor");
            event_bus_.publish(DocumentErrorEvent{source, std::string(to_string(e.code())), e.what()});
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "I/O error on " + source.string() + ": " + e.what(), "executor");
            event_bus_.publish(DocumentErrorEvent{source, "IoError", e.what()});
        }
    }

    bool ExtractionExecutor::extract_into(Document& doc, const fs::path& dir,
                                          DocumentCompleteEvent& result, const std::stop_token& st) const {
        if (settings_.metadata) {
            write_file(dir / "metadata.txt", format_metadata(doc.read_metadata()));
        }

        if (settings_.outline) {
            try {
                const auto entries = doc.load_outline();
                write_file(dir / "outline.txt", format_outline(entries));
                result.outline_entries = entries.size();
                result.has_outline = true;
            } catch (const DocumentError& e) {
                if (e.code() != ErrorCode::LoadOutlineFailed) throw;
                Logger::log(LogLevel::Debug, "No outline in " + result.path.string(), "executor");
            }
        }

        if (settings_.text) {
            for (int page = 0; page < result.pages; ++page) {
                if (stopping(st)) return false;
                write_file(dir / numbered_name("page-", page + 1, 4, ".txt"), doc.extract_text(page));
                ++result.text_pages;
            }
        }

        if (settings_.images) {
            if (stopping(st)) return false;
            for (const auto& image : doc.extract_all_images()) {
                write_file(dir / numbered_name("image-", image.object_number, 5, ".png"), image.png);
                ++result.images;
            }
        }
        return true;
    }

} // namespace quarry
