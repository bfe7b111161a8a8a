/**
 * @file extraction_executor.hpp
 * @brief Batch extraction of many documents to an output tree.
 */

#ifndef QUARRY_EXTRACTION_EXECUTOR_HPP
#define QUARRY_EXTRACTION_EXECUTOR_HPP

#include "document.hpp"
#include "event_bus.hpp"
#include "events.hpp"
#include "thread_pool.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <mutex>
#include <set>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace quarry {

    /**
     * @brief What to extract and where to put it.
     */
    struct ExtractionSettings {
        bool text = true;
        bool images = true;
        bool outline = true;
        bool metadata = true;
        std::filesystem::path output_dir = "quarry-out";
        std::string password; ///< Tried on every encrypted input
    };

    /**
     * @brief Renders an outline as text, one entry per line.
     *
     * Each line is indented by (level - 1) tabs and holds
     * `title<TAB>page<TAB>uri`, with page 1-based or `-` for external links.
     */
    [[nodiscard]] std::string format_outline(const std::vector<OutlineEntry>& entries);

    /**
     * @brief Renders metadata as `key: value` lines in kMetadataKeys order.
     */
    [[nodiscard]] std::string format_metadata(const Metadata& metadata);

    /**
     * @brief Extracts documents in parallel and reports progress on an EventBus.
     *
     * @details Each input is handled by one worker, which owns its own
     * Document, so workers never contend on a document lock. Results are
     * written below `output_dir/<stem>/`:
     * - `page-NNNN.txt` per page (1-based),
     * - `image-NNNNN.png` per image object (object number),
     * - `outline.txt` when the document has an outline,
     * - `metadata.txt`.
     *
     * Exactly one DocumentCompleteEvent, DocumentErrorEvent or
     * DocumentSkippedEvent is published per input.
     */
    class ExtractionExecutor {
    public:
        /**
         * @brief Construct an ExtractionExecutor.
         * @param settings What to extract and where.
         * @param bus EventBus used to publish progress and results.
         * @param threads Number of worker threads.
         * @throws std::runtime_error if the output directory cannot be created.
         */
        ExtractionExecutor(ExtractionSettings settings,
                           EventBus& bus,
                           unsigned threads = std::thread::hardware_concurrency());

        /**
         * @brief Extract every supported file in @p inputs; blocks until done.
         * Unsupported files are reported with DocumentSkippedEvent.
         */
        void process(const std::vector<std::filesystem::path>& inputs);

        /**
         * @brief Extract one document read from a stream; blocks until done.
         * @param in The stream, drained completely.
         * @param name Name used for events and as the output directory stem.
         */
        void process_stream(std::istream& in, const std::string& name);

        [[nodiscard]] bool is_stopped() const {
            return stop_flag_.load(std::memory_order_relaxed);
        }

        /**
         * @brief Stop extracting. Queued and not yet queued inputs are reported
         * as skipped; documents already being extracted stop at the next page
         * or image boundary and are reported as skipped too.
         * Safe to call from a signal-handling thread.
         */
        void request_stop();

    private:
        /// Opens, extracts and publishes the outcome for one input.
        void run_document(const std::filesystem::path& source,
                          const std::function<Document()>& open,
                          const std::stop_token& st);

        [[nodiscard]] bool stopping(const std::stop_token& st = {}) const;

        /// @return false if extraction was interrupted.
        bool extract_into(Document& doc, const std::filesystem::path& dir,
                          DocumentCompleteEvent& result, const std::stop_token& st) const;

        /// Reserves a fresh directory name for @p source so equal stems do not collide.
        std::filesystem::path claim_output_dir(const std::filesystem::path& source);

        ExtractionSettings settings_;
        EventBus& event_bus_;
        ThreadPool pool_;
        std::atomic<bool> stop_flag_{false};
        std::mutex dirs_mutex_;
        std::set<std::filesystem::path> claimed_dirs_;
    };

} // namespace quarry

#endif // QUARRY_EXTRACTION_EXECUTOR_HPP
