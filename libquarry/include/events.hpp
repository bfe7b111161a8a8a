#ifndef QUARRY_EVENTS_HPP
#define QUARRY_EVENTS_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace quarry {

    /**
     * @brief Events published by ExtractionExecutor on the EventBus.
     *
     * Plain data carriers. Exactly one of DocumentCompleteEvent,
     * DocumentErrorEvent or DocumentSkippedEvent is published per input.
     */

    /**
     * @brief Emitted when a worker starts extracting a document.
     */
    struct DocumentStartEvent {
        std::filesystem::path path; ///< Input path, or the stream name for stdin
    };

    /**
     * @brief Emitted when every requested extraction of a document succeeded.
     */
    struct DocumentCompleteEvent {
        std::filesystem::path path;
        int pages = 0;                  ///< Page count of the document
        std::size_t text_pages = 0;     ///< Text files written
        std::size_t images = 0;         ///< Images written
        std::size_t outline_entries = 0;
        bool has_outline = false;       ///< False when the document carries no outline
        std::chrono::milliseconds duration{0};
    };

    /**
     * @brief Emitted when opening or extracting a document failed.
     */
    struct DocumentErrorEvent {
        std::filesystem::path path;
        std::string error_code;    ///< to_string(ErrorCode), or "IoError" for output failures
        std::string error_message;
    };

    /**
     * @brief Emitted when an input is not processed at all.
     */
    struct DocumentSkippedEvent {
        std::filesystem::path path;
        std::string reason;
    };

} // namespace quarry

#endif // QUARRY_EVENTS_HPP
