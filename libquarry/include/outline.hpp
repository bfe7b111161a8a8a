/**
 * @file outline.hpp
 * @brief Flattened table of contents entries.
 */

#ifndef QUARRY_OUTLINE_HPP
#define QUARRY_OUTLINE_HPP

#include <string>

namespace quarry {

    /**
     * @brief One node of the document outline.
     *
     * Document::load_outline() returns the outline forest flattened in
     * depth-first pre-order; nesting is recorded in `level` instead.
     */
    struct OutlineEntry {
        int level = 1;      ///< Depth in the tree, 1 for top-level entries
        std::string title;  ///< Title of the entry, possibly empty
        std::string uri;    ///< Link target, possibly empty for internal page links
        int page = -1;      ///< 0-based target page, -1 for external links
        double top = 0.0;   ///< Vertical offset on the target page
    };

} // namespace quarry

#endif // QUARRY_OUTLINE_HPP
