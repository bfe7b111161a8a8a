#include "native_document.hpp"
#include "../../include/logger.hpp"

#include <utility>

namespace quarry::detail {

    namespace {

        constexpr std::string_view kTag = "outline_walker";

        // 0-based page of an outline target, -1 for external links
        int resolve_page(fz_context* ctx, fz_document* doc, const fz_outline* node) {
            if (node->page.page < 0) {
                return -1;
            }
            int number = -1;
            fz_var(number);
            fz_try(ctx) {
                number = fz_page_number_from_location(ctx, doc, node->page);
            }
            fz_catch(ctx) {
                number = -1;
            }
            return number;
        }

        // the catalog has an /Outlines dictionary, even if it lists no items
        bool has_outline_root(fz_context* ctx, pdf_document* pdf) {
            if (!pdf) {
                return false;
            }
            bool present = false;
            fz_var(present);
            fz_try(ctx) {
                pdf_obj* root = pdf_dict_get(ctx, pdf_trailer(ctx, pdf), PDF_NAME(Root));
                present = pdf_is_dict(ctx, pdf_dict_get(ctx, root, PDF_NAME(Outlines))) != 0;
            }
            fz_catch(ctx) {
                present = false;
            }
            return present;
        }

    } // namespace

    std::vector<OutlineEntry> walk_outline(fz_context* ctx, fz_document* doc, pdf_document* pdf) {
        fz_outline* outline = nullptr;
        bool failed = false;
        std::string reason;

        fz_var(outline);
        fz_try(ctx) {
            outline = fz_load_outline(ctx, doc);
        }
        fz_catch(ctx) {
            failed = true;
            reason = fz_caught_message(ctx);
        }
        if (failed) {
            Logger::log(LogLevel::Warning, "Cannot load outline: " + reason, kTag);
            throw DocumentError(ErrorCode::LoadOutlineFailed, "quarry: cannot load outline: " + reason);
        }

        const OutlineHandle holder(ctx, outline);
        std::vector<OutlineEntry> entries;
        if (!outline) {
            // mupdf returns no tree both for a missing and for an empty outline
            if (has_outline_root(ctx, pdf)) {
                return entries;
            }
            throw DocumentError(ErrorCode::LoadOutlineFailed, "quarry: cannot load outline");
        }

        // explicit stack: children are pushed last so they are emitted before
        // the next sibling, which gives pre-order without native recursion
        std::vector<std::pair<const fz_outline*, int>> pending;
        pending.emplace_back(outline, 1);
        while (!pending.empty()) {
            const auto [node, level] = pending.back();
            pending.pop_back();

            OutlineEntry entry;
            entry.level = level;
            entry.title = node->title ? node->title : "";
            entry.uri = node->uri ? node->uri : "";
            entry.page = resolve_page(ctx, doc, node);
            entry.top = static_cast<double>(node->y);
            entries.push_back(std::move(entry));

            if (node->next) {
                pending.emplace_back(node->next, level);
            }
            if (node->down) {
                pending.emplace_back(node->down, level + 1);
            }
        }

        Logger::log(LogLevel::Debug, "Outline has " + std::to_string(entries.size()) + " entries", kTag);
        return entries;
    }

} // namespace quarry::detail
