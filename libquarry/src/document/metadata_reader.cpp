#include "native_document.hpp"
#include "../../include/logger.hpp"

#include <array>
#include <cstring>

namespace quarry::detail {

    Metadata lookup_metadata(fz_context* ctx, fz_document* doc) {
        Metadata data;
        for (const auto& [key, native_key] : kMetadataKeys) {
            const std::string lookup_key(native_key);
            std::array<char, 256> buf{};
            bool failed = false;

            fz_try(ctx) {
                fz_lookup_metadata(ctx, doc, lookup_key.c_str(), buf.data(), static_cast<int>(buf.size()));
            }
            fz_catch(ctx) {
                failed = true;
            }
            if (failed) {
                buf.fill('\0');
                Logger::log(LogLevel::Debug, "Metadata lookup failed for " + lookup_key, "metadata_reader");
            }

            // strip the NUL padding
            data[std::string(key)] = std::string(buf.data(), strnlen(buf.data(), buf.size()));
        }
        return data;
    }

} // namespace quarry::detail
