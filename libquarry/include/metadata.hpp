/**
 * @file metadata.hpp
 * @brief The fixed metadata record read from a document.
 */

#ifndef QUARRY_METADATA_HPP
#define QUARRY_METADATA_HPP

#include <array>
#include <map>
#include <string>
#include <string_view>

namespace quarry {

    /**
     * @brief Metadata keyed by the names in kMetadataKeys.
     *
     * Document::read_metadata() always fills all ten keys; fields the
     * document does not carry map to an empty string.
     */
    using Metadata = std::map<std::string, std::string>;

    /**
     * @brief Output key and the MuPDF lookup key it is read from.
     */
    struct MetadataField {
        std::string_view key;
        std::string_view native_key;
    };

    inline constexpr std::array<MetadataField, 10> kMetadataKeys = {{
        {"format",       "format"},
        {"encryption",   "encryption"},
        {"title",        "info:Title"},
        {"author",       "info:Author"},
        {"subject",      "info:Subject"},
        {"keywords",     "info:Keywords"},
        {"creator",      "info:Creator"},
        {"producer",     "info:Producer"},
        {"creationDate", "info:CreationDate"},
        {"modDate",      "info:ModDate"},
    }};

} // namespace quarry

#endif // QUARRY_METADATA_HPP
