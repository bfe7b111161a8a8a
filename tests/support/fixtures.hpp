#ifndef QUARRY_TEST_FIXTURES_HPP
#define QUARRY_TEST_FIXTURES_HPP

#include <array>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace quarry::test {

/// One outline item; `page` is 0-based, or -1 to link to `uri` instead.
struct OutlineItem {
    std::string title;
    int page = 0;
    std::string uri;
    std::vector<OutlineItem> children;
};

/// Description of a PDF built in memory with qpdf.
struct PdfSpec {
    std::vector<std::string> pages{"Hello quarry"}; ///< One line of Helvetica text per page
    int images = 0;                                  ///< 4x4 RGB images, all placed on page 0
    std::array<unsigned char, 3> image_rgb{255, 0, 0};
    std::optional<std::vector<OutlineItem>> outline; ///< nullopt: no /Outlines in the catalog
    std::map<std::string, std::string> info;         ///< /Info entries, e.g. {"/Title", "Report"}
    std::string user_password;                       ///< Non-empty: AES-256 (R6) encryption
};

/// @return The serialized PDF.
std::vector<unsigned char> build_pdf(const PdfSpec& spec);

/// @return The object numbers of all image XObjects in the written file, ascending.
std::vector<int> image_object_numbers(const std::vector<unsigned char>& pdf);

/// @return The smallest valid EPUB container header (ZIP with a stored "mimetype" entry).
std::vector<unsigned char> epub_header();

/// Description of an EPUB 2 book built in memory.
struct EpubSpec {
    std::string title = "Quarry Sample";
    std::vector<std::string> chapters{"Hello from an EPUB"}; ///< One XHTML paragraph per chapter
    bool toc = true;                                         ///< Adds toc.ncx, one navPoint per chapter
};

/// @return A stored (uncompressed) ZIP holding mimetype, container.xml, the OPF and the chapters.
std::vector<unsigned char> build_epub(const EpubSpec& spec);

/**
 * @brief Encodes raw rows with libpng.
 * @param color_type PNG_COLOR_TYPE_* value.
 * @param palette RGB triplets, only used for palette images.
 */
std::vector<unsigned char> encode_png(unsigned width, unsigned height, int color_type, int bit_depth,
                                      const std::vector<unsigned char>& pixels,
                                      const std::vector<unsigned char>& palette = {});

/**
 * @brief A fresh directory under the system temp dir, removed on destruction.
 */
class TempDir {
public:
    TempDir();
    ~TempDir();
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    /// Writes @p bytes to `path()/name` and returns the full path.
    std::filesystem::path write(const std::string& name, const std::vector<unsigned char>& bytes) const;

private:
    std::filesystem::path path_;
};

/// @return Whole file contents as text.
std::string read_text(const std::filesystem::path& path);

} // namespace quarry::test

#endif // QUARRY_TEST_FIXTURES_HPP
