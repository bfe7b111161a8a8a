#include "fixtures.hpp"

#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <png.h>
#include <zlib.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace quarry::test {

namespace {

QPDFObjectHandle make_font(QPDF& pdf) {
    return pdf.makeIndirectObject(QPDFObjectHandle::parse(
        "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>"));
}

QPDFObjectHandle make_image(QPDF& pdf, const std::array<unsigned char, 3>& rgb) {
    QPDFObjectHandle image = QPDFObjectHandle::newStream(&pdf);
    image.replaceDict(QPDFObjectHandle::parse(
        "<< /Type /XObject /Subtype /Image /Width 4 /Height 4"
        " /ColorSpace /DeviceRGB /BitsPerComponent 8 >>"));
    std::string data;
    for (int i = 0; i < 16; ++i) {
        data.append(reinterpret_cast<const char*>(rgb.data()), rgb.size());
    }
    image.replaceStreamData(data, QPDFObjectHandle::newNull(), QPDFObjectHandle::newNull());
    return image;
}

// escapes the characters PDF literal strings treat specially
std::string pdf_literal(const std::string& text) {
    std::string out;
    for (const char c : text) {
        if (c == '(' || c == ')' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

QPDFObjectHandle make_page(QPDF& pdf, const QPDFObjectHandle& font, const std::string& text,
                           const std::vector<QPDFObjectHandle>& images) {
    std::ostringstream content;
    content << "BT /F1 24 Tf 72 720 Td (" << pdf_literal(text) << ") Tj ET\n";

    QPDFObjectHandle xobjects = QPDFObjectHandle::newDictionary();
    for (size_t i = 0; i < images.size(); ++i) {
        const std::string name = "/Im" + std::to_string(i + 1);
        xobjects.replaceKey(name, images[i]);
        content << "q 48 0 0 48 " << 72 + 60 * i << " 600 cm " << name << " Do Q\n";
    }

    QPDFObjectHandle fonts = QPDFObjectHandle::newDictionary();
    fonts.replaceKey("/F1", font);
    QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
    resources.replaceKey("/Font", fonts);
    if (!images.empty()) {
        resources.replaceKey("/XObject", xobjects);
    }

    QPDFObjectHandle page = pdf.makeIndirectObject(QPDFObjectHandle::parse(
        "<< /Type /Page /MediaBox [0 0 612 792] >>"));
    page.replaceKey("/Contents", QPDFObjectHandle::newStream(&pdf, content.str()));
    page.replaceKey("/Resources", resources);
    return page;
}

// links items as siblings under parent; returns the number of visible descendants
int add_outline_items(QPDF& pdf, QPDFObjectHandle parent, const std::vector<OutlineItem>& items,
                      const std::vector<QPDFObjectHandle>& pages) {
    std::vector<QPDFObjectHandle> nodes;
    int count = 0;
    for (const auto& item : items) {
        QPDFObjectHandle node = pdf.makeIndirectObject(QPDFObjectHandle::newDictionary());
        node.replaceKey("/Title", QPDFObjectHandle::newUnicodeString(item.title));
        node.replaceKey("/Parent", parent);
        if (item.page >= 0) {
            const std::vector<QPDFObjectHandle> dest{
                pages.at(static_cast<size_t>(item.page)),
                QPDFObjectHandle::newName("/XYZ"),
                QPDFObjectHandle::newInteger(0),
                QPDFObjectHandle::newInteger(792),
                QPDFObjectHandle::newNull()};
            node.replaceKey("/Dest", QPDFObjectHandle::newArray(dest));
        } else {
            QPDFObjectHandle action = QPDFObjectHandle::newDictionary();
            action.replaceKey("/S", QPDFObjectHandle::newName("/URI"));
            action.replaceKey("/URI", QPDFObjectHandle::newString(item.uri));
            node.replaceKey("/A", action);
        }
        if (!item.children.empty()) {
            const int children = add_outline_items(pdf, node, item.children, pages);
            node.replaceKey("/Count", QPDFObjectHandle::newInteger(children));
            count += children;
        }
        nodes.push_back(node);
        ++count;
    }
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (i > 0) nodes[i].replaceKey("/Prev", nodes[i - 1]);
        if (i + 1 < nodes.size()) nodes[i].replaceKey("/Next", nodes[i + 1]);
    }
    if (!nodes.empty()) {
        parent.replaceKey("/First", nodes.front());
        parent.replaceKey("/Last", nodes.back());
    }
    return count;
}

void put_u16(std::vector<unsigned char>& out, const unsigned value) {
    out.push_back(static_cast<unsigned char>(value & 0xFF));
    out.push_back(static_cast<unsigned char>((value >> 8) & 0xFF));
}

void put_u32(std::vector<unsigned char>& out, const unsigned long value) {
    put_u16(out, static_cast<unsigned>(value & 0xFFFF));
    put_u16(out, static_cast<unsigned>((value >> 16) & 0xFFFF));
}

// writes every entry stored, in order, followed by the central directory
std::vector<unsigned char> stored_zip(const std::vector<std::pair<std::string, std::string>>& entries) {
    std::vector<unsigned char> out;
    std::vector<unsigned char> central;
    for (const auto& [name, data] : entries) {
        const auto crc = crc32(0L, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size()));
        const auto offset = out.size();

        put_u32(out, 0x04034B50);
        put_u16(out, 10); // version needed
        put_u16(out, 0);  // flags
        put_u16(out, 0);  // method: stored
        put_u16(out, 0);  // time
        put_u16(out, 0);  // date
        put_u32(out, crc);
        put_u32(out, data.size());
        put_u32(out, data.size());
        put_u16(out, static_cast<unsigned>(name.size()));
        put_u16(out, 0);  // extra length
        out.insert(out.end(), name.begin(), name.end());
        out.insert(out.end(), data.begin(), data.end());

        put_u32(central, 0x02014B50);
        put_u16(central, 20); // version made by
        put_u16(central, 10);
        put_u16(central, 0);
        put_u16(central, 0);
        put_u16(central, 0);
        put_u16(central, 0);
        put_u32(central, crc);
        put_u32(central, data.size());
        put_u32(central, data.size());
        put_u16(central, static_cast<unsigned>(name.size()));
        put_u16(central, 0); // extra length
        put_u16(central, 0); // comment length
        put_u16(central, 0); // disk number
        put_u16(central, 0); // internal attributes
        put_u32(central, 0); // external attributes
        put_u32(central, offset);
        central.insert(central.end(), name.begin(), name.end());
    }

    const auto central_offset = out.size();
    out.insert(out.end(), central.begin(), central.end());
    put_u32(out, 0x06054B50);
    put_u16(out, 0);
    put_u16(out, 0);
    put_u16(out, static_cast<unsigned>(entries.size()));
    put_u16(out, static_cast<unsigned>(entries.size()));
    put_u32(out, central.size());
    put_u32(out, central_offset);
    put_u16(out, 0); // comment length
    return out;
}

std::string chapter_name(const size_t index) {
    return "chapter" + std::to_string(index + 1) + ".xhtml";
}

void write_png_data(png_structp png, png_bytep data, const png_size_t length) {
    auto* out = static_cast<std::vector<unsigned char>*>(png_get_io_ptr(png));
    out->insert(out->end(), data, data + length);
}

void flush_png_data(png_structp) {}

void png_error_fn(png_structp, const png_const_charp msg) {
    throw std::runtime_error(msg);
}

} // namespace

std::vector<unsigned char> build_pdf(const PdfSpec& spec) {
    QPDF pdf;
    pdf.emptyPDF();

    const QPDFObjectHandle font = make_font(pdf);
    std::vector<QPDFObjectHandle> images;
    for (int i = 0; i < spec.images; ++i) {
        images.push_back(make_image(pdf, spec.image_rgb));
    }

    QPDFPageDocumentHelper page_helper(pdf);
    std::vector<QPDFObjectHandle> pages;
    for (size_t i = 0; i < spec.pages.size(); ++i) {
        QPDFObjectHandle page = make_page(pdf, font, spec.pages[i],
                                          i == 0 ? images : std::vector<QPDFObjectHandle>{});
        page_helper.addPage(QPDFPageObjectHelper(page), false);
        pages.push_back(page);
    }

    if (spec.outline) {
        QPDFObjectHandle outlines = pdf.makeIndirectObject(QPDFObjectHandle::parse("<< /Type /Outlines >>"));
        const int count = add_outline_items(pdf, outlines, *spec.outline, pages);
        outlines.replaceKey("/Count", QPDFObjectHandle::newInteger(count));
        pdf.getRoot().replaceKey("/Outlines", outlines);
    }

    if (!spec.info.empty()) {
        QPDFObjectHandle info = pdf.makeIndirectObject(QPDFObjectHandle::newDictionary());
        for (const auto& [key, value] : spec.info) {
            info.replaceKey(key, QPDFObjectHandle::newUnicodeString(value));
        }
        pdf.getTrailer().replaceKey("/Info", info);
    }

    QPDFWriter writer(pdf);
    writer.setOutputMemory();
    writer.setStaticID(true);
    if (!spec.user_password.empty()) {
        writer.setR6EncryptionParameters(spec.user_password.c_str(), "quarry-owner",
                                         true, true, qpdf_r3p_full, qpdf_r3m_all, true);
    }
    writer.write();

    const std::unique_ptr<Buffer> buffer(writer.getBuffer());
    const unsigned char* data = buffer->getBuffer();
    return {data, data + buffer->getSize()};
}

std::vector<int> image_object_numbers(const std::vector<unsigned char>& pdf) {
    QPDF parsed;
    parsed.processMemoryFile("fixture.pdf", reinterpret_cast<const char*>(pdf.data()), pdf.size());
    std::vector<int> numbers;
    for (auto& obj : parsed.getAllObjects()) {
        if (obj.isStream() && obj.getDict().getKey("/Subtype").isNameAndEquals("/Image")) {
            numbers.push_back(obj.getObjectID());
        }
    }
    std::ranges::sort(numbers);
    return numbers;
}

std::vector<unsigned char> epub_header() {
    std::vector<unsigned char> zip = {
        0x50, 0x4B, 0x03, 0x04, // local file header signature
        0x0A, 0x00,             // version needed
        0x00, 0x00,             // flags
        0x00, 0x00,             // method: stored
        0x00, 0x00, 0x00, 0x00, // time, date
        0x6F, 0x61, 0xAB, 0x2C, // crc-32
        0x14, 0x00, 0x00, 0x00, // compressed size (20)
        0x14, 0x00, 0x00, 0x00, // uncompressed size (20)
        0x08, 0x00,             // name length
        0x00, 0x00,             // extra length
    };
    const std::string tail = "mimetypeapplication/epub+zip";
    zip.insert(zip.end(), tail.begin(), tail.end());
    return zip;
}

std::vector<unsigned char> build_epub(const EpubSpec& spec) {
    std::vector<std::pair<std::string, std::string>> entries;
    // must come first and stored, so the container can be sniffed
    entries.emplace_back("mimetype", "application/epub+zip");
    entries.emplace_back("META-INF/container.xml",
        "<?xml version=\"1.0\"?>\n"
        "<container version=\"1.0\" xmlns=\"urn:oasis:names:tc:opendocument:xmlns:container\">"
        "<rootfiles><rootfile full-path=\"OEBPS/content.opf\" media-type=\"application/oebps-package+xml\"/>"
        "</rootfiles></container>\n");

    std::ostringstream manifest;
    std::ostringstream spine;
    std::ostringstream nav;
    for (size_t i = 0; i < spec.chapters.size(); ++i) {
        const std::string id = "ch" + std::to_string(i + 1);
        manifest << "<item id=\"" << id << "\" href=\"" << chapter_name(i)
                 << "\" media-type=\"application/xhtml+xml\"/>";
        spine << "<itemref idref=\"" << id << "\"/>";
        nav << "<navPoint id=\"nav" << i + 1 << "\" playOrder=\"" << i + 1 << "\">"
            << "<navLabel><text>Chapter " << i + 1 << "</text></navLabel>"
            << "<content src=\"" << chapter_name(i) << "\"/></navPoint>";
    }
    if (spec.toc) {
        manifest << "<item id=\"ncx\" href=\"toc.ncx\" media-type=\"application/x-dtbncx+xml\"/>";
    }

    std::ostringstream opf;
    opf << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        << "<package xmlns=\"http://www.idpf.org/2007/opf\" version=\"2.0\" unique-identifier=\"bookid\">"
        << "<metadata xmlns:dc=\"http://purl.org/dc/elements/1.1/\">"
        << "<dc:title>" << spec.title << "</dc:title>"
        << "<dc:identifier id=\"bookid\">quarry-sample</dc:identifier>"
        << "<dc:language>en</dc:language></metadata>"
        << "<manifest>" << manifest.str() << "</manifest>"
        << (spec.toc ? "<spine toc=\"ncx\">" : "<spine>") << spine.str() << "</spine>"
        << "</package>\n";
    entries.emplace_back("OEBPS/content.opf", opf.str());

    if (spec.toc) {
        std::ostringstream ncx;
        ncx << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
            << "<ncx xmlns=\"http://www.daisy.org/z3986/2005/ncx/\" version=\"2005-1\">"
            << "<head><meta name=\"dtb:uid\" content=\"quarry-sample\"/></head>"
            << "<docTitle><text>" << spec.title << "</text></docTitle>"
            << "<navMap>" << nav.str() << "</navMap></ncx>\n";
        entries.emplace_back("OEBPS/toc.ncx", ncx.str());
    }

    for (size_t i = 0; i < spec.chapters.size(); ++i) {
        std::ostringstream xhtml;
        xhtml << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
              << "<html xmlns=\"http://www.w3.org/1999/xhtml\"><head><title>Chapter " << i + 1
              << "</title></head><body><p>" << spec.chapters[i] << "</p></body></html>\n";
        entries.emplace_back("OEBPS/" + chapter_name(i), xhtml.str());
    }
    return stored_zip(entries);
}

std::vector<unsigned char> encode_png(const unsigned width, const unsigned height, const int color_type,
                                      const int bit_depth, const std::vector<unsigned char>& pixels,
                                      const std::vector<unsigned char>& palette) {
    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, nullptr);
    png_infop info = png_create_info_struct(png);
    struct Guard {
        png_structp& png;
        png_infop& info;
        ~Guard() { png_destroy_write_struct(&png, &info); }
    } guard{png, info};

    std::vector<unsigned char> out;
    png_set_write_fn(png, &out, write_png_data, flush_png_data);
    png_set_IHDR(png, info, width, height, bit_depth, color_type,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);

    std::vector<png_color> colors;
    for (size_t i = 0; i + 2 < palette.size(); i += 3) {
        colors.push_back({palette[i], palette[i + 1], palette[i + 2]});
    }
    if (color_type == PNG_COLOR_TYPE_PALETTE) {
        png_set_PLTE(png, info, colors.data(), static_cast<int>(colors.size()));
    }
    png_write_info(png, info);

    const size_t rowbytes = png_get_rowbytes(png, info);
    for (unsigned y = 0; y < height; ++y) {
        png_write_row(png, const_cast<png_bytep>(pixels.data() + y * rowbytes));
    }
    png_write_end(png, nullptr);
    return out;
}

TempDir::TempDir() {
    static std::atomic<int> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            ("quarry-test-" + std::to_string(stamp) + "-" + std::to_string(counter++));
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TempDir::write(const std::string& name, const std::vector<unsigned char>& bytes) const {
    const auto target = path_ / name;
    std::ofstream out(target, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw std::runtime_error("cannot write fixture " + target.string());
    }
    return target;
}

std::string read_text(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

} // namespace quarry::test
