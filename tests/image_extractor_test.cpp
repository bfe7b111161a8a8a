#include <gtest/gtest.h>

#include "../libquarry/include/document.hpp"
#include "support/fixtures.hpp"

#include <algorithm>

using quarry::Document;
using quarry::DocumentError;
using quarry::ErrorCode;

namespace {

ErrorCode image_error(Document& doc, const int object_number) {
    try {
        (void)doc.extract_image_bytes(object_number);
    } catch (const DocumentError& e) {
        return e.code();
    }
    ADD_FAILURE() << "obj " << object_number << " should not yield an image";
    return ErrorCode::DocumentClosed;
}

} // namespace

class ImageExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        quarry::test::PdfSpec spec;
        spec.pages = {"images here", "no images"};
        spec.images = 3;
        spec.image_rgb = {255, 0, 0};
        bytes_ = quarry::test::build_pdf(spec);
        image_objects_ = quarry::test::image_object_numbers(bytes_);
        doc_ = std::make_unique<Document>(Document::open_from_bytes(bytes_));
    }

    std::vector<unsigned char> bytes_;
    std::vector<int> image_objects_;
    std::unique_ptr<Document> doc_;
};

TEST_F(ImageExtractorTest, FixtureHasThreeImages) {
    ASSERT_EQ(image_objects_.size(), 3u);
}

TEST_F(ImageExtractorTest, ImageObjectsEncodeAsPng) {
    for (const int n : image_objects_) {
        const auto png = doc_->extract_image_bytes(n);
        ASSERT_GE(png.size(), 8u);
        EXPECT_EQ(png[0], 0x89);
        EXPECT_EQ(png[1], 'P');
        EXPECT_EQ(png[2], 'N');
        EXPECT_EQ(png[3], 'G');
    }
}

TEST_F(ImageExtractorTest, DecodedPixelsMatchTheSource) {
    const auto pixels = doc_->extract_image(image_objects_.front());
    EXPECT_EQ(pixels.width, 4u);
    EXPECT_EQ(pixels.height, 4u);
    ASSERT_EQ(pixels.rgba.size(), 4u * 4u * 4u);
    for (std::uint32_t y = 0; y < pixels.height; ++y) {
        for (std::uint32_t x = 0; x < pixels.width; ++x) {
            const unsigned char* px = pixels.pixel(x, y);
            EXPECT_EQ(px[0], 255);
            EXPECT_EQ(px[1], 0);
            EXPECT_EQ(px[2], 0);
            EXPECT_EQ(px[3], 255);
        }
    }
}

TEST_F(ImageExtractorTest, NonImageObjectsAreNotImage) {
    for (int n = 1; n < doc_->object_count(); ++n) {
        if (std::ranges::find(image_objects_, n) == image_objects_.end()) {
            EXPECT_EQ(image_error(*doc_, n), ErrorCode::NotImage) << "obj " << n;
        }
    }
}

TEST_F(ImageExtractorTest, OutOfRangeObjectsAreMissing) {
    EXPECT_EQ(image_error(*doc_, 0), ErrorCode::ObjectMissing);
    EXPECT_EQ(image_error(*doc_, -3), ErrorCode::ObjectMissing);
    EXPECT_EQ(image_error(*doc_, doc_->object_count()), ErrorCode::ObjectMissing);
}

TEST_F(ImageExtractorTest, ScanFindsExactlyTheImageObjects) {
    const auto images = doc_->extract_all_images();
    std::vector<int> found;
    for (const auto& image : images) {
        found.push_back(image.object_number);
        EXPECT_FALSE(image.png.empty());
    }
    EXPECT_EQ(found, image_objects_);
}

TEST_F(ImageExtractorTest, ScanMatchesManualScan) {
    size_t manual = 0;
    for (int n = 1; n < doc_->object_count(); ++n) {
        try {
            (void)doc_->extract_image_bytes(n);
            ++manual;
        } catch (const DocumentError& e) {
            ASSERT_EQ(e.code(), ErrorCode::NotImage);
        }
    }
    EXPECT_EQ(doc_->extract_all_images().size(), manual);
}

TEST(ImageExtractor, DocumentWithoutImagesScansEmpty) {
    Document doc = Document::open_from_bytes(quarry::test::build_pdf({}));
    EXPECT_TRUE(doc.extract_all_images().empty());
}
