#include <gtest/gtest.h>
#include "render/image_resolver.hpp"

using namespace lodbook;
using json = nlohmann::json;

class ImageResolverTest : public ::testing::Test {
protected:
    InMemoryRecordStore store;
    TypeRegistry types;
    AdvisoryLog advisories;
    std::unique_ptr<BuildContext> context;

    void SetUp() override {
        store = InMemoryRecordStore::from_json(json::array({
            {{"name", "Hall Photo"}, {"type", "image"}, {"image", "hall.jpg"}},
            {{"name", "Unfiled Photo"}, {"type", "image"}}
        }));
        context = std::make_unique<BuildContext>(store, types, advisories);
    }
};

TEST_F(ImageResolverTest, SupportedExtensions) {
    ImageResolver resolver(*context);
    EXPECT_EQ(resolver.check_extension("a.jpg"), "a.jpg");
    EXPECT_EQ(resolver.check_extension("a.JPEG"), "a.JPEG");
    EXPECT_EQ(resolver.check_extension("maps/a.png"), "maps/a.png");
    EXPECT_EQ(resolver.check_extension("a.gif"), "a.gif");
    EXPECT_TRUE(advisories.empty());
}

TEST_F(ImageResolverTest, UnsupportedFormatsAreReported) {
    ImageResolver resolver(*context);
    EXPECT_FALSE(resolver.check_extension("scan.tif").has_value());
    EXPECT_FALSE(resolver.check_extension("scan.TIFF").has_value());
    EXPECT_FALSE(resolver.check_extension("letter.pdf").has_value());
    EXPECT_EQ(advisories.count(AdvisoryKind::UNSUPPORTED_IMAGE_FORMAT), 3);
}

TEST_F(ImageResolverTest, OtherFilesAreSilentlyDropped) {
    ImageResolver resolver(*context);
    EXPECT_FALSE(resolver.check_extension("notes.txt").has_value());
    EXPECT_FALSE(resolver.check_extension("no-extension").has_value());
    EXPECT_TRUE(advisories.empty());
}

TEST_F(ImageResolverTest, ScalarImage) {
    ImageResolver resolver(*context);
    EXPECT_EQ(resolver.resolve(PropertyValue::from_json("portrait.png")), "portrait.png");
    EXPECT_FALSE(resolver.resolve(PropertyValue::from_json("portrait.tif")).has_value());
}

TEST_F(ImageResolverTest, ImageReferenceResolvesThroughRecord) {
    ImageResolver resolver(*context);
    auto file = resolver.resolve(PropertyValue::from_json({{"name", "Hall Photo"}}));
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(*file, "hall.jpg");
}

TEST_F(ImageResolverTest, MissingImageRecord) {
    ImageResolver resolver(*context);
    EXPECT_FALSE(resolver.resolve(PropertyValue::from_json({{"name", "Lost Photo"}})).has_value());
    EXPECT_FALSE(resolver.resolve(PropertyValue::from_json({{"name", "Unfiled Photo"}})).has_value());
    EXPECT_EQ(advisories.count(AdvisoryKind::MISSING_IMAGE_RECORD), 2);
}

TEST_F(ImageResolverTest, ObjectWithoutNameIsIgnored) {
    ImageResolver resolver(*context);
    EXPECT_FALSE(resolver.resolve(PropertyValue::from_json({{"url", "x.jpg"}})).has_value());
    EXPECT_TRUE(advisories.empty());
}
