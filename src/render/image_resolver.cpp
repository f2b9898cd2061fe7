#include "render/image_resolver.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace lodbook {

namespace {

std::string lower_extension(const std::string& file) {
    std::string ext = std::filesystem::path(file).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

}  // namespace

ImageResolver::ImageResolver(const BuildContext& context) : context_(context) {}

std::optional<std::string> ImageResolver::resolve(const PropertyValue& image) const {
    if (image.is_scalar()) {
        return check_extension(image.scalar_text());
    }

    const PropertyValue* name = image.get("name");
    if (!name || !name->is_scalar()) {
        return std::nullopt;
    }

    std::string image_name = name->scalar_text();
    const Record* record = context_.store.find(image_name);
    const PropertyValue* file = record ? record->property("image") : nullptr;
    if (!file || !file->is_scalar()) {
        context_.advisories.report(AdvisoryKind::MISSING_IMAGE_RECORD, image_name,
                                   "no image record with a file for this name");
        return std::nullopt;
    }

    return file->scalar_text();
}

std::optional<std::string> ImageResolver::check_extension(const std::string& file) const {
    std::string ext = lower_extension(file);
    if (ext == ".jpg" || ext == ".jpeg" || ext == ".png" || ext == ".gif") {
        return file;
    }
    if (ext == ".tif" || ext == ".tiff" || ext == ".pdf") {
        context_.advisories.report(AdvisoryKind::UNSUPPORTED_IMAGE_FORMAT, file,
                                   "image format cannot be displayed");
    }
    return std::nullopt;
}

} // namespace lodbook
