#pragma once

#include "core/build_context.hpp"
#include "record/record.hpp"
#include <optional>
#include <string>

namespace lodbook {

/**
 * @brief Resolves a record's `image` property to a displayable file name
 *
 * Images are referenced by name, so an `image` object such as
 * {"name": "Hall photograph"} is resolved through the image record's own
 * `image` value. A plain string is used as the file name directly.
 */
class ImageResolver {
public:
    explicit ImageResolver(const BuildContext& context);

    /**
     * @brief File to display for an image property, if any
     *
     * Reports missing_image_record when a referenced image record (or its
     * file) is absent and unsupported_image_format for .tif, .tiff and .pdf.
     */
    std::optional<std::string> resolve(const PropertyValue& image) const;

    /**
     * @brief Keep .jpg, .jpeg, .png and .gif files (any case)
     */
    std::optional<std::string> check_extension(const std::string& file) const;

private:
    const BuildContext& context_;
};

} // namespace lodbook
