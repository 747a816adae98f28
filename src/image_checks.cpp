/// @file image_checks.cpp
/// @brief Image size helpers
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "image_checks.h"

namespace blankline_cpp {

bool isImageSmall(Image const& image) {
    double widthPx = static_cast<double>(image.width()) / kEmuPerPixel;
    double heightPx = static_cast<double>(image.height()) / kEmuPerPixel;
    return widthPx < kSmallImagePixels && heightPx < kSmallImagePixels;
}

Image const* firstImageIn(Paragraph const& paragraph) {
    for (auto const& item : paragraph.content()) {
        if (item.kind == ContentKind::ImageRun) {
            return &item.image;
        }
        if (item.kind == ContentKind::Revision) {
            for (auto const& child : item.children) {
                if (child.kind == ContentKind::ImageRun) {
                    return &child.image;
                }
            }
        }
    }
    return nullptr;
}

bool isSmallImageParagraph(Paragraph const& paragraph) {
    Image const* image = firstImageIn(paragraph);
    return image && isImageSmall(*image);
}

bool hasLargeImage(Paragraph const& paragraph) {
    Image const* image = firstImageIn(paragraph);
    return image && !isImageSmall(*image);
}

} // namespace blankline_cpp
