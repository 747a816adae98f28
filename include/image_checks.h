/// @file image_checks.h
/// @brief Image size helpers
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef BLANKLINE_CPP_IMAGE_CHECKS_H
#define BLANKLINE_CPP_IMAGE_CHECKS_H

#include "document.h"

#include <cstdint>

namespace blankline_cpp {

/// EMU per pixel at 96 DPI.
inline constexpr std::int64_t kEmuPerPixel = 9525;

/// Images under this many pixels in both dimensions are "small".
inline constexpr double kSmallImagePixels = 100.0;

/// @brief Check if both pixel dimensions are below kSmallImagePixels
bool isImageSmall(Image const& image);

/// @brief First image of a paragraph, looking one level into revisions
/// @return nullptr when the paragraph has no image run
Image const* firstImageIn(Paragraph const& paragraph);

/// @brief Check if the paragraph's first image is small
bool isSmallImageParagraph(Paragraph const& paragraph);

/// @brief Check if the paragraph's first image exists and is not small
bool hasLargeImage(Paragraph const& paragraph);

} // namespace blankline_cpp

#endif // BLANKLINE_CPP_IMAGE_CHECKS_H
