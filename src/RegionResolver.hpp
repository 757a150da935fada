#pragma once

#include "PanelTypes.hpp"

#include <optional>

// Converts normalized panel rectangles to pixel rectangles of a frame (the
// visible page area of the view, or the native page size).
namespace RegionResolver
{

// Finite, positive extent, and no more than a page's worth of overhang.
bool isValid(const PanelData &panel) noexcept;

// Origin is floored and extent is ceiled, so the crop never falls short of
// the panel. Extents are at least one pixel. Returns nullopt for invalid
// panels or an empty frame.
std::optional<PixelRect> toPixelRect(const PanelData &panel,
                                     const DisplayRect &frame) noexcept;

std::optional<DisplayRect>
chooseFrame(const std::optional<QRect> &viewArea,
            const std::optional<QSize> &nativeSize) noexcept;

bool fitsWithin(const PixelRect &rect, const DisplayRect &frame) noexcept;

} // namespace RegionResolver
