#pragma once

#include "tp/Toolpath.h"

#include <optional>
#include <vector>

namespace tp
{

constexpr int kCoordinateDecimals = 3;

[[nodiscard]] double roundCoordinate(double value);
[[nodiscard]] Point roundPoint(const Point& point);

/**
 * Extracts the ordered, rounded vertices of one raw input path.
 * Returns std::nullopt when the input yields no usable points; callers skip
 * such paths without treating them as errors.
 */
[[nodiscard]] std::optional<Path> normalize(const RawPath& raw);

/// Normalizes every raw path, dropping the ones that produce nothing.
[[nodiscard]] std::vector<Path> normalizeAll(const std::vector<RawPath>& raws);

} // namespace tp
