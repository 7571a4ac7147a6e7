module;

#include <cstddef>
#include <vector>

export module Kernel:Export;

import :Geometry;
import :Shape;

export namespace Kernel
{
    // Read-only helpers for consumers that turn a finished shape into
    // something displayable. Neither mutates the shape.

    // Bounding box of every point in the shape. Invalid for an empty shape.
    [[nodiscard]] AABB ComputeBounds(const Shape& shape);

    // Appends the triangles of every triangle face, in face insertion order.
    // Boundary faces are skipped; triangulating them is a builder concern.
    // Returns the number of triangles appended.
    size_t CollectTriangles(const Shape& shape, std::vector<Triangle>& out);
}
