module;

#include <cstddef>
#include <vector>

#include <glm/glm.hpp>

module Kernel:Export.Impl;

import Core;
import :Geometry;
import :Topology;
import :Shape;
import :Export;

namespace Kernel
{
    AABB ComputeBounds(const Shape& shape)
    {
        AABB bounds;
        for (const auto& entry : shape.Points().Iter())
        {
            bounds = Union(bounds, entry.Value.Coords);
        }
        return bounds;
    }

    size_t CollectTriangles(const Shape& shape, std::vector<Triangle>& out)
    {
        const size_t before = out.size();
        size_t skipped = 0;

        for (const auto& entry : shape.Faces().Iter())
        {
            if (const TriangleFace* face = entry.Value.AsTriangles())
            {
                out.insert(out.end(), face->Triangles.begin(), face->Triangles.end());
            }
            else
            {
                ++skipped;
            }
        }

        if (skipped > 0)
        {
            Core::Log::Debug("CollectTriangles: skipped {} boundary face(s) without triangulation", skipped);
        }

        return out.size() - before;
    }
}
