module;

#include <array>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

export module Kernel:Topology;

import :Handle;
import :Geometry;

export namespace Kernel
{
    // =========================================================================
    // TOPOLOGICAL ENTITIES
    // =========================================================================
    // Every reference to another entity is a handle into the owning shape's
    // stores. References only point "down" (face -> cycle -> edge -> vertex
    // -> point), never back up.

    struct Vertex
    {
        Handle<Point> PointHandle{};

        bool operator==(const Vertex&) const = default;
    };

    struct Edge
    {
        Handle<Curve> CurveHandle{};

        // Empty for closed/unbounded edges (e.g. a full circle), otherwise the
        // two bounding vertices.
        std::optional<std::array<Handle<Vertex>, 2>> Vertices{};

        [[nodiscard]] static Edge Closed(Handle<Curve> curve)
        {
            return {curve, std::nullopt};
        }

        [[nodiscard]] static Edge Bounded(Handle<Curve> curve, Handle<Vertex> a, Handle<Vertex> b)
        {
            return {curve, std::array<Handle<Vertex>, 2>{a, b}};
        }

        [[nodiscard]] bool IsClosed() const { return !Vertices.has_value(); }

        bool operator==(const Edge&) const = default;
    };

    // Ordered edges of a loop. Closure is not checked.
    struct Cycle
    {
        std::vector<Handle<Edge>> Edges;

        bool operator==(const Cycle&) const = default;
    };

    using Color = std::array<uint8_t, 4>;

    inline constexpr Color DefaultFaceColor{255, 0, 0, 255};

    // Face bounded by cycles on a surface.
    struct BoundaryFace
    {
        Handle<Surface> SurfaceHandle{};
        std::vector<Handle<Cycle>> Exteriors;
        std::vector<Handle<Cycle>> Interiors;
        Color FaceColor = DefaultFaceColor;
    };

    // Pre-triangulated face without a symbolic boundary.
    struct TriangleFace
    {
        std::vector<Triangle> Triangles;
        Color FaceColor = DefaultFaceColor;
    };

    struct Face
    {
        std::variant<BoundaryFace, TriangleFace> Data;

        [[nodiscard]] bool IsBoundary() const { return std::holds_alternative<BoundaryFace>(Data); }

        [[nodiscard]] const BoundaryFace* AsBoundary() const { return std::get_if<BoundaryFace>(&Data); }
        [[nodiscard]] const TriangleFace* AsTriangles() const { return std::get_if<TriangleFace>(&Data); }

        [[nodiscard]] Color GetColor() const;

        // Exteriors followed by interiors. Empty for triangle faces.
        [[nodiscard]] std::vector<Handle<Cycle>> AllCycles() const;
    };
}
