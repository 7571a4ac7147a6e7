module;

#include <cfloat>
#include <span>
#include <variant>

#include <glm/glm.hpp>

export module Kernel:Geometry;

export namespace Kernel
{
    // =========================================================================
    // GEOMETRIC LEAF ENTITIES
    // =========================================================================
    // Plain values without references to other entities. They are validated
    // unconditionally when inserted into a shape.

    struct Point
    {
        glm::dvec3 Coords{0.0};

        bool operator==(const Point&) const = default;
    };

    struct Line
    {
        glm::dvec3 Origin{0.0};
        glm::dvec3 Direction{1.0, 0.0, 0.0};

        // Line through a and b, parametrized so that t=0 is a and t=1 is b.
        [[nodiscard]] static Line FromPoints(const glm::dvec3& a, const glm::dvec3& b)
        {
            return {a, b - a};
        }

        [[nodiscard]] glm::dvec3 PointAt(double t) const { return Origin + Direction * t; }
        [[nodiscard]] Line Reversed() const { return {Origin, -Direction}; }

        bool operator==(const Line&) const = default;
    };

    // Circle spanned by two orthogonal radius vectors; t is an angle in radians.
    struct Circle
    {
        glm::dvec3 Center{0.0};
        glm::dvec3 A{1.0, 0.0, 0.0};
        glm::dvec3 B{0.0, 1.0, 0.0};

        [[nodiscard]] double Radius() const { return glm::length(A); }
        [[nodiscard]] glm::dvec3 PointAt(double t) const;
        [[nodiscard]] Circle Reversed() const { return {Center, A, -B}; }

        bool operator==(const Circle&) const = default;
    };

    struct Curve
    {
        std::variant<Line, Circle> Data;

        [[nodiscard]] bool IsLine() const { return std::holds_alternative<Line>(Data); }
        [[nodiscard]] bool IsCircle() const { return std::holds_alternative<Circle>(Data); }

        [[nodiscard]] glm::dvec3 PointAt(double t) const;
        [[nodiscard]] Curve Reversed() const;

        bool operator==(const Curve&) const = default;
    };

    // Surface generated by sweeping a profile curve along a straight path.
    struct Surface
    {
        Curve Profile{Line{}};
        glm::dvec3 Path{0.0, 1.0, 0.0};

        [[nodiscard]] static Surface XYPlane();

        // u runs along the profile, v along the path.
        [[nodiscard]] glm::dvec3 PointAt(double u, double v) const;
        [[nodiscard]] glm::dvec3 PointSurfaceToModel(const glm::dvec2& point) const
        {
            return PointAt(point.x, point.y);
        }

        bool operator==(const Surface&) const = default;
    };

    struct Triangle
    {
        glm::dvec3 A{0.0}, B{0.0}, C{0.0};
    };

    struct AABB
    {
        glm::dvec3 Min = glm::dvec3(DBL_MAX);
        glm::dvec3 Max = glm::dvec3(-DBL_MAX);

        [[nodiscard]] bool IsValid() const
        {
            return (Min.x <= Max.x) && (Min.y <= Max.y) && (Min.z <= Max.z);
        }

        [[nodiscard]] glm::dvec3 GetCenter() const
        {
            return (Min + Max) * 0.5;
        }

        [[nodiscard]] glm::dvec3 GetSize() const
        {
            return Max - Min;
        }
    };

    [[nodiscard]] AABB Union(const AABB& aabb, const glm::dvec3& point);
    [[nodiscard]] AABB FromPoints(std::span<const glm::dvec3> points);
}
