module;

#include <cmath>
#include <span>
#include <variant>

#include <glm/glm.hpp>

module Kernel:Geometry.Impl;

import :Geometry;

namespace Kernel
{
    glm::dvec3 Circle::PointAt(double t) const
    {
        return Center + A * std::cos(t) + B * std::sin(t);
    }

    glm::dvec3 Curve::PointAt(double t) const
    {
        return std::visit([t](const auto& curve) { return curve.PointAt(t); }, Data);
    }

    Curve Curve::Reversed() const
    {
        return std::visit([](const auto& curve) { return Curve{curve.Reversed()}; }, Data);
    }

    Surface Surface::XYPlane()
    {
        return {Curve{Line{glm::dvec3(0.0), glm::dvec3(1.0, 0.0, 0.0)}}, glm::dvec3(0.0, 1.0, 0.0)};
    }

    glm::dvec3 Surface::PointAt(double u, double v) const
    {
        return Profile.PointAt(u) + Path * v;
    }

    AABB Union(const AABB& aabb, const glm::dvec3& point)
    {
        AABB result;
        result.Min = glm::min(aabb.Min, point);
        result.Max = glm::max(aabb.Max, point);
        return result;
    }

    AABB FromPoints(std::span<const glm::dvec3> points)
    {
        AABB result;
        for (const auto& point : points)
        {
            result = Union(result, point);
        }
        return result;
    }
}
