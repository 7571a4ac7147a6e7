module;

#include <expected>
#include <string_view>

#include <glm/glm.hpp>

module Kernel:Shape.Impl;

import Core;
import :Handle;
import :Geometry;
import :Topology;
import :Validation;
import :Shape;

namespace Kernel
{
    Shape::Shape() : Shape(ShapeConfig{})
    {
    }

    Shape::Shape(const ShapeConfig& config) : m_Config(config)
    {
    }

    Core::Expected<Shape> Shape::Create(const ShapeConfig& config)
    {
        if (!config.IsValid())
        {
            Core::Log::Error("Shape: minimum vertex distance must be finite and non-negative, got {} ({})",
                             config.MinDistance,
                             Core::ErrorCodeToString(Core::ErrorCode::InvalidArgument));
            return Core::Err<Shape>(Core::ErrorCode::InvalidArgument);
        }

        return Core::Ok(Shape(config));
    }

    Core::Expected<Shape> Shape::WithMinDistance(double minDistance)
    {
        return Create(ShapeConfig{.MinDistance = minDistance});
    }

    Core::Expected<glm::dvec3> Shape::VertexPosition(Handle<Vertex> vertex) const
    {
        auto resolved = m_Stores.Vertices.Get(vertex);
        if (!resolved)
            return std::unexpected(resolved.error());

        auto point = m_Stores.Points.Get((*resolved)->PointHandle);
        if (!point)
            return std::unexpected(point.error());

        return (*point)->Coords;
    }

    void Shape::LogRejected(std::string_view kind, const ValidationError& error)
    {
        const StructuralIssues& issues = error.Issues();
        Core::Log::Debug("Shape: rejected {} ({}, {}): curve={} vertices={} edges={} surface={} cycles={}",
                         kind,
                         ToString(error.Kind()),
                         Core::ErrorCodeToString(error.Code()),
                         issues.MissingCurve.has_value(),
                         issues.MissingVertices.size(),
                         issues.MissingEdges.size(),
                         issues.MissingSurface.has_value(),
                         issues.MissingCycles.size());
    }
}
