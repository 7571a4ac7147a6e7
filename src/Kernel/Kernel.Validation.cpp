module;

#include <expected>
#include <string_view>
#include <unordered_set>
#include <utility>

#include <glm/glm.hpp>

module Kernel:Validation.Impl;

import Core;
import :Handle;
import :Geometry;
import :Topology;
import :Stores;
import :Validation;

namespace Kernel
{
    std::string_view ToString(ValidationErrorKind kind)
    {
        switch (kind)
        {
        case ValidationErrorKind::Structural: return "Structural";
        case ValidationErrorKind::Uniqueness: return "Uniqueness";
        case ValidationErrorKind::Geometric:  return "Geometric";
        }
        return "Unknown";
    }

    ValidationError::ValidationError(ValidationErrorKind kind, StructuralIssues issues)
        : m_Kind(kind), m_Issues(std::move(issues))
    {
    }

    ValidationError ValidationError::Structural(StructuralIssues issues)
    {
        return {ValidationErrorKind::Structural, std::move(issues)};
    }

    ValidationError ValidationError::Uniqueness()
    {
        return {ValidationErrorKind::Uniqueness, {}};
    }

    ValidationError ValidationError::Geometric()
    {
        return {ValidationErrorKind::Geometric, {}};
    }

    Core::ErrorCode ValidationError::Code() const noexcept
    {
        switch (m_Kind)
        {
        case ValidationErrorKind::Structural: return Core::ErrorCode::StructuralValidationFailed;
        case ValidationErrorKind::Uniqueness: return Core::ErrorCode::UniquenessValidationFailed;
        case ValidationErrorKind::Geometric:  return Core::ErrorCode::GeometricValidationFailed;
        }
        return Core::ErrorCode::Unknown;
    }

    bool ValidationError::IsMissingCurve(Handle<Curve> curve) const
    {
        return IsStructural() && m_Issues.MissingCurve == curve;
    }

    bool ValidationError::IsMissingVertex(Handle<Vertex> vertex) const
    {
        return IsStructural() && m_Issues.MissingVertices.contains(vertex);
    }

    bool ValidationError::IsMissingEdge(Handle<Edge> edge) const
    {
        return IsStructural() && m_Issues.MissingEdges.contains(edge);
    }

    bool ValidationError::IsMissingSurface(Handle<Surface> surface) const
    {
        return IsStructural() && m_Issues.MissingSurface == surface;
    }

    bool ValidationError::IsMissingCycle(Handle<Cycle> cycle) const
    {
        return IsStructural() && m_Issues.MissingCycles.contains(cycle);
    }
}

namespace Kernel::Validation
{
    ValidationOutcome Validate(const Point&, double, const Stores&)
    {
        return {};
    }

    ValidationOutcome Validate(const Curve&, double, const Stores&)
    {
        return {};
    }

    ValidationOutcome Validate(const Surface&, double, const Stores&)
    {
        return {};
    }

    ValidationOutcome Validate(const Vertex& vertex, double minDistance, const Stores& stores)
    {
        const Point* candidate = stores.Points.GetUnchecked(vertex.PointHandle);
        if (candidate == nullptr)
        {
            // The missing point is not recorded in the issues.
            return std::unexpected(ValidationError::Structural({}));
        }

        for (const auto& entry : stores.Vertices.Iter())
        {
            const Point* position = stores.Points.GetUnchecked(entry.Value.PointHandle);
            if (position == nullptr) continue;

            if (glm::distance(position->Coords, candidate->Coords) < minDistance)
            {
                return std::unexpected(ValidationError::Uniqueness());
            }
        }

        return {};
    }

    ValidationOutcome Validate(const Edge& edge, double, const Stores& stores)
    {
        StructuralIssues issues;

        if (!stores.Curves.Contains(edge.CurveHandle))
        {
            issues.MissingCurve = edge.CurveHandle;
        }
        if (edge.Vertices)
        {
            for (const Handle<Vertex>& vertex : *edge.Vertices)
            {
                if (!stores.Vertices.Contains(vertex))
                {
                    issues.MissingVertices.insert(vertex);
                }
            }
        }

        if (!issues.IsEmpty())
        {
            return std::unexpected(ValidationError::Structural(std::move(issues)));
        }
        return {};
    }

    ValidationOutcome Validate(const Cycle& cycle, double, const Stores& stores)
    {
        StructuralIssues issues;

        for (const Handle<Edge>& edge : cycle.Edges)
        {
            if (!stores.Edges.Contains(edge))
            {
                issues.MissingEdges.insert(edge);
            }
        }

        if (!issues.IsEmpty())
        {
            return std::unexpected(ValidationError::Structural(std::move(issues)));
        }
        return {};
    }

    ValidationOutcome Validate(const Face& face, double, const Stores& stores)
    {
        const BoundaryFace* boundary = face.AsBoundary();
        if (boundary == nullptr)
        {
            return {};
        }

        StructuralIssues issues;

        if (!stores.Surfaces.Contains(boundary->SurfaceHandle))
        {
            issues.MissingSurface = boundary->SurfaceHandle;
        }
        for (const Handle<Cycle>& cycle : face.AllCycles())
        {
            if (!stores.Cycles.Contains(cycle))
            {
                issues.MissingCycles.insert(cycle);
            }
        }

        if (!issues.IsEmpty())
        {
            return std::unexpected(ValidationError::Structural(std::move(issues)));
        }
        return {};
    }
}
