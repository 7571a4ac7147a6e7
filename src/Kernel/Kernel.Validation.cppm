module;

#include <cstdint>
#include <expected>
#include <optional>
#include <string_view>
#include <unordered_set>

export module Kernel:Validation;

import Core;
import :Handle;
import :Geometry;
import :Topology;
import :Stores;

export namespace Kernel
{
    enum class ValidationErrorKind : uint8_t
    {
        // A referenced entity is not part of the shape.
        Structural,
        // The entity coincides with an existing one.
        Uniqueness,
        // Reserved for geometric constraints (intersections, overlaps).
        // Not produced yet.
        Geometric
    };

    [[nodiscard]] std::string_view ToString(ValidationErrorKind kind);

    // References found missing during structural validation. Only the fields
    // that belong to the validated kind are ever populated.
    struct StructuralIssues
    {
        // Edge validation
        std::optional<Handle<Curve>> MissingCurve;
        std::unordered_set<Handle<Vertex>> MissingVertices;

        // Cycle validation
        std::unordered_set<Handle<Edge>> MissingEdges;

        // Face validation
        std::optional<Handle<Surface>> MissingSurface;
        std::unordered_set<Handle<Cycle>> MissingCycles;

        [[nodiscard]] bool IsEmpty() const
        {
            return !MissingCurve && MissingVertices.empty() && MissingEdges.empty() && !MissingSurface &&
                   MissingCycles.empty();
        }
    };

    class ValidationError
    {
    public:
        [[nodiscard]] static ValidationError Structural(StructuralIssues issues);
        [[nodiscard]] static ValidationError Uniqueness();
        [[nodiscard]] static ValidationError Geometric();

        [[nodiscard]] ValidationErrorKind Kind() const noexcept { return m_Kind; }
        [[nodiscard]] const StructuralIssues& Issues() const noexcept { return m_Issues; }
        [[nodiscard]] Core::ErrorCode Code() const noexcept;

        [[nodiscard]] bool IsStructural() const noexcept { return m_Kind == ValidationErrorKind::Structural; }
        [[nodiscard]] bool IsUniqueness() const noexcept { return m_Kind == ValidationErrorKind::Uniqueness; }

        [[nodiscard]] bool IsMissingCurve(Handle<Curve> curve) const;
        [[nodiscard]] bool IsMissingVertex(Handle<Vertex> vertex) const;
        [[nodiscard]] bool IsMissingEdge(Handle<Edge> edge) const;
        [[nodiscard]] bool IsMissingSurface(Handle<Surface> surface) const;
        [[nodiscard]] bool IsMissingCycle(Handle<Cycle> cycle) const;

    private:
        ValidationError(ValidationErrorKind kind, StructuralIssues issues);

        ValidationErrorKind m_Kind;
        StructuralIssues m_Issues;
    };

    // Returned by the Shape::Add* operations.
    template <typename T>
    using ValidationResult = std::expected<Handle<T>, ValidationError>;

    using ValidationOutcome = std::expected<void, ValidationError>;
}

export namespace Kernel::Validation
{
    // -------------------------------------------------------------------------
    // One check per entity kind, evaluated against the stores as they are
    // before the candidate is inserted. minDistance is the smallest distance
    // allowed between two distinct vertices.
    // -------------------------------------------------------------------------

    // Geometry is not validated yet; these always succeed.
    [[nodiscard]] ValidationOutcome Validate(const Point& point, double minDistance, const Stores& stores);
    [[nodiscard]] ValidationOutcome Validate(const Curve& curve, double minDistance, const Stores& stores);
    [[nodiscard]] ValidationOutcome Validate(const Surface& surface, double minDistance, const Stores& stores);

    // Structural: the point must exist. Uniqueness: no stored vertex may lie
    // closer than minDistance. Scans every stored vertex.
    [[nodiscard]] ValidationOutcome Validate(const Vertex& vertex, double minDistance, const Stores& stores);

    // Structural: the curve and the bounding vertices (if any) must exist.
    [[nodiscard]] ValidationOutcome Validate(const Edge& edge, double minDistance, const Stores& stores);

    // Structural: every edge must exist.
    // TODO: check that the edges connect into a closed loop, that the loop
    // doesn't overlap itself and that no identical cycle exists.
    [[nodiscard]] ValidationOutcome Validate(const Cycle& cycle, double minDistance, const Stores& stores);

    // Structural for boundary faces: the surface and every exterior and
    // interior cycle must exist. Triangle faces always succeed.
    [[nodiscard]] ValidationOutcome Validate(const Face& face, double minDistance, const Stores& stores);
}
