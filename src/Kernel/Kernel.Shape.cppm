module;

#include <cmath>
#include <expected>
#include <string_view>
#include <utility>

#include <glm/glm.hpp>

export module Kernel:Shape;

import Core;
import :Handle;
import :Geometry;
import :Topology;
import :Stores;
import :Validation;

export namespace Kernel
{
    struct ShapeConfig
    {
        // Smallest distance allowed between two distinct vertices.
        double MinDistance = 5e-7;

        [[nodiscard]] bool IsValid() const { return std::isfinite(MinDistance) && MinDistance >= 0.0; }
    };

    // -------------------------------------------------------------------------
    // Shape - owns the stores of one B-rep model
    // -------------------------------------------------------------------------
    // Every Add* call validates the entity against the stores as they are
    // before the call and only inserts it on success. A rejected entity leaves
    // the shape untouched. Nothing spans more than one call: a caller adding
    // several dependent entities has to deal with partial completion itself.
    //
    // Single writer. Readers may run concurrently with each other.
    // -------------------------------------------------------------------------
    class Shape
    {
    public:
        Shape();

        // Fails with ErrorCode::InvalidArgument if the configuration is not valid.
        [[nodiscard]] static Core::Expected<Shape> Create(const ShapeConfig& config);
        [[nodiscard]] static Core::Expected<Shape> WithMinDistance(double minDistance);

        Shape(const Shape&) = delete;
        Shape& operator=(const Shape&) = delete;
        Shape(Shape&&) noexcept = default;
        Shape& operator=(Shape&&) noexcept = default;

        // Geometry
        [[nodiscard]] ValidationResult<Point> AddPoint(Point point) { return Insert(std::move(point)); }
        [[nodiscard]] ValidationResult<Curve> AddCurve(Curve curve) { return Insert(std::move(curve)); }
        [[nodiscard]] ValidationResult<Surface> AddSurface(Surface surface) { return Insert(std::move(surface)); }

        // Topology
        [[nodiscard]] ValidationResult<Vertex> AddVertex(Vertex vertex) { return Insert(std::move(vertex)); }
        [[nodiscard]] ValidationResult<Edge> AddEdge(Edge edge) { return Insert(std::move(edge)); }
        [[nodiscard]] ValidationResult<Cycle> AddCycle(Cycle cycle) { return Insert(std::move(cycle)); }
        [[nodiscard]] ValidationResult<Face> AddFace(Face face) { return Insert(std::move(face)); }

        template <typename T>
        [[nodiscard]] ValidationResult<T> Insert(T value)
        {
            static_assert(IsEntity<T>, "Kernel::Shape::Insert: not an entity kind");

            if (auto valid = Validation::Validate(value, m_Config.MinDistance, m_Stores); !valid)
            {
                LogRejected(EntityName<T>(), valid.error());
                return std::unexpected(std::move(valid).error());
            }

            auto handle = m_Stores.Of<T>().Insert(std::move(value));
            if (!handle)
                Core::Log::Error("Shape: {} store is full", EntityName<T>());
            return handle;
        }

        // Read access
        template <typename T>
        [[nodiscard]] bool Contains(Handle<T> handle) const
        {
            return m_Stores.Of<T>().Contains(handle);
        }

        template <typename T>
        [[nodiscard]] Core::Expected<const T*> Get(Handle<T> handle) const
        {
            return m_Stores.Of<T>().Get(handle);
        }

        [[nodiscard]] Core::Expected<glm::dvec3> VertexPosition(Handle<Vertex> vertex) const;

        [[nodiscard]] const Store<Point>& Points() const { return m_Stores.Points; }
        [[nodiscard]] const Store<Curve>& Curves() const { return m_Stores.Curves; }
        [[nodiscard]] const Store<Surface>& Surfaces() const { return m_Stores.Surfaces; }
        [[nodiscard]] const Store<Vertex>& Vertices() const { return m_Stores.Vertices; }
        [[nodiscard]] const Store<Edge>& Edges() const { return m_Stores.Edges; }
        [[nodiscard]] const Store<Cycle>& Cycles() const { return m_Stores.Cycles; }
        [[nodiscard]] const Store<Face>& Faces() const { return m_Stores.Faces; }

        [[nodiscard]] const Stores& GetStores() const { return m_Stores; }
        [[nodiscard]] double GetMinDistance() const { return m_Config.MinDistance; }
        [[nodiscard]] const ShapeConfig& GetConfig() const { return m_Config; }

    private:
        // Config must already satisfy IsValid().
        explicit Shape(const ShapeConfig& config);

        static void LogRejected(std::string_view kind, const ValidationError& error);

        ShapeConfig m_Config;
        Stores m_Stores;
    };
}
