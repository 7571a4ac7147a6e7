module;

#include <string_view>
#include <type_traits>

export module Kernel:Stores;

import Core;
import :Handle;
import :Geometry;
import :Topology;

export namespace Kernel
{
    template <typename T>
    inline constexpr bool IsEntity = std::is_same_v<T, Point> || std::is_same_v<T, Curve> ||
                                     std::is_same_v<T, Surface> || std::is_same_v<T, Vertex> ||
                                     std::is_same_v<T, Edge> || std::is_same_v<T, Cycle> ||
                                     std::is_same_v<T, Face>;

    template <typename T>
    [[nodiscard]] constexpr std::string_view EntityName()
    {
        static_assert(IsEntity<T>, "Kernel::EntityName: not an entity kind");
        if constexpr (std::is_same_v<T, Point>) return "Point";
        else if constexpr (std::is_same_v<T, Curve>) return "Curve";
        else if constexpr (std::is_same_v<T, Surface>) return "Surface";
        else if constexpr (std::is_same_v<T, Vertex>) return "Vertex";
        else if constexpr (std::is_same_v<T, Edge>) return "Edge";
        else if constexpr (std::is_same_v<T, Cycle>) return "Cycle";
        else return "Face";
    }

    // One independent store per entity kind.
    struct Stores
    {
        Store<Point> Points;
        Store<Curve> Curves;
        Store<Surface> Surfaces;

        Store<Vertex> Vertices;
        Store<Edge> Edges;
        Store<Cycle> Cycles;
        Store<Face> Faces;

        template <typename T>
        [[nodiscard]] Store<T>& Of()
        {
            return const_cast<Store<T>&>(static_cast<const Stores&>(*this).Of<T>());
        }

        template <typename T>
        [[nodiscard]] const Store<T>& Of() const
        {
            static_assert(IsEntity<T>, "Kernel::Stores::Of: not an entity kind");
            if constexpr (std::is_same_v<T, Point>) return Points;
            else if constexpr (std::is_same_v<T, Curve>) return Curves;
            else if constexpr (std::is_same_v<T, Surface>) return Surfaces;
            else if constexpr (std::is_same_v<T, Vertex>) return Vertices;
            else if constexpr (std::is_same_v<T, Edge>) return Edges;
            else if constexpr (std::is_same_v<T, Cycle>) return Cycles;
            else return Faces;
        }
    };
}
