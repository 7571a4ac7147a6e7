module;

#include <variant>
#include <vector>

module Kernel:Topology.Impl;

import :Handle;
import :Topology;

namespace Kernel
{
    Color Face::GetColor() const
    {
        return std::visit([](const auto& face) { return face.FaceColor; }, Data);
    }

    std::vector<Handle<Cycle>> Face::AllCycles() const
    {
        std::vector<Handle<Cycle>> cycles;
        if (const BoundaryFace* face = AsBoundary())
        {
            cycles.reserve(face->Exteriors.size() + face->Interiors.size());
            cycles.insert(cycles.end(), face->Exteriors.begin(), face->Exteriors.end());
            cycles.insert(cycles.end(), face->Interiors.begin(), face->Interiors.end());
        }
        return cycles;
    }
}
