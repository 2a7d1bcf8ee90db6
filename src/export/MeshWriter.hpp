#pragma once
#include "document/Document.hpp"
#include "scene/SceneTypes.h"

namespace CyclesExport
{
    /**
     * @brief Serializes polygon meshes.
     */
    class MeshWriter
    {
    public:
        // Value of the "subdivision" attribute for Catmull-Clark meshes.
        static constexpr const char* SUBDIVISION_CATMULL_CLARK = "catmull-clark";

        /**
         * @brief Appends a <mesh> element with P, nverts, verts and, for Catmull-Clark meshes only,
         * subdivision="catmull-clark". Data is written verbatim.
         */
        static Element& Write( Element& parent, const MeshPrimitive& mesh );
    };
} // namespace CyclesExport
