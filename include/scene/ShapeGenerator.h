#pragma once
#include "scene/SceneTypes.h"

namespace CyclesExport
{
    /**
     * @brief Builds simple polygon meshes for demo scenes and tests.
     */
    class CE_API ShapeGenerator
    {
    public:
        // Unit cube centered at the origin, 8 shared points and 6 quads.
        static Ref<MeshPrimitive> CreateCube( float size = 1.0f );

        // Plane in XY facing +Z, divided into divisions.x * divisions.y quads.
        static Ref<MeshPrimitive> CreatePlane( const glm::vec2& size = glm::vec2( 1.0f ), const glm::ivec2& divisions = glm::ivec2( 1 ) );

        // UV sphere: quads on the bands, triangle fans at the poles.
        static Ref<MeshPrimitive> CreateSphere( float radius, int stacks, int slices );
    };
} // namespace CyclesExport
