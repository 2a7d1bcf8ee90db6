#include "scene/ShapeGenerator.h"

#include <algorithm>
#include <cmath>
#include <glm/gtc/constants.hpp>

namespace CyclesExport
{
    Ref<MeshPrimitive> ShapeGenerator::CreateCube( float size )
    {
        auto mesh = CreateRef<MeshPrimitive>();

        float s = size * 0.5f;
        mesh->P = {
            { -s, -s, s },  { s, -s, s },  { s, s, s },  { -s, s, s },  // front
            { -s, -s, -s }, { s, -s, -s }, { s, s, -s }, { -s, s, -s }, // back
        };

        // Faces: Front, Back, Right, Left, Top, Bottom (CCW seen from outside)
        mesh->verticesPerFace = { 4, 4, 4, 4, 4, 4 };
        mesh->vertexIds       = {
            0, 1, 2, 3, //
            5, 4, 7, 6, //
            1, 5, 6, 2, //
            4, 0, 3, 7, //
            3, 2, 6, 7, //
            4, 5, 1, 0, //
        };

        return mesh;
    }

    Ref<MeshPrimitive> ShapeGenerator::CreatePlane( const glm::vec2& size, const glm::ivec2& divisions )
    {
        auto mesh = CreateRef<MeshPrimitive>();

        int nx = std::max( divisions.x, 1 );
        int ny = std::max( divisions.y, 1 );

        mesh->P.reserve( ( nx + 1 ) * ( ny + 1 ) );
        for( int j = 0; j <= ny; ++j )
        {
            float y = ( float( j ) / float( ny ) - 0.5f ) * size.y;
            for( int i = 0; i <= nx; ++i )
            {
                float x = ( float( i ) / float( nx ) - 0.5f ) * size.x;
                mesh->P.push_back( { x, y, 0.0f } );
            }
        }

        mesh->verticesPerFace.assign( nx * ny, 4 );
        mesh->vertexIds.reserve( nx * ny * 4 );
        for( int j = 0; j < ny; ++j )
        {
            for( int i = 0; i < nx; ++i )
            {
                int first = j * ( nx + 1 ) + i;
                mesh->vertexIds.push_back( first );
                mesh->vertexIds.push_back( first + 1 );
                mesh->vertexIds.push_back( first + nx + 2 );
                mesh->vertexIds.push_back( first + nx + 1 );
            }
        }

        return mesh;
    }

    Ref<MeshPrimitive> ShapeGenerator::CreateSphere( float radius, int stacks, int slices )
    {
        auto mesh = CreateRef<MeshPrimitive>();

        stacks = std::max( stacks, 2 );
        slices = std::max( slices, 3 );

        // 1. Points: north pole, (stacks - 1) rings of 'slices' points, south pole
        mesh->P.reserve( 2 + ( stacks - 1 ) * slices );
        mesh->P.push_back( { 0.0f, radius, 0.0f } );
        for( int i = 1; i < stacks; ++i )
        {
            float phi = glm::pi<float>() * float( i ) / float( stacks ); // 0 to PI
            float y   = cos( phi );
            float r   = sin( phi );

            for( int j = 0; j < slices; ++j )
            {
                float theta = 2.0f * glm::pi<float>() * float( j ) / float( slices ); // 0 to 2PI
                mesh->P.push_back( glm::vec3( r * cos( theta ), y, r * sin( theta ) ) * radius );
            }
        }
        int southPole = static_cast<int>( mesh->P.size() );
        mesh->P.push_back( { 0.0f, -radius, 0.0f } );

        auto ringPoint = [ & ]( int ring, int slice ) { return 1 + ring * slices + ( slice % slices ); };

        // 2. North cap
        for( int j = 0; j < slices; ++j )
        {
            mesh->verticesPerFace.push_back( 3 );
            mesh->vertexIds.insert( mesh->vertexIds.end(), { 0, ringPoint( 0, j + 1 ), ringPoint( 0, j ) } );
        }

        // 3. Bands
        for( int i = 0; i < stacks - 2; ++i )
        {
            for( int j = 0; j < slices; ++j )
            {
                mesh->verticesPerFace.push_back( 4 );
                mesh->vertexIds.insert( mesh->vertexIds.end(), { ringPoint( i, j ), ringPoint( i, j + 1 ), ringPoint( i + 1, j + 1 ), ringPoint( i + 1, j ) } );
            }
        }

        // 4. South cap
        int lastRing = stacks - 2;
        for( int j = 0; j < slices; ++j )
        {
            mesh->verticesPerFace.push_back( 3 );
            mesh->vertexIds.insert( mesh->vertexIds.end(), { southPole, ringPoint( lastRing, j ), ringPoint( lastRing, j + 1 ) } );
        }

        return mesh;
    }
} // namespace CyclesExport
