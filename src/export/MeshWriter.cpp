#include "export/MeshWriter.hpp"

#include "export/Formatting.hpp"

namespace CyclesExport
{
    Element& MeshWriter::Write( Element& parent, const MeshPrimitive& mesh )
    {
        if( !mesh.IsValid() )
        {
            CE_CORE_WARN( "MeshWriter: Mesh topology is inconsistent ({} points, {} faces, {} indices), writing it unchanged", mesh.P.size(),
                          mesh.verticesPerFace.size(), mesh.vertexIds.size() );
        }

        Element& element = parent.AddChild( "mesh" );
        element.SetAttribute( "P", FormatPoints( mesh.P ) );
        element.SetAttribute( "nverts", FormatInts( mesh.verticesPerFace ) );
        element.SetAttribute( "verts", FormatInts( mesh.vertexIds ) );

        if( mesh.interpolation == MeshInterpolation::CATMULL_CLARK )
        {
            element.SetAttribute( "subdivision", SUBDIVISION_CATMULL_CLARK );
        }

        return element;
    }
} // namespace CyclesExport
