#include "export/SceneWriter.hpp"

#include "export/SceneWalker.hpp"

namespace CyclesExport
{
    SceneWriter::SceneWriter( const ShaderSearchPath& searchPath, ShaderInfoCache& infoCache )
        : m_shaderWriter( searchPath, infoCache )
    {
    }

    Element& SceneWriter::WriteBackground( Document& document )
    {
        Element& block = document.Append( "background" );

        Element& shader = block.AddChild( "background" );
        shader.SetAttribute( "name", "bg" );
        shader.SetAttribute( "strength", "2.0" );
        shader.SetAttribute( "color", "0.2, 0.2, 0.2" );

        Element& connect = block.AddChild( "connect" );
        connect.SetAttribute( "from", "bg background" );
        connect.SetAttribute( "to", "output surface" );

        return block;
    }

    Result SceneWriter::Write( const SceneSource& source, Document& document )
    {
        if( !document.IsEmpty() )
        {
            CE_CORE_ERROR( "SceneWriter: Target document already has {} elements", document.GetElements().size() );
            return Result::INVALID_ARGS;
        }

        // 1. Camera
        Parameters globals = source.Globals();
        CameraWriter::Write( document, CameraWriter::Resolve( source, globals ) );

        // 2. Background
        WriteBackground( document );

        // 3. Scene
        ShaderRegistry registry;
        SceneWalker    walker( source, document, m_shaderWriter );

        Result result = walker.Walk( ScenePath(), ExportState( &registry ) );
        if( result != Result::SUCCESS )
        {
            CE_CORE_ERROR( "SceneWriter: Scene traversal failed: {}", toString( result ) );
            return result;
        }

        CE_CORE_INFO( "SceneWriter: {} locations, {} meshes, {} shader networks", walker.GetLocationCount(), walker.GetMeshCount(), registry.GetSize() );
        return Result::SUCCESS;
    }
} // namespace CyclesExport
