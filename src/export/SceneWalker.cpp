#include "export/SceneWalker.hpp"

#include "export/Formatting.hpp"
#include "export/MeshWriter.hpp"

namespace CyclesExport
{
    SceneWalker::SceneWalker( const SceneSource& source, Document& document, ShaderWriter& shaderWriter )
        : m_source( source )
        , m_document( document )
        , m_shaderWriter( shaderWriter )
    {
    }

    Result SceneWalker::Walk( const ScenePath& path, const ExportState& state )
    {
        ++m_locationCount;

        const ExportState localState = state.Push( m_source.Transform( path ), m_source.GetAttributes( path ) );

        if( Ref<const Object> object = m_source.GetObject( path ) )
        {
            CE_CHECK( WriteObject( path, localState, *object ) );
        }

        ScenePath childPath = path;
        childPath.emplace_back();
        for( const std::string& childName : m_source.ChildNames( path ) )
        {
            childPath.back() = childName;
            CE_CHECK( Walk( childPath, localState ) );
        }

        return Result::SUCCESS;
    }

    Result SceneWalker::WriteObject( const ScenePath& path, const ExportState& state, const Object& object )
    {
        const MeshPrimitive* mesh = object.GetType() == ObjectType::MESH ? dynamic_cast<const MeshPrimitive*>( &object ) : nullptr;
        if( !mesh )
        {
            CE_CORE_TRACE( "SceneWalker: Skipping non-mesh object at '{}'", PathToString( path ) );
            return Result::SUCCESS;
        }

        // The shader block has to precede the state that references it
        std::string shaderHandle;
        Result      result = m_shaderWriter.Write( m_document, state, shaderHandle );
        if( result != Result::SUCCESS )
        {
            CE_CORE_ERROR( "SceneWalker: Failed to write the shader of '{}': {}", PathToString( path ), toString( result ) );
            return result;
        }

        Element& transform = m_document.Append( "transform" );
        transform.SetAttribute( "matrix", FormatMatrix( state.transform ) );

        Element& stateElement = transform.AddChild( "state" );
        if( !shaderHandle.empty() )
        {
            stateElement.SetAttribute( "shader", shaderHandle );
        }

        MeshWriter::Write( stateElement, *mesh );

        ++m_meshCount;
        CE_CORE_TRACE( "SceneWalker: Wrote mesh '{}'", PathToString( path ) );
        return Result::SUCCESS;
    }
} // namespace CyclesExport
