#include "export/ShaderWriter.hpp"

#include <set>

namespace CyclesExport
{
    namespace
    {
        // Attributes WriteNetwork sets on every <osl_shader> before the literal parameters
        bool IsNodeAttribute( const std::string& name ) { return name == "name" || name == "src"; }
    } // namespace

    ShaderWriter::ShaderWriter( const ShaderSearchPath& searchPath, ShaderInfoCache& infoCache )
        : m_searchPath( searchPath )
        , m_infoCache( infoCache )
    {
    }

    bool ShaderWriter::ParseLink( const std::string& value, std::string& outHandle, std::string& outParameter )
    {
        const std::string prefix = Shader::LINK_PREFIX;
        if( value.rfind( prefix, 0 ) != 0 )
            return false;

        std::string target = value.substr( prefix.size() );
        size_t      dot    = target.rfind( '.' );
        if( dot == std::string::npos || dot == 0 || dot + 1 == target.size() )
            return false;

        outHandle    = target.substr( 0, dot );
        outParameter = target.substr( dot + 1 );
        return true;
    }

    Result ShaderWriter::Validate( const ShaderAssignment& network )
    {
        std::set<std::string> defined;

        for( size_t i = 0; i < network.size(); ++i )
        {
            const Shader&     shader = network[ i ];
            const std::string handle = shader.GetHandle();

            for( const auto& [ name, value ] : shader.parameters )
            {
                if( !Shader::IsLink( value ) )
                {
                    if( IsNodeAttribute( name ) )
                    {
                        CE_CORE_ERROR( "ShaderWriter: Parameter '{}' of {} clashes with the node's own attribute", name, handle );
                        return Result::INVALID_ARGS;
                    }
                    continue;
                }

                std::string sourceHandle, sourceParameter;
                if( !ParseLink( *GetString( value ), sourceHandle, sourceParameter ) )
                {
                    CE_CORE_ERROR( "ShaderWriter: Malformed link '{}' on {}.{}", *GetString( value ), handle, name );
                    return Result::INVALID_ARGS;
                }

                if( defined.find( sourceHandle ) == defined.end() )
                {
                    CE_CORE_ERROR( "ShaderWriter: {}.{} links to '{}', which is not an earlier node of the network", handle, name, sourceHandle );
                    return Result::INVALID_ARGS;
                }
            }

            if( !defined.insert( handle ).second )
            {
                CE_CORE_ERROR( "ShaderWriter: Handle '{}' is used by more than one node (node {} '{}')", handle, i, shader.name );
                return Result::INVALID_ARGS;
            }
        }

        // The closing connection reads from the default handle
        if( !network.empty() && defined.find( Shader::DEFAULT_HANDLE ) == defined.end() )
        {
            CE_CORE_ERROR( "ShaderWriter: No node of the network has the handle '{}'", Shader::DEFAULT_HANDLE );
            return Result::INVALID_ARGS;
        }

        return Result::SUCCESS;
    }

    Result ShaderWriter::Write( Document& document, const ExportState& state, std::string& outHandle )
    {
        outHandle.clear();

        Ref<const ShaderAssignment> network = state.GetShader();
        if( !network )
        {
            return Result::SUCCESS;
        }

        CE_CORE_ASSERT( state.shaders, "ExportState has no shader registry!" );

        std::string hash = HashShaderAssignment( *network );

        // Already written by this or another branch
        if( !state.shaders->Claim( hash ) )
        {
            outHandle = hash;
            return Result::SUCCESS;
        }

        Element block( "shader" );
        block.SetAttribute( "name", hash );

        Result result = Validate( *network );
        if( result == Result::SUCCESS )
        {
            result = WriteNetwork( block, *network );
        }

        if( result != Result::SUCCESS )
        {
            state.shaders->Release( hash );
            return result;
        }

        document.Append( std::move( block ) );
        CE_CORE_DEBUG( "ShaderWriter: Wrote network {} ({} nodes)", hash, network->size() );

        outHandle = hash;
        return Result::SUCCESS;
    }

    Result ShaderWriter::WriteNetwork( Element& block, const ShaderAssignment& network )
    {
        for( const Shader& shader : network )
        {
            const std::string handle = shader.GetHandle();

            // 1. Binary and its interface
            std::filesystem::path binaryPath;
            CE_CHECK( m_searchPath.ResolveShader( shader.name, binaryPath ) );

            ShaderParameterList interfaceParameters;
            CE_CHECK( m_infoCache.GetOrCompute( binaryPath, interfaceParameters ) );

            // 2. Node with its literal parameter values
            {
                Element& node = block.AddChild( "osl_shader" );
                node.SetAttribute( "name", handle );
                node.SetAttribute( "src", binaryPath.generic_string() );

                for( const auto& [ name, value ] : shader.parameters )
                {
                    if( Shader::IsInternalParameter( name ) || Shader::IsLink( value ) )
                        continue;
                    node.SetAttribute( name, ValueToString( value ) );
                }

                // 3. Declared interface
                for( const ShaderParameterInfo& parameter : interfaceParameters )
                {
                    Element& socket = node.AddChild( parameter.direction == ShaderParameterDirection::OUTPUT ? "output" : "input" );
                    socket.SetAttribute( "name", parameter.name );
                    socket.SetAttribute( "type", parameter.type );
                }
            }

            // 4. Connections feeding this node
            for( const auto& [ name, value ] : shader.parameters )
            {
                if( !Shader::IsLink( value ) )
                    continue;

                std::string sourceHandle, sourceParameter;
                if( !ParseLink( *GetString( value ), sourceHandle, sourceParameter ) )
                    return Result::INVALID_ARGS;

                Element& connect = block.AddChild( "connect" );
                connect.SetAttribute( "from", sourceHandle + " " + sourceParameter );
                connect.SetAttribute( "to", handle + " " + name );
            }
        }

        Element& output = block.AddChild( "connect" );
        output.SetAttribute( "from", OUTPUT_SOURCE );
        output.SetAttribute( "to", OUTPUT_TARGET );

        return Result::SUCCESS;
    }
} // namespace CyclesExport
