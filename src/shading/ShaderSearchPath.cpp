#include "shading/ShaderSearchPath.hpp"

#include <cstdlib>
#include <system_error>

namespace CyclesExport
{
    ShaderSearchPath::ShaderSearchPath( const std::string& paths, std::string extension )
        : m_extension( std::move( extension ) )
    {
        size_t start = 0;
        while( start <= paths.size() )
        {
            size_t end = paths.find( ':', start );
            if( end == std::string::npos )
                end = paths.size();

            if( end > start )
                m_directories.emplace_back( paths.substr( start, end - start ) );

            start = end + 1;
        }
    }

    ShaderSearchPath ShaderSearchPath::FromEnvironment( std::string extension )
    {
        const char* value = std::getenv( ENVIRONMENT_VARIABLE );
        if( !value )
        {
            CE_CORE_WARN( "ShaderSearchPath: {} is not set, shaders cannot be resolved", ENVIRONMENT_VARIABLE );
            return ShaderSearchPath( std::string(), std::move( extension ) );
        }
        return ShaderSearchPath( value, std::move( extension ) );
    }

    std::filesystem::path ShaderSearchPath::Find( const std::string& fileName ) const
    {
        for( const std::filesystem::path& directory : m_directories )
        {
            std::filesystem::path candidate = directory / fileName;

            std::error_code ec;
            if( std::filesystem::is_regular_file( candidate, ec ) )
            {
                return candidate;
            }
        }
        return {};
    }

    Result ShaderSearchPath::ResolveShader( const std::string& shaderName, std::filesystem::path& outPath ) const
    {
        outPath = Find( shaderName + m_extension );
        if( outPath.empty() )
        {
            CE_CORE_ERROR( "ShaderSearchPath: Shader '{}{}' not found in {} search directories", shaderName, m_extension, m_directories.size() );
            return Result::NOT_FOUND;
        }

        CE_CORE_TRACE( "ShaderSearchPath: '{}' -> '{}'", shaderName, outPath.generic_string() );
        return Result::SUCCESS;
    }
} // namespace CyclesExport
