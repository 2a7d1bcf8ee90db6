#include "core/FileSystem.h"

#include "core/Base.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <system_error>

namespace CyclesExport
{

    Result FileSystem::CreateDirectories( const std::filesystem::path& directory )
    {
        if( directory.empty() )
        {
            return Result::SUCCESS;
        }

        std::error_code ec;
        std::filesystem::create_directories( directory, ec );

        // create_directories reports an error if a racing writer made the last component first,
        // so the outcome is judged by what exists afterwards.
        if( ec && !std::filesystem::is_directory( directory ) )
        {
            CE_CORE_ERROR( "FileSystem: Failed to create directory '{}': {}", directory.generic_string(), ec.message() );
            return Result::FAIL;
        }

        if( !std::filesystem::is_directory( directory ) )
        {
            CE_CORE_ERROR( "FileSystem: '{}' exists and is not a directory", directory.generic_string() );
            return Result::FAIL;
        }

        return Result::SUCCESS;
    }

    Result FileSystem::WriteFile( const std::filesystem::path& path, const std::string& content )
    {
        if( path.empty() )
        {
            return Result::INVALID_ARGS;
        }

        CE_CHECK( CreateDirectories( path.parent_path() ) );

        std::filesystem::path tempPath = path;
        tempPath += ".tmp";

        {
            std::ofstream out( tempPath, std::ios::out | std::ios::binary | std::ios::trunc );
            if( !out )
            {
                CE_CORE_ERROR( "FileSystem: Failed to open '{}' for writing", tempPath.generic_string() );
                return Result::IO_ERROR;
            }

            out.write( content.data(), static_cast<std::streamsize>( content.size() ) );
            out.flush();
            if( !out )
            {
                CE_CORE_ERROR( "FileSystem: Failed to write '{}'", tempPath.generic_string() );
                out.close();
                std::error_code ignored;
                std::filesystem::remove( tempPath, ignored );
                return Result::IO_ERROR;
            }
        }

        std::error_code ec;
        std::filesystem::rename( tempPath, path, ec );
        if( ec )
        {
            CE_CORE_ERROR( "FileSystem: Failed to move '{}' into place: {}", path.generic_string(), ec.message() );
            std::error_code ignored;
            std::filesystem::remove( tempPath, ignored );
            return Result::IO_ERROR;
        }

        CE_CORE_TRACE( "FileSystem: Wrote {} bytes to '{}'", content.size(), path.generic_string() );
        return Result::SUCCESS;
    }

    std::string FileSystem::SubstitutePath( const std::string& path, int32_t frame, const std::map<std::string, std::string>& variables )
    {
        auto lookup = [ & ]( const std::string& name ) -> std::string {
            auto it = variables.find( name );
            if( it != variables.end() )
                return it->second;
            if( name == "frame" )
                return std::to_string( frame );
            return {};
        };

        std::string result;
        result.reserve( path.size() );

        size_t i = 0;

        // 1. Home directory
        if( path.size() >= 2 && path[ 0 ] == '~' && path[ 1 ] == '/' )
        {
            const char* home = std::getenv( "HOME" );
            if( home )
            {
                result += home;
                i = 1;
            }
        }

        // 2. Variables and frame padding
        while( i < path.size() )
        {
            char c = path[ i ];
            if( c == '$' && i + 1 < path.size() )
            {
                if( path[ i + 1 ] == '{' )
                {
                    size_t close = path.find( '}', i + 2 );
                    if( close != std::string::npos )
                    {
                        result += lookup( path.substr( i + 2, close - i - 2 ) );
                        i = close + 1;
                        continue;
                    }
                }
                else if( std::isalpha( static_cast<unsigned char>( path[ i + 1 ] ) ) || path[ i + 1 ] == '_' )
                {
                    size_t end = i + 1;
                    while( end < path.size() && ( std::isalnum( static_cast<unsigned char>( path[ end ] ) ) || path[ end ] == '_' ) )
                        ++end;
                    result += lookup( path.substr( i + 1, end - i - 1 ) );
                    i = end;
                    continue;
                }
            }
            else if( c == '#' )
            {
                size_t end = i;
                while( end < path.size() && path[ end ] == '#' )
                    ++end;

                // Magnitude in unsigned arithmetic, INT32_MIN has no positive int32_t counterpart
                const uint32_t magnitude = frame < 0 ? 0u - static_cast<uint32_t>( frame ) : static_cast<uint32_t>( frame );
                std::string    number    = std::to_string( magnitude );
                size_t      width  = end - i;
                if( frame < 0 )
                    result += '-';
                if( number.size() < width )
                    result.append( width - number.size(), '0' );
                result += number;
                i = end;
                continue;
            }

            result += c;
            ++i;
        }

        return result;
    }

} // namespace CyclesExport
