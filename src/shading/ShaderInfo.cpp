#include "shading/ShaderInfo.hpp"

#include <array>
#include <cctype>
#include <cstdio>
#include <sys/wait.h>

namespace CyclesExport
{
    namespace
    {
        const std::array<const char*, 8> PRIMITIVE_TYPES = { "float", "int", "color", "point", "vector", "normal", "string", "matrix" };

        bool IsPrimitiveType( const std::string& token )
        {
            for( const char* type : PRIMITIVE_TYPES )
            {
                if( token == type )
                    return true;
            }
            return false;
        }

        // Whitespace separated tokens; a double-quoted run is one token with the quotes removed.
        std::vector<std::string> Tokenize( const std::string& line )
        {
            std::vector<std::string> tokens;
            size_t                   i = 0;
            while( i < line.size() )
            {
                if( std::isspace( static_cast<unsigned char>( line[ i ] ) ) )
                {
                    ++i;
                    continue;
                }

                if( line[ i ] == '"' )
                {
                    size_t close = line.find( '"', i + 1 );
                    if( close == std::string::npos )
                        close = line.size();
                    tokens.push_back( line.substr( i + 1, close - i - 1 ) );
                    i = close + 1;
                    continue;
                }

                size_t end = i;
                while( end < line.size() && !std::isspace( static_cast<unsigned char>( line[ end ] ) ) )
                    ++end;
                tokens.push_back( line.substr( i, end - i ) );
                i = end;
            }
            return tokens;
        }

        /**
         * Reads "<type> <name>" starting at index, where type may be the two words "closure color".
         * Returns false when the tokens do not form a known type followed by a name.
         */
        bool ReadTypeAndName( const std::vector<std::string>& tokens, size_t index, std::string& outType, std::string& outName )
        {
            if( index >= tokens.size() )
                return false;

            if( tokens[ index ] == "closure" )
            {
                if( index + 2 >= tokens.size() || tokens[ index + 1 ] != "color" )
                    return false;
                outType = "closure color";
                outName = tokens[ index + 2 ];
                return true;
            }

            if( tokens[ index ] == "closure color" && index + 1 < tokens.size() )
            {
                outType = tokens[ index ];
                outName = tokens[ index + 1 ];
                return true;
            }

            if( !IsPrimitiveType( tokens[ index ] ) || index + 1 >= tokens.size() )
                return false;

            outType = tokens[ index ];
            outName = tokens[ index + 1 ];
            return true;
        }

        // oslinfo's own layout: "name" "type" or "name" "output type".
        bool ReadNativeParameter( const std::vector<std::string>& tokens, ShaderParameterInfo& out )
        {
            if( tokens.size() != 2 )
                return false;

            std::vector<std::string> typeTokens = Tokenize( tokens[ 1 ] );
            if( typeTokens.empty() )
                return false;

            size_t typeIndex = 0;
            out.direction    = ShaderParameterDirection::INPUT;
            if( typeTokens[ 0 ] == "output" )
            {
                out.direction = ShaderParameterDirection::OUTPUT;
                typeIndex     = 1;
            }

            if( typeIndex >= typeTokens.size() )
                return false;

            if( typeTokens[ typeIndex ] == "closure" )
            {
                if( typeIndex + 1 >= typeTokens.size() || typeTokens[ typeIndex + 1 ] != "color" )
                    return false;
                out.type = "closure color";
            }
            else if( IsPrimitiveType( typeTokens[ typeIndex ] ) && typeIndex + 1 == typeTokens.size() )
            {
                out.type = typeTokens[ typeIndex ];
            }
            else
            {
                return false;
            }

            out.name = tokens[ 0 ];
            return !out.name.empty();
        }
    } // namespace

    ShaderParameterList ParseShaderInfo( const std::string& text )
    {
        ShaderParameterList parameters;

        size_t start = 0;
        while( start < text.size() )
        {
            size_t end = text.find( '\n', start );
            if( end == std::string::npos )
                end = text.size();

            std::vector<std::string> tokens = Tokenize( text.substr( start, end - start ) );
            start                           = end + 1;

            if( tokens.empty() )
                continue;

            const std::string& leading = tokens[ 0 ];

            ShaderParameterInfo info;
            if( leading == "surface" )
            {
                info.direction = ShaderParameterDirection::OUTPUT;
                info.name      = "Ci";
                info.type      = "closure color";
                parameters.push_back( info );
            }
            else if( leading == "output" )
            {
                info.direction = ShaderParameterDirection::OUTPUT;
                if( ReadTypeAndName( tokens, 1, info.type, info.name ) )
                    parameters.push_back( info );
            }
            else if( IsPrimitiveType( leading ) || leading == "closure" )
            {
                info.direction = ShaderParameterDirection::INPUT;
                if( ReadTypeAndName( tokens, 0, info.type, info.name ) )
                    parameters.push_back( info );
            }
            else if( ReadNativeParameter( tokens, info ) )
            {
                parameters.push_back( info );
            }
        }

        return parameters;
    }

    // --- OslInfoIntrospector ---

    OslInfoIntrospector::OslInfoIntrospector( std::string command )
        : m_command( std::move( command ) )
    {
    }

    Result OslInfoIntrospector::Introspect( const std::filesystem::path& binaryPath, std::string& outText )
    {
        outText.clear();

        // Single-quote the path for the shell
        std::string quoted = "'";
        for( char c : binaryPath.string() )
        {
            if( c == '\'' )
                quoted += "'\\''";
            else
                quoted += c;
        }
        quoted += "'";

        std::string commandLine = m_command + " " + quoted;
        CE_CORE_TRACE( "OslInfoIntrospector: Running '{}'", commandLine );

        FILE* pipe = popen( commandLine.c_str(), "r" );
        if( !pipe )
        {
            CE_CORE_ERROR( "OslInfoIntrospector: Failed to launch '{}'", commandLine );
            return Result::FAIL;
        }

        std::array<char, 4096> buffer;
        size_t                 read = 0;
        while( ( read = fread( buffer.data(), 1, buffer.size(), pipe ) ) > 0 )
        {
            outText.append( buffer.data(), read );
        }

        int status = pclose( pipe );
        if( status == -1 || !WIFEXITED( status ) || WEXITSTATUS( status ) != 0 )
        {
            CE_CORE_ERROR( "OslInfoIntrospector: '{}' failed (status {})", commandLine, status );
            outText.clear();
            return Result::FAIL;
        }

        return Result::SUCCESS;
    }

    // --- ShaderInfoCache ---

    ShaderInfoCache::ShaderInfoCache( Ref<ShaderIntrospector> introspector )
        : m_introspector( std::move( introspector ) )
    {
        CE_CORE_ASSERT( m_introspector, "ShaderInfoCache requires an introspector!" );
    }

    Result ShaderInfoCache::GetOrCompute( const std::filesystem::path& binaryPath, ShaderParameterList& outParameters )
    {
        const std::string key = binaryPath.generic_string();

        // Held across introspection so concurrent callers for the same path wait for one result
        std::lock_guard<std::mutex> lock( m_mutex );

        auto it = m_entries.find( key );
        if( it != m_entries.end() )
        {
            outParameters = it->second;
            return Result::SUCCESS;
        }

        if( !m_introspector )
        {
            return Result::FAIL;
        }

        std::string text;
        CE_CHECK( m_introspector->Introspect( binaryPath, text ) );

        ShaderParameterList parameters = ParseShaderInfo( text );
        CE_CORE_DEBUG( "ShaderInfoCache: '{}' declares {} parameters", key, parameters.size() );

        outParameters = parameters;
        m_entries.emplace( key, std::move( parameters ) );
        return Result::SUCCESS;
    }

    bool ShaderInfoCache::Contains( const std::filesystem::path& binaryPath ) const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        return m_entries.find( binaryPath.generic_string() ) != m_entries.end();
    }

    size_t ShaderInfoCache::GetSize() const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        return m_entries.size();
    }

    void ShaderInfoCache::Clear()
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        m_entries.clear();
    }
} // namespace CyclesExport
