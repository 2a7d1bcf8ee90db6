#include "scene/SceneTypes.h"

#include "core/Hash.hpp"
#include <spdlog/fmt/fmt.h>

namespace CyclesExport
{
    std::string PathToString( const ScenePath& path )
    {
        if( path.empty() )
        {
            return "/";
        }

        std::string result;
        for( const std::string& segment : path )
        {
            result += '/';
            result += segment;
        }
        return result;
    }

    ScenePath StringToPath( const std::string& path )
    {
        ScenePath result;
        size_t    start = 0;
        while( start <= path.size() )
        {
            size_t end = path.find( '/', start );
            if( end == std::string::npos )
                end = path.size();

            if( end > start )
                result.push_back( path.substr( start, end - start ) );

            start = end + 1;
        }
        return result;
    }

    namespace
    {
        std::string FormatFloats( const float* values, size_t count )
        {
            std::string out;
            for( size_t i = 0; i < count; ++i )
            {
                if( i > 0 )
                    out += ' ';
                out += fmt::format( "{}", values[ i ] );
            }
            return out;
        }

        struct ValueFormatter
        {
            std::string operator()( bool v ) const { return v ? "1" : "0"; }
            std::string operator()( int32_t v ) const { return fmt::format( "{}", v ); }
            std::string operator()( float v ) const { return fmt::format( "{}", v ); }
            std::string operator()( const std::string& v ) const { return v; }
            std::string operator()( const glm::ivec2& v ) const { return fmt::format( "{} {}", v.x, v.y ); }
            std::string operator()( const glm::vec2& v ) const { return FormatFloats( &v.x, 2 ); }
            std::string operator()( const glm::vec3& v ) const { return FormatFloats( &v.x, 3 ); }
            std::string operator()( const glm::vec4& v ) const { return FormatFloats( &v.x, 4 ); }
            std::string operator()( const Color& v ) const { return FormatFloats( &v.value.x, 3 ); }
        };

        struct ValueTypeNamer
        {
            const char* operator()( bool ) const { return "bool"; }
            const char* operator()( int32_t ) const { return "int"; }
            const char* operator()( float ) const { return "float"; }
            const char* operator()( const std::string& ) const { return "string"; }
            const char* operator()( const glm::ivec2& ) const { return "int2"; }
            const char* operator()( const glm::vec2& ) const { return "float2"; }
            const char* operator()( const glm::vec3& ) const { return "vector"; }
            const char* operator()( const glm::vec4& ) const { return "float4"; }
            const char* operator()( const Color& ) const { return "color"; }
        };

        struct ValueHasher
        {
            ContentHasher& h;

            void operator()( bool v ) const { h.Append( v ); }
            void operator()( int32_t v ) const { h.Append( v ); }
            void operator()( float v ) const { h.Append( v ); }
            void operator()( const std::string& v ) const { h.Append( v ); }
            void operator()( const glm::ivec2& v ) const { h.Append( v.x ).Append( v.y ); }
            void operator()( const glm::vec2& v ) const { h.Append( v.x ).Append( v.y ); }
            void operator()( const glm::vec3& v ) const { h.Append( v.x ).Append( v.y ).Append( v.z ); }
            void operator()( const glm::vec4& v ) const { h.Append( v.x ).Append( v.y ).Append( v.z ).Append( v.w ); }
            void operator()( const Color& v ) const { ( *this )( v.value ); }
        };
    } // namespace

    std::string ValueToString( const Value& value )
    {
        return std::visit( ValueFormatter{}, value );
    }

    const char* ValueTypeName( const Value& value )
    {
        return std::visit( ValueTypeNamer{}, value );
    }

    const std::string* GetString( const Value& value )
    {
        return std::get_if<std::string>( &value );
    }

    std::string Shader::GetHandle() const
    {
        auto it = parameters.find( HANDLE_PARAMETER );
        if( it != parameters.end() )
        {
            if( const std::string* handle = GetString( it->second ) )
            {
                if( !handle->empty() )
                    return *handle;
            }
        }
        return DEFAULT_HANDLE;
    }

    bool Shader::IsLink( const Value& value )
    {
        const std::string* str = GetString( value );
        return str && str->rfind( LINK_PREFIX, 0 ) == 0;
    }

    std::string HashShaderAssignment( const ShaderAssignment& network )
    {
        ContentHasher hasher;
        hasher.Append( static_cast<uint64_t>( network.size() ) );

        for( const Shader& shader : network )
        {
            hasher.Append( shader.name );
            hasher.Append( shader.type );
            hasher.Append( static_cast<uint64_t>( shader.parameters.size() ) );

            for( const auto& [ name, value ] : shader.parameters )
            {
                hasher.Append( name );
                hasher.Append( ValueTypeName( value ) );
                std::visit( ValueHasher{ hasher }, value );
            }
        }

        return hasher.ToString();
    }

    bool MeshPrimitive::IsValid() const
    {
        size_t expected = 0;
        for( int32_t count : verticesPerFace )
        {
            if( count < 3 )
                return false;
            expected += static_cast<size_t>( count );
        }

        if( expected != vertexIds.size() )
            return false;

        for( int32_t id : vertexIds )
        {
            if( id < 0 || static_cast<size_t>( id ) >= P.size() )
                return false;
        }
        return true;
    }

    void CameraObject::AddStandardParameters()
    {
        // 1. Resolution first, everything else is derived from it
        auto resIt = parameters.find( "resolution" );
        if( resIt == parameters.end() || !std::holds_alternative<glm::ivec2>( resIt->second ) )
        {
            parameters[ "resolution" ] = glm::ivec2( DEFAULT_WIDTH, DEFAULT_HEIGHT );
        }
        glm::ivec2 resolution = std::get<glm::ivec2>( parameters[ "resolution" ] );

        // 2. Projection
        auto projIt = parameters.find( "projection" );
        if( projIt == parameters.end() || !GetString( projIt->second ) )
        {
            parameters[ "projection" ] = std::string( "perspective" );
        }

        if( *GetString( parameters[ "projection" ] ) == "perspective" )
        {
            auto fovIt = parameters.find( "projection:fov" );
            if( fovIt == parameters.end() || !std::holds_alternative<float>( fovIt->second ) )
            {
                parameters[ "projection:fov" ] = DEFAULT_FOV;
            }
        }

        // 3. Screen window, fit to the aspect ratio along the wider axis
        if( parameters.find( "screenWindow" ) == parameters.end() )
        {
            float aspect = resolution.y > 0 ? static_cast<float>( resolution.x ) / static_cast<float>( resolution.y ) : 1.0f;
            if( aspect >= 1.0f )
                parameters[ "screenWindow" ] = glm::vec4( -aspect, -1.0f, aspect, 1.0f );
            else
                parameters[ "screenWindow" ] = glm::vec4( -1.0f, -1.0f / aspect, 1.0f, 1.0f / aspect );
        }

        // 4. Clipping and shutter
        if( parameters.find( "clippingPlanes" ) == parameters.end() )
        {
            parameters[ "clippingPlanes" ] = glm::vec2( 0.01f, 100000.0f );
        }

        if( parameters.find( "shutter" ) == parameters.end() )
        {
            parameters[ "shutter" ] = glm::vec2( 0.0f, 0.0f );
        }
    }

} // namespace CyclesExport
