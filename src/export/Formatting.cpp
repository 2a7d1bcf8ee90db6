#include "export/Formatting.hpp"

#include <iterator>
#include <spdlog/fmt/fmt.h>

namespace CyclesExport
{
    namespace
    {
        // -0 prints as "-0"
        inline float Clean( float v )
        {
            return v == 0.0f ? 0.0f : v;
        }
    } // namespace

    std::string FormatMatrix( const glm::mat4& matrix )
    {
        fmt::memory_buffer out;
        for( int column = 0; column < 4; ++column )
        {
            for( int row = 0; row < 4; ++row )
            {
                if( column || row )
                    out.push_back( ' ' );
                fmt::format_to( std::back_inserter( out ), "{}", Clean( matrix[ column ][ row ] ) );
            }
        }
        return fmt::to_string( out );
    }

    std::string FormatPoints( const std::vector<glm::vec3>& points )
    {
        fmt::memory_buffer out;
        for( size_t i = 0; i < points.size(); ++i )
        {
            if( i > 0 )
                out.push_back( ' ' );
            fmt::format_to( std::back_inserter( out ), "{} {} {}", Clean( points[ i ].x ), Clean( points[ i ].y ), Clean( points[ i ].z ) );
        }
        return fmt::to_string( out );
    }

    std::string FormatInts( const std::vector<int32_t>& values )
    {
        fmt::memory_buffer out;
        for( size_t i = 0; i < values.size(); ++i )
        {
            if( i > 0 )
                out.push_back( ' ' );
            fmt::format_to( std::back_inserter( out ), "{}", values[ i ] );
        }
        return fmt::to_string( out );
    }
} // namespace CyclesExport
