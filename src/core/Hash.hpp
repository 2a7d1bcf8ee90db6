#pragma once
#include <cstdint>
#include <cstring>
#include <spdlog/fmt/fmt.h>
#include <string>
#include <string_view>

namespace CyclesExport
{
    /**
     * @brief Incremental 64-bit FNV-1a hasher.
     * The digest depends only on the appended bytes, so it is stable across runs and platforms
     * (unlike std::hash) and can be written into output files.
     */
    class ContentHasher
    {
    public:
        static constexpr uint64_t OFFSET_BASIS = 14695981039346656037ULL;
        static constexpr uint64_t PRIME        = 1099511628211ULL;

        ContentHasher& Append( const void* data, size_t sizeBytes )
        {
            const auto* p = static_cast<const unsigned char*>( data );
            for( size_t i = 0; i < sizeBytes; ++i )
            {
                m_value ^= static_cast<uint64_t>( p[ i ] );
                m_value *= PRIME;
            }
            return *this;
        }

        // Length-prefixed so that ("ab","c") and ("a","bc") differ
        ContentHasher& Append( std::string_view str )
        {
            Append( static_cast<uint64_t>( str.size() ) );
            return Append( str.data(), str.size() );
        }

        ContentHasher& Append( const char* str ) { return Append( std::string_view( str ) ); }
        ContentHasher& Append( const std::string& str ) { return Append( std::string_view( str ) ); }

        ContentHasher& Append( uint64_t v )
        {
            unsigned char bytes[ 8 ];
            for( int i = 0; i < 8; ++i )
                bytes[ i ] = static_cast<unsigned char>( ( v >> ( i * 8 ) ) & 0xFF );
            return Append( bytes, sizeof( bytes ) );
        }

        ContentHasher& Append( int32_t v ) { return Append( static_cast<uint64_t>( static_cast<uint32_t>( v ) ) ); }

        ContentHasher& Append( float v )
        {
            // Collapse -0.0 onto 0.0 so equal values hash equally
            if( v == 0.0f )
                v = 0.0f;
            uint32_t bits;
            std::memcpy( &bits, &v, sizeof( bits ) );
            return Append( static_cast<uint64_t>( bits ) );
        }

        ContentHasher& Append( bool v ) { return Append( static_cast<uint64_t>( v ? 1 : 0 ) ); }

        uint64_t GetValue() const { return m_value; }

        // 16 lowercase hex digits
        std::string ToString() const { return fmt::format( "{:016x}", m_value ); }

    private:
        uint64_t m_value = OFFSET_BASIS;
    };
} // namespace CyclesExport
