#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>

#if defined( _WIN32 ) && defined( CE_SHARED )
#    ifdef CE_BUILD_DLL
#        define CE_API __declspec( dllexport )
#    else
#        define CE_API __declspec( dllimport )
#    endif
#elif defined( CE_SHARED )
#    define CE_API __attribute__( ( visibility( "default" ) ) )
#else
#    define CE_API
#endif

namespace CyclesExport
{
    // Error codes
    enum class Result : int32_t
    {
        SUCCESS      = 0,
        FAIL         = -1,
        INVALID_ARGS = -3,
        NOT_FOUND    = -5,
        IO_ERROR     = -6,
    };

    inline std::string_view toString( Result result )
    {
        switch( result )
        {
            case Result::SUCCESS:
                return "SUCCESS";
            case Result::FAIL:
                return "FAIL";
            case Result::INVALID_ARGS:
                return "INVALID_ARGS";
            case Result::NOT_FOUND:
                return "NOT_FOUND";
            case Result::IO_ERROR:
                return "IO_ERROR";
            default:
                return "UNKNOWN";
        }
    }

    template<typename T>
    using Scope = std::unique_ptr<T>;

    template<typename T, typename... Args>
    constexpr Scope<T> CreateScope( Args&&... args )
    {
        return std::make_unique<T>( std::forward<Args>( args )... );
    }

    template<typename T>
    using Ref = std::shared_ptr<T>;

    template<typename T, typename... Args>
    constexpr Ref<T> CreateRef( Args&&... args )
    {
        return std::make_shared<T>( std::forward<Args>( args )... );
    }
} // namespace CyclesExport
