#pragma once

#include "core/Core.h"
#include "core/Log.h"

#if defined( _MSC_VER )
#    define CE_DEBUGBREAK() __debugbreak()
#elif defined( __linux__ ) || defined( __APPLE__ )
#    include <signal.h>
#    define CE_DEBUGBREAK() raise( SIGTRAP )
#else
#    define CE_DEBUGBREAK()
#endif

#ifdef CE_DEBUG
#    define CE_ENABLE_ASSERTS
#endif

#ifdef CE_ENABLE_ASSERTS
#    define CE_CORE_ASSERT( x, ... )                                                                                                                 \
        {                                                                                                                                            \
            if( !( x ) )                                                                                                                             \
            {                                                                                                                                        \
                CE_CORE_ERROR( "Assertion Failed: {0}", __VA_ARGS__ );                                                                               \
                CE_DEBUGBREAK();                                                                                                                     \
            }                                                                                                                                        \
        }
#else
#    define CE_CORE_ASSERT( x, ... )
#endif

// Evaluates a Result expression and returns it from the enclosing function on failure.
#define CE_CHECK( x )                                                                                                                                \
    {                                                                                                                                                \
        ::CyclesExport::Result ce_check_result_ = ( x );                                                                                             \
        if( ce_check_result_ != ::CyclesExport::Result::SUCCESS )                                                                                    \
        {                                                                                                                                            \
            return ce_check_result_;                                                                                                                 \
        }                                                                                                                                            \
    }
