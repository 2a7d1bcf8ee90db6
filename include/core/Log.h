#pragma once

#include "core/Core.h"
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace CyclesExport
{

    class CE_API Log
    {
    public:
        static void Init();

        /**
         * @brief Applies a spdlog level name ("trace", "debug", "info", "warn", "error", "critical", "off")
         * to both loggers. Unknown names leave the level untouched and return false.
         */
        static bool SetLevel( const std::string& levelName );

        inline static std::shared_ptr<spdlog::logger>& GetCoreLogger() { return s_coreLogger; }
        inline static std::shared_ptr<spdlog::logger>& GetClientLogger() { return s_clientLogger; }

    private:
        static std::shared_ptr<spdlog::logger> s_coreLogger;
        static std::shared_ptr<spdlog::logger> s_clientLogger;
    };

} // namespace CyclesExport

// Core Logging (library internals)
#define CE_CORE_TRACE( ... )    ::CyclesExport::Log::GetCoreLogger()->trace( __VA_ARGS__ )
#define CE_CORE_DEBUG( ... )    ::CyclesExport::Log::GetCoreLogger()->debug( __VA_ARGS__ )
#define CE_CORE_INFO( ... )     ::CyclesExport::Log::GetCoreLogger()->info( __VA_ARGS__ )
#define CE_CORE_WARN( ... )     ::CyclesExport::Log::GetCoreLogger()->warn( __VA_ARGS__ )
#define CE_CORE_ERROR( ... )    ::CyclesExport::Log::GetCoreLogger()->error( __VA_ARGS__ )
#define CE_CORE_CRITICAL( ... ) ::CyclesExport::Log::GetCoreLogger()->critical( __VA_ARGS__ )

// Client Logging (applications)
#define CE_TRACE( ... )    ::CyclesExport::Log::GetClientLogger()->trace( __VA_ARGS__ )
#define CE_INFO( ... )     ::CyclesExport::Log::GetClientLogger()->info( __VA_ARGS__ )
#define CE_WARN( ... )     ::CyclesExport::Log::GetClientLogger()->warn( __VA_ARGS__ )
#define CE_ERROR( ... )    ::CyclesExport::Log::GetClientLogger()->error( __VA_ARGS__ )
#define CE_CRITICAL( ... ) ::CyclesExport::Log::GetClientLogger()->critical( __VA_ARGS__ )
