#include "core/Base.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace CyclesExport
{

    Ref<spdlog::logger> Log::s_coreLogger   = nullptr;
    Ref<spdlog::logger> Log::s_clientLogger = nullptr;

    void Log::Init()
    {
        if( s_coreLogger != nullptr )
        {
            return;
        }

        spdlog::set_pattern( "%^[%T] %n: %v%$" );

        // Reuse loggers registered by a previous instance of the library (e.g. a second test binary init)
        s_coreLogger   = spdlog::get( "CORE" );
        s_clientLogger = spdlog::get( "CLIENT" );
        if( !s_coreLogger )
            s_coreLogger = spdlog::stdout_color_mt( "CORE" );
        if( !s_clientLogger )
            s_clientLogger = spdlog::stdout_color_mt( "CLIENT" );

        s_coreLogger->set_level( spdlog::level::info );
        s_clientLogger->set_level( spdlog::level::info );

        CE_CORE_INFO( "Logging system initialized." );
    }

    bool Log::SetLevel( const std::string& levelName )
    {
        Init();

        spdlog::level::level_enum level = spdlog::level::from_str( levelName );

        // from_str maps unknown names to "off", so only accept "off" when it was asked for
        if( level == spdlog::level::off && levelName != "off" )
        {
            CE_CORE_WARN( "Unknown log level '{}', keeping '{}'", levelName, spdlog::level::to_string_view( s_coreLogger->level() ) );
            return false;
        }

        s_coreLogger->set_level( level );
        s_clientLogger->set_level( level );
        return true;
    }

} // namespace CyclesExport
