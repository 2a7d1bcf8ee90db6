#pragma once

#include "core/Core.h"
#include <map>
#include <string>

namespace CyclesExport
{
    class Log;
    class FileSystem;
    class SceneSource;

    struct ExportConfig
    {
        // Target document. May contain ${variables} and '#' frame padding. Empty means "do not export".
        std::string outputPath;

        // Colon-delimited shader directories. Empty means read OSL_SHADER_PATHS from the environment.
        std::string shaderSearchPath;
        std::string shaderExtension = ".oso";

        // Tool printing a compiled shader's parameters; invoked as: <command> '<binary>'
        std::string introspectionCommand = "oslinfo";

        std::string logLevel = "info";
    };

    /**
     * @brief Per-execution values substituted into the output path.
     */
    struct ExportContext
    {
        int32_t                            frame = 1;
        std::map<std::string, std::string> variables;
    };

} // namespace CyclesExport
