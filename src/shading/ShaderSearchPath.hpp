#pragma once
#include "core/Base.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace CyclesExport
{
    /**
     * @brief Ordered list of directories searched for compiled shaders.
     */
    class ShaderSearchPath
    {
    public:
        // Name of the environment variable read by FromEnvironment().
        static constexpr const char* ENVIRONMENT_VARIABLE = "OSL_SHADER_PATHS";

        ShaderSearchPath() = default;

        /**
         * @param paths Colon-delimited directory list. Empty entries are skipped.
         * @param extension Appended to shader names by ResolveShader (e.g. ".oso").
         */
        explicit ShaderSearchPath( const std::string& paths, std::string extension = ".oso" );

        static ShaderSearchPath FromEnvironment( std::string extension = ".oso" );

        /**
         * @brief Returns the first existing regular file named fileName in the search directories,
         * or an empty path when there is none.
         */
        std::filesystem::path Find( const std::string& fileName ) const;

        /**
         * @brief Locates the compiled binary for a shader name.
         * @return NOT_FOUND (and logs) when no directory holds <name><extension>.
         */
        Result ResolveShader( const std::string& shaderName, std::filesystem::path& outPath ) const;

        const std::vector<std::filesystem::path>& GetDirectories() const { return m_directories; }
        const std::string&                        GetExtension() const { return m_extension; }

    private:
        std::vector<std::filesystem::path> m_directories;
        std::string                        m_extension = ".oso";
    };
} // namespace CyclesExport
