#pragma once
#include "core/Base.hpp"
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace CyclesExport
{
    enum class ShaderParameterDirection
    {
        INPUT,
        OUTPUT,
    };

    // One entry of a compiled shader's declared interface.
    struct ShaderParameterInfo
    {
        ShaderParameterDirection direction = ShaderParameterDirection::INPUT;
        std::string              name;
        std::string              type; // "float", "color", "closure color", ...

        bool operator==( const ShaderParameterInfo& other ) const
        {
            return direction == other.direction && name == other.name && type == other.type;
        }
    };

    using ShaderParameterList = std::vector<ShaderParameterInfo>;

    /**
     * @brief Parses introspection text into a parameter list.
     * Lines are classified by their leading token:
     * - "surface": the shader's closure output, declared as output "Ci" of type "closure color".
     * - "output <type> <name>": an output.
     * - "<type> <name>" with a primitive type (float int color point vector normal string matrix, or "closure color"): an input.
     * - "\"name\" \"type\"" / "\"name\" \"output type\"" (oslinfo's own layout): classified by the leading token of the type.
     * Everything else is ignored.
     */
    ShaderParameterList ParseShaderInfo( const std::string& text );

    /**
     * @brief Source of a compiled shader's interface description.
     */
    class ShaderIntrospector
    {
    public:
        virtual ~ShaderIntrospector() = default;

        // Produces the raw introspection text for a binary.
        virtual Result Introspect( const std::filesystem::path& binaryPath, std::string& outText ) = 0;
    };

    /**
     * @brief Runs an external tool ("oslinfo" by default) on the binary and captures its stdout.
     */
    class OslInfoIntrospector : public ShaderIntrospector
    {
    public:
        explicit OslInfoIntrospector( std::string command = "oslinfo" );

        Result Introspect( const std::filesystem::path& binaryPath, std::string& outText ) override;

        const std::string& GetCommand() const { return m_command; }

    private:
        std::string m_command;
    };

    /**
     * @brief Lazily populated map from binary path to parameter list.
     * Entries are never invalidated: compiled shaders do not change during an export session.
     * Safe to share between threads; each path is introspected at most once on success.
     */
    class ShaderInfoCache
    {
    public:
        explicit ShaderInfoCache( Ref<ShaderIntrospector> introspector );

        /**
         * @brief Returns the cached interface, introspecting on first use.
         * Failures are returned and not cached.
         */
        Result GetOrCompute( const std::filesystem::path& binaryPath, ShaderParameterList& outParameters );

        bool   Contains( const std::filesystem::path& binaryPath ) const;
        size_t GetSize() const;
        void   Clear();

    private:
        Ref<ShaderIntrospector> m_introspector;

        mutable std::mutex                                   m_mutex;
        std::unordered_map<std::string, ShaderParameterList> m_entries;
    };
} // namespace CyclesExport
