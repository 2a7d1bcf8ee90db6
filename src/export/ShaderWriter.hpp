#pragma once
#include "document/Document.hpp"
#include "export/ExportState.hpp"
#include "shading/ShaderInfo.hpp"
#include "shading/ShaderSearchPath.hpp"
#include <string>

namespace CyclesExport
{
    /**
     * @brief Writes shading networks as <shader> blocks, once per distinct network.
     */
    class ShaderWriter
    {
    public:
        // Socket the last node's closure is wired into.
        static constexpr const char* OUTPUT_SOURCE = "surface Ci";
        static constexpr const char* OUTPUT_TARGET = "output surface";

        ShaderWriter( const ShaderSearchPath& searchPath, ShaderInfoCache& infoCache );

        /**
         * @brief Writes the network inherited by the state, if any.
         * @param outHandle Receives the network's content hash, or an empty string when the state carries no network.
         * A network already registered in state.shaders is not written again; its handle is still returned.
         * On failure nothing is appended to the document.
         */
        Result Write( Document& document, const ExportState& state, std::string& outHandle );

        /**
         * @brief Checks node handles, parameter names and links.
         * Handles must be unique and one node must carry the default handle ("surface"), which feeds the
         * output. Literal parameters may not be called "name" or "src". Every link must read
         * "link:<handle>.<parameter>" and name a node that comes earlier in the network.
         * @return INVALID_ARGS on the first violation.
         */
        static Result Validate( const ShaderAssignment& network );

        // Splits "link:<handle>.<parameter>". Returns false when the value is not a well-formed link.
        static bool ParseLink( const std::string& value, std::string& outHandle, std::string& outParameter );

    private:
        Result WriteNetwork( Element& block, const ShaderAssignment& network );

    private:
        const ShaderSearchPath& m_searchPath;
        ShaderInfoCache&        m_infoCache;
    };
} // namespace CyclesExport
