#pragma once
#include "document/Document.hpp"
#include "export/CameraWriter.hpp"
#include "export/ShaderWriter.hpp"
#include "scene/SceneSource.h"

namespace CyclesExport
{
    /**
     * @brief Assembles a complete scene document: camera, background, then the traversal output.
     */
    class SceneWriter
    {
    public:
        SceneWriter( const ShaderSearchPath& searchPath, ShaderInfoCache& infoCache );

        /**
         * @brief Writes the whole scene into an empty document.
         * Shader networks are deduplicated per document.
         */
        Result Write( const SceneSource& source, Document& document );

        // Constant grey environment wired to the output surface.
        static Element& WriteBackground( Document& document );

    private:
        ShaderWriter m_shaderWriter;
    };
} // namespace CyclesExport
