#pragma once
#include "document/Document.hpp"
#include "export/ExportState.hpp"
#include "export/ShaderWriter.hpp"
#include "scene/SceneSource.h"

namespace CyclesExport
{
    /**
     * @brief Depth-first, pre-order traversal of a scene into a document.
     * At each location: derive the state, write the location's object, then visit children in ChildNames() order.
     */
    class SceneWalker
    {
    public:
        SceneWalker( const SceneSource& source, Document& document, ShaderWriter& shaderWriter );

        /**
         * @brief Visits the location and its whole subtree.
         * @param state State inherited from the parent (the root takes a fresh state).
         * @return The first failure, which stops the traversal.
         */
        Result Walk( const ScenePath& path, const ExportState& state );

        size_t GetLocationCount() const { return m_locationCount; }
        size_t GetMeshCount() const { return m_meshCount; }

    private:
        Result WriteObject( const ScenePath& path, const ExportState& state, const Object& object );

    private:
        const SceneSource& m_source;
        Document&          m_document;
        ShaderWriter&      m_shaderWriter;

        size_t m_locationCount = 0;
        size_t m_meshCount     = 0;
    };
} // namespace CyclesExport
