#pragma once
#include "scene/SceneTypes.h"
#include <glm/glm.hpp>

namespace CyclesExport
{
    /**
     * @brief Read-only view of a hierarchical scene.
     * Every query addresses a location by path. Implementations must return children in a stable order,
     * since traversal order is output order.
     */
    class CE_API SceneSource
    {
    public:
        virtual ~SceneSource() = default;

        // Local transform of the location (identity for the root).
        virtual glm::mat4 Transform( const ScenePath& path ) const = 0;

        /**
         * @brief World transform of the location.
         * The default composes Transform() over every prefix of the path, parent first.
         */
        virtual glm::mat4 FullTransform( const ScenePath& path ) const;

        // Object at the location, or nullptr.
        virtual Ref<const Object> GetObject( const ScenePath& path ) const = 0;

        // Attributes assigned directly at the location (not inherited).
        virtual Attributes GetAttributes( const ScenePath& path ) const = 0;

        virtual std::vector<std::string> ChildNames( const ScenePath& path ) const = 0;

        virtual Parameters Globals() const = 0;
    };
} // namespace CyclesExport
