#pragma once
#include "document/Document.hpp"
#include "scene/SceneSource.h"
#include <glm/glm.hpp>
#include <string>

namespace CyclesExport
{
    struct CameraDescription
    {
        glm::ivec2  resolution = glm::ivec2( CameraObject::DEFAULT_WIDTH, CameraObject::DEFAULT_HEIGHT );
        std::string projection = "perspective";
        float       fov        = CameraObject::DEFAULT_FOV;
        glm::vec2   clippingPlanes{ 0.01f, 100000.0f };
        glm::vec4   screenWindow{ -1.0f, -1.0f, 1.0f, 1.0f };

        bool IsPerspective() const { return projection == "perspective"; }
    };

    struct ResolvedCamera
    {
        CameraDescription description;
        glm::mat4         transform = glm::mat4( 1.0f ); // World transform, Z already flipped
        bool              isDefault = true;              // No camera object was found at render:camera
    };

    /**
     * @brief Resolves the render camera from the globals and writes the camera block.
     */
    class CameraWriter
    {
    public:
        /**
         * @brief Picks the camera named by "render:camera".
         * Falls back to a default camera (identity transform) when the global is missing or the location
         * does not hold a camera. "render:resolution" overrides the resolution before defaults are derived.
         * The world transform is always scaled by (1, 1, -1): the renderer looks down +Z, the scene's cameras down -Z.
         */
        static ResolvedCamera Resolve( const SceneSource& source, const Parameters& globals );

        // <transform matrix="..."><camera width height type [fov] /></transform>
        static Element& Write( Document& document, const ResolvedCamera& camera );
    };
} // namespace CyclesExport
