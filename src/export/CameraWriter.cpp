#include "export/CameraWriter.hpp"

#include "export/Formatting.hpp"
#include <glm/gtc/matrix_transform.hpp>
#include <spdlog/fmt/fmt.h>

namespace CyclesExport
{
    ResolvedCamera CameraWriter::Resolve( const SceneSource& source, const Parameters& globals )
    {
        ResolvedCamera resolved;
        CameraObject   camera;

        // 1. Camera object named by the globals
        auto cameraIt = globals.find( GLOBAL_CAMERA );
        if( cameraIt != globals.end() )
        {
            const std::string* cameraPath = GetString( cameraIt->second );
            if( cameraPath && !cameraPath->empty() )
            {
                ScenePath         path   = StringToPath( *cameraPath );
                Ref<const Object> object = source.GetObject( path );
                if( object && object->GetType() == ObjectType::CAMERA )
                {
                    camera.parameters  = static_cast<const CameraObject&>( *object ).parameters;
                    resolved.transform = source.FullTransform( path );
                    resolved.isDefault = false;
                }
                else
                {
                    CE_CORE_WARN( "CameraWriter: '{}' is not a camera, using the default camera", *cameraPath );
                }
            }
        }

        // 2. Resolution override, then derived parameters
        auto resolutionIt = globals.find( GLOBAL_RESOLUTION );
        if( resolutionIt != globals.end() )
        {
            if( const glm::ivec2* resolution = std::get_if<glm::ivec2>( &resolutionIt->second ) )
            {
                camera.parameters[ "resolution" ] = *resolution;
            }
            else
            {
                CE_CORE_WARN( "CameraWriter: '{}' must be an int2, got {}", GLOBAL_RESOLUTION, ValueTypeName( resolutionIt->second ) );
            }
        }

        camera.AddStandardParameters();

        // 3. Description
        CameraDescription& desc = resolved.description;
        desc.resolution         = std::get<glm::ivec2>( camera.parameters[ "resolution" ] );
        desc.projection         = *GetString( camera.parameters[ "projection" ] );
        if( desc.IsPerspective() )
        {
            desc.fov = std::get<float>( camera.parameters[ "projection:fov" ] );
        }
        if( const glm::vec2* clipping = std::get_if<glm::vec2>( &camera.parameters[ "clippingPlanes" ] ) )
        {
            desc.clippingPlanes = *clipping;
        }
        if( const glm::vec4* window = std::get_if<glm::vec4>( &camera.parameters[ "screenWindow" ] ) )
        {
            desc.screenWindow = *window;
        }

        // 4. Coordinate convention
        resolved.transform = glm::scale( resolved.transform, glm::vec3( 1.0f, 1.0f, -1.0f ) );

        return resolved;
    }

    Element& CameraWriter::Write( Document& document, const ResolvedCamera& camera )
    {
        const CameraDescription& desc = camera.description;

        Element& transform = document.Append( "transform" );
        transform.SetAttribute( "matrix", FormatMatrix( camera.transform ) );

        Element& element = transform.AddChild( "camera" );
        element.SetAttribute( "width", fmt::format( "{}", desc.resolution.x ) );
        element.SetAttribute( "height", fmt::format( "{}", desc.resolution.y ) );

        if( desc.IsPerspective() )
        {
            element.SetAttribute( "type", "perspective" );
            element.SetAttribute( "fov", fmt::format( "{:f}", desc.fov ) );
        }
        else
        {
            element.SetAttribute( "type", "orthographic" );
        }

        CE_CORE_DEBUG( "CameraWriter: {}x{} {}{}", desc.resolution.x, desc.resolution.y, desc.projection, camera.isDefault ? " (default)" : "" );
        return transform;
    }
} // namespace CyclesExport
