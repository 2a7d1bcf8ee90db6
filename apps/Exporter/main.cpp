#include <CyclesExport.h>
#include <core/Log.h>
#include <glm/gtc/matrix_transform.hpp>
#include <scene/MemoryScene.h>
#include <scene/ShapeGenerator.h>
#include <cstdlib>
#include <string>
#include <vector>

using namespace CyclesExport;

namespace
{
    void BuildDemoScene( MemoryScene& scene, bool withShaders )
    {
        // Camera looking at the origin from +Z
        auto camera                            = CreateRef<CameraObject>();
        camera->parameters[ "projection" ]     = std::string( "perspective" );
        camera->parameters[ "projection:fov" ] = 45.0f;
        scene.SetObject( "/world/camera", camera );
        scene.SetTransform( "/world/camera", glm::translate( glm::mat4( 1.0f ), glm::vec3( 0.0f, 1.0f, 8.0f ) ) );

        scene.SetGlobal( GLOBAL_CAMERA, std::string( "/world/camera" ) );
        scene.SetGlobal( GLOBAL_RESOLUTION, glm::ivec2( 960, 540 ) );

        // Geometry
        scene.SetObject( "/world/geo/ground", ShapeGenerator::CreatePlane( glm::vec2( 20.0f ), glm::ivec2( 4 ) ) );
        scene.SetTransform( "/world/geo/ground", glm::rotate( glm::mat4( 1.0f ), glm::radians( -90.0f ), glm::vec3( 1.0f, 0.0f, 0.0f ) ) );

        auto cube = ShapeGenerator::CreateCube();
        scene.SetObject( "/world/geo/cube", cube );
        scene.SetTransform( "/world/geo/cube", glm::translate( glm::mat4( 1.0f ), glm::vec3( -1.5f, 0.5f, 0.0f ) ) );

        auto sphere           = ShapeGenerator::CreateSphere( 0.75f, 16, 24 );
        sphere->interpolation = MeshInterpolation::CATMULL_CLARK;
        scene.SetObject( "/world/geo/sphere", sphere );
        scene.SetTransform( "/world/geo/sphere", glm::translate( glm::mat4( 1.0f ), glm::vec3( 1.5f, 0.75f, 0.0f ) ) );

        if( !withShaders )
            return;

        // One network on the group, inherited by every mesh below it
        ShaderAssignment network;
        network.push_back( Shader( "noise", { { Shader::HANDLE_PARAMETER, std::string( "tex" ) }, { "scale", 4.0f } }, "osl:shader" ) );
        network.push_back( Shader( "matte", { { "Kd", 0.8f }, { "Cs", std::string( "link:tex.result" ) } } ) );
        scene.SetShader( "/world/geo", network );
    }

    bool ParseFrame( const char* text, int& outFrame )
    {
        char* end   = nullptr;
        long  value = std::strtol( text, &end, 10 );
        if( end == text || *end != '\0' )
            return false;

        outFrame = static_cast<int>( value );
        return true;
    }
} // namespace

int main( int argc, char** argv )
{
    Log::Init();

    if( argc < 2 )
    {
        CE_ERROR( "Usage: {} <output.xml> [--shaders] [--frames <first> <last>]", argv[ 0 ] );
        return 1;
    }

    ExportConfig config;
    config.outputPath = argv[ 1 ];

    bool                       withShaders = false;
    std::vector<ExportContext> contexts;
    for( int i = 2; i < argc; ++i )
    {
        std::string arg = argv[ i ];
        if( arg == "--shaders" )
        {
            withShaders = true;
        }
        else if( arg == "--frames" && i + 2 < argc )
        {
            int first = 0;
            int last  = 0;
            if( !ParseFrame( argv[ i + 1 ], first ) || !ParseFrame( argv[ i + 2 ], last ) )
            {
                CE_ERROR( "Invalid frame range '{} {}'", argv[ i + 1 ], argv[ i + 2 ] );
                return 1;
            }
            for( int frame = first; frame <= last; ++frame )
            {
                ExportContext context;
                context.frame = frame;
                contexts.push_back( context );
            }
            i += 2;
        }
        else
        {
            CE_ERROR( "Unknown argument '{}'", arg );
            return 1;
        }
    }

    if( contexts.empty() )
    {
        contexts.push_back( ExportContext() );
    }

    MemoryScene scene;
    BuildDemoScene( scene, withShaders );

    Exporter exporter;
    if( exporter.Initialize( config ) != Result::SUCCESS )
    {
        CE_CRITICAL( "Failed to initialize the exporter" );
        return 1;
    }

    CE_INFO( "Exporting {} frame(s)...", contexts.size() );
    Result result = exporter.Execute( scene, contexts );
    exporter.Shutdown();

    if( result != Result::SUCCESS )
    {
        CE_ERROR( "Export failed: {}", toString( result ) );
        return 1;
    }

    return 0;
}
