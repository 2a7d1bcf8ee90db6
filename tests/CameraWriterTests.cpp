#include "export/CameraWriter.hpp"
#include "export/Formatting.hpp"
#include "scene/MemoryScene.h"
#include "scene/ShapeGenerator.h"
#include <glm/gtc/matrix_transform.hpp>
#include <gtest/gtest.h>

using namespace CyclesExport;

namespace
{
    const glm::mat4 FLIP_Z = glm::scale( glm::mat4( 1.0f ), glm::vec3( 1.0f, 1.0f, -1.0f ) );
}

class CameraWriterTest : public ::testing::Test
{
protected:
    void AddCamera( const std::string& path, Parameters parameters )
    {
        auto camera        = CreateRef<CameraObject>();
        camera->parameters = std::move( parameters );
        scene.SetObject( path, camera );
    }

    MemoryScene scene;
};

TEST_F( CameraWriterTest, DefaultCameraWithoutGlobal )
{
    ResolvedCamera camera = CameraWriter::Resolve( scene, scene.Globals() );

    EXPECT_TRUE( camera.isDefault );
    EXPECT_EQ( camera.description.resolution, glm::ivec2( 640, 480 ) );
    EXPECT_TRUE( camera.description.IsPerspective() );
    EXPECT_FLOAT_EQ( camera.description.fov, 90.0f );
    EXPECT_EQ( camera.transform, FLIP_Z );
}

TEST_F( CameraWriterTest, NonCameraLocationFallsBack )
{
    scene.SetObject( "/world/cube", ShapeGenerator::CreateCube() );
    scene.SetTransform( "/world/cube", glm::translate( glm::mat4( 1.0f ), glm::vec3( 1.0f, 2.0f, 3.0f ) ) );
    scene.SetGlobal( GLOBAL_CAMERA, std::string( "/world/cube" ) );

    ResolvedCamera camera = CameraWriter::Resolve( scene, scene.Globals() );
    EXPECT_TRUE( camera.isDefault );
    EXPECT_EQ( camera.transform, FLIP_Z );

    // Missing location as well
    scene.SetGlobal( GLOBAL_CAMERA, std::string( "/world/nothing" ) );
    EXPECT_TRUE( CameraWriter::Resolve( scene, scene.Globals() ).isDefault );
}

TEST_F( CameraWriterTest, SceneCamera )
{
    const glm::mat4 parent = glm::translate( glm::mat4( 1.0f ), glm::vec3( 0.0f, 0.0f, 10.0f ) );
    const glm::mat4 local  = glm::rotate( glm::mat4( 1.0f ), glm::radians( 30.0f ), glm::vec3( 0.0f, 1.0f, 0.0f ) );

    AddCamera( "/world/camera", { { "resolution", glm::ivec2( 1920, 1080 ) }, { "projection:fov", 35.0f } } );
    scene.SetTransform( "/world", parent );
    scene.SetTransform( "/world/camera", local );
    scene.SetGlobal( GLOBAL_CAMERA, std::string( "/world/camera" ) );

    ResolvedCamera camera = CameraWriter::Resolve( scene, scene.Globals() );

    EXPECT_FALSE( camera.isDefault );
    EXPECT_EQ( camera.description.resolution, glm::ivec2( 1920, 1080 ) );
    EXPECT_FLOAT_EQ( camera.description.fov, 35.0f );
    EXPECT_EQ( camera.transform, parent * local * FLIP_Z );
}

TEST_F( CameraWriterTest, ResolutionOverride )
{
    AddCamera( "/camera", { { "resolution", glm::ivec2( 1920, 1080 ) } } );
    scene.SetGlobal( GLOBAL_CAMERA, std::string( "/camera" ) );
    scene.SetGlobal( GLOBAL_RESOLUTION, glm::ivec2( 200, 100 ) );

    ResolvedCamera camera = CameraWriter::Resolve( scene, scene.Globals() );
    EXPECT_EQ( camera.description.resolution, glm::ivec2( 200, 100 ) );

    // The screen window follows the overridden aspect ratio
    EXPECT_FLOAT_EQ( camera.description.screenWindow.x, -2.0f );

    // Applies to the default camera too
    MemoryScene empty;
    empty.SetGlobal( GLOBAL_RESOLUTION, glm::ivec2( 320, 240 ) );
    EXPECT_EQ( CameraWriter::Resolve( empty, empty.Globals() ).description.resolution, glm::ivec2( 320, 240 ) );

    // Wrongly typed overrides are ignored
    empty.SetGlobal( GLOBAL_RESOLUTION, 320.0f );
    EXPECT_EQ( CameraWriter::Resolve( empty, empty.Globals() ).description.resolution, glm::ivec2( 640, 480 ) );
}

TEST_F( CameraWriterTest, WritePerspective )
{
    Document document;
    CameraWriter::Write( document, CameraWriter::Resolve( scene, scene.Globals() ) );

    ASSERT_EQ( document.GetElements().size(), 1u );
    const Element& transform = document.GetElements()[ 0 ];
    EXPECT_EQ( transform.GetName(), "transform" );
    EXPECT_EQ( *transform.GetAttribute( "matrix" ), "1 0 0 0 0 1 0 0 0 0 -1 0 0 0 0 1" );

    ASSERT_EQ( transform.GetChildren().size(), 1u );
    const Element& camera = transform.GetChildren()[ 0 ];
    EXPECT_EQ( camera.GetName(), "camera" );
    EXPECT_EQ( *camera.GetAttribute( "width" ), "640" );
    EXPECT_EQ( *camera.GetAttribute( "height" ), "480" );
    EXPECT_EQ( *camera.GetAttribute( "type" ), "perspective" );
    EXPECT_EQ( *camera.GetAttribute( "fov" ), "90.000000" );
}

TEST_F( CameraWriterTest, WriteOrthographic )
{
    AddCamera( "/camera", { { "projection", std::string( "orthographic" ) } } );
    scene.SetGlobal( GLOBAL_CAMERA, std::string( "/camera" ) );

    Document document;
    CameraWriter::Write( document, CameraWriter::Resolve( scene, scene.Globals() ) );

    const Element& camera = document.GetElements()[ 0 ].GetChildren()[ 0 ];
    EXPECT_EQ( *camera.GetAttribute( "type" ), "orthographic" );
    EXPECT_EQ( camera.GetAttribute( "fov" ), nullptr );
}

TEST( FormattingTests, MatrixIsColumnMajor )
{
    const glm::mat4 translation = glm::translate( glm::mat4( 1.0f ), glm::vec3( 1.5f, -2.0f, 3.0f ) );
    EXPECT_EQ( FormatMatrix( translation ), "1 0 0 0 0 1 0 0 0 0 1 0 1.5 -2 3 1" );
}

TEST( FormattingTests, FlatLists )
{
    EXPECT_EQ( FormatPoints( { { 0.0f, 1.0f, 2.0f }, { 0.5f, -1.0f, 3.25f } } ), "0 1 2 0.5 -1 3.25" );
    EXPECT_EQ( FormatInts( { 4, 4, 3 } ), "4 4 3" );
    EXPECT_EQ( FormatInts( {} ), "" );
    EXPECT_EQ( FormatPoints( {} ), "" );
}
