#include "export/ExportState.hpp"
#include "scene/MemoryScene.h"
#include "scene/ShapeGenerator.h"
#include <glm/gtc/matrix_transform.hpp>
#include <gtest/gtest.h>

using namespace CyclesExport;

class MemorySceneTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        scene.AddLocation( "/world/b" );
        scene.AddLocation( "/world/a" );
        scene.AddLocation( "/world/c/deep" );
    }

    MemoryScene scene;
};

TEST_F( MemorySceneTest, ChildrenKeepInsertionOrder )
{
    EXPECT_EQ( scene.ChildNames( {} ), ( std::vector<std::string>{ "world" } ) );
    EXPECT_EQ( scene.ChildNames( { "world" } ), ( std::vector<std::string>{ "b", "a", "c" } ) );
    EXPECT_TRUE( scene.ChildNames( { "world", "a" } ).empty() );
}

TEST_F( MemorySceneTest, MissingLocations )
{
    EXPECT_TRUE( scene.HasLocation( { "world", "c", "deep" } ) );
    EXPECT_FALSE( scene.HasLocation( { "world", "missing" } ) );

    EXPECT_TRUE( scene.ChildNames( { "world", "missing" } ).empty() );
    EXPECT_EQ( scene.GetObject( { "world", "missing" } ), nullptr );
    EXPECT_EQ( scene.Transform( { "world", "missing" } ), glm::mat4( 1.0f ) );
    EXPECT_TRUE( scene.GetAttributes( { "world", "missing" } ).empty() );
}

TEST_F( MemorySceneTest, SettersCreateLocations )
{
    scene.SetObject( "/world/new/cube", ShapeGenerator::CreateCube() );

    EXPECT_TRUE( scene.HasLocation( { "world", "new" } ) );
    auto object = scene.GetObject( { "world", "new", "cube" } );
    ASSERT_NE( object, nullptr );
    EXPECT_EQ( object->GetType(), ObjectType::MESH );
}

TEST_F( MemorySceneTest, FullTransformComposesParentFirst )
{
    const glm::mat4 parent = glm::translate( glm::mat4( 1.0f ), glm::vec3( 10.0f, 0.0f, 0.0f ) );
    const glm::mat4 child  = glm::scale( glm::mat4( 1.0f ), glm::vec3( 2.0f ) );

    scene.SetTransform( "/world", parent );
    scene.SetTransform( "/world/c", child );

    const glm::mat4 world = scene.FullTransform( { "world", "c" } );
    EXPECT_EQ( world, parent * child );

    // A point at x=1 is scaled before it is translated
    glm::vec4 p = world * glm::vec4( 1.0f, 0.0f, 0.0f, 1.0f );
    EXPECT_FLOAT_EQ( p.x, 12.0f );

    EXPECT_EQ( scene.FullTransform( {} ), glm::mat4( 1.0f ) );
}

TEST_F( MemorySceneTest, ShaderAttribute )
{
    scene.SetShader( "/world/a", { Shader( "matte" ) } );

    Attributes attributes = scene.GetAttributes( { "world", "a" } );
    ASSERT_EQ( attributes.count( SHADER_ATTRIBUTE ), 1u );

    const auto* network = std::get_if<Ref<const ShaderAssignment>>( &attributes[ SHADER_ATTRIBUTE ] );
    ASSERT_NE( network, nullptr );
    ASSERT_EQ( ( *network )->size(), 1u );
    EXPECT_EQ( ( *network )->front().name, "matte" );
}

TEST_F( MemorySceneTest, Globals )
{
    scene.SetGlobal( GLOBAL_CAMERA, std::string( "/world/camera" ) );
    scene.SetGlobal( GLOBAL_RESOLUTION, glm::ivec2( 320, 240 ) );

    Parameters globals = scene.Globals();
    EXPECT_EQ( *GetString( globals[ GLOBAL_CAMERA ] ), "/world/camera" );
    EXPECT_EQ( std::get<glm::ivec2>( globals[ GLOBAL_RESOLUTION ] ), glm::ivec2( 320, 240 ) );
}

// =================================================================================================
// Inherited state
// =================================================================================================

TEST( ExportStateTests, PushInheritsAndOverrides )
{
    ShaderRegistry registry;
    ExportState    root( &registry );

    const glm::mat4 parentTransform = glm::translate( glm::mat4( 1.0f ), glm::vec3( 0.0f, 5.0f, 0.0f ) );
    Attributes      parentAttributes;
    parentAttributes[ "visible" ]        = Value( true );
    parentAttributes[ SHADER_ATTRIBUTE ] = Ref<const ShaderAssignment>( CreateRef<ShaderAssignment>( ShaderAssignment{ Shader( "matte" ) } ) );

    ExportState parent = root.Push( parentTransform, parentAttributes );
    ASSERT_NE( parent.GetShader(), nullptr );
    EXPECT_EQ( parent.GetShader()->front().name, "matte" );

    Attributes childAttributes;
    childAttributes[ SHADER_ATTRIBUTE ] = Ref<const ShaderAssignment>( CreateRef<ShaderAssignment>( ShaderAssignment{ Shader( "plastic" ) } ) );

    const glm::mat4 childTransform = glm::scale( glm::mat4( 1.0f ), glm::vec3( 3.0f ) );
    ExportState     child          = parent.Push( childTransform, childAttributes );

    EXPECT_EQ( child.GetShader()->front().name, "plastic" );
    EXPECT_EQ( child.attributes.count( "visible" ), 1u );
    EXPECT_EQ( child.transform, parentTransform * childTransform );
    EXPECT_EQ( child.shaders, &registry );

    // The parent is unchanged
    EXPECT_EQ( parent.GetShader()->front().name, "matte" );
    EXPECT_EQ( root.GetShader(), nullptr );
}

TEST( ExportStateTests, NonNetworkShaderAttributeIsIgnored )
{
    ShaderRegistry registry;
    Attributes     attributes;
    attributes[ SHADER_ATTRIBUTE ] = Value( std::string( "matte" ) );

    ExportState state = ExportState( &registry ).Push( glm::mat4( 1.0f ), attributes );
    EXPECT_EQ( state.GetShader(), nullptr );
}

TEST( ShaderRegistryTests, ClaimOnce )
{
    ShaderRegistry registry;

    EXPECT_TRUE( registry.Claim( "abc" ) );
    EXPECT_FALSE( registry.Claim( "abc" ) );
    EXPECT_TRUE( registry.Contains( "abc" ) );

    registry.Release( "abc" );
    EXPECT_FALSE( registry.Contains( "abc" ) );
    EXPECT_TRUE( registry.Claim( "abc" ) );
    EXPECT_EQ( registry.GetSize(), 1u );
}
