#include "CyclesExport.h"
#include "TestHelpers.hpp"
#include "scene/MemoryScene.h"
#include "scene/ShapeGenerator.h"
#include <cstdlib>
#include <gtest/gtest.h>

using namespace CyclesExport;
using namespace CyclesExport::Testing;

class ExporterTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_temp       = CreateScope<TempDirectory>( "exporter_test" );
        m_shaderRoot = m_temp->GetPath() / "shaders";
        m_outputRoot = m_temp->GetPath() / "output";

        // 'cat' echoes the fixture back, standing in for oslinfo
        WriteTextFile( m_shaderRoot / "matte.oso", MATTE_INFO );
        WriteTextFile( m_shaderRoot / "noise.oso", NOISE_INFO );

        m_config.shaderSearchPath     = m_shaderRoot.string();
        m_config.introspectionCommand = "cat";
        m_config.logLevel             = "warn";
        m_config.outputPath           = ( m_outputRoot / "scene.xml" ).string();

        m_scene.SetShader( "/world/geo",
                           { Shader( "noise", { { "__handle", std::string( "n1" ) } } ), Shader( "matte", { { "Cs", std::string( "link:n1.Cout" ) } } ) } );
        m_scene.SetObject( "/world/geo/cube", ShapeGenerator::CreateCube() );
        m_scene.SetObject( "/world/geo/plane", ShapeGenerator::CreatePlane() );
    }

    void TearDown() override
    {
        m_exporter.Shutdown();
        m_temp.reset();
    }

    Scope<TempDirectory>  m_temp;
    std::filesystem::path m_shaderRoot;
    std::filesystem::path m_outputRoot;
    ExportConfig          m_config;
    MemoryScene           m_scene;
    Exporter              m_exporter;
};

TEST_F( ExporterTest, RequiresInitialize )
{
    EXPECT_FALSE( m_exporter.IsInitialized() );

    std::string text;
    EXPECT_EQ( m_exporter.Execute( m_scene ), Result::FAIL );
    EXPECT_EQ( m_exporter.WriteScene( m_scene, text ), Result::FAIL );
    EXPECT_FALSE( std::filesystem::exists( m_outputRoot ) );
}

TEST_F( ExporterTest, InitializeLifecycle )
{
    ASSERT_EQ( m_exporter.Initialize( m_config ), Result::SUCCESS );
    EXPECT_TRUE( m_exporter.IsInitialized() );
    EXPECT_EQ( m_exporter.GetConfig().introspectionCommand, "cat" );

    // A second Initialize keeps the first configuration
    ExportConfig other = m_config;
    other.outputPath   = "elsewhere.xml";
    EXPECT_EQ( m_exporter.Initialize( other ), Result::SUCCESS );
    EXPECT_EQ( m_exporter.GetConfig().outputPath, m_config.outputPath );

    m_exporter.Shutdown();
    EXPECT_FALSE( m_exporter.IsInitialized() );
    EXPECT_EQ( m_exporter.Execute( m_scene ), Result::FAIL );
}

TEST_F( ExporterTest, RejectsMissingIntrospectionCommand )
{
    m_config.introspectionCommand.clear();
    EXPECT_EQ( m_exporter.Initialize( m_config ), Result::INVALID_ARGS );
    EXPECT_FALSE( m_exporter.IsInitialized() );
}

TEST_F( ExporterTest, WritesDocument )
{
    ASSERT_EQ( m_exporter.Initialize( m_config ), Result::SUCCESS );

    // The output directory does not exist yet
    ASSERT_FALSE( std::filesystem::exists( m_outputRoot ) );
    ASSERT_EQ( m_exporter.Execute( m_scene ), Result::SUCCESS );

    const std::filesystem::path output = m_outputRoot / "scene.xml";
    ASSERT_TRUE( std::filesystem::exists( output ) );

    std::string expected;
    ASSERT_EQ( m_exporter.WriteScene( m_scene, expected ), Result::SUCCESS );

    const std::string text = ReadTextFile( output );
    EXPECT_EQ( text, expected );

    // camera, background, one shader block, two meshes
    EXPECT_EQ( text.rfind( "<transform", 0 ), 0u );
    EXPECT_NE( text.find( "<background>" ), std::string::npos );
    EXPECT_NE( text.find( "<connect from=\"n1 Cout\" to=\"surface Cs\" />" ), std::string::npos );
    EXPECT_NE( text.find( "src=\"" + ( m_shaderRoot / "noise.oso" ).generic_string() + "\"" ), std::string::npos );
    EXPECT_NE( text.find( "<output name=\"Cout\" type=\"color\" />" ), std::string::npos );
    EXPECT_NE( text.find( "<input name=\"scale\" type=\"float\" />" ), std::string::npos );

    size_t shaderBlocks = 0;
    for( size_t at = text.find( "<shader " ); at != std::string::npos; at = text.find( "<shader ", at + 1 ) )
        ++shaderBlocks;
    EXPECT_EQ( shaderBlocks, 1u );

    size_t meshes = 0;
    for( size_t at = text.find( "<mesh " ); at != std::string::npos; at = text.find( "<mesh ", at + 1 ) )
        ++meshes;
    EXPECT_EQ( meshes, 2u );
}

TEST_F( ExporterTest, EmptyOutputPathSkipsExport )
{
    m_config.outputPath.clear();
    ASSERT_EQ( m_exporter.Initialize( m_config ), Result::SUCCESS );

    EXPECT_EQ( m_exporter.Execute( m_scene ), Result::SUCCESS );
    EXPECT_FALSE( std::filesystem::exists( m_outputRoot ) );

    // An expansion to nothing is skipped as well
    m_exporter.Shutdown();
    m_config.outputPath = "${unset}";
    ASSERT_EQ( m_exporter.Initialize( m_config ), Result::SUCCESS );
    EXPECT_EQ( m_exporter.Execute( m_scene ), Result::SUCCESS );
}

TEST_F( ExporterTest, FrameSequence )
{
    m_config.outputPath = ( m_outputRoot / "${shot}" / "scene.####.xml" ).string();
    ASSERT_EQ( m_exporter.Initialize( m_config ), Result::SUCCESS );

    std::vector<ExportContext> contexts( 3 );
    for( size_t i = 0; i < contexts.size(); ++i )
    {
        contexts[ i ].frame               = static_cast<int32_t>( 9 + i );
        contexts[ i ].variables[ "shot" ] = "sh010";
    }

    EXPECT_EQ( m_exporter.GetOutputPath( contexts[ 0 ] ), ( m_outputRoot / "sh010" / "scene.0009.xml" ).string() );

    ASSERT_EQ( m_exporter.Execute( m_scene, contexts ), Result::SUCCESS );
    EXPECT_TRUE( std::filesystem::exists( m_outputRoot / "sh010" / "scene.0009.xml" ) );
    EXPECT_TRUE( std::filesystem::exists( m_outputRoot / "sh010" / "scene.0010.xml" ) );
    EXPECT_TRUE( std::filesystem::exists( m_outputRoot / "sh010" / "scene.0011.xml" ) );

    // Every frame of a static scene is identical
    EXPECT_EQ( ReadTextFile( m_outputRoot / "sh010" / "scene.0009.xml" ), ReadTextFile( m_outputRoot / "sh010" / "scene.0011.xml" ) );
}

TEST_F( ExporterTest, MissingShaderWritesNoFile )
{
    m_scene.SetShader( "/world/geo/cube", { Shader( "plastic" ) } );
    ASSERT_EQ( m_exporter.Initialize( m_config ), Result::SUCCESS );

    EXPECT_EQ( m_exporter.Execute( m_scene ), Result::NOT_FOUND );
    EXPECT_FALSE( std::filesystem::exists( m_outputRoot / "scene.xml" ) );
}

TEST_F( ExporterTest, FailingIntrospectionToolWritesNoFile )
{
    m_config.introspectionCommand = "false";
    ASSERT_EQ( m_exporter.Initialize( m_config ), Result::SUCCESS );

    EXPECT_EQ( m_exporter.Execute( m_scene ), Result::FAIL );
    EXPECT_FALSE( std::filesystem::exists( m_outputRoot / "scene.xml" ) );
}

TEST_F( ExporterTest, SearchPathFromEnvironment )
{
    const char* previous = std::getenv( "OSL_SHADER_PATHS" );
    std::string saved    = previous ? previous : "";

    setenv( "OSL_SHADER_PATHS", m_shaderRoot.string().c_str(), 1 );

    m_config.shaderSearchPath.clear();
    ASSERT_EQ( m_exporter.Initialize( m_config ), Result::SUCCESS );
    EXPECT_EQ( m_exporter.Execute( m_scene ), Result::SUCCESS );
    EXPECT_TRUE( std::filesystem::exists( m_outputRoot / "scene.xml" ) );

    if( previous )
        setenv( "OSL_SHADER_PATHS", saved.c_str(), 1 );
    else
        unsetenv( "OSL_SHADER_PATHS" );
}
