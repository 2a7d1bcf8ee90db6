#include "core/FileSystem.h"
#include "TestHelpers.hpp"
#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <limits>

using namespace CyclesExport;
using namespace CyclesExport::Testing;

class FileSystemTest : public ::testing::Test
{
protected:
    void SetUp() override { m_temp = CreateScope<TempDirectory>( "filesystem_test" ); }

    void TearDown() override { m_temp.reset(); }

    const std::filesystem::path& Root() const { return m_temp->GetPath(); }

    Scope<TempDirectory> m_temp;
};

// 1. Write and read back
TEST_F( FileSystemTest, WriteReadCycle )
{
    const std::filesystem::path path    = Root() / "scene.xml";
    const std::string           content = "<camera />\n";

    EXPECT_EQ( FileSystem::WriteFile( path, content ), Result::SUCCESS );
    EXPECT_TRUE( std::filesystem::exists( path ) );
    EXPECT_EQ( ReadTextFile( path ), content );

    // No temporary left behind
    EXPECT_FALSE( std::filesystem::exists( Root() / "scene.xml.tmp" ) );
}

// 2. Overwrite replaces the whole file
TEST_F( FileSystemTest, WriteReplacesExistingFile )
{
    const std::filesystem::path path = Root() / "scene.xml";

    ASSERT_EQ( FileSystem::WriteFile( path, "a much longer first version" ), Result::SUCCESS );
    ASSERT_EQ( FileSystem::WriteFile( path, "short" ), Result::SUCCESS );

    EXPECT_EQ( ReadTextFile( path ), "short" );
}

// 3. Subdirectory creation on write
TEST_F( FileSystemTest, AutoCreateDirectories )
{
    const std::filesystem::path path = Root() / "renders" / "shot010" / "scene.xml";

    EXPECT_EQ( FileSystem::WriteFile( path, "DATA" ), Result::SUCCESS );
    EXPECT_TRUE( std::filesystem::exists( path ) );
}

// 4. Creating an existing directory is not an error
TEST_F( FileSystemTest, CreateDirectoriesIsIdempotent )
{
    const std::filesystem::path directory = Root() / "a" / "b";

    EXPECT_EQ( FileSystem::CreateDirectories( directory ), Result::SUCCESS );
    EXPECT_EQ( FileSystem::CreateDirectories( directory ), Result::SUCCESS );
    EXPECT_TRUE( std::filesystem::is_directory( directory ) );
}

// 5. A file in the way of the directory is an error
TEST_F( FileSystemTest, CreateDirectoriesOverFileFails )
{
    const std::filesystem::path blocker = Root() / "blocker";
    WriteTextFile( blocker, "not a directory" );

    EXPECT_EQ( FileSystem::CreateDirectories( blocker ), Result::FAIL );
    EXPECT_NE( FileSystem::WriteFile( blocker / "scene.xml", "DATA" ), Result::SUCCESS );
}

TEST_F( FileSystemTest, WriteEmptyPathIsInvalid )
{
    EXPECT_EQ( FileSystem::WriteFile( std::filesystem::path(), "DATA" ), Result::INVALID_ARGS );
}

// =================================================================================================
// Path substitution
// =================================================================================================

TEST( SubstitutePathTests, PlainPathIsUnchanged )
{
    EXPECT_EQ( FileSystem::SubstitutePath( "/tmp/scene.xml", 7, {} ), "/tmp/scene.xml" );
    EXPECT_EQ( FileSystem::SubstitutePath( "", 7, {} ), "" );
}

TEST( SubstitutePathTests, FramePadding )
{
    EXPECT_EQ( FileSystem::SubstitutePath( "scene.####.xml", 7, {} ), "scene.0007.xml" );
    EXPECT_EQ( FileSystem::SubstitutePath( "scene.#.xml", 123, {} ), "scene.123.xml" );
    EXPECT_EQ( FileSystem::SubstitutePath( "scene.###.xml", -4, {} ), "scene.-004.xml" );
}

TEST( SubstitutePathTests, FramePaddingAtIntegerLimits )
{
    EXPECT_EQ( FileSystem::SubstitutePath( "out.#.xml", std::numeric_limits<int32_t>::min(), {} ), "out.-2147483648.xml" );
    EXPECT_EQ( FileSystem::SubstitutePath( "out.############.xml", std::numeric_limits<int32_t>::max(), {} ), "out.002147483647.xml" );
}

TEST( SubstitutePathTests, Variables )
{
    std::map<std::string, std::string> variables = { { "project", "demo" }, { "shot", "sh010" } };

    EXPECT_EQ( FileSystem::SubstitutePath( "/out/${project}/$shot/${frame}.xml", 12, variables ), "/out/demo/sh010/12.xml" );

    // An explicit "frame" variable wins over the frame number
    variables[ "frame" ] = "final";
    EXPECT_EQ( FileSystem::SubstitutePath( "$frame.xml", 12, variables ), "final.xml" );
}

TEST( SubstitutePathTests, UnknownVariablesExpandToNothing )
{
    EXPECT_EQ( FileSystem::SubstitutePath( "${missing}scene.xml", 1, {} ), "scene.xml" );
    EXPECT_EQ( FileSystem::SubstitutePath( "${missing}", 1, {} ), "" );

    // A lone '$' is literal
    EXPECT_EQ( FileSystem::SubstitutePath( "cost$.xml", 1, {} ), "cost$.xml" );
}

TEST( SubstitutePathTests, HomeDirectory )
{
    const char* home = std::getenv( "HOME" );
    if( !home )
        GTEST_SKIP() << "HOME is not set";

    EXPECT_EQ( FileSystem::SubstitutePath( "~/scene.xml", 1, {} ), std::string( home ) + "/scene.xml" );

    // Only a leading "~/" is expanded
    EXPECT_EQ( FileSystem::SubstitutePath( "/a/~/b", 1, {} ), "/a/~/b" );
}
