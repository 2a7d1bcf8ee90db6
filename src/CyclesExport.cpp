#include "CyclesExport.h"

#include "core/Base.hpp"
#include "core/FileSystem.h"
#include "document/Document.hpp"
#include "export/SceneWriter.hpp"
#include "scene/SceneSource.h"
#include "shading/ShaderInfo.hpp"
#include "shading/ShaderSearchPath.hpp"

namespace CyclesExport
{

    // Impl
    struct Exporter::Impl
    {
        ExportConfig           m_config;
        bool                   m_initialized = false;
        ShaderSearchPath       m_searchPath;
        Scope<ShaderInfoCache> m_shaderInfoCache;

        Result BuildDocument( const SceneSource& scene, Document& document )
        {
            SceneWriter writer( m_searchPath, *m_shaderInfoCache );
            return writer.Write( scene, document );
        }
    };

    Exporter::Exporter()
        : m_impl( CreateScope<Impl>() )
    {
    }

    Exporter::~Exporter()
    {
        Shutdown();
    }

    Result Exporter::Initialize( const ExportConfig& config )
    {
        Log::Init();

        if( m_impl->m_initialized )
        {
            CE_CORE_WARN( "[Exporter] Already initialized!" );
            return Result::SUCCESS;
        }

        if( config.introspectionCommand.empty() )
        {
            CE_CORE_ERROR( "[Exporter] No shader introspection command configured" );
            return Result::INVALID_ARGS;
        }

        m_impl->m_config = config;
        Log::SetLevel( config.logLevel );

        // 1. Shader search path
        if( config.shaderSearchPath.empty() )
        {
            m_impl->m_searchPath = ShaderSearchPath::FromEnvironment( config.shaderExtension );
        }
        else
        {
            m_impl->m_searchPath = ShaderSearchPath( config.shaderSearchPath, config.shaderExtension );
        }

        // 2. Shader interface cache, shared by every execution of this exporter
        m_impl->m_shaderInfoCache = CreateScope<ShaderInfoCache>( CreateRef<OslInfoIntrospector>( config.introspectionCommand ) );

        m_impl->m_initialized = true;
        CE_CORE_INFO( "[Exporter] Initialized ({} shader directories)", m_impl->m_searchPath.GetDirectories().size() );
        return Result::SUCCESS;
    }

    void Exporter::Shutdown()
    {
        if( !m_impl || !m_impl->m_initialized )
        {
            return;
        }

        m_impl->m_shaderInfoCache.reset();
        m_impl->m_searchPath  = ShaderSearchPath();
        m_impl->m_initialized = false;
    }

    bool Exporter::IsInitialized() const
    {
        return m_impl->m_initialized;
    }

    const ExportConfig& Exporter::GetConfig() const
    {
        return m_impl->m_config;
    }

    std::string Exporter::GetOutputPath( const ExportContext& context ) const
    {
        return FileSystem::SubstitutePath( m_impl->m_config.outputPath, context.frame, context.variables );
    }

    Result Exporter::WriteScene( const SceneSource& scene, std::string& outText )
    {
        outText.clear();

        if( !m_impl->m_initialized )
        {
            CE_CORE_ERROR( "[Exporter] WriteScene called before Initialize" );
            return Result::FAIL;
        }

        Document document;
        CE_CHECK( m_impl->BuildDocument( scene, document ) );

        outText = document.ToString();
        return Result::SUCCESS;
    }

    Result Exporter::Execute( const SceneSource& scene, const ExportContext& context )
    {
        if( !m_impl->m_initialized )
        {
            CE_CORE_ERROR( "[Exporter] Execute called before Initialize" );
            return Result::FAIL;
        }

        std::string fileName = GetOutputPath( context );
        if( fileName.empty() )
        {
            CE_CORE_INFO( "[Exporter] No output path for frame {}, nothing to export", context.frame );
            return Result::SUCCESS;
        }

        // 1. Build the whole document before touching the disk
        std::string text;
        CE_CHECK( WriteScene( scene, text ) );

        // 2. Write it
        Result result = FileSystem::WriteFile( fileName, text );
        if( result != Result::SUCCESS )
        {
            CE_CORE_ERROR( "[Exporter] Failed to write '{}': {}", fileName, toString( result ) );
            return result;
        }

        CE_CORE_INFO( "[Exporter] Wrote '{}'", fileName );
        return Result::SUCCESS;
    }

    Result Exporter::Execute( const SceneSource& scene, const std::vector<ExportContext>& contexts )
    {
        for( const ExportContext& context : contexts )
        {
            CE_CHECK( Execute( scene, context ) );
        }
        return Result::SUCCESS;
    }

} // namespace CyclesExport
