#pragma once
#include "CyclesExportTypes.h"

#include "core/Core.h"
#include <string>
#include <vector>

namespace CyclesExport
{

    /**
     * @brief Writes scenes as Cycles XML documents.
     * One instance keeps the shader search path and the shader interface cache alive across executions.
     */
    class CE_API Exporter
    {
    public:
        Exporter();
        ~Exporter();

        Result Initialize( const ExportConfig& config );
        void   Shutdown();

        bool IsInitialized() const;

        /**
         * @brief Exports the scene to the configured output path, expanded for the context.
         * An empty expanded path skips the export and succeeds. The output directory is created when missing.
         */
        Result Execute( const SceneSource& scene, const ExportContext& context = ExportContext() );

        // Runs Execute once per context, stopping at the first failure.
        Result Execute( const SceneSource& scene, const std::vector<ExportContext>& contexts );

        // Builds the document in memory without touching the file system.
        Result WriteScene( const SceneSource& scene, std::string& outText );

        // The output path for a context after substitution.
        std::string GetOutputPath( const ExportContext& context ) const;

        const ExportConfig& GetConfig() const;

    private:
        struct Impl;
        Scope<Impl> m_impl;
    };

} // namespace CyclesExport
