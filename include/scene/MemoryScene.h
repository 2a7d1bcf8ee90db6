#pragma once
#include "scene/SceneSource.h"
#include <string>
#include <vector>

namespace CyclesExport
{
    /**
     * @brief Mutable in-memory scene.
     * Locations are created on demand by every setter; children keep their insertion order.
     */
    class CE_API MemoryScene : public SceneSource
    {
    public:
        MemoryScene();
        ~MemoryScene() override;

        MemoryScene( const MemoryScene& )            = delete;
        MemoryScene& operator=( const MemoryScene& ) = delete;

        // --- Building ---

        // Creates the location and any missing ancestors.
        void AddLocation( const ScenePath& path );

        void SetTransform( const ScenePath& path, const glm::mat4& transform );
        void SetObject( const ScenePath& path, Ref<const Object> object );
        void SetAttribute( const ScenePath& path, const std::string& name, AttributeValue value );
        void SetShader( const ScenePath& path, ShaderAssignment network );
        void SetGlobal( const std::string& name, Value value );

        // String-path conveniences ("/world/geo").
        void AddLocation( const std::string& path ) { AddLocation( StringToPath( path ) ); }
        void SetTransform( const std::string& path, const glm::mat4& transform ) { SetTransform( StringToPath( path ), transform ); }
        void SetObject( const std::string& path, Ref<const Object> object ) { SetObject( StringToPath( path ), std::move( object ) ); }
        void SetShader( const std::string& path, ShaderAssignment network ) { SetShader( StringToPath( path ), std::move( network ) ); }

        bool HasLocation( const ScenePath& path ) const;

        // --- SceneSource ---

        glm::mat4                Transform( const ScenePath& path ) const override;
        Ref<const Object>        GetObject( const ScenePath& path ) const override;
        Attributes               GetAttributes( const ScenePath& path ) const override;
        std::vector<std::string> ChildNames( const ScenePath& path ) const override;
        Parameters               Globals() const override;

    private:
        struct Location;

        Location*       Find( const ScenePath& path );
        const Location* Find( const ScenePath& path ) const;
        Location&       FindOrCreate( const ScenePath& path );

    private:
        Scope<Location> m_root;
        Parameters      m_globals;
    };
} // namespace CyclesExport
