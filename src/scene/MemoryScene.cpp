#include "scene/MemoryScene.h"

#include "core/Base.hpp"
#include <algorithm>

namespace CyclesExport
{
    struct MemoryScene::Location
    {
        std::string                  name;
        glm::mat4                    transform = glm::mat4( 1.0f );
        Ref<const Object>            object;
        Attributes                   attributes;
        std::vector<Scope<Location>> children;

        Location* FindChild( const std::string& childName ) const
        {
            auto it = std::find_if( children.begin(), children.end(), [ & ]( const Scope<Location>& c ) { return c->name == childName; } );
            return it != children.end() ? it->get() : nullptr;
        }
    };

    MemoryScene::MemoryScene()
        : m_root( CreateScope<Location>() )
    {
    }

    MemoryScene::~MemoryScene() = default;

    MemoryScene::Location* MemoryScene::Find( const ScenePath& path )
    {
        return const_cast<Location*>( static_cast<const MemoryScene*>( this )->Find( path ) );
    }

    const MemoryScene::Location* MemoryScene::Find( const ScenePath& path ) const
    {
        const Location* current = m_root.get();
        for( const std::string& segment : path )
        {
            current = current->FindChild( segment );
            if( !current )
                return nullptr;
        }
        return current;
    }

    MemoryScene::Location& MemoryScene::FindOrCreate( const ScenePath& path )
    {
        Location* current = m_root.get();
        for( const std::string& segment : path )
        {
            Location* child = current->FindChild( segment );
            if( !child )
            {
                current->children.push_back( CreateScope<Location>() );
                child       = current->children.back().get();
                child->name = segment;
            }
            current = child;
        }
        return *current;
    }

    void MemoryScene::AddLocation( const ScenePath& path )
    {
        FindOrCreate( path );
    }

    void MemoryScene::SetTransform( const ScenePath& path, const glm::mat4& transform )
    {
        FindOrCreate( path ).transform = transform;
    }

    void MemoryScene::SetObject( const ScenePath& path, Ref<const Object> object )
    {
        FindOrCreate( path ).object = std::move( object );
    }

    void MemoryScene::SetAttribute( const ScenePath& path, const std::string& name, AttributeValue value )
    {
        FindOrCreate( path ).attributes[ name ] = std::move( value );
    }

    void MemoryScene::SetShader( const ScenePath& path, ShaderAssignment network )
    {
        SetAttribute( path, SHADER_ATTRIBUTE, Ref<const ShaderAssignment>( CreateRef<ShaderAssignment>( std::move( network ) ) ) );
    }

    void MemoryScene::SetGlobal( const std::string& name, Value value )
    {
        m_globals[ name ] = std::move( value );
    }

    bool MemoryScene::HasLocation( const ScenePath& path ) const
    {
        return Find( path ) != nullptr;
    }

    glm::mat4 MemoryScene::Transform( const ScenePath& path ) const
    {
        const Location* location = Find( path );
        return location ? location->transform : glm::mat4( 1.0f );
    }

    Ref<const Object> MemoryScene::GetObject( const ScenePath& path ) const
    {
        const Location* location = Find( path );
        return location ? location->object : nullptr;
    }

    Attributes MemoryScene::GetAttributes( const ScenePath& path ) const
    {
        const Location* location = Find( path );
        return location ? location->attributes : Attributes();
    }

    std::vector<std::string> MemoryScene::ChildNames( const ScenePath& path ) const
    {
        std::vector<std::string> names;

        const Location* location = Find( path );
        if( !location )
        {
            CE_CORE_WARN( "MemoryScene: ChildNames queried for missing location '{}'", PathToString( path ) );
            return names;
        }

        names.reserve( location->children.size() );
        for( const auto& child : location->children )
        {
            names.push_back( child->name );
        }
        return names;
    }

    Parameters MemoryScene::Globals() const
    {
        return m_globals;
    }

} // namespace CyclesExport
