#pragma once
#include "core/Base.hpp"
#include "scene/SceneTypes.h"
#include <glm/glm.hpp>
#include <mutex>
#include <string>
#include <unordered_set>

namespace CyclesExport
{
    /**
     * @brief Content hashes of the shader networks already written into one document.
     * Claim() succeeds for exactly one caller per hash, also under concurrent use.
     */
    class ShaderRegistry
    {
    public:
        // True if the hash was not registered yet; the caller is then responsible for writing it.
        bool Claim( const std::string& hash )
        {
            std::lock_guard<std::mutex> lock( m_mutex );
            return m_hashes.insert( hash ).second;
        }

        // Undoes a claim whose network could not be written.
        void Release( const std::string& hash )
        {
            std::lock_guard<std::mutex> lock( m_mutex );
            m_hashes.erase( hash );
        }

        bool Contains( const std::string& hash ) const
        {
            std::lock_guard<std::mutex> lock( m_mutex );
            return m_hashes.find( hash ) != m_hashes.end();
        }

        size_t GetSize() const
        {
            std::lock_guard<std::mutex> lock( m_mutex );
            return m_hashes.size();
        }

    private:
        mutable std::mutex              m_mutex;
        std::unordered_set<std::string> m_hashes;
    };

    /**
     * @brief State inherited down one branch of the traversal.
     * A state is never modified once children start using it; each level derives a new one with Push().
     */
    struct ExportState
    {
        glm::mat4       transform = glm::mat4( 1.0f );
        Attributes      attributes;
        ShaderRegistry* shaders = nullptr; // Document-wide, shared by every branch

        explicit ExportState( ShaderRegistry* registry )
            : shaders( registry )
        {
        }

        /**
         * @brief Derives the state of a child location.
         * The local transform is applied after the parent's (parent * local) and local attributes win over inherited ones.
         */
        ExportState Push( const glm::mat4& localTransform, const Attributes& localAttributes ) const
        {
            ExportState child( *this );
            child.transform = transform * localTransform;
            for( const auto& [ name, value ] : localAttributes )
            {
                child.attributes[ name ] = value;
            }
            return child;
        }

        // The inherited shading network, or nullptr.
        Ref<const ShaderAssignment> GetShader() const
        {
            auto it = attributes.find( SHADER_ATTRIBUTE );
            if( it == attributes.end() )
                return nullptr;

            const Ref<const ShaderAssignment>* network = std::get_if<Ref<const ShaderAssignment>>( &it->second );
            return network ? *network : nullptr;
        }
    };
} // namespace CyclesExport
