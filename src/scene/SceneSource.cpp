#include "scene/SceneSource.h"

namespace CyclesExport
{
    glm::mat4 SceneSource::FullTransform( const ScenePath& path ) const
    {
        glm::mat4 result = Transform( ScenePath() );

        ScenePath prefix;
        prefix.reserve( path.size() );
        for( const std::string& segment : path )
        {
            prefix.push_back( segment );
            result = result * Transform( prefix );
        }
        return result;
    }
} // namespace CyclesExport
