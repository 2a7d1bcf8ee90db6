#pragma once
#include "core/Core.h"
#include <glm/glm.hpp>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace CyclesExport
{
    // Location address. The root is the empty path.
    using ScenePath = std::vector<std::string>;

    CE_API std::string PathToString( const ScenePath& path );
    CE_API ScenePath   StringToPath( const std::string& path );

    /**
     * @brief Color is kept distinct from glm::vec3 so that colors and vectors hash differently.
     */
    struct Color
    {
        glm::vec3 value = glm::vec3( 0.0f );

        Color() = default;
        Color( float r, float g, float b )
            : value( r, g, b )
        {
        }
        explicit Color( const glm::vec3& v )
            : value( v )
        {
        }

        bool operator==( const Color& other ) const { return value == other.value; }
        bool operator!=( const Color& other ) const { return value != other.value; }
    };

    // Typed literal used for shader parameters, camera parameters and globals.
    using Value = std::variant<bool, int32_t, float, std::string, glm::ivec2, glm::vec2, glm::vec3, glm::vec4, Color>;

    // Ordered by name so iteration (and therefore output and hashing) is deterministic.
    using Parameters = std::map<std::string, Value>;

    /**
     * @brief Formats a value the way the renderer's XML reader expects it:
     * components separated by spaces, floats in shortest round-trip form, bools as 0/1.
     */
    CE_API std::string ValueToString( const Value& value );

    // Name of the value's type, e.g. "float", "color", "string". Part of the content hash.
    CE_API const char* ValueTypeName( const Value& value );

    // Returns the string payload or nullptr.
    CE_API const std::string* GetString( const Value& value );

    /**
     * @brief A single node of a shading network.
     */
    struct CE_API Shader
    {
        static constexpr const char* HANDLE_PARAMETER = "__handle";
        static constexpr const char* DEFAULT_HANDLE   = "surface";
        static constexpr const char* LINK_PREFIX      = "link:";

        std::string name; // Binary base name, resolved as <name>.oso on the search path
        std::string type = "osl:surface";
        Parameters  parameters;

        Shader() = default;
        Shader( std::string shaderName, Parameters shaderParameters = {}, std::string shaderType = "osl:surface" )
            : name( std::move( shaderName ) )
            , type( std::move( shaderType ) )
            , parameters( std::move( shaderParameters ) )
        {
        }

        // Value of "__handle", or "surface" when absent.
        std::string GetHandle() const;

        static bool IsInternalParameter( const std::string& parameterName ) { return parameterName.rfind( "__", 0 ) == 0; }

        // True for string values of the form "link:<handle>.<parameter>"
        static bool IsLink( const Value& value );
    };

    // Ordered sequence of shader nodes attached to a location through the "shader" attribute.
    using ShaderAssignment = std::vector<Shader>;

    // Deterministic digest of a network's structure and values, as 16 hex digits.
    CE_API std::string HashShaderAssignment( const ShaderAssignment& network );

    // Attribute values are either literals or an immutable, shared shading network.
    using AttributeValue = std::variant<Value, Ref<const ShaderAssignment>>;
    using Attributes     = std::map<std::string, AttributeValue>;

    // Key of the attribute carrying the shading network.
    inline constexpr const char* SHADER_ATTRIBUTE = "shader";

    // Keys read from the globals.
    inline constexpr const char* GLOBAL_CAMERA     = "render:camera";
    inline constexpr const char* GLOBAL_RESOLUTION = "render:resolution";

    enum class ObjectType
    {
        MESH,
        CAMERA,
        POINTS,
        UNKNOWN,
    };

    /**
     * @brief Base class for everything that can live at a scene location.
     */
    class CE_API Object
    {
    public:
        virtual ~Object() = default;

        virtual ObjectType GetType() const = 0;
    };

    enum class MeshInterpolation
    {
        LINEAR,
        CATMULL_CLARK,
    };

    /**
     * @brief Polygon mesh with arbitrary face sizes.
     */
    class CE_API MeshPrimitive : public Object
    {
    public:
        ObjectType GetType() const override { return ObjectType::MESH; }

        std::vector<glm::vec3> P;
        std::vector<int32_t>   verticesPerFace;
        std::vector<int32_t>   vertexIds;
        MeshInterpolation      interpolation = MeshInterpolation::LINEAR;

        size_t GetNumFaces() const { return verticesPerFace.size(); }

        // Topology is consistent: face sizes sum to the index count and every index addresses a point.
        bool IsValid() const;
    };

    /**
     * @brief Point cloud. Carried through the scene but never serialized.
     */
    class CE_API PointsPrimitive : public Object
    {
    public:
        ObjectType GetType() const override { return ObjectType::POINTS; }

        std::vector<glm::vec3> P;
        std::vector<float>     width;
    };

    /**
     * @brief Camera with a free-form parameter set.
     * Known parameters: "resolution" (ivec2), "projection" (string), "projection:fov" (float),
     * "clippingPlanes" (vec2), "screenWindow" (vec4 minX minY maxX maxY), "shutter" (vec2).
     */
    class CE_API CameraObject : public Object
    {
    public:
        static constexpr int32_t DEFAULT_WIDTH  = 640;
        static constexpr int32_t DEFAULT_HEIGHT = 480;
        static constexpr float   DEFAULT_FOV    = 90.0f;

        ObjectType GetType() const override { return ObjectType::CAMERA; }

        Parameters parameters;

        /**
         * @brief Fills in every missing standard parameter.
         * The screen window is derived from the resolution, so resolution overrides must be applied first.
         */
        void AddStandardParameters();
    };

} // namespace CyclesExport
