#pragma once
#include <glm/glm.hpp>
#include <string>
#include <vector>

namespace CyclesExport
{
    // 16 floats, column-major (translation in elements 12..14), space separated.
    std::string FormatMatrix( const glm::mat4& matrix );

    // Flattened "x y z x y z ..."
    std::string FormatPoints( const std::vector<glm::vec3>& points );

    std::string FormatInts( const std::vector<int32_t>& values );
} // namespace CyclesExport
