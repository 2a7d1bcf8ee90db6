#pragma once
#include "Core.h"
#include <filesystem>
#include <map>
#include <string>

namespace CyclesExport
{

    /**
     * @brief Output-side file helpers used by the exporter.
     */
    class CE_API FileSystem
    {
    public:
        /**
         * @brief Creates a directory and all missing parents.
         * A directory that already exists (or is created concurrently by someone else) is not an error.
         * @return SUCCESS if the directory exists afterwards, FAIL otherwise.
         */
        static Result CreateDirectories( const std::filesystem::path& directory );

        /**
         * @brief Writes text to a file, creating the parent directory first.
         * The file is written to a temporary sibling and renamed into place, so readers never see a partial document.
         */
        static Result WriteFile( const std::filesystem::path& path, const std::string& content );

        /**
         * @brief Expands variables in an output path.
         * - "${name}" and "$name" are replaced from the variable map ("frame" is always available).
         * - A run of '#' is replaced by the frame number zero-padded to the run length.
         * - A leading "~/" is replaced by $HOME.
         * Unknown variables expand to nothing.
         */
        static std::string SubstitutePath( const std::string& path, int32_t frame, const std::map<std::string, std::string>& variables );
    };

} // namespace CyclesExport
