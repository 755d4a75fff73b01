#ifndef PDFSCRUB_TEMPFILESET_HH
#define PDFSCRUB_TEMPFILESET_HH

#include <string>
#include <vector>

namespace pdfscrub
{
    // Owns the intermediate files of one scrub run. Every file created
    // through a TempFileSet is removed when the set is cleaned up or
    // destroyed, whichever happens first.
    class TempFileSet
    {
      public:
        TempFileSet(std::string const& directory);
        ~TempFileSet();
        TempFileSet(TempFileSet const&) = delete;
        TempFileSet& operator=(TempFileSet const&) = delete;

        // Create an empty file with an unpredictable name in the
        // directory and return its path. Throws std::runtime_error.
        std::string create();

        std::vector<std::string> const& getPaths() const;

        // Remove every file. Returns the paths that still exist
        // afterwards.
        std::vector<std::string> cleanup();

      private:
        std::string directory;
        std::vector<std::string> paths;
    };
} // namespace pdfscrub

#endif // PDFSCRUB_TEMPFILESET_HH
