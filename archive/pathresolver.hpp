#ifndef PATH_RESOLVER_HPP
#define PATH_RESOLVER_HPP

#include "directory.hpp"
#include <string>
#include <vector>

// Walks virtual paths ("sub\dir\file.txt") through a directory tree.
// Paths are always relative to the start directory given by the caller.
class PathResolver {
public:
    // Strips one leading separator; "" stays "".
    static std::string formatPath(const std::string& path);
    static std::vector<std::string> split(const std::string& path);
    static bool isSingleSegment(const std::string& path);
    static std::string join(const std::string& dirPath, const std::string& name);

    // Follows every segment but the last as a subdirectory.
    // Returns nullptr as soon as one is missing.
    static Directory* resolveParent(const std::vector<std::string>& segments, Directory& startNode);

    // Bare name match for single-segment paths, full path match otherwise.
    static File* resolveFile(const std::string& path, Directory& startNode);

    // Every segment is a directory; an empty path addresses startNode.
    static Directory* resolveDirectory(const std::string& path, Directory& startNode);
};

#endif
