#ifndef TREE_QUERY_HPP
#define TREE_QUERY_HPP

#include "directory.hpp"
#include "result.hpp"
#include <string>
#include <vector>

struct SearchResult {
    std::vector<Directory*> directories;
    std::vector<File*> files;
};

// Existence, removal and search over a directory tree.
// Nothing here locks: callers serialize mutations, and read-only queries
// must not overlap a mutation of the same tree.
class TreeQuery {
public:
    static bool fileExists(const std::string& path, Directory& startNode);

    // Not found is success == false with no error text.
    static Result<bool> removeFile(const std::string& path, Directory& startNode);
    static Result<bool> removeDirectory(const std::string& path, Directory& startNode);
    static Result<bool> createDirectory(const std::string& path, Directory& startNode, DirectoryIndexer& indexer);

    // Case-insensitive substring match on names.
    // Without recursion only the files of startNode are tested.
    static SearchResult search(const std::string& query, Directory& startNode, bool recurse);

    static bool isValidName(const std::string& name);
};

#endif
