#ifndef DIRECTORY_HPP
#define DIRECTORY_HPP

#include "file.hpp"
#include "dirindexer.hpp"
#include <memory>
#include <string>
#include <vector>

// Separator between segments of a virtual path.
const char kPathSeparator = '\\';

class Directory {
public:
    std::string name;
    Directory* parent;
    int index;
    std::vector<std::unique_ptr<File>> files;
    std::vector<std::unique_ptr<Directory>> subdirs;

    Directory(const std::string& name_, Directory* parent_, int index_);

    // Ancestor names joined with the separator; "" for the root.
    std::string fullPath() const;
    bool isRoot() const { return parent == nullptr; }
    bool empty() const { return files.empty() && subdirs.empty(); }

    // Subdirectories
    bool contains(const std::string& name) const;
    int indexOf(const std::string& name) const;
    Directory* findSubdir(const std::string& name);
    Directory* addSubdir(const std::string& name, DirectoryIndexer& indexer);
    bool removeSubdir(const Directory* dir);

    // Files
    bool hasFile(const std::string& filename) const;
    File* findFile(const std::string& filename);
    File* fileByPath(const std::string& path);
    File* addFile(const std::string& filename);
    bool removeFile(const File* file);

    void clear();
    size_t countFiles() const;   // whole subtree
};

#endif
