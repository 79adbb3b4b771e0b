#ifndef FILE_HPP
#define FILE_HPP

#include <cstdint>
#include <string>
#include <vector>

class Directory;

// Where the current bytes of a virtual file live.
enum class ContentSource {
    Archive,   // [offset, offset + size) of the archive data region
    Pending,   // written through the API, held in memory until save
    RealFile   // ingested by create, read from sourcePath at save time
};

class File {
public:
    std::string name;
    Directory* parent;          // owning directory, never owned here
    uint64_t size;
    uint64_t offset;
    ContentSource source;
    std::vector<char> pending;
    std::string sourcePath;

    File(const std::string& name_, Directory* parent_);

    std::string fullPath() const;

    void setPending(const std::vector<char>& data);
    void setRealFile(const std::string& path, uint64_t fileSize);
    void setStored(uint64_t newOffset, uint64_t newSize);
};

#endif
