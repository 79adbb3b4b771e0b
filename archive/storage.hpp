#ifndef STORAGE_HPP
#define STORAGE_HPP

#include "result.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

struct StorageEntry {
    std::string name;
    bool isDirectory;
    uint64_t size;
};

// Access to real storage. Archives only touch the outside world through
// this interface, and only from lifecycle operations and content reads.
class IStorage {
public:
    virtual ~IStorage() = default;

    virtual Result<std::vector<char>> readFile(const std::filesystem::path& path) = 0;
    virtual Result<std::vector<char>> readRange(const std::filesystem::path& path, uint64_t offset, uint64_t length) = 0;
    virtual Result<bool> writeFile(const std::filesystem::path& path, const std::vector<char>& data) = 0;
    virtual Result<bool> appendFile(const std::filesystem::path& path, const std::vector<char>& data) = 0;
    virtual Result<uint64_t> fileSize(const std::filesystem::path& path) = 0;

    virtual bool fileExists(const std::filesystem::path& path) = 0;
    virtual bool directoryExists(const std::filesystem::path& path) = 0;
    // Entries sorted by name.
    virtual Result<std::vector<StorageEntry>> listDirectory(const std::filesystem::path& path) = 0;
    virtual Result<bool> createDirectories(const std::filesystem::path& path) = 0;
    virtual Result<bool> rename(const std::filesystem::path& from, const std::filesystem::path& to) = 0;
    virtual Result<bool> remove(const std::filesystem::path& path) = 0;
};

#endif
