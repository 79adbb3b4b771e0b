#ifndef LOCAL_STORAGE_HPP
#define LOCAL_STORAGE_HPP

#include "storage.hpp"

// IStorage on the local filesystem.
class LocalStorage : public IStorage {
public:
    Result<std::vector<char>> readFile(const std::filesystem::path& path) override;
    Result<std::vector<char>> readRange(const std::filesystem::path& path, uint64_t offset, uint64_t length) override;
    Result<bool> writeFile(const std::filesystem::path& path, const std::vector<char>& data) override;
    Result<bool> appendFile(const std::filesystem::path& path, const std::vector<char>& data) override;
    Result<uint64_t> fileSize(const std::filesystem::path& path) override;

    bool fileExists(const std::filesystem::path& path) override;
    bool directoryExists(const std::filesystem::path& path) override;
    Result<std::vector<StorageEntry>> listDirectory(const std::filesystem::path& path) override;
    Result<bool> createDirectories(const std::filesystem::path& path) override;
    Result<bool> rename(const std::filesystem::path& from, const std::filesystem::path& to) override;
    Result<bool> remove(const std::filesystem::path& path) override;
};

#endif
