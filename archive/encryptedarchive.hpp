#ifndef ENCRYPTED_ARCHIVE_HPP
#define ENCRYPTED_ARCHIVE_HPP

#include "layeredarchive.hpp"
#include <string>

// Layer that stores file contents XOR-ed with a repeating key.
// Names and the tree shape stay readable; this hides content from casual
// inspection and nothing more.
class EncryptedArchive : public LayeredArchive {
public:
    // Throws std::invalid_argument for an empty key.
    EncryptedArchive(std::unique_ptr<Archive> inner, const std::string& key);

    std::vector<char> transform(const std::vector<char>& data) const;

protected:
    Result<bool> doCreate(const std::filesystem::path& directory) override;
    Result<bool> doCreate(const std::vector<std::filesystem::path>& files,
                          const std::vector<std::filesystem::path>& directories) override;
    Result<std::vector<char>> readContent(File& file) override;

    Result<bool> doExtract(const std::filesystem::path& targetDir) override;
    Result<bool> doExtractFiles(const std::vector<std::string>& files, const std::filesystem::path& targetDir) override;
    Result<bool> doExtractFiles(const std::vector<File*>& files, const std::filesystem::path& targetDir) override;
    Result<bool> doExtractDirectory(Directory& dir, const std::filesystem::path& targetDir) override;
    Result<bool> doExtractDirectory(const std::string& path, const std::filesystem::path& targetDir) override;
    Result<std::vector<char>> doReadAllBytes(const std::string& path, Directory& startNode) override;
    Result<std::string> doReadAllText(const std::string& path, Directory& startNode) override;
    Result<bool> doWriteAllBytes(const std::vector<char>& data, const std::string& name, Directory& dir,
                                 bool overrideExisting) override;
    Result<bool> doWriteAllBytes(const std::vector<char>& data, const std::string& path, bool overrideExisting) override;
    Result<bool> doWriteAllText(const std::string& content, const std::string& name, Directory& dir,
                                bool overrideExisting) override;
    Result<bool> doWriteStream(const std::string& name, Directory& dir, std::istream& stream,
                               bool overrideExisting) override;

private:
    Result<bool> ingestDirectory(const std::filesystem::path& source, Directory& dir);
    Result<bool> ingestFile(const std::filesystem::path& source, Directory& dir);
    Result<bool> finishCreate(const Result<bool>& ingested, std::unique_ptr<Directory> staging);

    std::string key;
};

#endif
