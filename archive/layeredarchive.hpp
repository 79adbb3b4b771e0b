#ifndef LAYERED_ARCHIVE_HPP
#define LAYERED_ARCHIVE_HPP

#include "archive.hpp"

// Wraps another archive and forwards every lifecycle call to it.
// The tree seen through a layer is the inner archive's tree; subclasses
// override the calls they want to transform. The layer's own root, indexer
// and save path inherited from Archive stay empty and are never consulted.
class LayeredArchive : public Archive {
public:
    explicit LayeredArchive(std::unique_ptr<Archive> inner);

    Directory& rootDirectory() override;
    ArchiveState state() const override;
    std::filesystem::path savePath() const override;

    Archive& innerArchive() { return *inner; }

protected:
    DirectoryIndexer& directoryIndexer() override;

    // Fails unless the inner archive could still be created.
    Result<bool> checkCreatable();
    // Makes tree the inner archive's content and saves it. On failure the
    // inner archive is back to Uninitialized with an empty tree.
    Result<bool> adoptTree(std::unique_ptr<Directory> tree);

    Result<bool> doCreate(const std::filesystem::path& directory) override;
    Result<bool> doCreate(const std::vector<std::filesystem::path>& files,
                          const std::vector<std::filesystem::path>& directories) override;
    Result<bool> doRead(const std::filesystem::path& file) override;
    Result<bool> doSave() override;
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

    std::unique_ptr<Archive> inner;
};

#endif
