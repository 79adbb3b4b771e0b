#ifndef PACKED_ARCHIVE_HPP
#define PACKED_ARCHIVE_HPP

#include "archive.hpp"

// The .vhp encoding: a text header describing the tree followed by the
// concatenated file contents. Reading only loads the header; contents are
// fetched from the archive file when they are asked for.
class PackedArchive : public Archive {
public:
    PackedArchive(std::shared_ptr<IStorage> storage, const std::filesystem::path& archivePath,
                  const ArchiveOptions& options = ArchiveOptions());

    uint64_t dataOffset() const { return dataStart; }

protected:
    Result<bool> doCreate(const std::filesystem::path& directory) override;
    Result<bool> doCreate(const std::vector<std::filesystem::path>& files,
                          const std::vector<std::filesystem::path>& directories) override;
    Result<bool> doRead(const std::filesystem::path& file) override;
    Result<bool> doSave() override;
    Result<std::vector<char>> readContent(File& file) override;

private:
    Result<bool> ingestDirectory(const std::filesystem::path& source, Directory& dir);
    Result<bool> ingestFile(const std::filesystem::path& source, Directory& dir);
    Result<bool> finishCreate(const Result<bool>& ingested);

    uint64_t dataStart;
};

#endif
