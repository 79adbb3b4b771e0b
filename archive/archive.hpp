#ifndef ARCHIVE_HPP
#define ARCHIVE_HPP

#include "directory.hpp"
#include "dirindexer.hpp"
#include "result.hpp"
#include "storage.hpp"
#include "treequery.hpp"
#include <cstdint>
#include <filesystem>
#include <future>
#include <istream>
#include <memory>
#include <string>
#include <vector>

// Largest single file content the read and stream-write operations accept.
const uint64_t kMaxContentSize = 1024ULL * 1024ULL * 1024ULL;

struct ArchiveOptions {
    bool saveAfterChange;   // save after every successful mutation

    ArchiveOptions() : saveAfterChange(false) {}
};

enum class ArchiveState {
    Uninitialized,   // neither created nor read
    Ready
};

// A virtual directory tree persisted as one physical file.
//
// With saveAfterChange set, a mutation whose autosave fails returns an
// error but is kept in memory.
//
// Tree queries (fileExists, search) run on the caller's thread. Every other
// operation runs on a worker and hands back a future; the caller awaits it
// before starting the next mutation. There is no locking inside: one owner
// drives an archive at a time, and queries must not overlap a mutation.
class Archive {
public:
    Archive(std::shared_ptr<IStorage> storage, const ArchiveOptions& options);
    virtual ~Archive();

    Archive(const Archive&) = delete;
    Archive& operator=(const Archive&) = delete;

    virtual Directory& rootDirectory();
    virtual ArchiveState state() const;
    virtual std::filesystem::path savePath() const;
    std::shared_ptr<IStorage> storage() const { return store; }
    const ArchiveOptions& options() const { return opts; }

    std::string formatPath(const std::string& path) const;

    // Query engine
    bool fileExists(const std::string& path, Directory& startNode);
    bool fileExists(const std::string& path) { return fileExists(path, rootDirectory()); }
    SearchResult search(const std::string& query, Directory& startNode, bool recurse);
    std::future<Result<bool>> removeFile(const std::string& path, Directory& startNode);
    std::future<Result<bool>> createDirectory(const std::string& path, Directory& startNode);
    std::future<Result<bool>> removeDirectory(const std::string& path, Directory& startNode);

    // Lifecycle
    std::future<Result<bool>> create(const std::filesystem::path& directory);
    std::future<Result<bool>> create(const std::vector<std::filesystem::path>& files,
                                     const std::vector<std::filesystem::path>& directories);
    std::future<Result<bool>> read(const std::filesystem::path& file);
    std::future<Result<bool>> save();

    std::future<Result<bool>> extract(const std::filesystem::path& targetDir);
    std::future<Result<bool>> extractFiles(const std::vector<std::string>& files, const std::filesystem::path& targetDir);
    std::future<Result<bool>> extractFiles(const std::vector<File*>& files, const std::filesystem::path& targetDir);
    std::future<Result<bool>> extractDirectory(Directory& dir, const std::filesystem::path& targetDir);
    std::future<Result<bool>> extractDirectory(const std::string& path, const std::filesystem::path& targetDir);

    // Content is limited to kMaxContentSize bytes.
    std::future<Result<std::string>> readAllText(const std::string& path, Directory& startNode);
    std::future<Result<std::vector<char>>> readAllBytes(const std::string& path, Directory& startNode);

    std::future<Result<bool>> writeAllBytes(const std::vector<char>& data, const std::string& name, Directory& dir,
                                            bool overrideExisting = false);
    std::future<Result<bool>> writeAllBytes(const std::vector<char>& data, const std::string& path,
                                            bool overrideExisting = false);
    std::future<Result<bool>> writeAllText(const std::string& content, const std::string& name, Directory& dir,
                                           bool overrideExisting = false);
    std::future<Result<bool>> writeStream(const std::string& name, Directory& dir, std::istream& stream,
                                          bool overrideExisting = false);

protected:
    friend class LayeredArchive;

    virtual DirectoryIndexer& directoryIndexer();

    // Encoding specific
    virtual Result<bool> doCreate(const std::filesystem::path& directory) = 0;
    virtual Result<bool> doCreate(const std::vector<std::filesystem::path>& files,
                                  const std::vector<std::filesystem::path>& directories) = 0;
    virtual Result<bool> doRead(const std::filesystem::path& file) = 0;
    virtual Result<bool> doSave() = 0;
    virtual Result<std::vector<char>> readContent(File& file) = 0;

    // Defaults built on readContent and the tree
    virtual Result<bool> doExtract(const std::filesystem::path& targetDir);
    virtual Result<bool> doExtractFiles(const std::vector<std::string>& files, const std::filesystem::path& targetDir);
    virtual Result<bool> doExtractFiles(const std::vector<File*>& files, const std::filesystem::path& targetDir);
    virtual Result<bool> doExtractDirectory(Directory& dir, const std::filesystem::path& targetDir);
    virtual Result<bool> doExtractDirectory(const std::string& path, const std::filesystem::path& targetDir);
    virtual Result<std::vector<char>> doReadAllBytes(const std::string& path, Directory& startNode);
    virtual Result<std::string> doReadAllText(const std::string& path, Directory& startNode);
    virtual Result<bool> doWriteAllBytes(const std::vector<char>& data, const std::string& name, Directory& dir,
                                         bool overrideExisting);
    virtual Result<bool> doWriteAllBytes(const std::vector<char>& data, const std::string& path, bool overrideExisting);
    virtual Result<bool> doWriteAllText(const std::string& content, const std::string& name, Directory& dir,
                                        bool overrideExisting);
    virtual Result<bool> doWriteStream(const std::string& name, Directory& dir, std::istream& stream,
                                       bool overrideExisting);

    // Saves when saveAfterChange is set and the change went through.
    // A failed save is reported as a failure, but the change itself stays
    // applied to the in-memory tree; a later save() may still persist it.
    Result<bool> afterChange(const Result<bool>& change);
    Result<bool> requireReady(const char* operation) const;
    Result<bool> extractContents(Directory& dir, const std::filesystem::path& targetDir);
    Result<bool> extractFile(File& file, const std::filesystem::path& targetDir);
    void resetTree();

    std::unique_ptr<Directory> root;
    std::shared_ptr<IStorage> store;
    std::filesystem::path saveFile;
    ArchiveOptions opts;
    DirectoryIndexer indexer;
    ArchiveState currentState;
};

// Reads a stream to the end, failing past kMaxContentSize bytes.
Result<std::vector<char>> readStream(std::istream& stream);

#endif
