#include "layeredarchive.hpp"
using namespace std;
namespace fs = std::filesystem;

LayeredArchive::LayeredArchive(unique_ptr<Archive> inner_)
    : Archive(inner_->storage(), inner_->options()), inner(std::move(inner_)) {}

Directory& LayeredArchive::rootDirectory() { return inner->rootDirectory(); }
ArchiveState LayeredArchive::state() const { return inner->state(); }
fs::path LayeredArchive::savePath() const { return inner->savePath(); }
DirectoryIndexer& LayeredArchive::directoryIndexer() { return inner->directoryIndexer(); }

Result<bool> LayeredArchive::checkCreatable() {
    if (inner->state() != ArchiveState::Uninitialized || !inner->rootDirectory().empty()) {
        return Result<bool>::fail("create: archive already holds a tree");
    }
    if (inner->savePath().empty()) return Result<bool>::fail("create: no archive path given");
    return Result<bool>::ok(true);
}

Result<bool> LayeredArchive::adoptTree(unique_ptr<Directory> tree) {
    inner->root = std::move(tree);
    inner->currentState = ArchiveState::Ready;
    Result<bool> saved = inner->doSave();
    if (!saved.success) {
        inner->resetTree();
        inner->currentState = ArchiveState::Uninitialized;
    }
    return saved;
}

Result<bool> LayeredArchive::doCreate(const fs::path& directory) { return inner->doCreate(directory); }

Result<bool> LayeredArchive::doCreate(const vector<fs::path>& files, const vector<fs::path>& directories) {
    return inner->doCreate(files, directories);
}

Result<bool> LayeredArchive::doRead(const fs::path& file) { return inner->doRead(file); }
Result<bool> LayeredArchive::doSave() { return inner->doSave(); }
Result<vector<char>> LayeredArchive::readContent(File& file) { return inner->readContent(file); }

Result<bool> LayeredArchive::doExtract(const fs::path& targetDir) { return inner->doExtract(targetDir); }

Result<bool> LayeredArchive::doExtractFiles(const vector<string>& files, const fs::path& targetDir) {
    return inner->doExtractFiles(files, targetDir);
}

Result<bool> LayeredArchive::doExtractFiles(const vector<File*>& files, const fs::path& targetDir) {
    return inner->doExtractFiles(files, targetDir);
}

Result<bool> LayeredArchive::doExtractDirectory(Directory& dir, const fs::path& targetDir) {
    return inner->doExtractDirectory(dir, targetDir);
}

Result<bool> LayeredArchive::doExtractDirectory(const string& path, const fs::path& targetDir) {
    return inner->doExtractDirectory(path, targetDir);
}

Result<vector<char>> LayeredArchive::doReadAllBytes(const string& path, Directory& startNode) {
    return inner->doReadAllBytes(path, startNode);
}

Result<string> LayeredArchive::doReadAllText(const string& path, Directory& startNode) {
    return inner->doReadAllText(path, startNode);
}

Result<bool> LayeredArchive::doWriteAllBytes(const vector<char>& data, const string& name, Directory& dir,
                                             bool overrideExisting) {
    return inner->doWriteAllBytes(data, name, dir, overrideExisting);
}

Result<bool> LayeredArchive::doWriteAllBytes(const vector<char>& data, const string& path, bool overrideExisting) {
    return inner->doWriteAllBytes(data, path, overrideExisting);
}

Result<bool> LayeredArchive::doWriteAllText(const string& content, const string& name, Directory& dir,
                                            bool overrideExisting) {
    return inner->doWriteAllText(content, name, dir, overrideExisting);
}

Result<bool> LayeredArchive::doWriteStream(const string& name, Directory& dir, istream& stream, bool overrideExisting) {
    return inner->doWriteStream(name, dir, stream, overrideExisting);
}
