#include "encryptedarchive.hpp"
#include "log.hpp"
#include "treequery.hpp"
#include <stdexcept>
using namespace std;
namespace fs = std::filesystem;

EncryptedArchive::EncryptedArchive(unique_ptr<Archive> inner_, const string& key_)
    : LayeredArchive(std::move(inner_)), key(key_) {
    if (key.empty()) throw invalid_argument("encryption key must not be empty");
}

vector<char> EncryptedArchive::transform(const vector<char>& data) const {
    vector<char> out(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        out[i] = (char)((unsigned char)data[i] ^ (unsigned char)key[i % key.size()]);
    }
    return out;
}

// Sources are encoded into a staging tree; the inner archive only sees it
// once every source has been read.
Result<bool> EncryptedArchive::doCreate(const fs::path& directory) {
    Result<bool> creatable = checkCreatable();
    if (!creatable.success) return creatable;
    if (!store->directoryExists(directory)) {
        return Result<bool>::fail("create: cannot read source directory " + directory.string());
    }
    unique_ptr<Directory> staging(new Directory("", nullptr, 0));
    Result<bool> ingested = ingestDirectory(directory, *staging);
    return finishCreate(ingested, std::move(staging));
}

Result<bool> EncryptedArchive::doCreate(const vector<fs::path>& files, const vector<fs::path>& directories) {
    Result<bool> creatable = checkCreatable();
    if (!creatable.success) return creatable;

    unique_ptr<Directory> staging(new Directory("", nullptr, 0));
    for (auto& file : files) {
        if (!store->fileExists(file)) {
            return finishCreate(Result<bool>::fail("create: cannot read source file " + file.string()), std::move(staging));
        }
        Result<bool> r = ingestFile(file, *staging);
        if (!r.success) return finishCreate(r, std::move(staging));
    }
    for (auto& directory : directories) {
        if (!store->directoryExists(directory)) {
            return finishCreate(Result<bool>::fail("create: cannot read source directory " + directory.string()),
                                std::move(staging));
        }
        fs::path named = directory.filename().empty() ? directory.parent_path() : directory;
        string name = named.filename().string();
        if (!TreeQuery::isValidName(name)) {
            return finishCreate(Result<bool>::fail("create: unusable directory name '" + name + "'"), std::move(staging));
        }
        Directory* sub = staging->addSubdir(name, directoryIndexer());
        if (!sub) return finishCreate(Result<bool>::fail("create: directory listed twice: " + name), std::move(staging));
        Result<bool> r = ingestDirectory(directory, *sub);
        if (!r.success) return finishCreate(r, std::move(staging));
    }
    return finishCreate(Result<bool>::ok(true), std::move(staging));
}

Result<bool> EncryptedArchive::finishCreate(const Result<bool>& ingested, unique_ptr<Directory> staging) {
    if (!ingested.success) {
        directoryIndexer().reset();
        logError(ingested.error);
        return ingested;
    }
    Result<bool> saved = adoptTree(std::move(staging));
    if (saved.success) logInfo("Encrypted archive created: " + savePath().string());
    return saved;
}

Result<bool> EncryptedArchive::ingestDirectory(const fs::path& source, Directory& dir) {
    Result<vector<StorageEntry>> entries = store->listDirectory(source);
    if (!entries.success) return Result<bool>::fail("create: " + entries.error);

    for (auto& e : entries.value) {
        if (!TreeQuery::isValidName(e.name)) {
            logWarn("Skipping " + (source / e.name).string() + ": name cannot be stored");
            continue;
        }
        Result<bool> r;
        if (e.isDirectory) {
            Directory* sub = dir.addSubdir(e.name, directoryIndexer());
            if (!sub) return Result<bool>::fail("create: directory listed twice: " + e.name);
            r = ingestDirectory(source / e.name, *sub);
        } else {
            r = ingestFile(source / e.name, dir);
        }
        if (!r.success) return r;
    }
    return Result<bool>::ok(true);
}

Result<bool> EncryptedArchive::ingestFile(const fs::path& source, Directory& dir) {
    string name = source.filename().string();
    if (!TreeQuery::isValidName(name)) return Result<bool>::fail("create: unusable file name '" + name + "'");
    Result<uint64_t> size = store->fileSize(source);
    if (!size.success) return Result<bool>::fail("create: " + size.error);
    if (size.value > kMaxContentSize) return Result<bool>::fail("create: " + source.string() + " exceeds the 1 GiB limit");

    Result<vector<char>> bytes = store->readFile(source);
    if (!bytes.success) return Result<bool>::fail("create: " + bytes.error);
    File* f = dir.addFile(name);
    if (!f) return Result<bool>::fail("create: file listed twice: " + name);
    f->setPending(transform(bytes.value));
    return Result<bool>::ok(true);
}

Result<vector<char>> EncryptedArchive::readContent(File& file) {
    Result<vector<char>> raw = LayeredArchive::readContent(file);
    if (!raw.success) return raw;
    return Result<vector<char>>::ok(transform(raw.value));
}

// Extraction and reads go through this layer's readContent.
Result<bool> EncryptedArchive::doExtract(const fs::path& targetDir) {
    return Archive::doExtract(targetDir);
}

Result<bool> EncryptedArchive::doExtractFiles(const vector<string>& files, const fs::path& targetDir) {
    return Archive::doExtractFiles(files, targetDir);
}

Result<bool> EncryptedArchive::doExtractFiles(const vector<File*>& files, const fs::path& targetDir) {
    return Archive::doExtractFiles(files, targetDir);
}

Result<bool> EncryptedArchive::doExtractDirectory(Directory& dir, const fs::path& targetDir) {
    return Archive::doExtractDirectory(dir, targetDir);
}

Result<bool> EncryptedArchive::doExtractDirectory(const string& path, const fs::path& targetDir) {
    return Archive::doExtractDirectory(path, targetDir);
}

Result<vector<char>> EncryptedArchive::doReadAllBytes(const string& path, Directory& startNode) {
    return Archive::doReadAllBytes(path, startNode);
}

Result<string> EncryptedArchive::doReadAllText(const string& path, Directory& startNode) {
    return Archive::doReadAllText(path, startNode);
}

Result<bool> EncryptedArchive::doWriteAllBytes(const vector<char>& data, const string& name, Directory& dir,
                                               bool overrideExisting) {
    return LayeredArchive::doWriteAllBytes(transform(data), name, dir, overrideExisting);
}

Result<bool> EncryptedArchive::doWriteAllBytes(const vector<char>& data, const string& path, bool overrideExisting) {
    return LayeredArchive::doWriteAllBytes(transform(data), path, overrideExisting);
}

Result<bool> EncryptedArchive::doWriteAllText(const string& content, const string& name, Directory& dir,
                                              bool overrideExisting) {
    return doWriteAllBytes(vector<char>(content.begin(), content.end()), name, dir, overrideExisting);
}

Result<bool> EncryptedArchive::doWriteStream(const string& name, Directory& dir, istream& stream, bool overrideExisting) {
    Result<vector<char>> data = readStream(stream);
    if (!data.success) return Result<bool>::fail(name + ": " + data.error);
    return doWriteAllBytes(data.value, name, dir, overrideExisting);
}
