#include "packedarchive.hpp"
#include "log.hpp"
#include "serializer.hpp"
#include "treequery.hpp"
#include <algorithm>
#include <map>
using namespace std;
namespace fs = std::filesystem;

// "VHP1\n" plus a 20 digit length and its newline always fit.
static const uint64_t kPrefixPeek = 32;

PackedArchive::PackedArchive(shared_ptr<IStorage> storage, const fs::path& archivePath, const ArchiveOptions& options)
    : Archive(std::move(storage), options), dataStart(0) {
    saveFile = archivePath;
}

Result<bool> PackedArchive::doCreate(const fs::path& directory) {
    if (currentState != ArchiveState::Uninitialized || !root->empty()) {
        return Result<bool>::fail("create: archive already holds a tree");
    }
    if (saveFile.empty()) return Result<bool>::fail("create: no archive path given");
    if (!store->directoryExists(directory)) {
        return Result<bool>::fail("create: cannot read source directory " + directory.string());
    }
    return finishCreate(ingestDirectory(directory, *root));
}

Result<bool> PackedArchive::doCreate(const vector<fs::path>& files, const vector<fs::path>& directories) {
    if (currentState != ArchiveState::Uninitialized || !root->empty()) {
        return Result<bool>::fail("create: archive already holds a tree");
    }
    if (saveFile.empty()) return Result<bool>::fail("create: no archive path given");

    for (auto& file : files) {
        Result<bool> r = ingestFile(file, *root);
        if (!r.success) return finishCreate(r);
    }
    for (auto& directory : directories) {
        if (!store->directoryExists(directory)) {
            return finishCreate(Result<bool>::fail("create: cannot read source directory " + directory.string()));
        }
        fs::path named = directory.filename().empty() ? directory.parent_path() : directory;
        string name = named.filename().string();
        if (!TreeQuery::isValidName(name)) {
            return finishCreate(Result<bool>::fail("create: unusable directory name '" + name + "'"));
        }
        Directory* sub = root->addSubdir(name, indexer);
        if (!sub) return finishCreate(Result<bool>::fail("create: directory listed twice: " + name));
        Result<bool> r = ingestDirectory(directory, *sub);
        if (!r.success) return finishCreate(r);
    }
    return finishCreate(Result<bool>::ok(true));
}

Result<bool> PackedArchive::finishCreate(const Result<bool>& ingested) {
    if (!ingested.success) {
        resetTree();
        logError(ingested.error);
        return ingested;
    }
    currentState = ArchiveState::Ready;
    Result<bool> saved = doSave();
    if (!saved.success) {
        resetTree();
        currentState = ArchiveState::Uninitialized;
        return saved;
    }
    logInfo("Archive created: " + saveFile.string() + " (" + to_string(root->countFiles()) + " files)");
    return saved;
}

Result<bool> PackedArchive::ingestDirectory(const fs::path& source, Directory& dir) {
    Result<vector<StorageEntry>> entries = store->listDirectory(source);
    if (!entries.success) return Result<bool>::fail("create: " + entries.error);

    for (auto& e : entries.value) {
        if (!TreeQuery::isValidName(e.name)) {
            logWarn("Skipping " + (source / e.name).string() + ": name cannot be stored");
            continue;
        }
        if (e.isDirectory) {
            Directory* sub = dir.addSubdir(e.name, indexer);
            if (!sub) return Result<bool>::fail("create: directory listed twice: " + e.name);
            Result<bool> r = ingestDirectory(source / e.name, *sub);
            if (!r.success) return r;
        } else {
            File* f = dir.addFile(e.name);
            if (!f) return Result<bool>::fail("create: file listed twice: " + e.name);
            f->setRealFile((source / e.name).string(), e.size);
        }
    }
    return Result<bool>::ok(true);
}

Result<bool> PackedArchive::ingestFile(const fs::path& source, Directory& dir) {
    if (!store->fileExists(source)) return Result<bool>::fail("create: cannot read source file " + source.string());
    Result<uint64_t> size = store->fileSize(source);
    if (!size.success) return Result<bool>::fail("create: " + size.error);

    string name = source.filename().string();
    if (!TreeQuery::isValidName(name)) return Result<bool>::fail("create: unusable file name '" + name + "'");
    File* f = dir.addFile(name);
    if (!f) return Result<bool>::fail("create: file listed twice: " + name);
    f->setRealFile(source.string(), size.value);
    return Result<bool>::ok(true);
}

Result<bool> PackedArchive::doRead(const fs::path& file) {
    if (currentState != ArchiveState::Uninitialized) {
        return Result<bool>::fail("read: archive already holds a tree");
    }
    Result<uint64_t> total = store->fileSize(file);
    if (!total.success) return Result<bool>::fail("read: " + total.error);

    Result<vector<char>> head = store->readRange(file, 0, min(total.value, kPrefixPeek));
    if (!head.success) return Result<bool>::fail("read: " + head.error);

    uint64_t headerLength = 0, prefixLength = 0;
    if (!Serializer::parsePrefix(string(head.value.begin(), head.value.end()), headerLength, prefixLength)) {
        return Result<bool>::fail("read: not a VHP archive: " + file.string());
    }
    if (prefixLength > total.value || headerLength > total.value - prefixLength) {
        return Result<bool>::fail("read: truncated header in " + file.string());
    }

    Result<vector<char>> header = store->readRange(file, prefixLength, headerLength);
    if (!header.success) return Result<bool>::fail("read: " + header.error);

    unique_ptr<Directory> tree;
    Result<bool> parsed = Serializer::parseHeader(string(header.value.begin(), header.value.end()), indexer, tree);
    if (!parsed.success) return Result<bool>::fail("read: " + file.string() + ": " + parsed.error);

    uint64_t dataSize = total.value - prefixLength - headerLength;
    vector<File*> files;
    Serializer::collectFiles(*tree, files);
    for (File* f : files) {
        if (f->offset > dataSize || f->size > dataSize - f->offset) {
            return Result<bool>::fail("read: " + f->fullPath() + " points past the end of " + file.string());
        }
    }

    root = std::move(tree);
    saveFile = file;
    dataStart = prefixLength + headerLength;
    currentState = ArchiveState::Ready;
    logInfo("Archive loaded: " + file.string() + " (" + to_string(files.size()) + " files)");
    return Result<bool>::ok(true);
}

Result<bool> PackedArchive::doSave() {
    Result<bool> ready = requireReady("save");
    if (!ready.success) return ready;
    if (saveFile.empty()) return Result<bool>::fail("save: no archive path given");

    vector<File*> files;
    Serializer::collectFiles(*root, files);
    map<const File*, uint64_t> offsets;
    uint64_t pos = 0;
    for (File* f : files) {
        offsets[f] = pos;
        pos += f->size;
    }

    string header = Serializer::writeHeader(*root, offsets);
    string prefix = Serializer::writePrefix(header.size());
    string head = prefix + header;

    fs::path tmp = saveFile;
    tmp += ".tmp";
    auto discard = [&](const string& error) {
        Result<bool> removed = store->remove(tmp);
        if (removed.hasError()) logWarn(removed.error);
        logError("Save failed: " + error);
        return Result<bool>::fail("save: " + error);
    };

    Result<bool> written = store->writeFile(tmp, vector<char>(head.begin(), head.end()));
    if (!written.success) return discard(written.error);

    for (File* f : files) {
        Result<vector<char>> content = readContent(*f);
        if (!content.success) {
            return discard(f->fullPath() + ": " + (content.hasError() ? content.error : "content missing"));
        }
        if (content.value.size() != f->size) {
            return discard(f->fullPath() + ": size changed from " + to_string(f->size) + " to " +
                           to_string(content.value.size()) + " bytes");
        }
        Result<bool> appended = store->appendFile(tmp, content.value);
        if (!appended.success) return discard(appended.error);
    }

    Result<bool> renamed = store->rename(tmp, saveFile);
    if (!renamed.success) return discard(renamed.error);

    dataStart = head.size();
    for (File* f : files) f->setStored(offsets[f], f->size);
    logInfo("Archive saved: " + saveFile.string() + " (" + to_string(files.size()) + " files, " + to_string(pos) +
            " bytes)");
    return Result<bool>::ok(true);
}

Result<vector<char>> PackedArchive::readContent(File& file) {
    switch (file.source) {
    case ContentSource::Pending:
        return Result<vector<char>>::ok(file.pending);
    case ContentSource::RealFile:
        return store->readFile(file.sourcePath);
    case ContentSource::Archive:
        if (file.size == 0) return Result<vector<char>>::ok(vector<char>());
        return store->readRange(saveFile, dataStart + file.offset, file.size);
    }
    return Result<vector<char>>::fail("unknown content source for " + file.fullPath());
}
