#include "archive.hpp"
#include "log.hpp"
#include "pathresolver.hpp"
#include <utility>
using namespace std;
namespace fs = std::filesystem;

// Runs one unit of archive work on a worker thread.
template <typename Work>
static auto offload(Work work) -> future<decltype(work())> {
    return async(launch::async, std::move(work));
}

Archive::Archive(shared_ptr<IStorage> storage, const ArchiveOptions& options)
    : root(new Directory("", nullptr, 0)), store(std::move(storage)), opts(options),
      currentState(ArchiveState::Uninitialized) {}

Archive::~Archive() {}

Directory& Archive::rootDirectory() { return *root; }
ArchiveState Archive::state() const { return currentState; }
fs::path Archive::savePath() const { return saveFile; }
DirectoryIndexer& Archive::directoryIndexer() { return indexer; }

string Archive::formatPath(const string& path) const {
    return PathResolver::formatPath(path);
}

bool Archive::fileExists(const string& path, Directory& startNode) {
    return TreeQuery::fileExists(path, startNode);
}

SearchResult Archive::search(const string& query, Directory& startNode, bool recurse) {
    return TreeQuery::search(query, startNode, recurse);
}

future<Result<bool>> Archive::removeFile(const string& path, Directory& startNode) {
    Directory* start = &startNode;
    return offload([this, path, start]() {
        Result<bool> r = TreeQuery::removeFile(path, *start);
        if (r.success) logInfo("File removed: " + path);
        return afterChange(r);
    });
}

future<Result<bool>> Archive::createDirectory(const string& path, Directory& startNode) {
    Directory* start = &startNode;
    return offload([this, path, start]() {
        Result<bool> r = TreeQuery::createDirectory(path, *start, directoryIndexer());
        if (r.success) logInfo("Directory created: " + path);
        return afterChange(r);
    });
}

future<Result<bool>> Archive::removeDirectory(const string& path, Directory& startNode) {
    Directory* start = &startNode;
    return offload([this, path, start]() {
        Result<bool> r = TreeQuery::removeDirectory(path, *start);
        if (r.success) logInfo("Directory removed: " + path);
        return afterChange(r);
    });
}

future<Result<bool>> Archive::create(const fs::path& directory) {
    return offload([this, directory]() { return doCreate(directory); });
}

future<Result<bool>> Archive::create(const vector<fs::path>& files, const vector<fs::path>& directories) {
    return offload([this, files, directories]() { return doCreate(files, directories); });
}

future<Result<bool>> Archive::read(const fs::path& file) {
    return offload([this, file]() { return doRead(file); });
}

future<Result<bool>> Archive::save() {
    return offload([this]() { return doSave(); });
}

future<Result<bool>> Archive::extract(const fs::path& targetDir) {
    return offload([this, targetDir]() { return doExtract(targetDir); });
}

future<Result<bool>> Archive::extractFiles(const vector<string>& files, const fs::path& targetDir) {
    return offload([this, files, targetDir]() { return doExtractFiles(files, targetDir); });
}

future<Result<bool>> Archive::extractFiles(const vector<File*>& files, const fs::path& targetDir) {
    return offload([this, files, targetDir]() { return doExtractFiles(files, targetDir); });
}

future<Result<bool>> Archive::extractDirectory(Directory& dir, const fs::path& targetDir) {
    Directory* d = &dir;
    return offload([this, d, targetDir]() { return doExtractDirectory(*d, targetDir); });
}

future<Result<bool>> Archive::extractDirectory(const string& path, const fs::path& targetDir) {
    return offload([this, path, targetDir]() { return doExtractDirectory(path, targetDir); });
}

future<Result<string>> Archive::readAllText(const string& path, Directory& startNode) {
    Directory* start = &startNode;
    return offload([this, path, start]() { return doReadAllText(path, *start); });
}

future<Result<vector<char>>> Archive::readAllBytes(const string& path, Directory& startNode) {
    Directory* start = &startNode;
    return offload([this, path, start]() { return doReadAllBytes(path, *start); });
}

future<Result<bool>> Archive::writeAllBytes(const vector<char>& data, const string& name, Directory& dir,
                                            bool overrideExisting) {
    Directory* d = &dir;
    return offload([this, data, name, d, overrideExisting]() {
        return doWriteAllBytes(data, name, *d, overrideExisting);
    });
}

future<Result<bool>> Archive::writeAllBytes(const vector<char>& data, const string& path, bool overrideExisting) {
    return offload([this, data, path, overrideExisting]() { return doWriteAllBytes(data, path, overrideExisting); });
}

future<Result<bool>> Archive::writeAllText(const string& content, const string& name, Directory& dir,
                                           bool overrideExisting) {
    Directory* d = &dir;
    return offload([this, content, name, d, overrideExisting]() {
        return doWriteAllText(content, name, *d, overrideExisting);
    });
}

future<Result<bool>> Archive::writeStream(const string& name, Directory& dir, istream& stream, bool overrideExisting) {
    Directory* d = &dir;
    istream* in = &stream;
    return offload([this, name, d, in, overrideExisting]() {
        return doWriteStream(name, *d, *in, overrideExisting);
    });
}

Result<bool> Archive::afterChange(const Result<bool>& change) {
    if (!change.success || !opts.saveAfterChange) return change;
    Result<bool> saved = doSave();
    if (!saved.success) return Result<bool>::fail("change applied but save failed: " + saved.error);
    return change;
}

Result<bool> Archive::requireReady(const char* operation) const {
    if (state() == ArchiveState::Uninitialized) {
        return Result<bool>::fail(string(operation) + ": archive was neither created nor read");
    }
    return Result<bool>::ok(true);
}

void Archive::resetTree() {
    root.reset(new Directory("", nullptr, 0));
    indexer.reset();
}

Result<bool> Archive::extractFile(File& file, const fs::path& targetDir) {
    Result<vector<char>> content = readContent(file);
    if (!content.success) {
        return Result<bool>::fail(file.fullPath() + ": " + (content.hasError() ? content.error : "content not found"));
    }
    Result<bool> written = store->writeFile(targetDir / file.name, content.value);
    if (!written.success) return Result<bool>::fail(file.fullPath() + ": " + written.error);
    return written;
}

// Independent entries are extracted even if a sibling fails; the first
// failure is reported.
Result<bool> Archive::extractContents(Directory& dir, const fs::path& targetDir) {
    Result<bool> created = store->createDirectories(targetDir);
    if (!created.success) return created;

    string firstError;
    int failures = 0;
    for (auto& f : dir.files) {
        Result<bool> r = extractFile(*f, targetDir);
        if (!r.success) {
            if (failures++ == 0) firstError = r.error;
            logError("Extract failed: " + r.error);
        }
    }
    for (auto& sd : dir.subdirs) {
        Result<bool> r = extractContents(*sd, targetDir / sd->name);
        if (!r.success) {
            if (failures++ == 0) firstError = r.error;
        }
    }
    if (failures > 0) {
        return Result<bool>::fail(to_string(failures) + " entries failed to extract; first: " + firstError);
    }
    return Result<bool>::ok(true);
}

Result<bool> Archive::doExtract(const fs::path& targetDir) {
    Result<bool> ready = requireReady("extract");
    if (!ready.success) return ready;
    Result<bool> r = extractContents(rootDirectory(), targetDir);
    if (r.success) logInfo("Extracted archive to " + targetDir.string());
    return r;
}

Result<bool> Archive::doExtractFiles(const vector<string>& files, const fs::path& targetDir) {
    vector<File*> resolved;
    string firstError;
    int failures = 0;
    for (auto& path : files) {
        File* f = PathResolver::resolveFile(path, rootDirectory());
        if (f) {
            resolved.push_back(f);
        } else if (failures++ == 0) {
            firstError = "not found: " + path;
        }
    }

    Result<bool> r = doExtractFiles(resolved, targetDir);
    if (!r.success && failures == 0) return r;
    if (failures > 0) {
        if (!r.success) firstError += "; " + r.error;
        return Result<bool>::fail(to_string(failures) + " files could not be resolved; first: " + firstError);
    }
    return r;
}

Result<bool> Archive::doExtractFiles(const vector<File*>& files, const fs::path& targetDir) {
    Result<bool> ready = requireReady("extract files");
    if (!ready.success) return ready;
    Result<bool> created = store->createDirectories(targetDir);
    if (!created.success) return created;

    string firstError;
    int failures = 0;
    for (File* f : files) {
        Result<bool> r = extractFile(*f, targetDir);
        if (!r.success && failures++ == 0) firstError = r.error;
    }
    if (failures > 0) {
        return Result<bool>::fail(to_string(failures) + " files failed to extract; first: " + firstError);
    }
    logInfo("Extracted " + to_string(files.size()) + " files to " + targetDir.string());
    return Result<bool>::ok(true);
}

Result<bool> Archive::doExtractDirectory(Directory& dir, const fs::path& targetDir) {
    Result<bool> ready = requireReady("extract directory");
    if (!ready.success) return ready;
    fs::path target = dir.isRoot() ? targetDir : targetDir / dir.name;
    Result<bool> r = extractContents(dir, target);
    if (r.success) logInfo("Extracted directory '" + dir.fullPath() + "' to " + target.string());
    return r;
}

Result<bool> Archive::doExtractDirectory(const string& path, const fs::path& targetDir) {
    Directory* dir = PathResolver::resolveDirectory(path, rootDirectory());
    if (!dir) return Result<bool>::notFound();
    return doExtractDirectory(*dir, targetDir);
}

Result<vector<char>> Archive::doReadAllBytes(const string& path, Directory& startNode) {
    Result<bool> ready = requireReady("read");
    if (!ready.success) return Result<vector<char>>::fail(ready.error);

    File* f = PathResolver::resolveFile(path, startNode);
    if (!f) return Result<vector<char>>::notFound();
    if (f->size > kMaxContentSize) {
        return Result<vector<char>>::fail(f->fullPath() + " is " + to_string(f->size) + " bytes, larger than the 1 GiB limit");
    }
    return readContent(*f);
}

Result<string> Archive::doReadAllText(const string& path, Directory& startNode) {
    Result<vector<char>> bytes = doReadAllBytes(path, startNode);
    if (!bytes.success) return Result<string>(false, string(), bytes.error);
    return Result<string>::ok(string(bytes.value.begin(), bytes.value.end()));
}

Result<bool> Archive::doWriteAllBytes(const vector<char>& data, const string& name, Directory& dir,
                                      bool overrideExisting) {
    Result<bool> ready = requireReady("write");
    if (!ready.success) return ready;
    if (!TreeQuery::isValidName(name)) return Result<bool>::fail("invalid file name: '" + name + "'");
    if (data.size() > kMaxContentSize) return Result<bool>::fail(name + ": content larger than the 1 GiB limit");

    File* existing = dir.findFile(name);
    if (existing) {
        if (!overrideExisting) return Result<bool>::fail("file already exists: " + existing->fullPath());
        existing->setPending(data);
        logInfo("Replaced " + existing->fullPath() + " (" + to_string(data.size()) + " bytes)");
    } else {
        File* f = dir.addFile(name);
        f->setPending(data);
        logInfo("Wrote " + f->fullPath() + " (" + to_string(data.size()) + " bytes)");
    }
    return afterChange(Result<bool>::ok(true));
}

Result<bool> Archive::doWriteAllBytes(const vector<char>& data, const string& path, bool overrideExisting) {
    vector<string> segments = PathResolver::split(PathResolver::formatPath(path));
    if (segments.empty()) return Result<bool>::fail("empty file path");
    Directory* dir = PathResolver::resolveParent(segments, rootDirectory());
    if (!dir) return Result<bool>::notFound();
    return doWriteAllBytes(data, segments.back(), *dir, overrideExisting);
}

Result<bool> Archive::doWriteAllText(const string& content, const string& name, Directory& dir, bool overrideExisting) {
    return doWriteAllBytes(vector<char>(content.begin(), content.end()), name, dir, overrideExisting);
}

Result<bool> Archive::doWriteStream(const string& name, Directory& dir, istream& stream, bool overrideExisting) {
    Result<vector<char>> data = readStream(stream);
    if (!data.success) return Result<bool>::fail(name + ": " + data.error);
    return doWriteAllBytes(data.value, name, dir, overrideExisting);
}

Result<vector<char>> readStream(istream& stream) {
    // seekable streams are measured before anything is buffered
    istream::pos_type start = stream.tellg();
    if (start != istream::pos_type(-1)) {
        stream.seekg(0, ios::end);
        istream::pos_type end = stream.tellg();
        stream.clear();
        stream.seekg(start);
        if (end != istream::pos_type(-1) && end > start && (uint64_t)(end - start) > kMaxContentSize) {
            return Result<vector<char>>::fail("stream exceeds the 1 GiB limit");
        }
    }

    vector<char> data;
    char chunk[64 * 1024];
    while (stream) {
        stream.read(chunk, sizeof(chunk));
        streamsize got = stream.gcount();
        if (got <= 0) break;
        if (data.size() + (uint64_t)got > kMaxContentSize) {
            return Result<vector<char>>::fail("stream exceeds the 1 GiB limit");
        }
        data.insert(data.end(), chunk, chunk + got);
    }
    if (stream.bad()) return Result<vector<char>>::fail("stream read error");
    return Result<vector<char>>::ok(std::move(data));
}
