#include "treequery.hpp"
#include "pathresolver.hpp"
#include <cctype>
#include <functional>
using namespace std;

static string toLower(const string& s) {
    string out(s);
    for (auto& c : out) c = (char)tolower((unsigned char)c);
    return out;
}

bool TreeQuery::fileExists(const string& path, Directory& startNode) {
    return PathResolver::resolveFile(path, startNode) != nullptr;
}

Result<bool> TreeQuery::removeFile(const string& path, Directory& startNode) {
    string p = PathResolver::formatPath(path);
    if (p.empty()) return Result<bool>::notFound();

    Directory* owner = nullptr;
    File* target = nullptr;
    if (PathResolver::isSingleSegment(p)) {
        owner = &startNode;
        target = startNode.findFile(p);
    } else {
        vector<string> segments = PathResolver::split(p);
        if (segments.empty()) return Result<bool>::notFound();
        owner = PathResolver::resolveParent(segments, startNode);
        if (!owner) return Result<bool>::notFound();
        target = owner->fileByPath(PathResolver::join(owner->fullPath(), segments.back()));
    }

    if (!target || !owner->removeFile(target)) return Result<bool>::notFound();
    return Result<bool>::ok(true);
}

Result<bool> TreeQuery::removeDirectory(const string& path, Directory& startNode) {
    vector<string> segments = PathResolver::split(PathResolver::formatPath(path));
    if (segments.empty()) return Result<bool>::notFound();

    Directory* owner = PathResolver::resolveParent(segments, startNode);
    if (!owner) return Result<bool>::notFound();
    Directory* target = owner->findSubdir(segments.back());
    if (!target || !owner->removeSubdir(target)) return Result<bool>::notFound();
    return Result<bool>::ok(true);
}

Result<bool> TreeQuery::createDirectory(const string& path, Directory& startNode, DirectoryIndexer& indexer) {
    vector<string> segments = PathResolver::split(PathResolver::formatPath(path));
    if (segments.empty()) return Result<bool>::fail("empty directory path");
    if (!isValidName(segments.back())) return Result<bool>::fail("invalid directory name: " + segments.back());

    Directory* owner = PathResolver::resolveParent(segments, startNode);
    if (!owner) return Result<bool>::notFound();
    if (owner->contains(segments.back())) {
        return Result<bool>::fail("directory already exists: " + PathResolver::join(owner->fullPath(), segments.back()));
    }
    owner->addSubdir(segments.back(), indexer);
    return Result<bool>::ok(true);
}

SearchResult TreeQuery::search(const string& query, Directory& startNode, bool recurse) {
    SearchResult result;
    string needle = toLower(query);
    auto matches = [&](const string& name) {
        return toLower(name).find(needle) != string::npos;
    };

    if (recurse) {
        function<void(Directory*)> passDirs = [&](Directory* dir) {
            for (auto& sd : dir->subdirs) {
                if (matches(sd->name)) result.directories.push_back(sd.get());
                for (auto& f : sd->files) {
                    if (matches(f->name)) result.files.push_back(f.get());
                }
                passDirs(sd.get());
            }
        };
        passDirs(&startNode);
    }

    // The start node's own files come last in recursive mode.
    for (auto& f : startNode.files) {
        if (matches(f->name)) result.files.push_back(f.get());
    }
    return result;
}

bool TreeQuery::isValidName(const string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    for (char c : name) {
        if (c == kPathSeparator || c == '/' || c == '\n' || c == '\r' || c == '\0') return false;
    }
    return true;
}
