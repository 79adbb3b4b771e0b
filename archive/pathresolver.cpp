#include "pathresolver.hpp"
using namespace std;

string PathResolver::formatPath(const string& path) {
    if (path.empty()) return string();
    if (path[0] == kPathSeparator) return path.substr(1);
    return path;
}

vector<string> PathResolver::split(const string& path) {
    vector<string> segments;
    string cur;
    for (char c : path) {
        if (c == kPathSeparator) {
            if (!cur.empty()) segments.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (!cur.empty()) segments.push_back(cur);
    return segments;
}

bool PathResolver::isSingleSegment(const string& path) {
    return path.find(kPathSeparator) == string::npos;
}

string PathResolver::join(const string& dirPath, const string& name) {
    if (dirPath.empty()) return name;
    return dirPath + kPathSeparator + name;
}

Directory* PathResolver::resolveParent(const vector<string>& segments, Directory& startNode) {
    Directory* current = &startNode;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        current = current->findSubdir(segments[i]);
        if (!current) return nullptr;
    }
    return current;
}

File* PathResolver::resolveFile(const string& path, Directory& startNode) {
    string p = formatPath(path);
    if (p.empty()) return nullptr;

    if (isSingleSegment(p)) return startNode.findFile(p);

    vector<string> segments = split(p);
    if (segments.empty()) return nullptr;
    Directory* current = resolveParent(segments, startNode);
    if (!current) return nullptr;
    return current->fileByPath(join(current->fullPath(), segments.back()));
}

Directory* PathResolver::resolveDirectory(const string& path, Directory& startNode) {
    Directory* current = &startNode;
    for (auto& segment : split(formatPath(path))) {
        current = current->findSubdir(segment);
        if (!current) return nullptr;
    }
    return current;
}
