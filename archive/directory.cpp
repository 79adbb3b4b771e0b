#include "directory.hpp"
using namespace std;

Directory::Directory(const string& name_, Directory* parent_, int index_) {
    name = name_;
    parent = parent_;
    index = index_;
}

string Directory::fullPath() const {
    string path;
    const Directory* cur = this;
    while (cur && cur->parent) {
        path = path.empty() ? cur->name : cur->name + kPathSeparator + path;
        cur = cur->parent;
    }
    return path;
}

bool Directory::contains(const string& name) const {
    return indexOf(name) != -1;
}

int Directory::indexOf(const string& name) const {
    for (size_t i = 0; i < subdirs.size(); ++i) {
        if (subdirs[i]->name == name) return (int)i;
    }
    return -1;
}

Directory* Directory::findSubdir(const string& name) {
    int i = indexOf(name);
    return i == -1 ? nullptr : subdirs[i].get();
}

Directory* Directory::addSubdir(const string& name, DirectoryIndexer& indexer) {
    if (contains(name)) return nullptr;
    subdirs.emplace_back(new Directory(name, this, indexer.nextIndex()));
    return subdirs.back().get();
}

bool Directory::removeSubdir(const Directory* dir) {
    for (size_t i = 0; i < subdirs.size(); ++i) {
        if (subdirs[i].get() == dir) {
            subdirs.erase(subdirs.begin() + i);
            return true;
        }
    }
    return false;
}

bool Directory::hasFile(const string& filename) const {
    for (auto& f : files) {
        if (f->name == filename) return true;
    }
    return false;
}

File* Directory::findFile(const string& filename) {
    for (auto& f : files) {
        if (f->name == filename) return f.get();
    }
    return nullptr;
}

File* Directory::fileByPath(const string& path) {
    for (auto& f : files) {
        if (f->fullPath() == path) return f.get();
    }
    return nullptr;
}

File* Directory::addFile(const string& filename) {
    if (hasFile(filename)) return nullptr;
    files.emplace_back(new File(filename, this));
    return files.back().get();
}

bool Directory::removeFile(const File* file) {
    for (size_t i = 0; i < files.size(); ++i) {
        if (files[i].get() == file) {
            files.erase(files.begin() + i);
            return true;
        }
    }
    return false;
}

void Directory::clear() {
    files.clear();
    subdirs.clear();
}

size_t Directory::countFiles() const {
    size_t n = files.size();
    for (auto& sd : subdirs) n += sd->countFiles();
    return n;
}
