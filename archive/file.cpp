#include "file.hpp"
#include "directory.hpp"
using namespace std;

File::File(const string& name_, Directory* parent_) {
    name = name_;
    parent = parent_;
    size = 0;
    offset = 0;
    source = ContentSource::Pending;
}

string File::fullPath() const {
    if (!parent) return name;
    string dirPath = parent->fullPath();
    if (dirPath.empty()) return name;
    return dirPath + kPathSeparator + name;
}

void File::setPending(const vector<char>& data) {
    pending = data;
    size = data.size();
    source = ContentSource::Pending;
    sourcePath.clear();
}

void File::setRealFile(const string& path, uint64_t fileSize) {
    pending.clear();
    sourcePath = path;
    size = fileSize;
    source = ContentSource::RealFile;
}

void File::setStored(uint64_t newOffset, uint64_t newSize) {
    pending.clear();
    pending.shrink_to_fit();
    sourcePath.clear();
    offset = newOffset;
    size = newSize;
    source = ContentSource::Archive;
}
