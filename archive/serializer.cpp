#include "serializer.hpp"
#include <functional>
#include <sstream>
using namespace std;

const string Serializer::kMagic = "VHP1";

// Splits "12 0 rest of line" into its first token and the remainder.
static bool nextToken(const string& line, size_t& pos, string& token) {
    size_t end = line.find(' ', pos);
    if (end == string::npos || end == pos) return false;
    token = line.substr(pos, end - pos);
    pos = end + 1;
    return true;
}

static bool parseNumber(const string& token, uint64_t& value) {
    if (token.empty()) return false;
    value = 0;
    for (char c : token) {
        if (c < '0' || c > '9') return false;
        uint64_t digit = (uint64_t)(c - '0');
        if (value > (UINT64_MAX - digit) / 10) return false;
        value = value * 10 + digit;
    }
    return true;
}

string Serializer::writePrefix(size_t headerLength) {
    return kMagic + "\n" + to_string(headerLength) + "\n";
}

bool Serializer::parsePrefix(const string& data, uint64_t& headerLength, uint64_t& prefixLength) {
    size_t first = data.find('\n');
    if (first == string::npos || data.substr(0, first) != kMagic) return false;
    size_t second = data.find('\n', first + 1);
    if (second == string::npos) return false;
    if (!parseNumber(data.substr(first + 1, second - first - 1), headerLength)) return false;
    prefixLength = second + 1;
    return true;
}

void Serializer::collectFiles(Directory& dir, vector<File*>& out) {
    for (auto& f : dir.files) out.push_back(f.get());
    for (auto& sd : dir.subdirs) collectFiles(*sd, out);
}

string Serializer::writeHeader(const Directory& root, const map<const File*, uint64_t>& offsets) {
    stringstream ss;

    function<void(const Directory*, int)> writeDir = [&](const Directory* d, int indent) {
        ss << string(indent, ' ') << "DIR " << (d->isRoot() ? string() : d->name) << "\n";
        for (auto& f : d->files) {
            auto it = offsets.find(f.get());
            uint64_t offset = it == offsets.end() ? f->offset : it->second;
            ss << string(indent + 2, ' ') << "FILE " << f->size << " " << offset << " " << f->name << "\n";
        }
        for (auto& sd : d->subdirs) writeDir(sd.get(), indent + 2);
        ss << string(indent, ' ') << "END_DIR\n";
    };

    writeDir(&root, 0);
    return ss.str();
}

Result<bool> Serializer::parseHeader(const string& text, DirectoryIndexer& indexer, unique_ptr<Directory>& root) {
    stringstream ss(text);
    string line;
    int lineNo = 0;
    unique_ptr<Directory> top;
    vector<Directory*> stack;
    bool closed = false;

    while (getline(ss, line)) {
        ++lineNo;
        if (line.empty()) continue;
        size_t pos = line.find_first_not_of(' ');
        string trimmed = (pos == string::npos) ? string() : line.substr(pos);
        if (trimmed.empty()) continue;
        if (closed) return Result<bool>::fail("data after root END_DIR at line " + to_string(lineNo));

        if (trimmed == "DIR" || trimmed.compare(0, 4, "DIR ") == 0) {
            string name = trimmed.size() > 4 ? trimmed.substr(4) : string();
            if (stack.empty()) {
                if (top) return Result<bool>::fail("second root directory at line " + to_string(lineNo));
                top.reset(new Directory("", nullptr, 0));
                stack.push_back(top.get());
                continue;
            }
            if (name.empty()) return Result<bool>::fail("unnamed directory at line " + to_string(lineNo));
            Directory* dir = stack.back()->addSubdir(name, indexer);
            if (!dir) return Result<bool>::fail("duplicate directory '" + name + "' at line " + to_string(lineNo));
            stack.push_back(dir);
        } else if (trimmed == "END_DIR") {
            if (stack.empty()) return Result<bool>::fail("unbalanced END_DIR at line " + to_string(lineNo));
            stack.pop_back();
            if (stack.empty()) closed = true;
        } else if (trimmed.compare(0, 5, "FILE ") == 0) {
            if (stack.empty()) return Result<bool>::fail("FILE outside a directory at line " + to_string(lineNo));
            size_t at = 5;
            string sizeTok, offsetTok;
            uint64_t size = 0, offset = 0;
            if (!nextToken(trimmed, at, sizeTok) || !nextToken(trimmed, at, offsetTok) ||
                !parseNumber(sizeTok, size) || !parseNumber(offsetTok, offset) || at >= trimmed.size()) {
                return Result<bool>::fail("malformed FILE entry at line " + to_string(lineNo));
            }
            string name = trimmed.substr(at);
            File* f = stack.back()->addFile(name);
            if (!f) return Result<bool>::fail("duplicate file '" + name + "' at line " + to_string(lineNo));
            f->setStored(offset, size);
        } else {
            return Result<bool>::fail("unknown header entry at line " + to_string(lineNo));
        }
    }

    if (!top) return Result<bool>::fail("header has no root directory");
    if (!stack.empty()) return Result<bool>::fail("header ends inside a directory");
    root = std::move(top);
    return Result<bool>::ok(true);
}
