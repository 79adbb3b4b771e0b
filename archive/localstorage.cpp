#include "localstorage.hpp"
#include <algorithm>
#include <fstream>
#include <system_error>
using namespace std;
namespace fs = std::filesystem;

Result<vector<char>> LocalStorage::readFile(const fs::path& path) {
    Result<uint64_t> size = fileSize(path);
    if (!size.success) return Result<vector<char>>::fail(size.error);
    return readRange(path, 0, size.value);
}

Result<vector<char>> LocalStorage::readRange(const fs::path& path, uint64_t offset, uint64_t length) {
    ifstream in(path, ios::binary);
    if (!in.good()) return Result<vector<char>>::fail("cannot open " + path.string());

    vector<char> buffer(length);
    in.seekg((streamoff)offset);
    if (length > 0) in.read(buffer.data(), (streamsize)length);
    if (!in || (uint64_t)in.gcount() != length) {
        return Result<vector<char>>::fail("short read from " + path.string() + " at offset " + to_string(offset));
    }
    return Result<vector<char>>::ok(std::move(buffer));
}

Result<bool> LocalStorage::writeFile(const fs::path& path, const vector<char>& data) {
    ofstream out(path, ios::binary | ios::trunc);
    if (!out.good()) return Result<bool>::fail("cannot open " + path.string() + " for writing");
    out.write(data.data(), (streamsize)data.size());
    out.flush();
    if (!out) return Result<bool>::fail("write failed: " + path.string());
    return Result<bool>::ok(true);
}

Result<bool> LocalStorage::appendFile(const fs::path& path, const vector<char>& data) {
    ofstream out(path, ios::binary | ios::app);
    if (!out.good()) return Result<bool>::fail("cannot open " + path.string() + " for appending");
    out.write(data.data(), (streamsize)data.size());
    out.flush();
    if (!out) return Result<bool>::fail("append failed: " + path.string());
    return Result<bool>::ok(true);
}

Result<uint64_t> LocalStorage::fileSize(const fs::path& path) {
    error_code ec;
    uintmax_t size = fs::file_size(path, ec);
    if (ec) return Result<uint64_t>::fail(path.string() + ": " + ec.message());
    return Result<uint64_t>::ok((uint64_t)size);
}

bool LocalStorage::fileExists(const fs::path& path) {
    error_code ec;
    return fs::is_regular_file(path, ec);
}

bool LocalStorage::directoryExists(const fs::path& path) {
    error_code ec;
    return fs::is_directory(path, ec);
}

Result<vector<StorageEntry>> LocalStorage::listDirectory(const fs::path& path) {
    error_code ec;
    vector<StorageEntry> out;
    fs::directory_iterator it(path, ec), end;
    if (ec) return Result<vector<StorageEntry>>::fail(path.string() + ": " + ec.message());
    for (; it != end; it.increment(ec)) {
        if (ec) break;
        StorageEntry e;
        e.name = it->path().filename().string();
        error_code sec;
        e.isDirectory = it->is_directory(sec);
        e.size = e.isDirectory ? 0 : (uint64_t)it->file_size(sec);
        if (sec) return Result<vector<StorageEntry>>::fail(it->path().string() + ": " + sec.message());
        out.push_back(e);
    }
    if (ec) return Result<vector<StorageEntry>>::fail(path.string() + ": " + ec.message());

    sort(out.begin(), out.end(), [](const StorageEntry& a, const StorageEntry& b) { return a.name < b.name; });
    return Result<vector<StorageEntry>>::ok(std::move(out));
}

Result<bool> LocalStorage::createDirectories(const fs::path& path) {
    error_code ec;
    fs::create_directories(path, ec);
    if (ec) return Result<bool>::fail("cannot create " + path.string() + ": " + ec.message());
    if (!fs::is_directory(path, ec)) return Result<bool>::fail("not a directory: " + path.string());
    return Result<bool>::ok(true);
}

Result<bool> LocalStorage::rename(const fs::path& from, const fs::path& to) {
    error_code ec;
    fs::rename(from, to, ec);
    if (ec) return Result<bool>::fail("cannot rename " + from.string() + " to " + to.string() + ": " + ec.message());
    return Result<bool>::ok(true);
}

Result<bool> LocalStorage::remove(const fs::path& path) {
    error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) return Result<bool>::fail("cannot remove " + path.string() + ": " + ec.message());
    return Result<bool>(removed, removed);
}
