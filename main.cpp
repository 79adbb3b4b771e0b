#include "archive/encryptedarchive.hpp"
#include "archive/localstorage.hpp"
#include "archive/log.hpp"
#include "archive/packedarchive.hpp"
#include "archive/pathresolver.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>
using namespace std;

static void printResult(const string& what, const Result<bool>& r) {
    if (r.success) cout << what << ": ok\n";
    else if (r.hasError()) cout << "[ERROR] " << what << ": " << r.error << "\n";
    else cout << "[ERROR] " << what << ": not found\n";
}

static void listDirectory(Directory& dir) {
    if (dir.empty()) {
        cout << "(empty directory)\n";
        return;
    }
    for (auto& d : dir.subdirs) cout << "d  -  " << d->name << "\\\n";
    for (auto& f : dir.files) cout << "-  " << f->size << "B  " << f->name << "\n";
}

static string restOfLine(stringstream& ss) {
    string rest;
    getline(ss, rest);
    if (!rest.empty() && rest[0] == ' ') rest = rest.substr(1);
    return rest;
}

int main(int argc, char* argv[]) {
    ArchiveOptions options;
    string key;
    string archivePath;
    for (int i = 1; i < argc; ++i) {
        string arg = argv[i];
        if (arg == "--autosave") options.saveAfterChange = true;
        else if (arg == "--key" && i + 1 < argc) key = argv[++i];
        else if (arg == "-q") setLogLevel(LogLevel::Warn);
        else if (archivePath.empty() && !arg.empty() && arg[0] != '-') archivePath = arg;
        else {
            cout << "[ERROR] Unknown argument: " << arg << "\n";
            return 2;
        }
    }
    if (archivePath.empty()) {
        cout << "Usage: vhp [--autosave] [--key <key>] [-q] <archive.vhp>\n";
        return 2;
    }

    shared_ptr<IStorage> storage = make_shared<LocalStorage>();
    unique_ptr<Archive> archive(new PackedArchive(storage, archivePath, options));
    if (!key.empty()) {
        try {
            archive.reset(new EncryptedArchive(std::move(archive), key));
        } catch (const invalid_argument& e) {
            cout << "[ERROR] " << e.what() << "\n";
            return 2;
        }
    }

    if (storage->fileExists(archivePath)) {
        Result<bool> opened = archive->read(archivePath).get();
        if (!opened.success) {
            cout << "[ERROR] Cannot open " << archivePath << ": " << opened.error << "\n";
            return 1;
        }
    } else {
        cout << "[INFO] " << archivePath << " does not exist yet; use 'pack <dir>' or 'new'\n";
    }

    Directory* currentDir = &archive->rootDirectory();

    cout << "=== VHP Archive Shell ===\n";
    cout << "Commands: new, pack, ls, cd, pwd, exists, cat, write, rm, mkdir, rmdir, find, extract, save, exit\n";

    string line;
    while (true) {
        cout << "vhp> ";
        if (!getline(cin, line)) break;
        stringstream ss(line);
        string cmd;
        ss >> cmd;

        if (cmd.empty()) continue;
        else if (cmd == "exit") break;

        else if (cmd == "new") {
            printResult("new", archive->create(vector<filesystem::path>(), vector<filesystem::path>()).get());
            currentDir = &archive->rootDirectory();
        }

        else if (cmd == "pack") {
            string source = restOfLine(ss);
            if (source.empty()) { cout << "[ERROR] Usage: pack <directory>\n"; continue; }
            printResult("pack", archive->create(filesystem::path(source)).get());
            currentDir = &archive->rootDirectory();
        }

        else if (cmd == "ls") {
            string path = restOfLine(ss);
            Directory* dir = PathResolver::resolveDirectory(path, *currentDir);
            if (!dir) { cout << "[ERROR] Directory not found: " << path << "\n"; continue; }
            listDirectory(*dir);
        }

        else if (cmd == "cd") {
            string path = restOfLine(ss);
            if (path.empty()) { cout << "[ERROR] Usage: cd <path>|..\n"; continue; }
            if (path == "..") {
                if (currentDir->parent) currentDir = currentDir->parent;
                continue;
            }
            Directory* dir = PathResolver::resolveDirectory(path, *currentDir);
            if (!dir) cout << "[ERROR] Directory not found: " << path << "\n";
            else currentDir = dir;
        }

        else if (cmd == "pwd") {
            cout << kPathSeparator << currentDir->fullPath() << "\n";
        }

        else if (cmd == "exists") {
            string path = restOfLine(ss);
            cout << (archive->fileExists(path, *currentDir) ? "yes" : "no") << "\n";
        }

        else if (cmd == "cat") {
            string path = restOfLine(ss);
            Result<string> text = archive->readAllText(path, *currentDir).get();
            if (text.success) cout << text.value << "\n";
            else if (text.hasError()) cout << "[ERROR] " << text.error << "\n";
            else cout << "[ERROR] File not found: " << path << "\n";
        }

        else if (cmd == "write") {
            string path;
            ss >> path;
            string content = restOfLine(ss);
            vector<string> segments = PathResolver::split(PathResolver::formatPath(path));
            if (segments.empty()) { cout << "[ERROR] Usage: write <path> <text>\n"; continue; }
            Directory* dir = PathResolver::resolveParent(segments, *currentDir);
            if (!dir) { cout << "[ERROR] Directory not found for " << path << "\n"; continue; }
            printResult("write", archive->writeAllText(content, segments.back(), *dir, true).get());
        }

        else if (cmd == "rm") {
            string path = restOfLine(ss);
            printResult("rm", archive->removeFile(path, *currentDir).get());
        }

        else if (cmd == "mkdir") {
            string path = restOfLine(ss);
            printResult("mkdir", archive->createDirectory(path, *currentDir).get());
        }

        else if (cmd == "rmdir") {
            string path = restOfLine(ss);
            Result<bool> removed = archive->removeDirectory(path, *currentDir).get();
            // the current directory may have lived inside the removed subtree
            if (removed.success) currentDir = &archive->rootDirectory();
            printResult("rmdir", removed);
        }

        else if (cmd == "find") {
            string arg;
            ss >> arg;
            bool recurse = false;
            if (arg == "-r") {
                recurse = true;
                ss >> arg;
            }
            if (arg.empty()) { cout << "[ERROR] Usage: find [-r] <query>\n"; continue; }
            SearchResult found = archive->search(arg, *currentDir, recurse);
            for (auto* d : found.directories) cout << kPathSeparator << d->fullPath() << kPathSeparator << "\n";
            for (auto* f : found.files) cout << kPathSeparator << f->fullPath() << "\n";
            cout << found.directories.size() << " directories, " << found.files.size() << " files\n";
        }

        else if (cmd == "extract") {
            string target, path;
            ss >> target;
            path = restOfLine(ss);
            if (target.empty()) { cout << "[ERROR] Usage: extract <target dir> [path]\n"; continue; }
            if (path.empty()) printResult("extract", archive->extract(target).get());
            else printResult("extract", archive->extractDirectory(path, target).get());
        }

        else if (cmd == "save") {
            printResult("save", archive->save().get());
        }

        else {
            cout << "[ERROR] Unknown command\n";
        }
    }

    if (archive->state() == ArchiveState::Ready && !options.saveAfterChange) {
        printResult("save", archive->save().get());
    }
    cout << "Exiting VHP Archive Shell.\n";
    return 0;
}
