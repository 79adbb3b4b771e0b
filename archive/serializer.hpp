#ifndef SERIALIZER_HPP
#define SERIALIZER_HPP

#include "directory.hpp"
#include "result.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

// Header codec of the .vhp format:
//
//   VHP1\n
//   <header length>\n
//   DIR <name>                  one block per directory, root first
//     FILE <size> <offset> <name>
//     ...
//   END_DIR
//   <file bytes, back to back>
//
// Offsets are relative to the first byte after the header.
class Serializer {
public:
    static const std::string kMagic;

    static std::string writePrefix(size_t headerLength);
    // Returns the header length and the byte count of the prefix itself.
    static bool parsePrefix(const std::string& data, uint64_t& headerLength, uint64_t& prefixLength);

    // Files listed in the order writeHeader emits them.
    static void collectFiles(Directory& dir, std::vector<File*>& out);

    static std::string writeHeader(const Directory& root, const std::map<const File*, uint64_t>& offsets);

    // Builds a fresh tree; on failure nothing is returned and the error says why.
    static Result<bool> parseHeader(const std::string& text, DirectoryIndexer& indexer, std::unique_ptr<Directory>& root);
};

#endif
