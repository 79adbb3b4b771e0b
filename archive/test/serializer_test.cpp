#include "archive/serializer.hpp"

#include <gtest/gtest.h>

class SerializerTest : public ::testing::Test {
protected:
    SerializerTest() : root("", nullptr, 0) {}

    DirectoryIndexer indexer;
    Directory root;
};

TEST_F(SerializerTest, PrefixCarriesHeaderLength) {
    std::string prefix = Serializer::writePrefix(123);
    EXPECT_EQ(prefix, "VHP1\n123\n");

    uint64_t headerLength = 0, prefixLength = 0;
    ASSERT_TRUE(Serializer::parsePrefix(prefix + "DIR \n", headerLength, prefixLength));
    EXPECT_EQ(headerLength, 123u);
    EXPECT_EQ(prefixLength, prefix.size());
}

TEST_F(SerializerTest, PrefixRejectsForeignData) {
    uint64_t headerLength = 0, prefixLength = 0;
    EXPECT_FALSE(Serializer::parsePrefix("PK\x03\x04", headerLength, prefixLength));
    EXPECT_FALSE(Serializer::parsePrefix("VHP1\n", headerLength, prefixLength));
    EXPECT_FALSE(Serializer::parsePrefix("VHP1\n12x\n", headerLength, prefixLength));
    EXPECT_FALSE(Serializer::parsePrefix("VHP2\n12\n", headerLength, prefixLength));
}

TEST_F(SerializerTest, PrefixRejectsLengthPastUint64) {
    uint64_t headerLength = 0, prefixLength = 0;
    ASSERT_TRUE(Serializer::parsePrefix("VHP1\n18446744073709551615\n", headerLength, prefixLength));
    EXPECT_EQ(headerLength, UINT64_MAX);
    EXPECT_FALSE(Serializer::parsePrefix("VHP1\n18446744073709551616\n", headerLength, prefixLength));
    EXPECT_FALSE(Serializer::parsePrefix("VHP1\n99999999999999999999\n", headerLength, prefixLength));
}

TEST_F(SerializerTest, FileEntryNumbersMustFit) {
    DirectoryIndexer fresh;
    std::unique_ptr<Directory> tree;
    Result<bool> r = Serializer::parseHeader("DIR \n  FILE 1 18446744073709551616 a\nEND_DIR\n", fresh, tree);
    EXPECT_TRUE(r.hasError());
    EXPECT_EQ(tree.get(), nullptr);
}

TEST_F(SerializerTest, HeaderLayout) {
    File* a = root.addFile("a.txt");
    a->setPending(std::vector<char>(5, 'a'));
    Directory* sub = root.addSubdir("sub", indexer);
    File* b = sub->addFile("b with spaces.bin");
    b->setPending(std::vector<char>(3, 'b'));

    std::map<const File*, uint64_t> offsets{{a, 0}, {b, 5}};
    std::string header = Serializer::writeHeader(root, offsets);

    EXPECT_EQ(header,
              "DIR \n"
              "  FILE 5 0 a.txt\n"
              "  DIR sub\n"
              "    FILE 3 5 b with spaces.bin\n"
              "  END_DIR\n"
              "END_DIR\n");
}

TEST_F(SerializerTest, CollectFilesFollowsHeaderOrder) {
    Directory* sub = root.addSubdir("sub", indexer);
    File* inner = sub->addFile("inner");
    File* top = root.addFile("top");

    std::vector<File*> files;
    Serializer::collectFiles(root, files);
    std::vector<File*> expected{top, inner};
    EXPECT_EQ(files, expected);
}

TEST_F(SerializerTest, ParseRebuildsTree) {
    std::string header =
        "DIR \n"
        "  FILE 5 0 a.txt\n"
        "  DIR sub\n"
        "    DIR deep\n"
        "      FILE 0 5 empty\n"
        "    END_DIR\n"
        "    FILE 3 5 b with spaces.bin\n"
        "  END_DIR\n"
        "END_DIR\n";

    DirectoryIndexer fresh;
    std::unique_ptr<Directory> tree;
    Result<bool> r = Serializer::parseHeader(header, fresh, tree);
    ASSERT_TRUE(r.success) << r.error;
    ASSERT_NE(tree.get(), nullptr);
    EXPECT_TRUE(tree->isRoot());
    EXPECT_EQ(tree->index, 0);

    File* a = tree->findFile("a.txt");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->size, 5u);
    EXPECT_EQ(a->offset, 0u);
    EXPECT_EQ(a->source, ContentSource::Archive);

    Directory* sub = tree->findSubdir("sub");
    ASSERT_NE(sub, nullptr);
    File* b = sub->findFile("b with spaces.bin");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->offset, 5u);
    EXPECT_EQ(b->fullPath(), "sub\\b with spaces.bin");

    Directory* deep = sub->findSubdir("deep");
    ASSERT_NE(deep, nullptr);
    EXPECT_NE(deep->index, sub->index);
    EXPECT_EQ(tree->countFiles(), 3u);
}

TEST_F(SerializerTest, WrittenHeaderParsesBack) {
    File* a = root.addFile("a");
    a->setPending(std::vector<char>{'1', '2'});
    root.addSubdir("x", indexer)->addSubdir("y", indexer);

    std::map<const File*, uint64_t> offsets{{a, 0}};
    DirectoryIndexer fresh;
    std::unique_ptr<Directory> tree;
    Result<bool> r = Serializer::parseHeader(Serializer::writeHeader(root, offsets), fresh, tree);
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_NE(tree->findSubdir("x")->findSubdir("y"), nullptr);
    EXPECT_EQ(tree->findFile("a")->size, 2u);
}

TEST_F(SerializerTest, CorruptHeadersAreRejected) {
    const char* broken[] = {
        "",
        "FILE 1 0 orphan\n",
        "DIR \nEND_DIR\nEND_DIR\n",
        "DIR \n  DIR sub\nEND_DIR\n",
        "DIR \nEND_DIR\nDIR \nEND_DIR\n",
        "DIR \n  DIR \n  END_DIR\nEND_DIR\n",
        "DIR \n  FILE x 0 a\nEND_DIR\n",
        "DIR \n  FILE 1 0\nEND_DIR\n",
        "DIR \n  FILE 1 0 a\n  FILE 1 1 a\nEND_DIR\n",
        "DIR \n  DIR d\n  END_DIR\n  DIR d\n  END_DIR\nEND_DIR\n",
        "DIR \n  LINK a b\nEND_DIR\n",
    };
    for (const char* header : broken) {
        DirectoryIndexer fresh;
        std::unique_ptr<Directory> tree;
        Result<bool> r = Serializer::parseHeader(header, fresh, tree);
        EXPECT_FALSE(r.success) << "accepted: " << header;
        EXPECT_TRUE(r.hasError()) << header;
        EXPECT_EQ(tree.get(), nullptr) << header;
    }
}
