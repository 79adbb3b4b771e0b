#include "archive/directory.hpp"

#include <gtest/gtest.h>

#include <set>

class DirectoryTest : public ::testing::Test {
protected:
    DirectoryTest() : root("", nullptr, 0) {}

    DirectoryIndexer indexer;
    Directory root;
};

TEST_F(DirectoryTest, RootHasEmptyFullPath) {
    EXPECT_TRUE(root.isRoot());
    EXPECT_EQ(root.fullPath(), "");
}

TEST_F(DirectoryTest, FullPathJoinsAncestorsWithoutRoot) {
    Directory* sub = root.addSubdir("sub", indexer);
    Directory* deep = sub->addSubdir("deep", indexer);
    File* f = deep->addFile("x.txt");
    File* top = root.addFile("a.txt");

    EXPECT_EQ(sub->fullPath(), "sub");
    EXPECT_EQ(deep->fullPath(), "sub\\deep");
    EXPECT_EQ(f->fullPath(), "sub\\deep\\x.txt");
    EXPECT_EQ(top->fullPath(), "a.txt");
}

TEST_F(DirectoryTest, ChildNamesAreUniquePerKind) {
    ASSERT_NE(root.addSubdir("docs", indexer), nullptr);
    EXPECT_EQ(root.addSubdir("docs", indexer), nullptr);

    ASSERT_NE(root.addFile("docs"), nullptr);  // files and directories are checked independently
    EXPECT_EQ(root.addFile("docs"), nullptr);

    EXPECT_EQ(root.subdirs.size(), 1u);
    EXPECT_EQ(root.files.size(), 1u);
}

TEST_F(DirectoryTest, IndicesAreUniqueAcrossTheTree) {
    std::set<int> seen{root.index};
    Directory* a = root.addSubdir("same", indexer);
    Directory* b = a->addSubdir("same", indexer);
    Directory* c = root.addSubdir("other", indexer)->addSubdir("same", indexer);
    for (Directory* d : {a, b, c}) {
        EXPECT_TRUE(seen.insert(d->index).second) << "duplicate index " << d->index;
    }
}

TEST_F(DirectoryTest, IndexersAreIndependent) {
    DirectoryIndexer other;
    Directory otherRoot("", nullptr, 0);
    Directory* mine = root.addSubdir("a", indexer);
    Directory* theirs = otherRoot.addSubdir("a", other);
    EXPECT_EQ(mine->index, theirs->index);
}

TEST_F(DirectoryTest, IndexOfAndContains) {
    root.addSubdir("one", indexer);
    root.addSubdir("two", indexer);
    EXPECT_EQ(root.indexOf("two"), 1);
    EXPECT_EQ(root.indexOf("three"), -1);
    EXPECT_TRUE(root.contains("one"));
    EXPECT_FALSE(root.contains("One"));
}

TEST_F(DirectoryTest, RemoveFileDetachesOnlyThatFile) {
    File* a = root.addFile("a");
    root.addFile("b");
    File* c = root.addFile("c");

    EXPECT_TRUE(root.removeFile(a));
    EXPECT_FALSE(root.removeFile(a));
    ASSERT_EQ(root.files.size(), 2u);
    EXPECT_EQ(root.files[0]->name, "b");
    EXPECT_EQ(root.files[1].get(), c);
}

TEST_F(DirectoryTest, FileByPathComparesFullPath) {
    Directory* sub = root.addSubdir("sub", indexer);
    File* f = sub->addFile("x.txt");
    EXPECT_EQ(sub->fileByPath("sub\\x.txt"), f);
    EXPECT_EQ(sub->fileByPath("x.txt"), nullptr);
}

TEST_F(DirectoryTest, CountFilesCoversSubtree) {
    root.addFile("a");
    Directory* sub = root.addSubdir("sub", indexer);
    sub->addFile("b");
    sub->addSubdir("deeper", indexer)->addFile("c");
    EXPECT_EQ(root.countFiles(), 3u);
    EXPECT_EQ(sub->countFiles(), 2u);
}

TEST(FileTest, ContentSourceTransitions) {
    Directory root("", nullptr, 0);
    File* f = root.addFile("data.bin");

    f->setRealFile("/tmp/data.bin", 42);
    EXPECT_EQ(f->source, ContentSource::RealFile);
    EXPECT_EQ(f->size, 42u);

    f->setPending(std::vector<char>{'h', 'i'});
    EXPECT_EQ(f->source, ContentSource::Pending);
    EXPECT_EQ(f->size, 2u);
    EXPECT_TRUE(f->sourcePath.empty());

    f->setStored(100, 2);
    EXPECT_EQ(f->source, ContentSource::Archive);
    EXPECT_EQ(f->offset, 100u);
    EXPECT_TRUE(f->pending.empty());
}
