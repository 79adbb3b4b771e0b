#ifndef DIR_INDEXER_HPP
#define DIR_INDEXER_HPP

#include <atomic>

// Hands out the unique directory index of one archive session.
// Index 0 belongs to the root directory.
class DirectoryIndexer {
public:
    DirectoryIndexer() : next(1) {}

    int nextIndex() { return next.fetch_add(1); }
    void reset() { next.store(1); }

private:
    std::atomic<int> next;
};

#endif
