#ifndef __RANK_POOL
#define __RANK_POOL

#include <vector>
#include <stdexcept>

/*!
 * The positions 0..n-1 with removal, addressed by rank among the positions
 * still present. Fenwick tree over presence bits: Select and Remove are
 * O(log n), the order of the remaining positions never changes.
 */
class RankPool {
public:
    explicit RankPool(size_t n = 0) { Reset(n); }

    void Reset(size_t n) {
        size = n;
        tree.assign(n + 1, 0);
        // linear build of an all-ones tree
        for (size_t i = 1; i <= n; i++) {
            tree[i] += 1;
            size_t parent = i + (i & (~i + 1));
            if (parent <= n) tree[parent] += tree[i];
        }
        log_n = 1;
        while (log_n * 2 <= n) log_n *= 2;
    }

    size_t Size() const { return size; }

    bool Empty() const { return size == 0; }

    // Position holding the given 0-based rank
    size_t Select(size_t rank) const {
        if (rank >= size)
            throw std::out_of_range("RankPool::Select rank out of range");
        size_t pos = 0;
        size_t remaining = rank + 1;
        for (size_t step = log_n; step > 0; step >>= 1) {
            size_t next = pos + step;
            if (next < tree.size() && tree[next] < remaining) {
                pos = next;
                remaining -= tree[next];
            }
        }
        return pos;
    }

    // position must be present
    void Remove(size_t position) {
        for (size_t i = position + 1; i < tree.size(); i += i & (~i + 1))
            tree[i]--;
        size--;
    }

private:
    std::vector<size_t> tree;
    size_t size;
    size_t log_n;
};

#endif
