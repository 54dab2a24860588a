#ifndef DISJOINTSET_HPP
#define DISJOINTSET_HPP

#include <cstddef>
#include <vector>

namespace wattsim {

// Union-find over dense integer ids with path compression and union by size
class DisjointSet {
public:
    DisjointSet() = default;
    explicit DisjointSet(int count);

    int make_set();
    int find(int i);
    // Returns false if both already belong to the same set
    bool unite(int a, int b);

    int size() const { return static_cast<int>(parent_.size()); }

private:
    std::vector<int> parent_;
    std::vector<int> set_size_;
};

} // namespace wattsim

#endif // DISJOINTSET_HPP
