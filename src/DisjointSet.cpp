#include "DisjointSet.hpp"
#include <utility>

namespace wattsim {

DisjointSet::DisjointSet(int count) {
    parent_.reserve(count);
    set_size_.reserve(count);
    for (int i = 0; i < count; ++i) {
        make_set();
    }
}

int DisjointSet::make_set() {
    int id = static_cast<int>(parent_.size());
    parent_.push_back(id);
    set_size_.push_back(1);
    return id;
}

int DisjointSet::find(int i) {
    int root = i;
    while (parent_[root] != root) {
        root = parent_[root];
    }
    // Path compression
    while (parent_[i] != root) {
        int next = parent_[i];
        parent_[i] = root;
        i = next;
    }
    return root;
}

bool DisjointSet::unite(int a, int b) {
    int ra = find(a);
    int rb = find(b);
    if (ra == rb) return false;

    if (set_size_[ra] < set_size_[rb]) std::swap(ra, rb);
    parent_[rb] = ra;
    set_size_[ra] += set_size_[rb];
    return true;
}

} // namespace wattsim
