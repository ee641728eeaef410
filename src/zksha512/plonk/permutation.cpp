#include "zksha512/plonk/permutation.hpp"

namespace libzksha512 {

size_t permutation::node(const cell& c)
{
    auto it = index_.find(c);
    if (it != index_.end()) {
        return it->second;
    }
    size_t i = cells_.size();
    index_[c] = i;
    cells_.push_back(c);
    parent_.push_back(i);
    rank_.push_back(0);
    return i;
}

size_t permutation::find(size_t i) const
{
    while (parent_[i] != i) {
        i = parent_[i];
    }
    return i;
}

void permutation::copy(const cell& a, const cell& b)
{
    size_t ra = find(node(a));
    size_t rb = find(node(b));
    if (ra == rb) {
        return;
    }

    // Union by rank keeps the trees shallow without path compression.
    if (rank_[ra] < rank_[rb]) {
        parent_[ra] = rb;
    } else if (rank_[ra] > rank_[rb]) {
        parent_[rb] = ra;
    } else {
        parent_[rb] = ra;
        rank_[ra]++;
    }
}

bool permutation::same_class(const cell& a, const cell& b) const
{
    if (a == b) {
        return true;
    }
    auto ia = index_.find(a);
    auto ib = index_.find(b);
    if (ia == index_.end() || ib == index_.end()) {
        return false;
    }
    return find(ia->second) == find(ib->second);
}

std::vector<std::vector<cell>> permutation::classes() const
{
    std::map<size_t, std::vector<cell>> by_root;
    for (size_t i = 0; i < cells_.size(); i++) {
        by_root[find(i)].push_back(cells_[i]);
    }

    std::vector<std::vector<cell>> result;
    for (auto& entry : by_root) {
        if (entry.second.size() > 1) {
            result.push_back(entry.second);
        }
    }
    return result;
}

} // libzksha512
