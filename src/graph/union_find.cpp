#include "notegraph/graph/union_find.hpp"

#include <numeric>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace notegraph::graph {

UnionFind::UnionFind(const std::size_t size) : parent_(size), rank_(size, 0) {
  std::iota(parent_.begin(), parent_.end(), std::size_t{0});
}

std::size_t UnionFind::find(const std::size_t x) {
  if (x >= parent_.size()) {
    throw std::out_of_range("union-find index " + std::to_string(x) + " out of range");
  }
  std::size_t root = x;
  while (parent_[root] != root) {
    root = parent_[root];
  }
  std::size_t node = x;
  while (parent_[node] != root) {
    const std::size_t next = parent_[node];
    parent_[node] = root;
    node = next;
  }
  return root;
}

bool UnionFind::unite(const std::size_t x, const std::size_t y) {
  const std::size_t root_x = find(x);
  const std::size_t root_y = find(y);
  if (root_x == root_y) {
    return false;
  }

  if (rank_[root_x] < rank_[root_y]) {
    parent_[root_x] = root_y;
  } else if (rank_[root_x] > rank_[root_y]) {
    parent_[root_y] = root_x;
  } else {
    parent_[root_y] = root_x;
    ++rank_[root_x];
  }
  return true;
}

bool UnionFind::connected(const std::size_t x, const std::size_t y) { return find(x) == find(y); }

std::vector<std::vector<std::size_t>> UnionFind::groups() {
  std::vector<std::vector<std::size_t>> out;
  std::unordered_map<std::size_t, std::size_t> slot_by_root;
  for (std::size_t i = 0; i < parent_.size(); ++i) {
    const std::size_t root = find(i);
    const auto [it, inserted] = slot_by_root.try_emplace(root, out.size());
    if (inserted) {
      out.emplace_back();
    }
    out[it->second].push_back(i);
  }
  return out;
}

} // namespace notegraph::graph
