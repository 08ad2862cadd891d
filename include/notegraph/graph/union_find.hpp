#pragma once

#include <cstddef>
#include <vector>

namespace notegraph::graph {

class UnionFind {
public:
  explicit UnionFind(std::size_t size);

  [[nodiscard]] std::size_t find(std::size_t x);
  bool unite(std::size_t x, std::size_t y);
  [[nodiscard]] bool connected(std::size_t x, std::size_t y);

  [[nodiscard]] std::vector<std::vector<std::size_t>> groups();

  [[nodiscard]] std::size_t size() const { return parent_.size(); }

private:
  std::vector<std::size_t> parent_;
  std::vector<unsigned> rank_;
};

} // namespace notegraph::graph
