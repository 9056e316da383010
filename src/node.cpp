#include "node.hpp"
#include <algorithm>

std::optional<size_t> Node::index_of(int child_id) const {
  auto it = std::find(children.begin(), children.end(), child_id);
  if (it == children.end()) return std::nullopt;
  return static_cast<size_t>(it - children.begin());
}

bool Node::insert_child_relative(int relative_id, Dir dir, int child_id) {
  auto idx = index_of(relative_id);
  if (!idx) return false;
  size_t at = dir == Dir::Below ? *idx + 1 : *idx;
  children.insert(children.begin() + static_cast<std::ptrdiff_t>(at), child_id);
  return true;
}

void Node::remove_child(int child_id) {
  children.erase(std::remove(children.begin(), children.end(), child_id), children.end());
}

std::optional<int> sibling_of(const NodeArena& nodes, int id, Dir dir) {
  auto self = nodes.find(id);
  if (self == nodes.end() || !self->second.parent) return std::nullopt;
  auto parent = nodes.find(*self->second.parent);
  if (parent == nodes.end()) return std::nullopt;
  auto idx = parent->second.index_of(id);
  if (!idx) return std::nullopt;
  const auto& kids = parent->second.children;
  if (dir == Dir::Above) {
    if (*idx == 0) return std::nullopt;
    return kids[*idx - 1];
  }
  if (*idx + 1 >= kids.size()) return std::nullopt;
  return kids[*idx + 1];
}
