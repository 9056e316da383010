#include "subtree.hpp"
#include <unordered_map>
#include "traversal.hpp"

Subtree::Subtree(NodeArena nodes, int root, int former_parent, std::optional<int> former_above)
  : nodes_(std::move(nodes)), root_(root), former_parent_(former_parent), former_above_(former_above) {}

std::vector<int> Subtree::ids() const {
  return LevelOrderTraversal(nodes_, root_).collect();
}

Subtree Subtree::make_unique(IIdSource& ids) const {
  std::vector<int> order = this->ids();
  std::unordered_map<int, int> remap;
  remap.reserve(order.size());
  for (int old_id : order) remap[old_id] = ids.next_id();

  NodeArena fresh;
  fresh.reserve(order.size());
  for (int old_id : order) {
    const Node& src = nodes_.at(old_id);
    Node n(remap.at(old_id), std::nullopt);
    if (old_id != root_ && src.parent) n.parent = remap.at(*src.parent);
    n.content = src.content;
    n.children.reserve(src.children.size());
    for (int c : src.children) {
      auto it = remap.find(c);
      if (it != remap.end()) n.children.push_back(it->second);
    }
    fresh.emplace(n.id, std::move(n));
  }
  return Subtree(std::move(fresh), remap.at(root_), former_parent_, former_above_);
}
