#include "traversal.hpp"

PostOrderTraversal::PostOrderTraversal(const NodeArena& nodes, int start) : nodes_(&nodes) {
  if (nodes.count(start)) stack_.push_back({start, false});
}

std::optional<int> PostOrderTraversal::next() {
  while (!stack_.empty()) {
    auto [id, expanded] = stack_.back();
    stack_.pop_back();
    if (expanded) return id;
    stack_.push_back({id, true});
    auto it = nodes_->find(id);
    if (it == nodes_->end()) continue;
    const auto& kids = it->second.children;
    for (auto k = kids.rbegin(); k != kids.rend(); ++k) {
      if (nodes_->count(*k)) stack_.push_back({*k, false});
    }
  }
  return std::nullopt;
}

std::vector<int> PostOrderTraversal::collect() {
  std::vector<int> out;
  while (auto id = next()) out.push_back(*id);
  return out;
}

LevelOrderTraversal::LevelOrderTraversal(const NodeArena& nodes, int start) : nodes_(&nodes) {
  if (nodes.count(start)) queue_.push_back(start);
}

std::optional<int> LevelOrderTraversal::next() {
  if (queue_.empty()) return std::nullopt;
  int id = queue_.front();
  queue_.pop_front();
  auto it = nodes_->find(id);
  if (it != nodes_->end()) {
    for (int k : it->second.children) {
      if (nodes_->count(k)) queue_.push_back(k);
    }
  }
  return id;
}

std::vector<int> LevelOrderTraversal::collect() {
  std::vector<int> out;
  while (auto id = next()) out.push_back(*id);
  return out;
}
