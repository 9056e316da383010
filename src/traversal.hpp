#pragma once
/*
 * Traversal
 *
 * Purpose: lazy single-pass walks over a node and its descendants in a NodeArena.
 * PostOrder: children (left to right) fully before their parent; used for bottom-up removal.
 * LevelOrder: breadth first, outer bullets before inner ones.
 * Restart by constructing a new traversal; the arena must outlive it and stay unmodified.
 */
#include <deque>
#include <optional>
#include <utility>
#include <vector>
#include "node.hpp"

class PostOrderTraversal {
public:
  PostOrderTraversal(const NodeArena& nodes, int start);
  std::optional<int> next();
  std::vector<int> collect();
private:
  const NodeArena* nodes_;
  std::vector<std::pair<int, bool>> stack_; // (id, children already pushed)
};

class LevelOrderTraversal {
public:
  LevelOrderTraversal(const NodeArena& nodes, int start);
  std::optional<int> next();
  std::vector<int> collect();
private:
  const NodeArena* nodes_;
  std::deque<int> queue_;
};
