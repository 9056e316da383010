#pragma once
/*
 * Node
 *
 * Purpose: one bullet stored in an arena keyed by identity.
 * Links: parent/children are identities resolved through the arena, never owning.
 * Note: child helpers only touch the child list; callers keep the child's parent field in sync.
 */
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "types.hpp"

constexpr int kRootId = 0;

struct Node {
  int id = 0;
  std::optional<int> parent;
  std::vector<int> children; // document order
  std::string content;

  Node() = default;
  Node(int id_, std::optional<int> parent_) : id(id_), parent(parent_) {}

  bool is_root() const { return id == kRootId; }
  std::optional<size_t> index_of(int child_id) const;
  // Inserts child above/below relative_id; false if relative_id is not a child.
  bool insert_child_relative(int relative_id, Dir dir, int child_id);
  void insert_child_first(int child_id) { children.insert(children.begin(), child_id); }
  void insert_child_last(int child_id) { children.push_back(child_id); }
  void remove_child(int child_id);
};

using NodeArena = std::unordered_map<int, Node>;

// Sibling of id on the given side within its parent, if any.
std::optional<int> sibling_of(const NodeArena& nodes, int id, Dir dir);
