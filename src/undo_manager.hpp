#pragma once
/*
 * UndoManager
 *
 * Purpose: history of structural deletions (dd, backspace over an empty bullet).
 * Entry: the detached Subtree, which remembers its former parent and above sibling.
 * Undo reinserts the subtree where it was; redo deletes the reinserted bullet again.
 * Reinsertion renumbers nodes, so recorded ids are resolved through an alias table
 * that only keeps chains still reachable from a recorded parent or above sibling.
 * Built only from Tree's public activate/get_subtree/insert_subtree/delete_active.
 */
#include <unordered_map>
#include <vector>
#include "outline_tree.hpp"
#include "subtree.hpp"
#include "types.hpp"

struct UndoEntry {
  Subtree tree;
};

class UndoManager {
public:
  void record(Subtree tree);
  size_t undo_size() const { return undo_entries_.size(); }
  size_t redo_size() const { return redo_ids_.size(); }
  size_t alias_size() const { return alias_.size(); }

  // On success the restored bullet is active; returns the number of bullets restored.
  Outcome<size_t> undo(Tree& tree);
  Outcome<size_t> redo(Tree& tree);

private:
  int resolve(int id) const;
  std::optional<Error> restore(Tree& tree, const Subtree& sub);
  void prune_aliases();

  std::vector<UndoEntry> undo_entries_;
  std::vector<int> redo_ids_; // roots reinserted by undo
  std::unordered_map<int, int> alias_; // id before reinsertion -> id after
};
