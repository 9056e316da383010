#include "undo_manager.hpp"

void UndoManager::record(Subtree tree) {
  undo_entries_.push_back(UndoEntry{std::move(tree)});
  redo_ids_.clear();
  prune_aliases();
}

void UndoManager::prune_aliases() {
  std::unordered_map<int, int> kept;
  auto keep_chain = [&](int id) {
    for (auto it = alias_.find(id); it != alias_.end(); it = alias_.find(it->second)) kept.insert(*it);
  };
  for (const auto& e : undo_entries_) {
    keep_chain(e.tree.former_parent());
    if (auto above = e.tree.former_above_sibling()) keep_chain(*above);
  }
  alias_.swap(kept);
}

int UndoManager::resolve(int id) const {
  for (auto it = alias_.find(id); it != alias_.end(); it = alias_.find(id)) id = it->second;
  return id;
}

std::optional<Error> UndoManager::restore(Tree& tree, const Subtree& sub) {
  if (auto above = sub.former_above_sibling(); above && tree.contains(resolve(*above))) {
    if (auto err = tree.activate(resolve(*above))) return err;
    tree.insert_subtree(sub, true);
    return std::nullopt;
  }
  int parent = resolve(sub.former_parent());
  if (!tree.contains(parent)) {
    return make_error(ErrorKind::UnknownIdentity, "cannot undo: former parent " + std::to_string(parent) + " is gone");
  }
  const auto& kids = tree.children_of(parent);
  if (!kids.empty()) {
    // it was the first child: go back above the current first child
    if (auto err = tree.activate(kids.front())) return err;
    tree.insert_subtree(sub, false);
    return std::nullopt;
  }
  if (auto err = tree.activate(parent)) return err;
  tree.insert_subtree(sub, true);
  return tree.indent(true);
}

Outcome<size_t> UndoManager::undo(Tree& tree) {
  if (undo_entries_.empty()) return make_error(ErrorKind::StructuralLimit, "already at oldest change");
  const UndoEntry& e = undo_entries_.back();
  if (auto err = restore(tree, e.tree)) return *err; // entry stays for a later retry
  std::vector<int> before = e.tree.ids();
  std::vector<int> after = tree.level_order(tree.active_id()).collect();
  for (size_t i = 0; i < before.size() && i < after.size(); ++i) alias_[before[i]] = after[i];
  size_t restored = e.tree.size();
  undo_entries_.pop_back();
  redo_ids_.push_back(tree.active_id());
  prune_aliases();
  return restored;
}

Outcome<size_t> UndoManager::redo(Tree& tree) {
  if (redo_ids_.empty()) return make_error(ErrorKind::StructuralLimit, "already at newest change");
  int id = redo_ids_.back();
  if (auto err = tree.activate(id)) { redo_ids_.pop_back(); return *err; }
  Subtree sub = tree.get_subtree();
  if (auto err = tree.delete_active()) return *err;
  redo_ids_.pop_back();
  undo_entries_.push_back(UndoEntry{std::move(sub)});
  prune_aliases();
  return undo_entries_.back().tree.size();
}
