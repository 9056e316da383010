#pragma once
/*
 * Subtree
 *
 * Purpose: detached deep copy of a bullet and its descendants (clipboard, undo record).
 * Context: remembers the former parent and former above sibling for precise undo.
 * Identity: node ids are a foreign namespace until remapped with make_unique().
 */
#include <optional>
#include <string>
#include <vector>
#include "id_source.hpp"
#include "node.hpp"

class Subtree {
public:
  Subtree(NodeArena nodes, int root, int former_parent, std::optional<int> former_above);

  int root_id() const { return root_; }
  int former_parent() const { return former_parent_; }
  std::optional<int> former_above_sibling() const { return former_above_; }
  const NodeArena& nodes() const { return nodes_; }
  size_t size() const { return nodes_.size(); }
  const std::string& content(int id) const { return nodes_.at(id).content; }
  const std::string& root_content() const { return content(root_); }

  // Identities in level order.
  std::vector<int> ids() const;
  // Copy with every node renumbered from ids; links rewritten, context kept.
  Subtree make_unique(IIdSource& ids) const;

private:
  NodeArena nodes_;
  int root_;
  int former_parent_;
  std::optional<int> former_above_;
};
