#pragma once
/*
 * Tree
 *
 * Purpose: the outline document; owns every bullet in an arena keyed by identity.
 * Invariants (after every public call):
 *   - exactly one active node, never the root
 *   - the root has at least one child
 *   - identities are unique
 *   - every non-root node has a parent and appears once in its child list
 * Failure: mutations return an Error and leave the tree untouched.
 */
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "id_source.hpp"
#include "node.hpp"
#include "subtree.hpp"
#include "traversal.hpp"
#include "types.hpp"

class Tree {
public:
  explicit Tree(std::unique_ptr<IIdSource> ids);

  /*structure*/
  void create_sibling(bool below);
  std::optional<Error> indent(bool as_first);
  std::optional<Error> unindent();
  std::optional<Error> activate(int id);
  std::optional<Error> delete_active();
  Subtree get_subtree() const;
  void insert_subtree(const Subtree& subtree, bool below);

  /*content*/
  int active_id() const { return active_; }
  const std::string& active_content() const { return nodes_.at(active_).content; }
  std::string& mutable_active_content() { return nodes_.at(active_).content; }

  /*lookup*/
  int root_id() const { return kRootId; }
  bool contains(int id) const { return nodes_.count(id) != 0; }
  size_t node_count() const { return nodes_.size(); }
  const Node* find(int id) const;
  const std::string& content(int id) const { return nodes_.at(id).content; }
  std::optional<int> parent_of(int id) const;
  const std::vector<int>& children_of(int id) const { return nodes_.at(id).children; }
  std::optional<int> sibling(int id, Dir dir) const { return sibling_of(nodes_, id, dir); }
  int depth_of(int id) const;

  PostOrderTraversal post_order(int start) const { return PostOrderTraversal(nodes_, start); }
  LevelOrderTraversal level_order(int start) const { return LevelOrderTraversal(nodes_, start); }

  // Indented listing of the whole document, active node marked.
  std::string dump() const;

private:
  void splice_next_to_active(Node node, Dir dir);

  NodeArena nodes_;
  int active_ = kRootId;
  std::unique_ptr<IIdSource> ids_;
};
