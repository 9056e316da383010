#include "outline_tree.hpp"
#include <sstream>
#include <utility>

Tree::Tree(std::unique_ptr<IIdSource> ids) : ids_(std::move(ids)) {
  Node root(kRootId, std::nullopt);
  int first_id = ids_->next_id();
  root.insert_child_last(first_id);
  nodes_.emplace(kRootId, std::move(root));
  nodes_.emplace(first_id, Node(first_id, kRootId));
  active_ = first_id;
}

void Tree::splice_next_to_active(Node node, Dir dir) {
  int parent_id = *nodes_.at(active_).parent;
  node.parent = parent_id;
  int id = node.id;
  nodes_.at(parent_id).insert_child_relative(active_, dir, id);
  nodes_.emplace(id, std::move(node));
}

void Tree::create_sibling(bool below) {
  Node node(ids_->next_id(), std::nullopt);
  int id = node.id;
  splice_next_to_active(std::move(node), below ? Dir::Below : Dir::Above);
  active_ = id;
}

std::optional<Error> Tree::indent(bool as_first) {
  auto above = sibling_of(nodes_, active_, Dir::Above);
  if (!above) return make_error(ErrorKind::StructuralLimit, "already at max indentation level");
  Node& self = nodes_.at(active_);
  nodes_.at(*self.parent).remove_child(active_);
  Node& new_parent = nodes_.at(*above);
  if (as_first) new_parent.insert_child_first(active_);
  else new_parent.insert_child_last(active_);
  self.parent = *above;
  return std::nullopt;
}

std::optional<Error> Tree::unindent() {
  Node& self = nodes_.at(active_);
  Node& parent = nodes_.at(*self.parent);
  if (parent.is_root()) return make_error(ErrorKind::StructuralLimit, "cannot unindent further");
  Node& grandparent = nodes_.at(*parent.parent);
  parent.remove_child(active_);
  grandparent.insert_child_relative(parent.id, Dir::Below, active_);
  self.parent = grandparent.id;
  return std::nullopt;
}

std::optional<Error> Tree::activate(int id) {
  if (id == kRootId || !nodes_.count(id)) {
    return make_error(ErrorKind::UnknownIdentity, "could not find id to activate: " + std::to_string(id));
  }
  active_ = id;
  return std::nullopt;
}

std::optional<Error> Tree::delete_active() {
  const Node& self = nodes_.at(active_);
  Node& parent = nodes_.at(*self.parent);
  if (parent.is_root() && parent.children.size() == 1) {
    return make_error(ErrorKind::StructuralLimit, "cannot delete last bullet");
  }
  int successor;
  if (auto below = sibling_of(nodes_, active_, Dir::Below)) successor = *below;
  else if (auto above = sibling_of(nodes_, active_, Dir::Above)) successor = *above;
  else successor = parent.id;

  int doomed = active_;
  std::vector<int> ids = PostOrderTraversal(nodes_, doomed).collect();
  parent.remove_child(doomed);
  for (int id : ids) nodes_.erase(id);
  active_ = successor;
  return std::nullopt;
}

Subtree Tree::get_subtree() const {
  NodeArena copy;
  for (int id : LevelOrderTraversal(nodes_, active_).collect()) copy.emplace(id, nodes_.at(id));
  copy.at(active_).parent.reset();
  return Subtree(std::move(copy), active_, *nodes_.at(active_).parent, sibling_of(nodes_, active_, Dir::Above));
}

void Tree::insert_subtree(const Subtree& subtree, bool below) {
  Subtree fresh = subtree.make_unique(*ids_);
  int root = fresh.root_id();
  for (const auto& [id, node] : fresh.nodes()) {
    if (id != root) nodes_.emplace(id, node);
  }
  splice_next_to_active(fresh.nodes().at(root), below ? Dir::Below : Dir::Above);
  active_ = root;
}

const Node* Tree::find(int id) const {
  auto it = nodes_.find(id);
  return it == nodes_.end() ? nullptr : &it->second;
}

std::optional<int> Tree::parent_of(int id) const {
  auto it = nodes_.find(id);
  if (it == nodes_.end()) return std::nullopt;
  return it->second.parent;
}

int Tree::depth_of(int id) const {
  int depth = -1;
  for (auto p = parent_of(id); p; p = parent_of(*p)) depth++;
  return depth;
}

std::string Tree::dump() const {
  std::ostringstream out;
  std::vector<std::pair<int, int>> stack{{kRootId, 0}}; // (id, level)
  while (!stack.empty()) {
    auto [id, level] = stack.back();
    stack.pop_back();
    const Node& n = nodes_.at(id);
    out << std::string(static_cast<size_t>(level), '\t') << n.id << ". " << (n.id == active_ ? "ACTIVE " : "") << n.content << "\n";
    for (auto it = n.children.rbegin(); it != n.children.rend(); ++it) stack.emplace_back(*it, level + 1);
  }
  return out.str();
}
