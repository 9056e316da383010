#include "traversal.hpp"
#include <cassert>
#include <vector>

static void add(NodeArena& nodes, int id, int parent) {
  nodes.emplace(id, Node(id, parent));
  nodes.at(parent).insert_child_last(id);
}

// 0
//   1
//   2
//     3
//     4
//       5
static NodeArena sample() {
  NodeArena nodes;
  nodes.emplace(0, Node(0, std::nullopt));
  add(nodes, 1, 0);
  add(nodes, 2, 0);
  add(nodes, 3, 2);
  add(nodes, 4, 2);
  add(nodes, 5, 4);
  return nodes;
}

static void test_post_order() {
  NodeArena nodes = sample();
  assert(PostOrderTraversal(nodes, 0).collect() == std::vector<int>({1, 3, 5, 4, 2, 0}));
  assert(PostOrderTraversal(nodes, 2).collect() == std::vector<int>({3, 5, 4, 2}));
  assert(PostOrderTraversal(nodes, 5).collect() == std::vector<int>({5}));
}

static void test_level_order() {
  NodeArena nodes = sample();
  assert(LevelOrderTraversal(nodes, 0).collect() == std::vector<int>({0, 1, 2, 3, 4, 5}));
  assert(LevelOrderTraversal(nodes, 4).collect() == std::vector<int>({4, 5}));
}

static void test_lazy_next() {
  NodeArena nodes = sample();
  PostOrderTraversal post(nodes, 2);
  assert(post.next() == 3);
  assert(post.next() == 5);
  assert(post.next() == 4);
  assert(post.next() == 2);
  assert(!post.next());
  assert(!post.next());

  LevelOrderTraversal level(nodes, 2);
  assert(level.next() == 2);
  assert(level.next() == 3);
  assert(level.collect() == std::vector<int>({4, 5}));
  assert(!level.next());
}

static void test_sibling_of() {
  NodeArena nodes = sample();
  assert(sibling_of(nodes, 3, Dir::Below) == 4);
  assert(sibling_of(nodes, 4, Dir::Above) == 3);
  assert(!sibling_of(nodes, 3, Dir::Above));
  assert(!sibling_of(nodes, 0, Dir::Below));
  assert(!sibling_of(nodes, 42, Dir::Below));
}

int main() {
  test_post_order();
  test_level_order();
  test_lazy_next();
  test_sibling_of();
  return 0;
}
