#include "outline_tree.hpp"
#include "subtree.hpp"
#include <algorithm>
#include <cassert>
#include <iterator>
#include <memory>
#include <vector>

static Tree new_tree() { return Tree(std::make_unique<CounterIdSource>()); }

// 1.
//   2.
//     3.
//   4.
//   5.
static Subtree sample_subtree() {
  Tree t = new_tree();
  t.create_sibling(true); // 2
  assert(!t.indent(false));
  t.create_sibling(true); // 3
  t.create_sibling(true); // 4
  t.create_sibling(true); // 5
  assert(!t.activate(3));
  assert(!t.indent(false));
  assert(!t.activate(1));
  t.mutable_active_content() = "top";
  return t.get_subtree();
}

static bool disjoint(std::vector<int> a, std::vector<int> b) {
  std::sort(a.begin(), a.end());
  std::sort(b.begin(), b.end());
  std::vector<int> both;
  std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(both));
  return both.empty();
}

static void test_level_ids() {
  Subtree s = sample_subtree();
  assert(s.ids() == std::vector<int>({1, 2, 4, 5, 3}));
  assert(s.root_id() == 1);
  assert(s.former_parent() == 0);
  assert(!s.former_above_sibling());
  assert(s.root_content() == "top");
}

static void test_make_unique_disjoint() {
  Subtree s = sample_subtree();
  CounterIdSource ids(1);
  Subtree a = s.make_unique(ids);
  Subtree b = a.make_unique(ids);
  assert(disjoint(s.ids(), a.ids()));
  assert(disjoint(a.ids(), b.ids()));
  assert(disjoint(s.ids(), b.ids()));
  assert(std::none_of(a.ids().begin(), a.ids().end(), [](int i){ return i == 0; }));
}

static void test_make_unique_keeps_shape() {
  Subtree s = sample_subtree();
  CounterIdSource ids(100);
  Subtree u = s.make_unique(ids);
  assert(u.size() == s.size());
  assert(u.root_content() == "top");
  assert(!u.nodes().at(u.root_id()).parent);
  const Node& root = u.nodes().at(u.root_id());
  assert(root.children.size() == 3);
  for (int c : root.children) assert(u.nodes().at(c).parent == u.root_id());
  const Node& two = u.nodes().at(root.children[0]);
  assert(two.children.size() == 1);
  assert(u.nodes().at(two.children[0]).parent == two.id);
  assert(u.former_parent() == s.former_parent());
  assert(u.former_above_sibling() == s.former_above_sibling());
}

static void test_source_untouched() {
  Subtree s = sample_subtree();
  CounterIdSource ids(50);
  Subtree u = s.make_unique(ids);
  assert(s.ids() == std::vector<int>({1, 2, 4, 5, 3}));
  assert(s.content(1) == "top");
  assert(u.ids().front() != 1);
}

int main() {
  test_level_ids();
  test_make_unique_disjoint();
  test_make_unique_keeps_shape();
  test_source_untouched();
  return 0;
}
