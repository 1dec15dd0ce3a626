/*
  Traversals: BFS (fewest-edge paths, used for Edmonds-Karp augmenting
  paths), DFS, and iterative back-edge detection for the Dijkstra DAG
  precondition.
*/
#include "flownet/core/traversal.hpp"
#include "flownet/core/error.hpp"

#include <algorithm>
#include <deque>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace flownet::core {

namespace {
// Walk parent pointers back from target and return the path start -> target.
std::vector<Vertex> unwind(const std::unordered_map<Vertex, Vertex>& parents,
                           const Vertex& start, const Vertex& target) {
  std::vector<Vertex> path {target};
  Vertex cur = target;
  while (cur != start) {
    cur = parents.at(cur);
    path.push_back(cur);
  }
  std::reverse(path.begin(), path.end());
  return path;
}
} // namespace

std::vector<Vertex> bfs(const Graph& g, const Vertex& start, const Vertex& target) {
  std::unordered_map<Vertex, Vertex> parents;
  parents.emplace(start, start);
  std::deque<Vertex> queue {start};
  while (!queue.empty()) {
    Vertex u = std::move(queue.front());
    queue.pop_front();
    if (u == target) break;
    for (auto const& [v, w] : g.children(u)) {
      (void)w;
      // parents doubles as the visited set
      if (parents.emplace(v, u).second) queue.push_back(v);
    }
  }
  if (parents.find(target) == parents.end()) return {};
  return unwind(parents, start, target);
}

std::vector<Vertex> dfs(const Graph& g, const Vertex& start, const Vertex& target) {
  std::unordered_map<Vertex, Vertex> parents;
  std::unordered_set<Vertex> visited;
  parents.emplace(start, start);
  std::vector<Vertex> stack {start};
  bool found = false;
  while (!stack.empty()) {
    Vertex u = std::move(stack.back());
    stack.pop_back();
    if (!visited.insert(u).second) continue;
    if (u == target) { found = true; break; }
    for (auto const& [v, w] : g.children(u)) {
      (void)w;
      if (visited.count(v)) continue;
      // Parent of an unvisited vertex may be overwritten by a later push;
      // both candidates are already visited, so the chain stays valid.
      parents.insert_or_assign(v, u);
      stack.push_back(v);
    }
  }
  if (!found) return {};
  return unwind(parents, start, target);
}

void verify_dag(const Graph& g, const Vertex& source) {
  // Explicit DFS frames instead of recursion: (vertex, next child to visit).
  struct Frame {
    Vertex vertex;
    Adjacency::const_iterator next;
    Adjacency::const_iterator end;
  };
  std::unordered_set<Vertex> on_path;
  std::unordered_set<Vertex> finished;
  std::vector<Frame> stack;

  auto enter = [&](const Vertex& v) {
    const auto& adj = g.children(v);
    on_path.insert(v);
    stack.push_back(Frame{v, adj.begin(), adj.end()});
  };

  enter(source);
  while (!stack.empty()) {
    Frame& top = stack.back();
    if (top.next == top.end) {
      on_path.erase(top.vertex);
      finished.insert(top.vertex);
      stack.pop_back();
      continue;
    }
    const Vertex& child = top.next->first;
    ++top.next;
    if (on_path.count(child)) {
      throw NotADag("graph reachable from " + source.value() +
                    " has a cycle through edge (" + top.vertex.value() + ", " +
                    child.value() + ")");
    }
    if (!finished.count(child)) enter(child);
  }
}

bool is_dag_from(const Graph& g, const Vertex& source) {
  try {
    verify_dag(g, source);
  } catch (const NotADag&) {
    return false;
  }
  return true;
}

} // namespace flownet::core
