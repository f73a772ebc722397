#include "critpath/graph/dependency_graph.hpp"

#include "critpath/core/arena.hpp"

#include <algorithm>
#include <format>
#include <queue>
#include <ranges>
#include <utility>

namespace critpath {

namespace {

enum class Mark : std::uint8_t { Unvisited, InProgress, Done };

}  // namespace

auto DependencyGraph::build(std::span<const Task> tasks,
                            std::span<const Dependency> dependencies)
    -> DependencyGraph {
  DependencyGraph graph;
  graph.nodes_.reserve(tasks.size());
  graph.keys_.reserve(tasks.size());
  for (const auto& task : tasks) {
    graph.add_node(task.id);
  }
  graph.edges_.reserve(dependencies.size());
  for (const auto& dep : dependencies) {
    graph.add_edge(dep);
  }
  return graph;
}

auto DependencyGraph::add_node(const TaskId& task_id) -> NodeIndex {
  auto it = key_to_idx_.find(task_id);
  if (it != key_to_idx_.end()) {
    return it->second;
  }

  auto idx = static_cast<NodeIndex>(nodes_.size());
  nodes_.emplace_back();
  keys_.push_back(task_id);
  key_to_idx_.emplace(task_id, idx);
  return idx;
}

auto DependencyGraph::add_edge(const Dependency& dep) -> void {
  NodeIndex from = get_index(dep.predecessor_id);
  NodeIndex to = get_index(dep.successor_id);
  if (from == kInvalidNode || to == kInvalidNode) [[unlikely]] {
    if (!dangling_) {
      dangling_ = from == kInvalidNode ? dep.predecessor_id : dep.successor_id;
    }
    return;
  }

  auto edge_idx = static_cast<std::uint32_t>(edges_.size());
  edges_.push_back(Edge{from, to, dep.type, dep.lag_days});
  nodes_[from].outgoing.push_back(edge_idx);
  nodes_[to].incoming.push_back(edge_idx);
}

auto DependencyGraph::validate() const -> ScheduleOutcome<void> {
  if (dangling_) {
    return schedule_fail(
        Error::DanglingReference,
        std::format("dependency references unknown task '{}'", *dangling_),
        *dangling_);
  }
  if (auto cycle = find_cycle()) {
    std::string path;
    for (const auto& id : *cycle) {
      path += std::format("{} -> ", id);
    }
    path += cycle->front().str();
    return schedule_fail(Error::CycleDetected,
                         std::format("dependency cycle: {}", path),
                         cycle->front(), std::move(*cycle));
  }
  return {};
}

// Iterative DFS with three-colour marking. A back edge to an in-progress
// node closes a cycle; the cycle is the DFS stack from that node to the top.
auto DependencyGraph::find_cycle() const
    -> std::optional<std::vector<TaskId>> {
  Arena<> arena;
  auto mark = arena.vector<Mark>(nodes_.size(), Mark::Unvisited);
  auto stack = arena.vector<std::pair<NodeIndex, std::size_t>>();

  for (NodeIndex start :
       std::views::iota(NodeIndex{0}, static_cast<NodeIndex>(nodes_.size()))) {
    if (mark[start] != Mark::Unvisited)
      continue;

    stack.push_back({start, 0});
    mark[start] = Mark::InProgress;

    while (!stack.empty()) {
      auto& [node, child_idx] = stack.back();
      const auto& out = nodes_[node].outgoing;

      if (child_idx < out.size()) {
        NodeIndex child = edges_[out[child_idx++]].to;
        if (mark[child] == Mark::InProgress) {
          auto from = std::ranges::find_if(
              stack, [child](const auto& frame) { return frame.first == child; });
          std::vector<TaskId> cycle;
          for (auto it = from; it != stack.end(); ++it) {
            cycle.push_back(keys_[it->first]);
          }
          return cycle;
        }
        if (mark[child] == Mark::Unvisited) {
          mark[child] = Mark::InProgress;
          stack.push_back({child, 0});
        }
      } else {
        mark[node] = Mark::Done;
        stack.pop_back();
      }
    }
  }
  return std::nullopt;
}

auto DependencyGraph::topological_order() const -> std::vector<NodeIndex> {
  auto in_degree = nodes_ | std::views::transform([](const Node& n) {
                     return n.incoming.size();
                   }) |
                   std::ranges::to<std::vector>();

  std::queue<NodeIndex> ready;
  for (NodeIndex i = 0; i < in_degree.size(); ++i) {
    if (in_degree[i] == 0) {
      ready.push(i);
    }
  }

  std::vector<NodeIndex> result;
  result.reserve(nodes_.size());
  while (!ready.empty()) {
    NodeIndex current = ready.front();
    ready.pop();
    result.push_back(current);

    for (auto edge_idx : nodes_[current].outgoing) {
      NodeIndex next = edges_[edge_idx].to;
      if (--in_degree[next] == 0) {
        ready.push(next);
      }
    }
  }

  return result;
}

auto DependencyGraph::topological_levels() const -> std::vector<std::uint32_t> {
  std::vector<std::uint32_t> level(nodes_.size(), 0);
  for (NodeIndex node : topological_order()) {
    for (auto edge_idx : nodes_[node].outgoing) {
      NodeIndex next = edges_[edge_idx].to;
      level[next] = std::max(level[next], level[node] + 1);
    }
  }
  return level;
}

auto DependencyGraph::incoming(NodeIndex idx) const noexcept
    -> std::span<const std::uint32_t> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].incoming;
}

auto DependencyGraph::outgoing(NodeIndex idx) const noexcept
    -> std::span<const std::uint32_t> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].outgoing;
}

auto DependencyGraph::has_node(const TaskId& task_id) const -> bool {
  return key_to_idx_.contains(task_id);
}

auto DependencyGraph::get_index(const TaskId& task_id) const -> NodeIndex {
  auto it = key_to_idx_.find(task_id);
  return it != key_to_idx_.end() ? it->second : kInvalidNode;
}

auto DependencyGraph::get_key(NodeIndex idx) const -> const TaskId& {
  return keys_[idx];
}

}  // namespace critpath
