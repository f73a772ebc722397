#pragma once

#include "critpath/model/entities.hpp"
#include "critpath/schedule/schedule_error.hpp"
#include "critpath/util/id.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace critpath {

using NodeIndex = std::uint32_t;
inline constexpr NodeIndex kInvalidNode = UINT32_MAX;

struct Edge {
  NodeIndex from{kInvalidNode};
  NodeIndex to{kInvalidNode};
  DependencyType type{DependencyType::FinishToStart};
  int lag_days{0};
};

// Task dependency network indexed by integer node. Nodes follow the task
// input order; edges referencing unknown tasks are remembered and reported
// by validate() instead of being dropped.
class DependencyGraph {
public:
  [[nodiscard]] static auto build(std::span<const Task> tasks,
                                  std::span<const Dependency> dependencies)
      -> DependencyGraph;

  auto add_node(const TaskId& task_id) -> NodeIndex;
  auto add_edge(const Dependency& dep) -> void;

  // DanglingReference first, then CycleDetected with the cycle in order.
  [[nodiscard]] auto validate() const -> ScheduleOutcome<void>;

  // Only meaningful on a validated graph.
  [[nodiscard]] auto topological_order() const -> std::vector<NodeIndex>;
  // Longest predecessor chain per node; sources are level 0.
  [[nodiscard]] auto topological_levels() const -> std::vector<std::uint32_t>;

  [[nodiscard]] auto incoming(NodeIndex idx) const noexcept
      -> std::span<const std::uint32_t>;
  [[nodiscard]] auto outgoing(NodeIndex idx) const noexcept
      -> std::span<const std::uint32_t>;
  [[nodiscard]] auto edge(std::uint32_t edge_idx) const -> const Edge& {
    return edges_[edge_idx];
  }

  [[nodiscard]] auto has_node(const TaskId& task_id) const -> bool;
  [[nodiscard]] auto get_index(const TaskId& task_id) const -> NodeIndex;
  [[nodiscard]] auto get_key(NodeIndex idx) const -> const TaskId&;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto edge_count() const noexcept -> std::size_t {
    return edges_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return nodes_.empty(); }

private:
  [[nodiscard]] auto find_cycle() const -> std::optional<std::vector<TaskId>>;

  struct Node {
    std::vector<std::uint32_t> incoming;  // edge indices
    std::vector<std::uint32_t> outgoing;
  };

  std::vector<Node> nodes_;
  std::vector<TaskId> keys_;
  std::unordered_map<TaskId, NodeIndex> key_to_idx_;
  std::vector<Edge> edges_;
  std::optional<TaskId> dangling_;
};

}  // namespace critpath
