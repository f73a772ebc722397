#pragma once

#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace critpath {

// Phantom type tags for type-safe ID disambiguation
struct TaskTag {};
struct PhaseTag {};
struct PersonTag {};

// Prevents passing a person id where a task id is expected
template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }

  [[nodiscard]] explicit operator std::string() const { return value_; }

  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs,
                                        const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs, const TypedId& rhs)
      -> bool = default;

private:
  std::string value_;
};

using TaskId = TypedId<TaskTag>;
using PhaseId = TypedId<PhaseTag>;
using PersonId = TypedId<PersonTag>;

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id)
    -> std::ostream& {
  return os << id.value();
}

}  // namespace critpath

template <typename Tag>
struct std::hash<critpath::TypedId<Tag>> {
  auto operator()(const critpath::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<critpath::TypedId<Tag>> : std::formatter<std::string_view> {
  auto format(const critpath::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
