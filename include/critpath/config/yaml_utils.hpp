#pragma once

#include "critpath/model/entities.hpp"
#include "critpath/util/date.hpp"
#include "critpath/util/id.hpp"

#include <yaml-cpp/yaml.h>

#include <string>
#include <string_view>

namespace YAML {

template <typename Tag>
struct convert<critpath::TypedId<Tag>> {
  static auto encode(const critpath::TypedId<Tag>& id) -> Node {
    return Node(std::string(id.value()));
  }
  static auto decode(const Node& node, critpath::TypedId<Tag>& id) -> bool {
    if (!node.IsScalar()) return false;
    id = critpath::TypedId<Tag>{node.as<std::string>()};
    return true;
  }
};

// "YYYY-MM-DD"; anything else fails the conversion.
template <>
struct convert<critpath::Date> {
  static auto encode(const critpath::Date& date) -> Node {
    return Node(critpath::format_date(date));
  }
  static auto decode(const Node& node, critpath::Date& date) -> bool {
    if (!node.IsScalar()) return false;
    auto parsed = critpath::parse_date(node.Scalar());
    if (!parsed) return false;
    date = *parsed;
    return true;
  }
};

// A sequence of weekday indices, 0 = Sunday.
template <>
struct convert<critpath::WorkWeek> {
  static auto decode(const Node& node, critpath::WorkWeek& week) -> bool {
    if (!node.IsSequence()) return false;
    week.reset();
    for (const auto& day : node) {
      auto index = day.as<int>();
      if (index < 0 || index > 6) return false;
      week.set(static_cast<std::size_t>(index));
    }
    return true;
  }
};

}  // namespace YAML

namespace critpath {

template <typename T>
concept YamlParsable = requires(const YAML::Node& n) { { n.as<T>() }; };

template <YamlParsable T>
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T default_val) -> T {
  auto field = node[std::string(key)];
  if (!field || (!field.IsScalar() && !field.IsSequence() && !field.IsMap())) {
    return default_val;
  }
  return field.as<T>();
}

inline void yaml_emit(YAML::Emitter& out, std::string_view key,
                      const auto& value) {
  out << YAML::Key << std::string(key) << YAML::Value << value;
}

}  // namespace critpath
