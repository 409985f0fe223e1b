// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Action set normalization

 A view advertises actions as name -> raw descriptor. The raw value is
 classified once per view:
 - Disabled      false, 0, "", [] or {} (shown by the UI but not selectable)
 - Flag          null, true, other numbers (no argument)
 - ArgumentPool  non-empty array, object or string; the argument is picked
                 from its elements, values or characters

 NormalizeActions() builds a fresh list every step from the view's actions,
 the undo filter and the resign injection. The view itself is never edited.
*/

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace rttfuzz {
namespace driver {

using json = nlohmann::json;

inline constexpr const char* UNDO_ACTION = "undo";
inline constexpr const char* RESIGN_ACTION = "_resign";

struct ActionDescriptor {
  enum class Kind { Disabled, Flag, ArgumentPool };

  Kind kind{Kind::Disabled};
  json raw;               // value as advertised by the view
  std::vector<json> pool; // candidate arguments, ArgumentPool only
};

ActionDescriptor ClassifyDescriptor(const json& raw);

struct NormalizedAction {
  std::string name;
  ActionDescriptor descriptor;
};

struct NormalizeOptions {
  bool drop_undo{false};
  bool inject_resign{false};
};

// True if the view carries an actions field with a usable value
bool HasActionsField(const json& view);

// Selectable actions in view order, _resign last when injected
std::vector<NormalizedAction> NormalizeActions(const json& view_actions, const NormalizeOptions& options);

std::vector<std::string> ActionNames(const std::vector<NormalizedAction>& actions);

// Position of the first pool value that does not read as a number (a NaN,
// or a string, object or list that JavaScript's Number() rejects), if any
std::optional<size_t> FindNaNArgument(const ActionDescriptor& descriptor);

}  // namespace driver
}  // namespace rttfuzz
