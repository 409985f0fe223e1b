// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "driver/action_set.hpp"

#include <cctype>
#include <cmath>
#include <utility>

namespace rttfuzz {
namespace driver {

namespace {

bool is_disabled_value(const json& raw) {
  if (raw.is_boolean()) {
    return !raw.get<bool>();
  }
  if (raw.is_number()) {
    return raw.get<double>() == 0.0;
  }
  if (raw.is_string()) {
    return raw.get_ref<const std::string&>().empty();
  }
  if (raw.is_array() || raw.is_object()) {
    return raw.empty();
  }
  return false;
}

bool is_js_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

bool all_digits(const std::string& text, size_t pos, int base) {
  if (pos >= text.size()) {
    return false;
  }
  for (; pos < text.size(); ++pos) {
    char c = static_cast<char>(std::tolower(static_cast<unsigned char>(text[pos])));
    int digit = (c >= '0' && c <= '9') ? c - '0' : (c >= 'a' && c <= 'f') ? c - 'a' + 10 : base;
    if (digit >= base) {
      return false;
    }
  }
  return true;
}

// Decimal literal: [+-] (digits [. digits] | . digits) [e [+-] digits]
bool is_decimal_literal(const std::string& text) {
  size_t pos = 0;
  if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    ++pos;
  }
  size_t mantissa_digits = 0;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    ++pos;
    ++mantissa_digits;
  }
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      ++pos;
      ++mantissa_digits;
    }
  }
  if (mantissa_digits == 0) {
    return false;
  }
  if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
    ++pos;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
      ++pos;
    }
    return all_digits(text, pos, 10);
  }
  return pos == text.size();
}

// Same acceptance as JavaScript's Number(string)
bool is_numeric_text(const std::string& raw) {
  size_t begin = 0;
  size_t end = raw.size();
  while (begin < end && is_js_space(raw[begin])) {
    ++begin;
  }
  while (end > begin && is_js_space(raw[end - 1])) {
    --end;
  }
  const std::string text = raw.substr(begin, end - begin);

  if (text.empty()) {
    return true;
  }
  if (text == "Infinity" || text == "+Infinity" || text == "-Infinity") {
    return true;
  }
  if (text.size() > 2 && text[0] == '0') {
    switch (text[1]) {
    case 'x':
    case 'X':
      return all_digits(text, 2, 16);
    case 'o':
    case 'O':
      return all_digits(text, 2, 8);
    case 'b':
    case 'B':
      return all_digits(text, 2, 2);
    default:
      break;
    }
  }
  return is_decimal_literal(text);
}

// True if JavaScript's Number(value) would not be NaN
bool reads_as_number(const json& value) {
  switch (value.type()) {
  case json::value_t::null:
  case json::value_t::boolean:
  case json::value_t::number_integer:
  case json::value_t::number_unsigned:
    return true;
  case json::value_t::number_float:
    return !std::isnan(value.get<double>());
  case json::value_t::string:
    return is_numeric_text(value.get_ref<const std::string&>());
  case json::value_t::array:
    if (value.empty()) {
      return true;
    }
    if (value.size() > 1) {
      return false;
    }
    // A single element converts through its text form; true/false read as words
    return !value.front().is_boolean() && !value.front().is_object() && reads_as_number(value.front());
  default:
    return false;
  }
}

// One pool entry per UTF-8 character
std::vector<json> split_characters(const std::string& text) {
  std::vector<json> characters;
  size_t start = 0;
  for (size_t i = 1; i <= text.size(); ++i) {
    if (i == text.size() || (static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
      characters.emplace_back(text.substr(start, i - start));
      start = i;
    }
  }
  return characters;
}

}  // anonymous namespace

ActionDescriptor ClassifyDescriptor(const json& raw) {
  ActionDescriptor descriptor;
  descriptor.raw = raw;

  if (is_disabled_value(raw)) {
    descriptor.kind = ActionDescriptor::Kind::Disabled;
  } else if (raw.is_array() || raw.is_object()) {
    descriptor.kind = ActionDescriptor::Kind::ArgumentPool;
    descriptor.pool.reserve(raw.size());
    for (const auto& value : raw) {
      descriptor.pool.push_back(value);
    }
  } else if (raw.is_string()) {
    descriptor.kind = ActionDescriptor::Kind::ArgumentPool;
    descriptor.pool = split_characters(raw.get_ref<const std::string&>());
  } else {
    descriptor.kind = ActionDescriptor::Kind::Flag;
  }
  return descriptor;
}

bool HasActionsField(const json& view) {
  if (!view.is_object()) {
    return false;
  }
  auto it = view.find("actions");
  if (it == view.end() || it->is_null()) {
    return false;
  }
  if (it->is_number()) {
    double value = it->get<double>();
    return value != 0.0 && !std::isnan(value);
  }
  if (it->is_boolean() || it->is_string()) {
    return !is_disabled_value(*it);
  }
  return true;
}

std::vector<NormalizedAction> NormalizeActions(const json& view_actions, const NormalizeOptions& options) {
  std::vector<NormalizedAction> actions;

  if (view_actions.is_object()) {
    for (const auto& [name, raw] : view_actions.items()) {
      if (options.drop_undo && name == UNDO_ACTION) {
        continue;
      }
      if (name == RESIGN_ACTION && options.inject_resign) {
        continue;  // replaced by the injected entry below
      }
      ActionDescriptor descriptor = ClassifyDescriptor(raw);
      if (descriptor.kind == ActionDescriptor::Kind::Disabled) {
        continue;
      }
      actions.push_back({name, std::move(descriptor)});
    }
  }

  if (options.inject_resign) {
    actions.push_back({RESIGN_ACTION, ClassifyDescriptor(json(1))});
  }

  return actions;
}

std::vector<std::string> ActionNames(const std::vector<NormalizedAction>& actions) {
  std::vector<std::string> names;
  names.reserve(actions.size());
  for (const auto& action : actions) {
    names.push_back(action.name);
  }
  return names;
}

std::optional<size_t> FindNaNArgument(const ActionDescriptor& descriptor) {
  for (size_t i = 0; i < descriptor.pool.size(); ++i) {
    if (!reads_as_number(descriptor.pool[i])) {
      return i;
    }
  }
  return std::nullopt;
}

}  // namespace driver
}  // namespace rttfuzz
