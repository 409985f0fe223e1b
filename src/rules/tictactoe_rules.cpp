// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "rules/tictactoe_rules.hpp"

#include "util/logging.hpp"

#include <array>
#include <stdexcept>

namespace rttfuzz {
namespace rules {

namespace {

constexpr std::array<std::array<int, 3>, 8> kLines = {{
    {0, 1, 2}, {3, 4, 5}, {6, 7, 8},  // rows
    {0, 3, 6}, {1, 4, 7}, {2, 5, 8},  // columns
    {0, 4, 8}, {2, 4, 6},             // diagonals
}};

std::string other(const std::string& role) {
  return role == "X" ? "O" : "X";
}

bool is_over(const json& state) {
  return state.at("state").get<std::string>() == STATE_GAME_OVER;
}

void finish(json& state, const std::string& winner, const std::string& reason) {
  state["state"] = STATE_GAME_OVER;
  state["active"] = "None";
  state["result"] = winner.empty() ? json("Draw") : json(winner);
  state["log"].push_back(reason);
  LOG_RULES_DEBUG("tictactoe: game over, result={} ({})", state["result"].get<std::string>(), reason);
}

void require_turn(const json& state, const std::string& role) {
  if (is_over(state)) {
    throw std::logic_error("game is over");
  }
  if (state.at("active").get<std::string>() != role) {
    throw std::invalid_argument("it is not " + role + "'s turn");
  }
}

}  // anonymous namespace

TicTacToeRules::TicTacToeRules() : roles_{"X", "O"}, scenarios_{"Standard", "Misere"} {}

std::string TicTacToeRules::LineOwner(const json& board) {
  for (const auto& line : kLines) {
    const std::string& a = board.at(line[0]).get_ref<const std::string&>();
    if (!a.empty() && a == board.at(line[1]).get_ref<const std::string&>() &&
        a == board.at(line[2]).get_ref<const std::string&>()) {
      return a;
    }
  }
  return "";
}

json TicTacToeRules::Setup(int64_t seed, const std::string& scenario, const json& options) {
  (void)options;
  if (scenario != "Standard" && scenario != "Misere") {
    throw std::invalid_argument("unknown scenario: " + scenario);
  }

  json state;
  state["seed"] = seed;
  state["scenario"] = scenario;
  state["board"] = json::array();
  for (int i = 0; i < BOARD_CELLS; ++i) {
    state["board"].push_back("");
  }
  state["active"] = (seed % 2 == 0) ? "X" : "O";
  state["state"] = "play";
  state["result"] = nullptr;
  state["history"] = json::array();
  state["log"] = json::array();
  return state;
}

json TicTacToeRules::View(const json& state, const std::string& role) {
  json view;
  view["board"] = state.at("board");
  view["active"] = state.at("active");
  view["state"] = state.at("state");

  if (is_over(state)) {
    view["prompt"] = "Game over: " + state.at("result").get<std::string>();
    return view;
  }
  if (state.at("active").get<std::string>() != role) {
    view["prompt"] = "Waiting for " + state.at("active").get<std::string>() + ".";
    return view;
  }

  json free_cells = json::array();
  const json& board = state.at("board");
  for (int i = 0; i < BOARD_CELLS; ++i) {
    if (board.at(i).get_ref<const std::string&>().empty()) {
      free_cells.push_back(i);
    }
  }

  view["prompt"] = "Place your mark.";
  view["actions"] = {{"place", free_cells}, {"undo", state.at("history").empty() ? 0 : 1}};
  return view;
}

json TicTacToeRules::Action(const json& state, const std::string& role, const std::string& action, const json& arg) {
  require_turn(state, role);
  json next = state;

  if (action == "undo") {
    if (next["history"].empty()) {
      throw std::logic_error("nothing to undo");
    }
    json last = next["history"].back();
    next["history"].erase(next["history"].size() - 1);
    next["board"] = last.at("board");
    next["active"] = last.at("active");
    next["log"].push_back(role + " undid a move");
    return next;
  }

  if (action != "place") {
    throw std::invalid_argument("unknown action: " + action);
  }
  if (!arg.is_number_integer()) {
    throw std::invalid_argument("place expects a cell index");
  }
  int cell = arg.get<int>();
  if (cell < 0 || cell >= BOARD_CELLS) {
    throw std::out_of_range("cell " + std::to_string(cell) + " is off the board");
  }
  if (!next["board"][cell].get_ref<const std::string&>().empty()) {
    throw std::invalid_argument("cell " + std::to_string(cell) + " is taken");
  }

  next["history"].push_back({{"board", state.at("board")}, {"active", role}});
  next["board"][cell] = role;
  next["log"].push_back(role + " placed at " + std::to_string(cell));

  std::string owner = LineOwner(next["board"]);
  if (!owner.empty()) {
    bool misere = next.at("scenario").get<std::string>() == "Misere";
    finish(next, misere ? other(owner) : owner, owner + " completed a line");
    return next;
  }
  if (next["history"].size() == static_cast<size_t>(BOARD_CELLS)) {
    finish(next, "", "board full");
    return next;
  }

  next["active"] = other(role);
  return next;
}

json TicTacToeRules::Resign(const json& state, const std::string& role) {
  require_turn(state, role);
  json next = state;
  finish(next, other(role), role + " resigned");
  return next;
}

}  // namespace rules
}  // namespace rttfuzz
