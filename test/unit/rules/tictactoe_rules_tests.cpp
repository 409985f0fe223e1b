// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for the tic-tac-toe reference rules engine

#include <catch2/catch_test_macros.hpp>

#include "rules/tictactoe_rules.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using namespace rttfuzz::rules;
using json = nlohmann::json;

namespace {

// Apply a sequence of placements, alternating from whoever is active
json Play(TicTacToeRules& rules, json state, const std::vector<int>& cells) {
    for (int cell : cells) {
        std::string active = state["active"].get<std::string>();
        state = rules.Action(state, active, "place", cell);
    }
    return state;
}

}  // namespace

TEST_CASE("TicTacToeRules: setup", "[rules][tictactoe]") {
    TicTacToeRules rules;

    REQUIRE(rules.Roles() == std::vector<std::string>{"X", "O"});
    REQUIRE(rules.Scenarios() == std::vector<std::string>{"Standard", "Misere"});
    REQUIRE(rules.SupportsResign());

    SECTION("Seed picks who moves first") {
        REQUIRE(rules.Setup(2, "Standard", json::object())["active"] == "X");
        REQUIRE(rules.Setup(7, "Standard", json::object())["active"] == "O");
    }

    SECTION("Empty board") {
        json state = rules.Setup(4, "Misere", json::object());
        REQUIRE(state["board"].size() == 9);
        for (const auto& cell : state["board"]) {
            REQUIRE(cell == "");
        }
        REQUIRE(state["state"] == "play");
        REQUIRE(state["result"].is_null());
        REQUIRE(state["history"].empty());
        REQUIRE(state["scenario"] == "Misere");
    }

    SECTION("Unknown scenario") {
        REQUIRE_THROWS_AS(rules.Setup(1, "Blitz", json::object()), std::invalid_argument);
    }
}

TEST_CASE("TicTacToeRules: views", "[rules][tictactoe]") {
    TicTacToeRules rules;
    json state = rules.Setup(2, "Standard", json::object());

    SECTION("Active role sees free cells and a disabled undo") {
        json view = rules.View(state, "X");
        REQUIRE(view["actions"]["place"] == json::array({0, 1, 2, 3, 4, 5, 6, 7, 8}));
        REQUIRE(view["actions"]["undo"] == 0);
        REQUIRE(view["active"] == "X");
    }

    SECTION("Waiting role has no actions") {
        json view = rules.View(state, "O");
        REQUIRE_FALSE(view.contains("actions"));
        REQUIRE(view["prompt"] == "Waiting for X.");
    }

    SECTION("Taken cells disappear and undo becomes available") {
        state = Play(rules, state, {4});
        json view = rules.View(state, "O");
        REQUIRE(view["actions"]["place"] == json::array({0, 1, 2, 3, 5, 6, 7, 8}));
        REQUIRE(view["actions"]["undo"] == 1);
    }

    SECTION("Finished game has no actions") {
        state = Play(rules, state, {0, 3, 1, 4, 2});
        json view = rules.View(state, "X");
        REQUIRE_FALSE(view.contains("actions"));
        REQUIRE(view["state"] == "game_over");
        REQUIRE(view["prompt"] == "Game over: X");
    }
}

TEST_CASE("TicTacToeRules: results", "[rules][tictactoe]") {
    TicTacToeRules rules;

    SECTION("Standard: completing a line wins") {
        json state = Play(rules, rules.Setup(2, "Standard", json::object()), {0, 3, 1, 4, 2});
        REQUIRE(state["state"] == "game_over");
        REQUIRE(state["result"] == "X");
        REQUIRE(state["active"] == "None");
    }

    SECTION("Misere: completing a line loses") {
        json state = Play(rules, rules.Setup(2, "Misere", json::object()), {0, 3, 1, 4, 2});
        REQUIRE(state["result"] == "O");
    }

    SECTION("Full board without a line is a draw") {
        json state = Play(rules, rules.Setup(2, "Standard", json::object()), {0, 1, 2, 4, 3, 5, 7, 6, 8});
        REQUIRE(state["state"] == "game_over");
        REQUIRE(state["result"] == "Draw");
        REQUIRE(TicTacToeRules::LineOwner(state["board"]).empty());
    }

    SECTION("Resignation hands the win to the other side") {
        json state = rules.Setup(3, "Standard", json::object());
        state = rules.Resign(state, "O");
        REQUIRE(state["state"] == "game_over");
        REQUIRE(state["result"] == "X");
    }
}

TEST_CASE("TicTacToeRules: undo", "[rules][tictactoe]") {
    TicTacToeRules rules;
    json start = rules.Setup(2, "Standard", json::object());
    json played = Play(rules, start, {4, 0});

    json undone = rules.Action(played, "X", "undo", json());
    REQUIRE(undone["board"][0] == "");
    REQUIRE(undone["board"][4] == "X");
    REQUIRE(undone["active"] == "O");
    REQUIRE(undone["history"].size() == 1);

    undone = rules.Action(undone, "O", "undo", json());
    REQUIRE(undone["board"] == start["board"]);
    REQUIRE(undone["active"] == "X");

    REQUIRE_THROWS_AS(rules.Action(start, "X", "undo", json()), std::logic_error);
}

TEST_CASE("TicTacToeRules: rejected moves", "[rules][tictactoe]") {
    TicTacToeRules rules;
    json state = rules.Setup(2, "Standard", json::object());

    REQUIRE_THROWS_AS(rules.Action(state, "O", "place", 0), std::invalid_argument);
    REQUIRE_THROWS_AS(rules.Action(state, "X", "place", 9), std::out_of_range);
    REQUIRE_THROWS_AS(rules.Action(state, "X", "place", -1), std::out_of_range);
    REQUIRE_THROWS_AS(rules.Action(state, "X", "place", "4"), std::invalid_argument);
    REQUIRE_THROWS_AS(rules.Action(state, "X", "castle", json()), std::invalid_argument);

    state = Play(rules, state, {4});
    REQUIRE_THROWS_AS(rules.Action(state, "O", "place", 4), std::invalid_argument);

    state = Play(rules, state, {0, 3, 1, 5});
    REQUIRE(state["state"] == "game_over");
    REQUIRE_THROWS_AS(rules.Action(state, "O", "place", 8), std::logic_error);
    REQUIRE_THROWS_AS(rules.Resign(state, "O"), std::logic_error);
}

TEST_CASE("TicTacToeRules: LineOwner", "[rules][tictactoe]") {
    json board = json::array({"", "", "", "", "", "", "", "", ""});
    REQUIRE(TicTacToeRules::LineOwner(board).empty());

    board[2] = "O";
    board[4] = "O";
    board[6] = "O";
    REQUIRE(TicTacToeRules::LineOwner(board) == "O");

    board[4] = "X";
    REQUIRE(TicTacToeRules::LineOwner(board).empty());
}
