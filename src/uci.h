#pragma once

#include "chess.hpp"
#include <iostream>
#include <string>
#include <vector>

struct GoParams {
    int time_left_ms = 0;
    int movetime_ms = 0;
    int depth = 0;
};

std::vector<std::string> split(const std::string& s, char delimiter);
bool is_integer(const std::string& s);

// Parses the arguments of a "go" command for the given side to move.
GoParams parse_go(const std::vector<std::string>& tokens, chess::Color side_to_move);

// Reads commands from in until "quit" or end of input. Engine search output
// still goes to std::cout.
void uci_loop(std::istream& in = std::cin, std::ostream& out = std::cout);
