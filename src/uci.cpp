#include "uci.h"
#include "search.h"
#include "timeman.h"
#include <cctype>
#include <exception>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream tokenStream(s);
    while (std::getline(tokenStream, token, delimiter)) {
        if (!token.empty()) tokens.push_back(token);
    }
    return tokens;
}

bool is_integer(const std::string& s) {
    if (s.empty()) return false;
    size_t i = 0;
    if (s[0] == '-' || s[0] == '+') i = 1;
    if (i >= s.size()) return false;
    for (; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

GoParams parse_go(const std::vector<std::string>& tokens, chess::Color side_to_move) {
    GoParams params;
    int wtime = 0, btime = 0;

    for (size_t i = 1; i + 1 < tokens.size(); ++i) {
        if (tokens[i] == "wtime") wtime = std::stoi(tokens[i + 1]);
        else if (tokens[i] == "btime") btime = std::stoi(tokens[i + 1]);
        else if (tokens[i] == "depth") params.depth = std::stoi(tokens[i + 1]);
        else if (tokens[i] == "movetime") params.movetime_ms = std::stoi(tokens[i + 1]);
    }

    // "go 15" is shorthand for "go depth 15"
    if (tokens.size() == 2 && is_integer(tokens[1])) {
        params.depth = std::stoi(tokens[1]);
    }

    params.time_left_ms = (side_to_move == chess::Color::WHITE) ? wtime : btime;
    return params;
}

void uci_loop(std::istream& in, std::ostream& out) {
    chess::Board board;
    Engine engine;
    int panic_reserve_ms = TimeManager::PANIC_RESERVE_MS;

    board.setFen(chess::constants::STARTPOS);

    std::string line;
    while (std::getline(in, line)) {
        auto tokens = split(line, ' ');
        if (tokens.empty()) continue;

        const std::string& command = tokens[0];
        if (command == "quit") break;

        try {
            if (command == "uci") {
                out << "id name Wayward" << std::endl;
                out << "id author Wayward developers" << std::endl;
                out << "option name Hash type spin default " << DEFAULT_HASH_MB
                          << " min 1 max 1024" << std::endl;
                out << "option name Seed type spin default " << DEFAULT_SEED
                          << " min 0 max 2147483647" << std::endl;
                out << "option name PanicReserve type spin default "
                          << TimeManager::PANIC_RESERVE_MS << " min 0 max 60000" << std::endl;
                out << "uciok" << std::endl;

            } else if (command == "setoption") {
                // setoption name <id> value <x>
                if (tokens.size() >= 5 && tokens[1] == "name" && tokens[3] == "value") {
                    if (tokens[2] == "Hash") {
                        engine.set_hash(static_cast<size_t>(std::stoi(tokens[4])));
                    } else if (tokens[2] == "Seed") {
                        engine.set_seed(static_cast<uint32_t>(std::stoul(tokens[4])));
                    } else if (tokens[2] == "PanicReserve") {
                        panic_reserve_ms = std::stoi(tokens[4]);
                    } else {
                        out << "info string unknown option " << tokens[2] << std::endl;
                    }
                }

            } else if (command == "isready") {
                out << "readyok" << std::endl;

            } else if (command == "ucinewgame") {
                board.setFen(chess::constants::STARTPOS);
                engine.new_game();

            } else if (command == "position") {
                // position [startpos | fen <fenstring>] [moves <move1> ... <moveN>]
                size_t moves_idx = 0;
                if (tokens.size() > 1 && tokens[1] == "startpos") {
                    board.setFen(chess::constants::STARTPOS);
                    moves_idx = 2;
                } else if (tokens.size() > 1 && tokens[1] == "fen") {
                    std::string fen;
                    size_t i = 2;
                    while (i < tokens.size() && tokens[i] != "moves") {
                        fen += tokens[i] + " ";
                        i++;
                    }
                    board.setFen(fen);
                    moves_idx = i;
                }

                if (moves_idx < tokens.size() && tokens[moves_idx] == "moves") {
                    for (size_t i = moves_idx + 1; i < tokens.size(); ++i) {
                        chess::Move move = chess::uci::uciToMove(board, tokens[i]);
                        if (move == chess::Move())
                            throw std::invalid_argument("illegal move " + tokens[i]);
                        board.makeMove(move);
                    }
                }

            } else if (command == "go") {
                GoParams params = parse_go(tokens, board.sideToMove());

                TimeManager tm;
                tm.panic_reserve_ms = panic_reserve_ms;
                tm.init(params.time_left_ms, params.movetime_ms);

                int depth = params.depth > 0 ? params.depth : DEFAULT_MAX_DEPTH;
                chess::Move best = engine.choose_move(board, tm, depth);
                out << "bestmove " << chess::uci::moveToUci(best) << std::endl;

            } else if (command == "eval") {
                // Static evaluation from the side to move
                Score val = Evaluator::evaluateUncached(board, board.sideToMove());
                out << "static eval: " << val << std::endl;

            } else {
                out << "info string unknown command " << command << std::endl;
            }
        } catch (const std::exception& e) {
            // A go must always be answered, or the GUI waits forever
            out << "info string error: " << e.what() << std::endl;
            if (command == "go") out << "bestmove 0000" << std::endl;
        }
        out.flush();
    }
}
