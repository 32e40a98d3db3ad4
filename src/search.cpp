// src/search.cpp

#include "search.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

Engine::Engine(size_t hash_mb, uint32_t seed) : tt(hash_mb), picker(seed) {}

void Engine::new_game() {
    tt.clear();
    eval.clear();
    hints.clear();
}

void Engine::begin_turn(chess::Color root, const TimeManager* time_manager) {
    root_color = root;
    tm = time_manager;
    eval.clear();
    search_stats.reset();
}

// ============================================================================
// Helper Functions
// ============================================================================

bool Engine::isRuleDraw(const chess::Board& board) const {
    return board.isRepetition(1) ||
           board.halfMoveClock() >= 100 ||
           board.isInsufficientMaterial();
}

// Faster mates score higher. The scale is the depth still remaining at the
// mated node, so a stored mate score only depends on the table key.
Score Engine::mateScore(int depth_limit, int ply, bool root_side_mated) const {
    Score value = MATE_VALUE * std::max(1, depth_limit - ply + 1);
    return root_side_mated ? -value : value;
}

std::vector<chess::Move> Engine::extractPV(chess::Board board, int max_depth) const {
    std::vector<chess::Move> pv;

    for (int i = 0; i < max_depth; ++i) {
        chess::Move move = hints.get(fingerprint(board));
        if (move == chess::Move()) break;

        chess::Movelist legal_moves;
        chess::movegen::legalmoves(legal_moves, board);

        bool is_legal = false;
        for (const auto& m : legal_moves) {
            if (m == move) {
                is_legal = true;
                break;
            }
        }
        if (!is_legal) break;

        pv.push_back(move);
        board.makeMove(move);
    }
    return pv;
}

// ============================================================================
// Alpha-Beta Search
// ============================================================================

SearchResult Engine::search(chess::Board& board, int depth_limit, int ply,
                            Score lower_bound, Score upper_bound, chess::Move last_move) {
    search_stats.nodes++;

    // Deadline poll, never at the shallowest plies
    if (ply >= ABORT_MIN_PLY && (search_stats.nodes & ABORT_POLL_MASK) == 0 &&
        tm && tm->should_stop()) {
        return SearchResult::abort();
    }

    const bool our_turn = board.sideToMove() == root_color;

    // ========================================================================
    // Terminal Positions
    // ========================================================================
    chess::Movelist moves;
    chess::movegen::legalmoves(moves, board);

    if (moves.empty()) {
        if (board.inCheck()) return SearchResult(chess::Move(), mateScore(depth_limit, ply, our_turn));
        return SearchResult(chess::Move(), 0.0);
    }

    if (ply > 0 && isRuleDraw(board)) {
        return SearchResult(chess::Move(), 0.0);
    }

    if (ply >= depth_limit) {
        return SearchResult(chess::Move(), eval.evaluate(board, root_color));
    }

    // ========================================================================
    // TT Probe
    // ========================================================================
    const uint64_t hash = fingerprint(board);
    const int depth_remaining = depth_limit - ply;
    chess::Move tt_move = chess::Move();

    TTEntry entry;
    if (tt.probe(depth_remaining, hash, entry)) {
        tt_move = entry.best_move;
        if (entry.flag == TT_EXACT) return SearchResult(entry.best_move, entry.score);

        if (entry.flag == TT_LOWER) lower_bound = std::max(lower_bound, entry.score);
        else upper_bound = std::min(upper_bound, entry.score);

        if (lower_bound >= upper_bound) return SearchResult(entry.best_move, entry.score);
    }

    // ========================================================================
    // Move Loop
    // ========================================================================
    auto scored_moves = picker.scoreMoves(moves, board, MovePickerContext(tt_move, hints.get(hash)));

    SearchResult best(chess::Move(), our_turn ? -SCORE_INFINITE : SCORE_INFINITE);
    TTFlag flag = TT_EXACT;

    for (size_t i = 0; i < scored_moves.size(); ++i) {
        pickNextMove(scored_moves, i);
        const chess::Move move = scored_moves[i].move;

        const bool capture = isCapture(board, move);
        const bool quiet = isQuietMove(board, move);
        const bool recapture = capture && last_move != chess::Move() &&
                               move.to() == last_move.to();

        SearchResult child;
        {
            ScopedMove guard(board, move);

            // Extensions and reductions
            int child_limit = depth_limit;
            const bool gives_check = board.inCheck();
            if ((gives_check || recapture) && depth_limit < 2 * root_depth) {
                child_limit += 1;
            } else if (quiet && !gives_check) {
                child_limit -= (depth_limit - ply - 1) / QUIET_REDUCTION_DIVISOR;
            }

            child = search(board, child_limit, ply + 1, lower_bound, upper_bound,
                           capture ? move : chess::Move());
        }

        if (child.aborted) return child;

        if (best.move == chess::Move() ||
            (our_turn && child.score > best.score) ||
            (!our_turn && child.score < best.score)) {
            best = SearchResult(move, child.score);
        }

        if (our_turn) {
            if (child.score >= upper_bound) {
                best = SearchResult(move, child.score);
                flag = TT_LOWER;
                break;
            }
            lower_bound = std::max(lower_bound, child.score);
        } else {
            if (child.score <= lower_bound) {
                best = SearchResult(move, child.score);
                flag = TT_UPPER;
                break;
            }
            upper_bound = std::min(upper_bound, child.score);
        }
    }

    tt.store(depth_remaining, hash, best.score, best.move, flag);
    hints.store(hash, best.move);

    return best;
}

SearchResult Engine::search_iteration(chess::Board& board, int depth) {
    tt.clear();
    root_depth = depth;
    return search(board, depth);
}

// ============================================================================
// Iterative Deepening Search
// ============================================================================

void Engine::printInfo(chess::Board& board, const SearchResult& result, int depth,
                       const TimeManager& time_manager) const {
    auto pv_line = extractPV(board, depth);
    std::string pv_str;
    for (const auto& m : pv_line)
        pv_str += chess::uci::moveToUci(m) + " ";
    if (pv_str.empty())
        pv_str = chess::uci::moveToUci(result.move);

    std::string score_str;
    if (std::abs(result.score) >= MATE_THRESHOLD) {
        int mate_ply = depth + 1 - static_cast<int>(std::lround(std::abs(result.score) / MATE_VALUE));
        int mate_in = (std::max(mate_ply, 1) + 1) / 2;
        score_str = "mate " + std::to_string(result.score > 0 ? mate_in : -mate_in);
    } else {
        score_str = "cp " + std::to_string(std::lround(result.score * 100.0));
    }

    std::cout << "info depth " << depth
              << " score " << score_str
              << " nodes " << search_stats.nodes
              << " time " << time_manager.elapsed_ms()
              << " pv " << pv_str << std::endl;
}

SearchInfo Engine::think(chess::Board& board, TimeManager& time_manager, int max_depth) {
    chess::Movelist moves;
    chess::movegen::legalmoves(moves, board);

    if (moves.empty())
        throw std::invalid_argument("no legal moves in position " + board.getFen());

    begin_turn(board.sideToMove(), &time_manager);

    SearchInfo info;

    // Single legal move - return immediately
    if (moves.size() == 1) {
        if (verbose) std::cout << "info string only move" << std::endl;
        info.best_move = moves[0];
        return info;
    }

    if (hints.should_age()) {
        hints.age();
        if (verbose) std::cout << "info string hint table aged" << std::endl;
    }

    // Fallback in case not even depth 1 completes
    auto root_scored = picker.scoreMoves(moves, board,
                                         MovePickerContext(chess::Move(), hints.get(fingerprint(board))));
    pickNextMove(root_scored, 0);
    info.best_move = root_scored[0].move;

    int stability = 0;

    for (int depth = 1; depth <= max_depth; ++depth) {
        if (depth > 1 && time_manager.should_stop()) {
            if (verbose)
                std::cout << "info string stopping at depth " << (depth - 1)
                          << " (time: " << time_manager.elapsed_ms() << "ms)" << std::endl;
            break;
        }

        SearchResult result = search_iteration(board, depth);

        if (result.aborted) {
            if (verbose)
                std::cout << "info string time limit reached at depth " << depth << std::endl;
            break;
        }

        stability = (info.depth > 0 && result.move == info.best_move) ? stability + 1 : 0;

        info.best_move = result.move;
        info.score = result.score;
        info.depth = depth;
        info.nodes = search_stats.nodes;

        if (verbose) printInfo(board, result, depth, time_manager);

        if (std::abs(info.score) >= MATE_THRESHOLD && stability >= MATE_STABLE_ITERATIONS) {
            if (verbose) std::cout << "info string forced mate confirmed" << std::endl;
            break;
        }

        if (stability >= STABLE_ITERATIONS && depth >= MIN_STABLE_DEPTH &&
            time_manager.min_think_elapsed()) {
            if (verbose) std::cout << "info string best move stable" << std::endl;
            break;
        }
    }

    info.nodes = search_stats.nodes;

    if (verbose) {
        std::cout << "info string " << board.getFen() << std::endl;
        std::cout << "info string " << chess::uci::moveToUci(info.best_move)
                  << ", score: " << info.score << std::endl;
    }

    return info;
}

chess::Move Engine::choose_move(chess::Board& board, TimeManager& time_manager, int max_depth) {
    return think(board, time_manager, max_depth).best_move;
}
