#include "uci.h"
#include "eval.h"
#include "search.h"
#include "timeman.h"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <string>

// Helper to split string by delimiter
static std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream tokenStream(s);
    while (std::getline(tokenStream, token, delimiter)) {
        if (!token.empty()) tokens.push_back(token);
    }
    return tokens;
}

// Helper to check if string is a number
static bool is_integer(const std::string& s) {
    if (s.empty()) return false;
    size_t i = 0;
    if (s[0] == '-' || s[0] == '+') i = 1;
    if (i >= s.size()) return false;
    for (; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

static bool parse_int(const std::string& s, int& out) {
    if (!is_integer(s)) return false;
    try {
        out = std::stoi(s);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

std::string formatScore(int score) {
    if (score >= MATE_BOUND) return "mate " + std::to_string((MATE_SCORE - score + 1) / 2);
    if (score <= -MATE_BOUND) return "mate " + std::to_string(-(MATE_SCORE + score) / 2);
    return "cp " + std::to_string(score);
}

std::string formatInfo(const SearchInfo& info) {
    std::ostringstream out;
    out << "info depth " << info.depth
        << " score " << formatScore(info.score)
        << " nodes " << info.nodes
        << " nps " << info.nps
        << " time " << info.time_ms
        << " hashfull " << info.hashfull
        << " pv";
    for (const auto& m : info.pv) out << ' ' << chess::uci::moveToUci(m);
    return out.str();
}

static void set_position(chess::Board& board, const std::vector<std::string>& tokens) {
    // position [startpos | fen <fenstring>] [moves <move1> ... <moveN>]
    size_t moves_idx = tokens.size();
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
            chess::Movelist legal;
            chess::movegen::legalmoves(legal, board);
            if (move == chess::Move() || std::find(legal.begin(), legal.end(), move) == legal.end()) {
                std::cout << "info string illegal move " << tokens[i] << ", ignoring the rest" << std::endl;
                break;
            }
            board.makeMove(move);
        }
    }
}

static void go(chess::Board& board, SearchSession& session, const std::vector<std::string>& tokens) {
    // go [depth N] [movetime T] [wtime X btime Y winc A binc B movestogo M]
    int wtime = 0, btime = 0, winc = 0, binc = 0, movestogo = 0;
    int depth = 0;
    int movetime = 0;

    for (size_t i = 1; i + 1 < tokens.size(); ++i) {
        const std::string& key = tokens[i];
        int* target = nullptr;
        if (key == "wtime") target = &wtime;
        else if (key == "btime") target = &btime;
        else if (key == "winc") target = &winc;
        else if (key == "binc") target = &binc;
        else if (key == "depth") target = &depth;
        else if (key == "movetime") target = &movetime;
        else if (key == "movestogo") target = &movestogo;
        if (!target) continue;

        if (!parse_int(tokens[i + 1], *target))
            std::cout << "info string bad value for " << key << ": " << tokens[i + 1] << std::endl;
        ++i;
    }

    // Support "go 15" shorthand for "go depth 15"
    if (tokens.size() == 2) parse_int(tokens[1], depth);

    const bool white = board.sideToMove() == chess::Color::WHITE;
    int64_t budget = TimeManager::budget_from_clock(white ? wtime : btime, white ? winc : binc,
                                                    movestogo, movetime);

    if (depth <= 0 && budget <= 0) {
        depth = DEFAULT_SEARCH_DEPTH;
        budget = DEFAULT_MOVE_TIME_MS;
    } else if (depth <= 0) {
        depth = MAX_PLY - 1;
    }

    chess::Move best = findBestMove(board, depth, budget, session);
    if (best == chess::Move()) {
        std::cout << "bestmove 0000" << std::endl;
        return;
    }
    std::cout << "bestmove " << chess::uci::moveToUci(best) << std::endl;
    std::cout.flush();
}

static void print_eval(chess::Board& board) {
    EvalTrace t = traceEval(board);
    if (t.terminal) {
        std::cout << "info string terminal position, eval " << t.total << std::endl;
        return;
    }
    std::cout << "info string material " << t.material
              << " positional " << t.positional
              << " mobility " << t.mobility
              << " endgame " << (t.endgame ? "yes" : "no")
              << " total " << t.total << std::endl;
}

void uci_loop() {
    chess::Board board;
    SearchSession session(DEFAULT_HASH_MB);
    session.on_info = [](const SearchInfo& info) { std::cout << formatInfo(info) << std::endl; };

    board.setFen(chess::constants::STARTPOS);

    std::string line;
    while (std::getline(std::cin, line)) {
        auto tokens = split(line, ' ');
        if (tokens.empty()) continue;

        const std::string& command = tokens[0];

        if (command == "uci") {
            std::cout << "id name Talon" << std::endl;
            std::cout << "id author the Talon developers" << std::endl;
            std::cout << "option name Hash type spin default " << DEFAULT_HASH_MB
                      << " min 1 max " << MAX_HASH_MB << std::endl;
            std::cout << "option name Clear Hash type button" << std::endl;
            std::cout << "uciok" << std::endl;
            std::cout.flush();

        } else if (command == "setoption") {
            int mb = 0;
            if (tokens.size() >= 5 && tokens[1] == "name" && tokens[2] == "Hash" && tokens[3] == "value") {
                if (parse_int(tokens[4], mb) && mb > 0) {
                    session.tt.resize(static_cast<size_t>(mb));
                    std::cout << "info string hash " << session.tt.megabytes() << " MB ("
                              << session.tt.size() << " entries)" << std::endl;
                } else {
                    std::cout << "info string bad hash size " << tokens[4] << std::endl;
                }
            } else if (tokens.size() >= 4 && tokens[1] == "name" && tokens[2] == "Clear" && tokens[3] == "Hash") {
                session.clear();
            }

        } else if (command == "isready") {
            std::cout << "readyok" << std::endl;
            std::cout.flush();

        } else if (command == "ucinewgame") {
            board.setFen(chess::constants::STARTPOS);
            session.clear();

        } else if (command == "position") {
            set_position(board, tokens);

        } else if (command == "go") {
            go(board, session, tokens);

        } else if (command == "eval") {
            print_eval(board);

        } else if (command == "d") {
            std::cout << "info string fen " << board.getFen() << std::endl;

        } else if (command == "quit") {
            break;
        }
    }
}
