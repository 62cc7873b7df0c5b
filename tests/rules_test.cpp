#include <cassert>
#include <string>
#include <vector>

#include "rules.h"

static void play(chess::Board& board, const std::vector<std::string>& moves) {
  for (const auto& m : moves) board.makeMove(chess::uci::uciToMove(board, m));
}

int main()
{
  // Start position: 20 moves for both sides, the null-move probe leaves no trace
  {
    chess::Board board(chess::constants::STARTPOS);
    const std::string fen = board.getFen();
    const uint64_t key = positionKey(board);

    assert(legalMoveCount(board, chess::Color::WHITE) == 20);
    assert(legalMoveCount(board, chess::Color::BLACK) == 20);
    assert(board.getFen() == fen);
    assert(positionKey(board) == key);
    assert(board.sideToMove() == chess::Color::WHITE);

    assert(!isCheckmate(board));
    assert(!isStalemate(board));
    assert(!isDrawByRule(board));
  }

  // Mover in check: the checking side's count leaves out the king capture
  {
    chess::Board board("4k3/8/8/8/8/8/4R3/4K3 b - - 0 1");
    assert(board.inCheck());
    // rook: 4 left, 3 right, e3-e7; king: d1 f1 d2 f2
    assert(legalMoveCount(board, chess::Color::WHITE) == 16);
    assert(legalMoveCount(board, chess::Color::BLACK) == 4);
    assert(board.sideToMove() == chess::Color::BLACK);
    assert(board.inCheck());
  }

  // Fool's mate
  {
    chess::Board board(chess::constants::STARTPOS);
    play(board, {"f2f3", "e7e5", "g2g4", "d8h4"});
    assert(isCheckmate(board));
    assert(!isStalemate(board));
    assert(board.sideToMove() == chess::Color::WHITE);
  }

  // Stalemate is not mate
  {
    chess::Board board("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1");
    assert(isStalemate(board));
    assert(!isCheckmate(board));
  }

  // Bare kings
  {
    chess::Board board("8/8/8/4k3/8/8/8/4K3 w - - 0 1");
    assert(isInsufficientMaterial(board));
    assert(isDrawByRule(board));
  }

  // Fifty-move rule
  {
    chess::Board board("8/8/8/4k3/8/8/8/R3K3 w - - 100 80");
    assert(isFiftyMoveDraw(board));
    assert(isDrawByRule(board));

    chess::Board fresh("8/8/8/4k3/8/8/8/R3K3 w - - 99 80");
    assert(!isFiftyMoveDraw(fresh));
  }

  // Repetition: one earlier occurrence vs. threefold
  {
    chess::Board board(chess::constants::STARTPOS);
    play(board, {"g1f3", "g8f6", "f3g1", "f6g8"});
    assert(isRepetition(board, 1));
    assert(!isRepetition(board));

    play(board, {"g1f3", "g8f6", "f3g1", "f6g8"});
    assert(isRepetition(board));
    assert(isDrawByRule(board));
  }

  // Transpositions share a key, side to move does not
  {
    chess::Board a(chess::constants::STARTPOS);
    chess::Board b(chess::constants::STARTPOS);
    play(a, {"g1f3", "g8f6", "b1c3"});
    play(b, {"b1c3", "g8f6", "g1f3"});
    assert(positionKey(a) == positionKey(b));

    chess::Board c(chess::constants::STARTPOS);
    play(c, {"g1f3", "g8f6", "b1c3", "b8c6"});
    assert(positionKey(a) != positionKey(c));
  }

  // make/unmake restores the position
  {
    chess::Board board(chess::constants::STARTPOS);
    const uint64_t key = positionKey(board);
    chess::Move e4 = chess::uci::uciToMove(board, "e2e4");
    board.makeMove(e4);
    assert(board.getFen().rfind("rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR", 0) == 0);
    assert(positionKey(board) != key);
    board.unmakeMove(e4);
    assert(positionKey(board) == key);
  }

  return 0;
}
