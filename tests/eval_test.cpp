#include <cassert>
#include <string>
#include <vector>

#include "config.h"
#include "eval.h"
#include "psqt.h"

static void play(chess::Board& board, const std::vector<std::string>& moves) {
  for (const auto& m : moves) board.makeMove(chess::uci::uciToMove(board, m));
}

int main()
{
  // Start position is balanced
  {
    chess::Board board(chess::constants::STARTPOS);
    assert(evaluate(board) == 0);
    assert(signedEval(board) == 0);
    assert(!isEndgame(board));
  }

  // Colour-mirrored positions score opposite
  {
    chess::Board white_up("4k3/8/8/8/8/8/4P3/4K3 w - - 0 1");
    chess::Board black_up("4k3/4p3/8/8/8/8/8/4K3 b - - 0 1");
    const int w = evaluate(white_up);
    const int b = evaluate(black_up);
    assert(w > 0);
    assert(w == -b);

    // material +100, pawn on e2 -20, mobility (6 - 5) * 5
    EvalTrace t = traceEval(white_up);
    assert(t.material == 100);
    assert(t.positional == -20);
    assert(t.mobility == MOBILITY_WEIGHT);
    assert(t.endgame);
  }

  // Side to move does not change a non-terminal score, signedEval does
  {
    chess::Board wtm("4k3/8/8/8/8/8/4P3/4K3 w - - 0 1");
    chess::Board btm("4k3/8/8/8/8/8/4P3/4K3 b - - 0 1");
    assert(evaluate(wtm) == evaluate(btm));
    assert(signedEval(wtm) == -signedEval(btm));
  }

  // Kings carry no material
  {
    chess::Board board("4k3/8/8/8/8/8/8/3QK3 w - - 0 1");
    assert(traceEval(board).material == 900);
  }

  // Fool's mate: Black wins
  {
    chess::Board board(chess::constants::STARTPOS);
    play(board, {"f2f3", "e7e5", "g2g4", "d8h4"});
    EvalTrace t = traceEval(board);
    assert(t.terminal);
    assert(evaluate(board) == -MATE_SCORE);
    assert(signedEval(board) == -MATE_SCORE);
  }

  // Back-rank mate by White, Black to move
  {
    chess::Board board("R5k1/5ppp/8/8/8/8/8/6K1 b - - 0 1");
    assert(evaluate(board) == MATE_SCORE);
    assert(signedEval(board) == -MATE_SCORE);
  }

  // Draws score zero whatever the material
  {
    chess::Board stalemate("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1");
    assert(evaluate(stalemate) == 0);

    chess::Board bare("8/8/8/4k3/8/8/8/4K3 w - - 0 1");
    assert(evaluate(bare) == 0);

    chess::Board fifty("4k3/8/8/8/8/8/8/3QK3 w - - 100 90");
    assert(evaluate(fifty) == 0);
  }

  // Endgame classification
  {
    chess::Board no_queens("r3k3/pppppppp/8/8/8/8/PPPPPPPP/R3K3 w - - 0 1");
    assert(isEndgame(no_queens));

    chess::Board light("r3k3/8/8/8/8/8/8/3QK2R w - - 0 1");
    assert(isEndgame(light));

    chess::Board two_queens("rn1qk3/8/8/8/8/8/8/3QK2R w - - 0 1");
    assert(!isEndgame(two_queens));

    chess::Board heavy("r2qk2r/8/8/8/8/8/8/R2QK2R w - - 0 1");
    assert(!isEndgame(heavy));
  }

  // Tables are mirrored for Black
  {
    const chess::Piece wn(chess::PieceType::KNIGHT, chess::Color::WHITE);
    const chess::Piece bn(chess::PieceType::KNIGHT, chess::Color::BLACK);
    assert(psqtValue(wn, chess::Square(1), false) == psqtValue(bn, chess::Square(57), false));
    assert(psqtValue(wn, chess::Square(28), false) > psqtValue(wn, chess::Square(0), false));

    const chess::Piece wk(chess::PieceType::KING, chess::Color::WHITE);
    assert(psqtValue(wk, chess::Square(6), false) > psqtValue(wk, chess::Square(6), true));
    assert(psqtValue(wk, chess::Square(28), true) > psqtValue(wk, chess::Square(28), false));
  }

  // The board comes back untouched
  {
    chess::Board board("r1bqkbnr/pppp1ppp/2n5/4p3/2B1P3/5N2/PPPP1PPP/RNBQK2R b KQkq - 3 3");
    const std::string fen = board.getFen();
    const uint64_t key = board.hash();
    (void)evaluate(board);
    assert(board.getFen() == fen);
    assert(board.hash() == key);
  }

  return 0;
}
