#include "LogMsgs.hpp"
#include "GameState.hpp"
#include "TestController.hpp"
#include <iostream>
#include <iomanip>

namespace {
    std::ostream* g_log_stream = &std::cout;
}

namespace LogMsgs {
void set_stream(std::ostream& os) { g_log_stream = &os; }
std::ostream& out() { return *g_log_stream; }

namespace Search {
void log_algo_tag(const std::string& tag) {
    out() << tag << "\n";
}

void log_root_moves(const std::vector<std::pair<int,int>>& moves, bool is_max) {
    out() << "[" << (is_max ? "MAX" : "MIN") << "] root->";
    for (const auto& m : moves) {
        out() << "(" << m.first << ", " << m.second << "), ";
    }
    out() << "\n";
}

void log_root_score(const std::pair<int,int>& mv, int score, bool is_last) {
    out() << (is_last ? "└── " : "├── ")
          << "score for: (" << mv.first << "," << mv.second << ")-> "
          << score << "\n";
}

void log_best_move(const std::string& player,
                   const std::pair<int,int>& mv,
                   int score,
                   long long nodes) {
    out() << "****[" << player << "] Best move selected: (" << mv.first
          << "," << mv.second << ") " << score << " [nodes: " << nodes << "] ";
}

void log_elapsed(double seconds) {
    out() << "[" << std::fixed << std::setprecision(4) << seconds << " s]";
    out().unsetf(std::ios_base::floatfield);
}
} // namespace Search

namespace Game {
void log_move(const std::string& who, const MoveResult& res) {
    out() << "[move] " << who << " -> (" << res.row << "," << res.col << ") = "
          << side_char(res.placed) << "  [" << outcome_label(res.outcome) << "]\n";
}

void log_rejected(const std::string& who, int row, int col, const char* reason) {
    out() << "[move] " << who << " rejected at (" << row << "," << col << "): "
          << reason << "\n";
}

void log_outcome(const char* outcome, const char* party) {
    out() << "[end] " << outcome << " -> " << party << "\n";
}
} // namespace Game

namespace Match {
void log_game(int index, const char* party, int moves) {
    out() << " - Jogo " << index << ": " << party << " (" << moves << " jogadas)\n";
}

void log_tally(const MatchTally& t) {
    auto& o = out();
    o << "[match] games=" << t.games
      << " human=" << t.human_wins
      << " opponent=" << t.opponent_wins
      << " draws=" << t.draws;
    if (t.games) {
        double frac_draw = double(t.draws) / double(t.games);
        o << " fracDraw=" << frac_draw;
    }
    o << "\n";
}
} // namespace Match

} // namespace LogMsgs
