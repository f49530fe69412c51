#ifndef LOGMSGS_HPP
#define LOGMSGS_HPP

#include <ostream>
#include <string>
#include <utility>
#include <vector>

struct MoveResult;
struct MatchTally;

namespace LogMsgs {
// Stream configurável (por defeito std::cout)
void set_stream(std::ostream& os);
std::ostream& out();

namespace Search {
// Helpers da pesquisa minimax
void log_algo_tag(const std::string& tag);
void log_root_moves(const std::vector<std::pair<int,int>>& moves, bool is_max);
void log_root_score(const std::pair<int,int>& mv, int score, bool is_last);
void log_best_move(const std::string& player,
                   const std::pair<int,int>& mv,
                   int score,
                   long long nodes);
void log_elapsed(double seconds);
} // namespace Search

namespace Game {
void log_move(const std::string& who, const MoveResult& res);
void log_rejected(const std::string& who, int row, int col, const char* reason);
void log_outcome(const char* outcome, const char* party);
} // namespace Game

namespace Match {
void log_game(int index, const char* party, int moves);
void log_tally(const MatchTally& t);
} // namespace Match

} // namespace LogMsgs

#endif
