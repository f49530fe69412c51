#include <iostream>
#include "GameController.hpp"
#include "TestController.hpp"
#include "LogMsgs.hpp"
#include <chrono>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>


//input helpers
static std::optional<int> get_flag_int(int argc, char* argv[], const std::string& shortf, const std::string& longf) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == shortf || a == longf) {
            if (i + 1 < argc) return std::stoi(argv[i + 1]);
        } else if (a.rfind(longf + "=", 0) == 0) {
            return std::stoi(a.substr(longf.size() + 1));
        }
    }
    return std::nullopt;
}

static std::optional<std::string> get_flag_str(int argc, char* argv[], const std::string& shortf, const std::string& longf) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == shortf || a == longf) {
            if (i + 1 < argc) return std::string(argv[i + 1]);
        } else if (a.rfind(longf + "=", 0) == 0) {
            return a.substr(longf.size() + 1);
        }
    }
    return std::nullopt;
}

static GameMode parse_mode(const std::string& s) {
    if (s == "classic" || s == "c" || s == "deterministic") return GameMode::Deterministic;
    if (s == "random" || s == "r" || s == "randomized") return GameMode::Randomized;
    std::cout << "Modo inválido, usando modo padrão: classic\n";
    return GameMode::Deterministic;
}

static Party parse_first(const std::string& s) {
    if (s == "human" || s == "h") return Party::Human;
    if (s == "ai" || s == "bot" || s == "opponent") return Party::Opponent;
    throw std::invalid_argument("--first expects human|ai, got: " + s);
}

static void print_usage() {
    std::cout << "uso:\n"
              << "  velha play  [--mode classic|random] [--first human|ai] [--debug N]\n"
              << "  velha match [--kind ss|rs|rr] [--first human|ai] [--games N] [--seed N] [--debug N]\n";
}

// Configuração do modo de jogo
struct PlayConfig {
    GameMode mode = GameMode::Deterministic;
    Party first = Party::Human;
    int debug = 0;
};

// Configuração do modo de teste (jogos automáticos)
struct MatchConfig {
    MatchKind kind = MatchKind::SearchVsSearch;
    Party first = Party::Human;
    int games = 100;
    std::uint32_t seed = 0;
    int debug = 0;
};

static int run_play(const PlayConfig& cfg) {
    GameController controller(cfg.mode, cfg.first, cfg.debug);
    int finished = controller.run();
    std::cout << "Jogos terminados: " << finished << "\n";
    return 0;
}

static int run_match(const MatchConfig& cfg) {
    std::cout << "Modo teste: " << match_kind_label(cfg.kind)
              << " (first=" << party_label(cfg.first) << ", seed=" << cfg.seed << ")\n";

    auto t1 = std::chrono::high_resolution_clock::now();
    TestController controller(cfg.kind, cfg.first, cfg.debug, cfg.seed);
    MatchTally tally = controller.run_games(cfg.games);
    auto t2 = std::chrono::high_resolution_clock::now();

    LogMsgs::Match::log_tally(tally);
    auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(t2 - t1).count();
    std::cout << "tempo total: " << elapsed / 1e9 << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }
    const std::string command = argv[1];

    try {
        auto modeFlag  = get_flag_str(argc, argv, "-m", "--mode");
        auto firstFlag = get_flag_str(argc, argv, "-f", "--first");
        auto kindFlag  = get_flag_str(argc, argv, "-k", "--kind");
        auto debugFlag = get_flag_int(argc, argv, "-d", "--debug");
        auto gamesFlag = get_flag_int(argc, argv, "-g", "--games");
        auto seedFlag  = get_flag_int(argc, argv, "-s", "--seed");

        if (command == "play") {
            PlayConfig cfg;
            if (modeFlag) cfg.mode = parse_mode(*modeFlag);
            if (firstFlag) cfg.first = parse_first(*firstFlag);
            cfg.debug = debugFlag.value_or(0);
            return run_play(cfg);
        }
        if (command == "match") {
            MatchConfig cfg;
            if (kindFlag) cfg.kind = parse_match_kind(*kindFlag);
            if (firstFlag) cfg.first = parse_first(*firstFlag);
            cfg.games = gamesFlag.value_or(100);
            cfg.seed = seedFlag ? static_cast<std::uint32_t>(*seedFlag) : std::random_device{}();
            cfg.debug = debugFlag.value_or(0);
            return run_match(cfg);
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Erro: " << e.what() << "\n";
        return 1;
    } catch (const std::out_of_range& e) {
        std::cerr << "Erro: valor fora do intervalo (" << e.what() << ")\n";
        return 1;
    }

    print_usage();
    return 1;
}
