#include "SessionStore.hpp"
#include "LogMsgs.hpp"

GameSession& SessionStore::start(const std::string& key, GameMode mode) {
    if (debug_level >= 1) {
        LogMsgs::out() << "[session] " << key << " new game (" << mode_label(mode) << ")\n";
    }
    auto it = sessions.find(key);
    if (it != sessions.end()) {
        it->second = GameSession(mode, Party::Human, debug_level);
        return it->second;
    }
    return sessions.emplace(key, GameSession(mode, Party::Human, debug_level)).first->second;
}

GameSession& SessionStore::new_game(const std::string& key) {
    auto it = sessions.find(key);
    GameMode mode = (it != sessions.end()) ? it->second.mode() : GameMode::Deterministic;
    return start(key, mode);
}

GameSession& SessionStore::get_or_create(const std::string& key) {
    auto it = sessions.find(key);
    if (it != sessions.end()) return it->second;
    return start(key, GameMode::Deterministic);
}

GameSession* SessionStore::find(const std::string& key) {
    auto it = sessions.find(key);
    return it == sessions.end() ? nullptr : &it->second;
}

const GameSession* SessionStore::find(const std::string& key) const {
    auto it = sessions.find(key);
    return it == sessions.end() ? nullptr : &it->second;
}

bool SessionStore::erase(const std::string& key) {
    return sessions.erase(key) > 0;
}
