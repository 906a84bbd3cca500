#include "player/player_directory.h"

#include <algorithm>
#include <cctype>

namespace player {

bool OnlinePlayerDirectory::addPlayer(UserId user_id, std::string name) {
    auto key = normalize(name);
    if (key.empty() || names_.count(user_id) > 0 || by_name_.count(key) > 0) {
        return false;
    }
    names_.emplace(user_id, std::move(name));
    by_name_.emplace(std::move(key), user_id);
    return true;
}

bool OnlinePlayerDirectory::removePlayer(UserId user_id) {
    auto it = names_.find(user_id);
    if (it == names_.end()) {
        return false;
    }
    by_name_.erase(normalize(it->second));
    names_.erase(it);
    return true;
}

std::size_t OnlinePlayerDirectory::size() const {
    return names_.size();
}

std::optional<UserId> OnlinePlayerDirectory::findUserByName(const std::string &name) const {
    auto it = by_name_.find(normalize(name));
    if (it == by_name_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string OnlinePlayerDirectory::displayName(UserId user_id) const {
    auto it = names_.find(user_id);
    if (it == names_.end()) {
        return "Player" + std::to_string(user_id);
    }
    return it->second;
}

std::string OnlinePlayerDirectory::normalize(const std::string &name) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    auto begin = std::find_if_not(name.begin(), name.end(), is_space);
    auto end = std::find_if_not(name.rbegin(), name.rend(), is_space).base();
    if (begin >= end) {
        return {};
    }
    std::string key(begin, end);
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return key;
}

}  // namespace player
