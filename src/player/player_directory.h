#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace player {

using UserId = std::uint64_t;

class PlayerDirectory {
public:
    virtual ~PlayerDirectory() = default;

    virtual std::optional<UserId> findUserByName(const std::string &name) const = 0;
    virtual std::string displayName(UserId user_id) const = 0;
};

// Players currently logged in. Name lookups ignore case and surrounding
// whitespace.
class OnlinePlayerDirectory : public PlayerDirectory {
public:
    bool addPlayer(UserId user_id, std::string name);
    bool removePlayer(UserId user_id);
    std::size_t size() const;

    std::optional<UserId> findUserByName(const std::string &name) const override;
    std::string displayName(UserId user_id) const override;

private:
    static std::string normalize(const std::string &name);

    std::unordered_map<UserId, std::string> names_;
    std::unordered_map<std::string, UserId> by_name_;
};

}  // namespace player
