#include "server/IdentityService.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "server/IdGenerator.hpp"

namespace blockfall::server {

namespace {

std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> defaultNicknames()
{
    return {
        "Brave Badger", "Clever Crow", "Dizzy Dolphin", "Eager Eagle",
        "Fuzzy Fox", "Gentle Goose", "Happy Hedgehog", "Jolly Jaguar",
        "Lucky Lynx", "Mighty Moose", "Nimble Newt", "Quiet Quail",
        "Rapid Rabbit", "Sly Squirrel", "Tiny Tiger", "Witty Walrus"
    };
}

} // namespace

InMemoryIdentityService::InMemoryIdentityService()
    : InMemoryIdentityService(defaultNicknames())
{
}

InMemoryIdentityService::InMemoryIdentityService(std::vector<std::string> nicknames)
    : m_nicknames(std::move(nicknames))
    , m_rng(std::random_device{}())
{
    if (m_nicknames.empty()) {
        throw std::invalid_argument("InMemoryIdentityService needs at least one nickname");
    }
}

Identity InMemoryIdentityService::resolvePlayer(const std::string& token)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!token.empty()) {
        auto it = m_players.find(token);
        if (it != m_players.end()) {
            return Identity{it->first, it->second};
        }
    }

    std::uniform_int_distribution<std::size_t> dist(0, m_nicknames.size() - 1);

    Identity issued{makeUuid(), m_nicknames[dist(m_rng)]};
    m_players.emplace(issued.id, issued.name);
    return issued;
}

Identity InMemoryIdentityService::registerName(const std::string& name)
{
    if (name.empty()) {
        throw std::invalid_argument("name may not be empty");
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    const std::string lowered = toLower(name);
    for (const auto& [id, existing] : m_players) {
        (void)id;
        if (toLower(existing) == lowered) {
            throw std::invalid_argument("name already in use");
        }
    }

    Identity registered{makeUuid(), name};
    m_players.emplace(registered.id, registered.name);
    return registered;
}

std::optional<Identity> InMemoryIdentityService::findPlayer(const core::PlayerId& id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_players.find(id);
    if (it == m_players.end()) {
        return std::nullopt;
    }
    return Identity{it->first, it->second};
}

} // namespace blockfall::server
