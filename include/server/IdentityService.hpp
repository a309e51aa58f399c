#pragma once

#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/Types.hpp"

namespace blockfall::server {

struct Identity {
    core::PlayerId id;
    std::string name;
};

/// Player identity as seen by the session layer.
class IIdentityService {
public:
    virtual ~IIdentityService() = default;

    /// Known token -> its identity. Unknown or empty token -> a fresh id
    /// with a random nickname.
    virtual Identity resolvePlayer(const std::string& token) = 0;

    /// Register a nickname under a fresh id. Throws std::invalid_argument if
    /// the name is empty or already used (case-insensitive).
    virtual Identity registerName(const std::string& name) = 0;

    virtual std::optional<Identity> findPlayer(const core::PlayerId& id) const = 0;
};

/// Process-lifetime identity registry.
class InMemoryIdentityService : public IIdentityService {
public:
    InMemoryIdentityService();
    explicit InMemoryIdentityService(std::vector<std::string> nicknames);

    Identity resolvePlayer(const std::string& token) override;
    Identity registerName(const std::string& name) override;
    std::optional<Identity> findPlayer(const core::PlayerId& id) const override;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<core::PlayerId, std::string> m_players;
    std::vector<std::string> m_nicknames;
    std::mt19937 m_rng;
};

} // namespace blockfall::server
