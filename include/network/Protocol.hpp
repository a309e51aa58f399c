#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace blockfall::net {

// Command id used when the sender expects no correlation, and for errors
// on frames whose id could not be read.
inline const std::string kNilCommandId = "00000000-0000-0000-0000-000000000000";

/// Malformed command frame. Fatal for the connection that sent it.
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(const std::string& what, std::string commandId)
        : std::runtime_error(what)
        , m_commandId(std::move(commandId))
    {
    }

    const std::string& commandId() const noexcept { return m_commandId; }

private:
    std::string m_commandId;
};

/// Client -> server frame: "<command>:<commandId>@<json payload>"
struct CommandFrame {
    std::string command;
    std::string id;
    std::string payload; // raw JSON text
};

enum class ResponseStatus {
    Ok,
    Error
};

struct Response {
    ResponseStatus status{ResponseStatus::Ok};
    std::optional<nlohmann::json> data;
    std::vector<std::string> errors;
};

Response okResponse(std::optional<nlohmann::json> data = std::nullopt);
Response errorResponse(std::vector<std::string> errors,
                       std::optional<nlohmann::json> data = std::nullopt);

/// Split a command frame. Only the first '@' separates the prefix from the
/// payload; everything after it belongs to the payload, even further '@'s.
/// Throws ProtocolError if the '@' or the ':' of the prefix is missing, or
/// the payload is empty.
CommandFrame parseCommand(const std::string& frame);

/// "response_<commandId>@{"status":..,"data":..,"errors":[..]}"
std::string assembleResponse(const std::string& commandId, const Response& response);

/// "<event>@<json>"
std::string assembleEvent(const std::string& event, const nlohmann::json& data);

/// Parse a JSON payload that must be a string (game ids, names, tokens).
/// Throws nlohmann::json::exception otherwise.
std::string parseStringPayload(const std::string& payload);

} // namespace blockfall::net
