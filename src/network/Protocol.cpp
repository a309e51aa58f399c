#include "network/Protocol.hpp"

namespace blockfall::net {

Response okResponse(std::optional<nlohmann::json> data)
{
    Response r;
    r.status = ResponseStatus::Ok;
    r.data   = std::move(data);
    return r;
}

Response errorResponse(std::vector<std::string> errors, std::optional<nlohmann::json> data)
{
    Response r;
    r.status = ResponseStatus::Error;
    r.data   = std::move(data);
    r.errors = std::move(errors);
    return r;
}

CommandFrame parseCommand(const std::string& frame)
{
    const auto at = frame.find('@');
    const std::string prefix = frame.substr(0, at);

    // Best effort: name the offending id in the error when the prefix has one
    std::string commandId = kNilCommandId;
    const auto colon = prefix.find(':');
    if (colon != std::string::npos) {
        const auto idEnd = prefix.find(':', colon + 1);
        commandId = prefix.substr(colon + 1, idEnd == std::string::npos
                                                 ? std::string::npos
                                                 : idEnd - colon - 1);
    }

    if (at == std::string::npos || at + 1 >= frame.size()) {
        throw ProtocolError("Invalid message format", commandId);
    }
    if (colon == std::string::npos) {
        throw ProtocolError("Invalid message command prefix", commandId);
    }

    CommandFrame out;
    out.command = prefix.substr(0, colon);
    out.id      = commandId;
    out.payload = frame.substr(at + 1);
    return out;
}

std::string assembleResponse(const std::string& commandId, const Response& response)
{
    nlohmann::json body;
    body["status"] = response.status == ResponseStatus::Ok ? "ok" : "error";
    if (response.data) {
        body["data"] = *response.data;
    }
    if (!response.errors.empty()) {
        body["errors"] = response.errors;
    }
    return "response_" + commandId + "@" + body.dump();
}

std::string assembleEvent(const std::string& event, const nlohmann::json& data)
{
    return event + "@" + data.dump();
}

std::string parseStringPayload(const std::string& payload)
{
    return nlohmann::json::parse(payload).get<std::string>();
}

} // namespace blockfall::net
