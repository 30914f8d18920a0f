#include "models/Channel.h"

std::optional<ChannelType> parseChannelType(const std::string &code) {
    if (code == "O") {
        return ChannelType::OPEN;
    }
    if (code == "P") {
        return ChannelType::PRIVATE;
    }
    if (code == "D") {
        return ChannelType::DIRECT;
    }
    if (code == "G") {
        return ChannelType::GROUP;
    }
    return std::nullopt;
}

Channel Channel::fromJson(const nlohmann::json &j) {
    Channel channel;

    channel.id = j.at("id").get<std::string>();

    if (j.contains("type") && j["type"].is_string()) {
        channel.type = parseChannelType(j["type"].get<std::string>()).value_or(ChannelType::OPEN);
    }
    if (j.contains("display_name") && j["display_name"].is_string()) {
        channel.displayName = j["display_name"].get<std::string>();
    }

    return channel;
}
