#include "archive/channel.hpp"

#include <array>

#include <util/Exceptions.h>

#include "archive/position.hpp"
#include "util/log.hpp"

namespace archive {

namespace {

constexpr const char* kComponent = "channel";

constexpr std::array<const char*, 9> kIdentifyingKeys = {
    "endpoint", "interface", "control", "control-mode", "tags", "rejoin", "group", "tether", "session-id",
};

std::string uri_prefix(aeron::ChannelUri& uri) {
    const std::string prefix = uri.prefix();
    return prefix.empty() ? std::string{} : prefix + ":";
}

} // namespace

std::shared_ptr<aeron::ChannelUri> parse_channel(const std::string& channel) {
    try {
        auto uri = aeron::ChannelUri::parse(channel);
        if (!uri || uri->media().empty()) {
            return nullptr;
        }
        return uri;
    } catch (const aeron::util::SourcedException& ex) {
        LOG_SLOW_DEBUG(kComponent, "rejected channel %s: %s", channel.c_str(), ex.what());
        return nullptr;
    }
}

std::string strip_channel(const std::string& channel) {
    const auto uri = parse_channel(channel);
    if (!uri) {
        return {};
    }
    const auto stripped = parse_channel(uri_prefix(*uri) + "aeron:" + uri->media());
    if (!stripped) {
        return {};
    }
    for (const char* key : kIdentifyingKeys) {
        const std::string value = uri->get(key);
        if (!value.empty()) {
            stripped->put(key, value);
        }
    }
    return stripped->toString();
}

std::optional<std::string> make_replay_channel(const std::string& channel,
                                               const RecordingDescriptor& descriptor,
                                               std::int64_t position) {
    const auto uri = parse_channel(channel);
    if (!uri) {
        return std::nullopt;
    }
    const int shift = position_bits_to_shift(descriptor.term_buffer_length);
    uri->put("init-term-id", std::to_string(descriptor.initial_term_id));
    uri->put("term-id", std::to_string(compute_term_id_from_position(position, shift, descriptor.initial_term_id)));
    uri->put("term-offset", std::to_string(compute_term_offset_from_position(position, shift)));
    uri->put("term-length", std::to_string(descriptor.term_buffer_length));
    uri->put("mtu", std::to_string(descriptor.mtu_length));
    uri->put("session-id", std::to_string(descriptor.session_id));
    return uri->toString();
}

} // namespace archive
