#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <ChannelUri.h>

#include "archive/recording_descriptor.hpp"

namespace archive {

// Parses with the client's channel URI grammar, including the aeron-spy prefix. Null when
// the channel is not a valid Aeron URI.
std::shared_ptr<aeron::ChannelUri> parse_channel(const std::string& channel);

// Channel reduced to the parameters that identify the source, used as the recording key
// and stored in the descriptor. Empty if the channel cannot be parsed.
std::string strip_channel(const std::string& channel);

// Caller's replay channel with the recording's term geometry and session id applied, so the
// replayed stream starts at the same term id and offset as the original at `position`.
std::optional<std::string> make_replay_channel(const std::string& channel,
                                               const RecordingDescriptor& descriptor,
                                               std::int64_t position);

} // namespace archive
