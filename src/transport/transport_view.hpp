#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>

namespace transport {

// Offer results below zero, with the transport's numbering.
inline constexpr std::int64_t not_connected = -1;
inline constexpr std::int64_t back_pressured = -2;
inline constexpr std::int64_t admin_action = -3;
inline constexpr std::int64_t publication_closed = -4;
inline constexpr std::int64_t max_position_exceeded = -5;

inline const char* offer_result_name(std::int64_t result) noexcept {
    switch (result) {
    case not_connected: return "NOT_CONNECTED";
    case back_pressured: return "BACK_PRESSURED";
    case admin_action: return "ADMIN_ACTION";
    case publication_closed: return "CLOSED";
    case max_position_exceeded: return "MAX_POSITION_EXCEEDED";
    default: return result >= 0 ? "OK" : "UNKNOWN";
    }
}

// Whole message delivered on a control subscription, with the sending image's session id.
using FragmentHandler = std::function<void(std::span<const std::byte> message, std::int32_t session_id)>;

// Raw, term-aligned run of frames from one term of an image. `term_offset` is where the
// block starts within its term.
using BlockHandler = std::function<void(std::span<const std::byte> block,
                                        std::int32_t term_offset,
                                        std::int32_t session_id,
                                        std::int32_t term_id)>;

class ImageView {
public:
    virtual ~ImageView() = default;
    // Delivers at most one block of up to `block_length_limit` bytes, never crossing a term
    // boundary, and advances position by its length. Returns the bytes consumed.
    virtual int block_poll(const BlockHandler& handler, int block_length_limit) = 0;
    virtual std::int64_t position() const = 0;
    virtual bool is_closed() const = 0;
    virtual std::int64_t correlation_id() const = 0;
    virtual std::int32_t session_id() const = 0;
    virtual std::int32_t initial_term_id() const = 0;
    virtual std::int32_t term_buffer_length() const = 0;
    virtual std::int32_t mtu_length() const = 0;
    virtual std::int64_t join_position() const = 0;
    virtual std::string source_identity() const = 0;
};

class SubscriptionView {
public:
    virtual ~SubscriptionView() = default;
    virtual int poll(const FragmentHandler& handler, int fragment_limit) = 0;
    virtual std::size_t image_count() const = 0;
    virtual std::shared_ptr<ImageView> image_at(std::size_t index) = 0;
    virtual bool is_closed() const = 0;
};

class PublicationView {
public:
    virtual ~PublicationView() = default;
    // New stream position on success, otherwise one of the negative offer results.
    virtual std::int64_t offer(std::span<const std::byte> message) = 0;
    virtual bool is_connected() const = 0;
    virtual bool is_closed() const = 0;
    virtual std::int32_t session_id() const = 0;
    virtual std::int32_t stream_id() const = 0;
    virtual std::int64_t position() const = 0;
};

// Single-writer publication that accepts pre-framed blocks, used to republish recorded terms.
class ExclusivePublicationView : public PublicationView {
public:
    // `block` must start with a data frame whose term offset, session id, stream id and term
    // id match the publication's current position, and must not cross a term boundary.
    virtual std::int64_t offer_block(std::span<std::byte> block) = 0;
    virtual std::int64_t append_padding(std::int32_t length) = 0;
};

// Outcome of resolving an asynchronous registration.
template <typename T>
struct Registered {
    std::shared_ptr<T> resource;
    bool failed{false};
    std::string error;

    bool pending() const noexcept { return !resource && !failed; }
};

class AeronClientView {
public:
    virtual ~AeronClientView() = default;

    // Registration ids are negative when the request could not be issued.
    virtual std::int64_t add_subscription(const std::string& channel, std::int32_t stream_id) = 0;
    virtual Registered<SubscriptionView> find_subscription(std::int64_t registration_id) = 0;

    virtual std::int64_t add_publication(const std::string& channel, std::int32_t stream_id) = 0;
    virtual Registered<PublicationView> find_publication(std::int64_t registration_id) = 0;

    virtual std::int64_t add_exclusive_publication(const std::string& channel, std::int32_t stream_id) = 0;
    virtual Registered<ExclusivePublicationView> find_exclusive_publication(std::int64_t registration_id) = 0;
};

} // namespace transport
