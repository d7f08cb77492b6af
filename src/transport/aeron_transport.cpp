#include "transport/aeron_transport.hpp"

#include "util/log.hpp"

namespace transport {

static_assert(not_connected == aeron::NOT_CONNECTED);
static_assert(back_pressured == aeron::BACK_PRESSURED);
static_assert(admin_action == aeron::ADMIN_ACTION);
static_assert(publication_closed == aeron::PUBLICATION_CLOSED);
static_assert(max_position_exceeded == aeron::MAX_POSITION_EXCEEDED);

namespace {

constexpr const char* kComponent = "aeron";

std::span<const std::byte> as_span(const aeron::concurrent::AtomicBuffer& buffer,
                                   aeron::util::index_t offset,
                                   aeron::util::index_t length) {
    const auto* ptr = reinterpret_cast<const std::byte*>(buffer.buffer() + offset);
    return {ptr, static_cast<std::size_t>(length)};
}

aeron::concurrent::AtomicBuffer wrap(std::span<const std::byte> bytes) {
    auto* ptr = reinterpret_cast<std::uint8_t*>(const_cast<std::byte*>(bytes.data()));
    return aeron::concurrent::AtomicBuffer(ptr, bytes.size());
}

template <typename View, typename Resource>
Registered<View> resolve(std::int64_t registration_id, Resource&& find) {
    Registered<View> out;
    if (registration_id < 0) {
        out.failed = true;
        out.error = "registration was never issued";
        return out;
    }
    try {
        auto resource = find(registration_id);
        if (resource) {
            out.resource = std::move(resource);
        }
    } catch (const aeron::util::SourcedException& e) {
        out.failed = true;
        out.error = e.what();
    }
    return out;
}

} // namespace

int RealImageView::block_poll(const BlockHandler& handler, int block_length_limit) {
    return image_->blockPoll(
        [&](aeron::concurrent::AtomicBuffer& buffer,
            aeron::util::index_t offset,
            aeron::util::index_t length,
            std::int32_t session_id,
            std::int32_t term_id) { handler(as_span(buffer, offset, length), offset, session_id, term_id); },
        block_length_limit);
}

RealSubscriptionView::RealSubscriptionView(std::shared_ptr<aeron::Subscription> sub)
    : sub_(std::move(sub)),
      assembler_([this](aeron::concurrent::AtomicBuffer& buffer,
                        aeron::util::index_t offset,
                        aeron::util::index_t length,
                        aeron::concurrent::logbuffer::Header& header) {
          if (current_handler_) {
              (*current_handler_)(as_span(buffer, offset, length), header.sessionId());
          }
      }) {}

int RealSubscriptionView::poll(const FragmentHandler& handler, int fragment_limit) {
    current_handler_ = &handler;
    const int fragments = sub_->poll(assembler_.handler(), fragment_limit);
    current_handler_ = nullptr;
    return fragments;
}

std::shared_ptr<ImageView> RealSubscriptionView::image_at(std::size_t index) {
    auto image = sub_->imageByIndex(index);
    if (!image) {
        return nullptr;
    }
    return std::make_shared<RealImageView>(std::move(image));
}

std::int64_t RealPublicationView::offer(std::span<const std::byte> message) {
    aeron::concurrent::AtomicBuffer buffer = wrap(message);
    return pub_->offer(buffer, 0, static_cast<aeron::util::index_t>(message.size()));
}

std::int64_t RealExclusivePublicationView::offer(std::span<const std::byte> message) {
    aeron::concurrent::AtomicBuffer buffer = wrap(message);
    return pub_->offer(buffer, 0, static_cast<aeron::util::index_t>(message.size()));
}

std::int64_t RealExclusivePublicationView::offer_block(std::span<std::byte> block) {
    aeron::concurrent::AtomicBuffer buffer = wrap(block);
    try {
        return pub_->offerBlock(buffer, 0, static_cast<aeron::util::index_t>(block.size()));
    } catch (const aeron::util::SourcedException& e) {
        // Thrown when the block's first frame does not match the publication position.
        LOG_SLOW_ERROR(kComponent, "offerBlock rejected: %s", e.what());
        return publication_closed;
    }
}

std::int64_t RealExclusivePublicationView::append_padding(std::int32_t length) {
    try {
        return pub_->appendPadding(length);
    } catch (const aeron::util::SourcedException& e) {
        LOG_SLOW_ERROR(kComponent, "appendPadding rejected: %s", e.what());
        return publication_closed;
    }
}

std::int64_t RealAeronClientView::add_subscription(const std::string& channel, std::int32_t stream_id) {
    try {
        return client_->addSubscription(channel, stream_id);
    } catch (const aeron::util::SourcedException& e) {
        LOG_SLOW_ERROR(kComponent, "addSubscription %s stream %d failed: %s", channel.c_str(), stream_id, e.what());
        return -1;
    }
}

Registered<SubscriptionView> RealAeronClientView::find_subscription(std::int64_t registration_id) {
    auto found = resolve<aeron::Subscription>(registration_id,
                                              [this](std::int64_t id) { return client_->findSubscription(id); });
    Registered<SubscriptionView> out{nullptr, found.failed, std::move(found.error)};
    if (found.resource) {
        out.resource = std::make_shared<RealSubscriptionView>(std::move(found.resource));
    }
    return out;
}

std::int64_t RealAeronClientView::add_publication(const std::string& channel, std::int32_t stream_id) {
    try {
        return client_->addPublication(channel, stream_id);
    } catch (const aeron::util::SourcedException& e) {
        LOG_SLOW_ERROR(kComponent, "addPublication %s stream %d failed: %s", channel.c_str(), stream_id, e.what());
        return -1;
    }
}

Registered<PublicationView> RealAeronClientView::find_publication(std::int64_t registration_id) {
    auto found = resolve<aeron::Publication>(registration_id,
                                             [this](std::int64_t id) { return client_->findPublication(id); });
    Registered<PublicationView> out{nullptr, found.failed, std::move(found.error)};
    if (found.resource) {
        out.resource = std::make_shared<RealPublicationView>(std::move(found.resource));
    }
    return out;
}

std::int64_t RealAeronClientView::add_exclusive_publication(const std::string& channel, std::int32_t stream_id) {
    try {
        return client_->addExclusivePublication(channel, stream_id);
    } catch (const aeron::util::SourcedException& e) {
        LOG_SLOW_ERROR(kComponent, "addExclusivePublication %s stream %d failed: %s", channel.c_str(), stream_id,
                       e.what());
        return -1;
    }
}

Registered<ExclusivePublicationView> RealAeronClientView::find_exclusive_publication(std::int64_t registration_id) {
    auto found = resolve<aeron::ExclusivePublication>(
        registration_id, [this](std::int64_t id) { return client_->findExclusivePublication(id); });
    Registered<ExclusivePublicationView> out{nullptr, found.failed, std::move(found.error)};
    if (found.resource) {
        out.resource = std::make_shared<RealExclusivePublicationView>(std::move(found.resource));
    }
    return out;
}

} // namespace transport
