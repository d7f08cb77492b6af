#pragma once

#include <memory>

#include <Aeron.h>
#include <FragmentAssembler.h>

#include "transport/transport_view.hpp"

namespace transport {

class RealImageView final : public ImageView {
public:
    explicit RealImageView(std::shared_ptr<aeron::Image> image) : image_(std::move(image)) {}

    int block_poll(const BlockHandler& handler, int block_length_limit) override;
    std::int64_t position() const override { return image_->position(); }
    bool is_closed() const override { return image_->isClosed(); }
    std::int64_t correlation_id() const override { return image_->correlationId(); }
    std::int32_t session_id() const override { return image_->sessionId(); }
    std::int32_t initial_term_id() const override { return image_->initialTermId(); }
    std::int32_t term_buffer_length() const override { return image_->termBufferLength(); }
    std::int32_t mtu_length() const override { return image_->mtuLength(); }
    std::int64_t join_position() const override { return image_->joinPosition(); }
    std::string source_identity() const override { return image_->sourceIdentity(); }

private:
    std::shared_ptr<aeron::Image> image_;
};

class RealSubscriptionView final : public SubscriptionView {
public:
    explicit RealSubscriptionView(std::shared_ptr<aeron::Subscription> sub);

    int poll(const FragmentHandler& handler, int fragment_limit) override;
    std::size_t image_count() const override { return static_cast<std::size_t>(sub_->imageCount()); }
    std::shared_ptr<ImageView> image_at(std::size_t index) override;
    bool is_closed() const override { return sub_->isClosed(); }

private:
    std::shared_ptr<aeron::Subscription> sub_;
    // Reassembles fragmented control messages; dispatches to the handler of the current poll.
    const FragmentHandler* current_handler_{nullptr};
    aeron::FragmentAssembler assembler_;
};

class RealPublicationView final : public PublicationView {
public:
    explicit RealPublicationView(std::shared_ptr<aeron::Publication> pub) : pub_(std::move(pub)) {}

    std::int64_t offer(std::span<const std::byte> message) override;
    bool is_connected() const override { return pub_->isConnected(); }
    bool is_closed() const override { return pub_->isClosed(); }
    std::int32_t session_id() const override { return pub_->sessionId(); }
    std::int32_t stream_id() const override { return pub_->streamId(); }
    std::int64_t position() const override { return pub_->position(); }

private:
    std::shared_ptr<aeron::Publication> pub_;
};

class RealExclusivePublicationView final : public ExclusivePublicationView {
public:
    explicit RealExclusivePublicationView(std::shared_ptr<aeron::ExclusivePublication> pub) : pub_(std::move(pub)) {}

    std::int64_t offer(std::span<const std::byte> message) override;
    std::int64_t offer_block(std::span<std::byte> block) override;
    std::int64_t append_padding(std::int32_t length) override;
    bool is_connected() const override { return pub_->isConnected(); }
    bool is_closed() const override { return pub_->isClosed(); }
    std::int32_t session_id() const override { return pub_->sessionId(); }
    std::int32_t stream_id() const override { return pub_->streamId(); }
    std::int64_t position() const override { return pub_->position(); }

private:
    std::shared_ptr<aeron::ExclusivePublication> pub_;
};

class RealAeronClientView final : public AeronClientView {
public:
    explicit RealAeronClientView(std::shared_ptr<aeron::Aeron> client) : client_(std::move(client)) {}

    std::int64_t add_subscription(const std::string& channel, std::int32_t stream_id) override;
    Registered<SubscriptionView> find_subscription(std::int64_t registration_id) override;

    std::int64_t add_publication(const std::string& channel, std::int32_t stream_id) override;
    Registered<PublicationView> find_publication(std::int64_t registration_id) override;

    std::int64_t add_exclusive_publication(const std::string& channel, std::int32_t stream_id) override;
    Registered<ExclusivePublicationView> find_exclusive_publication(std::int64_t registration_id) override;

private:
    std::shared_ptr<aeron::Aeron> client_;
};

inline std::shared_ptr<AeronClientView> make_aeron_client_view(std::shared_ptr<aeron::Aeron> client) {
    return std::make_shared<RealAeronClientView>(std::move(client));
}

} // namespace transport
