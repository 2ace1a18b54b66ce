//----------------------------------------------------------------------------------------------------------------------
// File: LoopbackService.hpp
// Description: An in process relay service connecting endpoints registered on any number of simulated domains.
// Dispatched payloads are held until DeliverPending() is called, at which point each target endpoint's delivery
// callback is invoked from the service's identity. Every attempt is logged for redelivery, the log keeps the most
// recent attempts up to the service's attempt limit.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Chain/Address.hpp"
#include "Components/Chain/ChainTypes.hpp"
#include "Components/Core/Result.hpp"
#include "Interfaces/RelayService.hpp"
#include "Utilities/LogUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace Courier { class Endpoint; }

//----------------------------------------------------------------------------------------------------------------------
namespace Relay {
//----------------------------------------------------------------------------------------------------------------------

class LoopbackService;

//----------------------------------------------------------------------------------------------------------------------
} // Relay namespace
//----------------------------------------------------------------------------------------------------------------------

class Relay::LoopbackService : public IRelayService
{
public:
    struct Pricing
    {
        Chain::Amount baseFee;
        Chain::Amount gasPrice;
    };

    struct Delivery
    {
        std::uint64_t sequence;
        Chain::Domain sourceDomain;
        Chain::Address sourceAddress;
        Chain::Domain targetDomain;
        Chain::Address targetAddress;
        Chain::Buffer payload;
        Chain::DeliveryHash hash;
    };

    struct Attempt
    {
        Delivery delivery;
        Courier::Result result;
    };

    static constexpr std::size_t DefaultAttemptLimit = 1'024;

    explicit LoopbackService(Chain::Address const& identity, std::size_t attemptLimit = DefaultAttemptLimit);

    LoopbackService(LoopbackService const&) = delete;
    LoopbackService& operator=(LoopbackService const&) = delete;

    [[nodiscard]] Chain::Address const& GetIdentity() const;

    void SetPricing(Chain::Domain domain, Pricing const& pricing);

    // Registration fails if the endpoint's domain is not priced or its address is already registered on any domain.
    [[nodiscard]] bool Register(std::shared_ptr<Courier::Endpoint> const& spEndpoint);

    // IRelayService {
    [[nodiscard]] virtual DeliveryQuote QuoteDeliveryPrice(
        Chain::Domain target, Chain::Amount receiverValue, Chain::Gas gasLimit) const override;

    [[nodiscard]] virtual Courier::Result SendPayload(
        Chain::CallContext const& context,
        Chain::Domain target,
        Chain::Address const& targetAddress,
        Chain::ReadableView payload,
        Chain::Amount receiverValue,
        Chain::Gas gasLimit) override;
    // } IRelayService

    // Returns the number of pending deliveries the target endpoints accepted.
    std::size_t DeliverPending();

    // Invokes the target endpoint again with a previously attempted delivery. Deliveries that have aged out of the
    // attempt log are unknown to the service.
    [[nodiscard]] Courier::Result Redeliver(Chain::DeliveryHash const& hash);

    [[nodiscard]] std::size_t PendingCount() const;
    [[nodiscard]] std::vector<Attempt> GetAttempts() const;

private:
    using RegistrationKey = std::pair<Chain::Domain, Chain::Address>;
    using Registrations = std::map<RegistrationKey, std::weak_ptr<Courier::Endpoint>>;

    [[nodiscard]] std::optional<Pricing> FetchPricing(Chain::Domain domain) const;
    [[nodiscard]] std::optional<Chain::Domain> FetchSourceDomain(Chain::Address const& caller) const;
    [[nodiscard]] Courier::Result Deliver(Delivery const& delivery);
    void RecordAttempt(Delivery const& delivery, Courier::Result result);

    Chain::Address const m_identity;
    std::size_t const m_attemptLimit;
    LogUtils::Logger m_logger;

    mutable std::mutex m_mutex;
    std::map<Chain::Domain, Pricing> m_pricing;
    Registrations m_registrations;
    std::uint64_t m_sequence;
    std::deque<Delivery> m_pending;
    std::deque<Attempt> m_attempts;
};

//----------------------------------------------------------------------------------------------------------------------
