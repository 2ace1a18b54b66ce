//----------------------------------------------------------------------------------------------------------------------
// File: LoopbackService.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "LoopbackService.hpp"
#include "RelayDefinitions.hpp"
#include "Components/Core/Endpoint.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/endian/conversion.hpp>
#include <openssl/evp.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <initializer_list>
#include <limits>
#include <ranges>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

[[nodiscard]] std::optional<Chain::Amount> ComputeCost(
    Relay::LoopbackService::Pricing const& pricing, Chain::Amount receiverValue, Chain::Gas gasLimit);

[[nodiscard]] std::optional<Chain::DeliveryHash> GenerateDeliveryHash(Relay::LoopbackService::Delivery const& delivery);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Relay::LoopbackService::LoopbackService(Chain::Address const& identity, std::size_t attemptLimit)
    : m_identity(identity)
    , m_attemptLimit(attemptLimit)
    , m_logger(LogUtils::GetLogger(LogUtils::Name::Relay))
    , m_mutex()
    , m_pricing()
    , m_registrations()
    , m_sequence(0)
    , m_pending()
    , m_attempts()
{
}

//----------------------------------------------------------------------------------------------------------------------

Chain::Address const& Relay::LoopbackService::GetIdentity() const
{
    return m_identity;
}

//----------------------------------------------------------------------------------------------------------------------

void Relay::LoopbackService::SetPricing(Chain::Domain domain, Pricing const& pricing)
{
    std::scoped_lock lock(m_mutex);
    m_pricing.insert_or_assign(domain, pricing);
}

//----------------------------------------------------------------------------------------------------------------------

bool Relay::LoopbackService::Register(std::shared_ptr<Courier::Endpoint> const& spEndpoint)
{
    if (!spEndpoint) { return false; }

    std::scoped_lock lock(m_mutex);
    if (!m_pricing.contains(spEndpoint->GetDomain())) { return false; }

    // Source domains are resolved from the caller's address, an address may therefore only be registered once.
    bool const duplicate = std::ranges::any_of(m_registrations, [&spEndpoint] (auto const& entry) {
        return entry.first.second == spEndpoint->GetIdentity();
    });
    if (duplicate) { return false; }

    m_registrations.emplace(RegistrationKey{ spEndpoint->GetDomain(), spEndpoint->GetIdentity() }, spEndpoint);
    m_logger->debug("Registered {} on domain {}.", spEndpoint->GetIdentity(), spEndpoint->GetDomain().GetValue());
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

DeliveryQuote Relay::LoopbackService::QuoteDeliveryPrice(
    Chain::Domain target, Chain::Amount receiverValue, Chain::Gas gasLimit) const
{
    auto const optPricing = FetchPricing(target);
    if (!optPricing) { return { { Courier::ResultCode::UpstreamError, "unsupported target domain" }, {}, {} }; }

    auto const optCost = local::ComputeCost(*optPricing, receiverValue, gasLimit);
    if (!optCost) { return { { Courier::ResultCode::UpstreamError, "price overflow" }, {}, {} }; }

    return { {}, *optCost, optPricing->gasPrice };
}

//----------------------------------------------------------------------------------------------------------------------

Courier::Result Relay::LoopbackService::SendPayload(
    Chain::CallContext const& context,
    Chain::Domain target,
    Chain::Address const& targetAddress,
    Chain::ReadableView payload,
    Chain::Amount receiverValue,
    Chain::Gas gasLimit)
{
    auto const optSourceDomain = FetchSourceDomain(context.caller);
    if (!optSourceDomain) { return { Courier::ResultCode::UpstreamError, "unregistered source" }; }

    auto const quote = QuoteDeliveryPrice(target, receiverValue, gasLimit);
    if (quote.result.IsError()) { return quote.result; }
    if (context.value != quote.cost) { return { Courier::ResultCode::UpstreamError, "delivery payment mismatch" }; }

    Delivery delivery{
        0, *optSourceDomain, context.caller, target, targetAddress, Chain::Buffer(payload.begin(), payload.end()), {}
    };

    std::scoped_lock lock(m_mutex);
    delivery.sequence = m_sequence;

    auto const optHash = local::GenerateDeliveryHash(delivery);
    if (!optHash) { return { Courier::ResultCode::UpstreamError, "unable to generate a delivery hash" }; }
    delivery.hash = *optHash;

    ++m_sequence;
    m_logger->debug(
        "Accepted delivery #{} from domain {} to domain {}.",
        delivery.sequence, delivery.sourceDomain.GetValue(), delivery.targetDomain.GetValue());
    m_pending.emplace_back(std::move(delivery));

    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Relay::LoopbackService::DeliverPending()
{
    // Pull the pending deliveries such that endpoints are invoked without holding the service's lock.
    std::deque<Delivery> pending;
    {
        std::scoped_lock lock(m_mutex);
        pending.swap(m_pending);
    }

    std::size_t accepted = 0;
    for (auto const& delivery : pending) {
        auto result = Deliver(delivery);
        if (result.IsSuccess()) { ++accepted; }
        RecordAttempt(delivery, std::move(result));
    }

    return accepted;
}

//----------------------------------------------------------------------------------------------------------------------

Courier::Result Relay::LoopbackService::Redeliver(Chain::DeliveryHash const& hash)
{
    std::optional<Delivery> optDelivery;
    {
        std::scoped_lock lock(m_mutex);
        auto const itr = std::ranges::find_if(m_attempts, [&hash] (Attempt const& attempt) {
            return attempt.delivery.hash == hash;
        });
        if (itr == m_attempts.end()) { return { Courier::ResultCode::UpstreamError, "unknown delivery" }; }
        optDelivery = itr->delivery;
    }

    auto const result = Deliver(*optDelivery);
    RecordAttempt(*optDelivery, result);
    return result;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Relay::LoopbackService::PendingCount() const
{
    std::scoped_lock lock(m_mutex);
    return m_pending.size();
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Relay::LoopbackService::Attempt> Relay::LoopbackService::GetAttempts() const
{
    std::scoped_lock lock(m_mutex);
    return { m_attempts.begin(), m_attempts.end() };
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Relay::LoopbackService::Pricing> Relay::LoopbackService::FetchPricing(Chain::Domain domain) const
{
    std::scoped_lock lock(m_mutex);
    if (auto const itr = m_pricing.find(domain); itr != m_pricing.end()) { return itr->second; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Chain::Domain> Relay::LoopbackService::FetchSourceDomain(Chain::Address const& caller) const
{
    std::scoped_lock lock(m_mutex);
    auto const itr = std::ranges::find_if(m_registrations, [&caller] (auto const& entry) {
        return entry.first.second == caller;
    });
    if (itr == m_registrations.end()) { return {}; }
    return itr->first.first;
}

//----------------------------------------------------------------------------------------------------------------------

Courier::Result Relay::LoopbackService::Deliver(Delivery const& delivery)
{
    std::shared_ptr<Courier::Endpoint> spEndpoint;
    {
        std::scoped_lock lock(m_mutex);
        if (auto const itr = m_registrations.find({ delivery.targetDomain, delivery.targetAddress });
            itr != m_registrations.end()) {
            spEndpoint = itr->second.lock();
        }
    }

    if (!spEndpoint) {
        m_logger->warn(
            "Dropping delivery #{}, no endpoint is registered as {} on domain {}.",
            delivery.sequence, delivery.targetAddress, delivery.targetDomain.GetValue());
        return { Courier::ResultCode::UpstreamError, "unknown target endpoint" };
    }

    auto const result = spEndpoint->OnDeliver(
        Chain::CallContext{ m_identity, ReceiverValue },
        delivery.payload, {}, delivery.sourceAddress, delivery.sourceDomain, delivery.hash);

    if (result.IsError()) {
        m_logger->warn("Delivery #{} was rejected by the target endpoint: {}", delivery.sequence, result.what());
    } else {
        m_logger->debug("Delivery #{} was applied by the target endpoint.", delivery.sequence);
    }

    return result;
}

//----------------------------------------------------------------------------------------------------------------------

void Relay::LoopbackService::RecordAttempt(Delivery const& delivery, Courier::Result result)
{
    std::scoped_lock lock(m_mutex);
    m_attempts.emplace_back(Attempt{ delivery, std::move(result) });
    while (m_attempts.size() > m_attemptLimit) { m_attempts.pop_front(); }
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Chain::Amount> local::ComputeCost(
    Relay::LoopbackService::Pricing const& pricing, Chain::Amount receiverValue, Chain::Gas gasLimit)
{
    using Limits = std::numeric_limits<Chain::Amount::UnderlyingType>;

    // The cost is baseFee + gasLimit * gasPrice + receiverValue, each step is checked before it is applied.
    auto const gasPrice = pricing.gasPrice.GetValue();
    if (gasPrice != 0 && gasLimit.GetValue() > Limits::max() / gasPrice) { return {}; }
    auto cost = gasLimit.GetValue() * gasPrice;

    for (auto const addend : { pricing.baseFee.GetValue(), receiverValue.GetValue() }) {
        if (addend > Limits::max() - cost) { return {}; }
        cost += addend;
    }

    return Chain::Amount{ cost };
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Chain::DeliveryHash> local::GenerateDeliveryHash(Relay::LoopbackService::Delivery const& delivery)
{
    local::DigestContext upDigestContext(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!upDigestContext) { return {}; }

    if (EVP_DigestInit_ex(upDigestContext.get(), EVP_sha3_256(), nullptr) <= 0) { return {}; }

    // The hash covers the delivery's sequence, its route, and its payload. Integral fields are hashed big endian.
    auto const sequence = boost::endian::native_to_big(delivery.sequence);
    auto const source = boost::endian::native_to_big(delivery.sourceDomain.GetValue());
    auto const target = boost::endian::native_to_big(delivery.targetDomain.GetValue());

    auto const update = [&upDigestContext] (void const* pData, std::size_t size) {
        return EVP_DigestUpdate(upDigestContext.get(), pData, size) > 0;
    };

    if (!update(&sequence, sizeof(sequence))) { return {}; }
    if (!update(&source, sizeof(source))) { return {}; }
    if (!update(delivery.sourceAddress.GetBytes().data(), Chain::Address::Size)) { return {}; }
    if (!update(&target, sizeof(target))) { return {}; }
    if (!update(delivery.targetAddress.GetBytes().data(), Chain::Address::Size)) { return {}; }
    if (!update(delivery.payload.data(), delivery.payload.size())) { return {}; }

    Chain::DeliveryHash hash;
    std::uint32_t processed = 0;
    if (EVP_DigestFinal_ex(upDigestContext.get(), hash.data(), &processed) <= 0) { return {}; }
    if (processed != Chain::DeliveryHashSize) { return {}; }

    return hash;
}

//----------------------------------------------------------------------------------------------------------------------
