//----------------------------------------------------------------------------------------------------------------------
#include "Components/Chain/Address.hpp"
#include "Components/Chain/ChainTypes.hpp"
#include "Components/Payload/Message.hpp"
#include "Components/State/LatestMessage.hpp"
#include "Components/State/ReceivedMessage.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <string>
#include <thread>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

Chain::Address CreateAddress(std::uint8_t seed);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr Chain::Domain SourceDomain{ 7 };

State::ReceivedMessage const First{ Payload::Message{ "first", local::CreateAddress(0x01) }, SourceDomain };
State::ReceivedMessage const Second{ Payload::Message{ "second", local::CreateAddress(0x02) }, Chain::Domain{ 8 } };

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(LatestMessageSuite, InitialStateTest)
{
    State::LatestMessage const store;
    EXPECT_FALSE(store.Get());
    EXPECT_EQ(store.GetUpdateCount(), std::uint64_t{ 0 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST(LatestMessageSuite, SetTest)
{
    State::LatestMessage store;
    store.Set(test::First);

    auto const optMessage = store.Get();
    ASSERT_TRUE(optMessage);
    EXPECT_EQ(*optMessage, test::First);
    EXPECT_EQ(optMessage->GetText(), "first");
    EXPECT_EQ(optMessage->GetSender(), local::CreateAddress(0x01));
    EXPECT_EQ(optMessage->GetSourceDomain(), test::SourceDomain);
    EXPECT_EQ(store.GetUpdateCount(), std::uint64_t{ 1 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST(LatestMessageSuite, OverwriteTest)
{
    State::LatestMessage store;
    store.Set(test::First);
    store.Set(test::Second);

    // The previous record is replaced as a whole, none of its fields survive.
    auto const optMessage = store.Get();
    ASSERT_TRUE(optMessage);
    EXPECT_EQ(*optMessage, test::Second);
    EXPECT_NE(*optMessage, test::First);
    EXPECT_EQ(store.GetUpdateCount(), std::uint64_t{ 2 });

    // Storing an identical record still counts as an update.
    store.Set(test::Second);
    EXPECT_EQ(store.Get(), test::Second);
    EXPECT_EQ(store.GetUpdateCount(), std::uint64_t{ 3 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST(LatestMessageSuite, ConcurrentWritersTest)
{
    constexpr std::uint32_t Writers = 4;
    constexpr std::uint32_t Iterations = 250;

    State::LatestMessage store;
    std::vector<std::thread> writers;
    for (std::uint32_t idx = 0; idx < Writers; ++idx) {
        writers.emplace_back([&store, idx] {
            auto const& message = (idx % 2 == 0) ? test::First : test::Second;
            for (std::uint32_t iteration = 0; iteration < Iterations; ++iteration) { store.Set(message); }
        });
    }

    for (auto& writer : writers) { writer.join(); }

    // Whichever write landed last wins, but a record is never a mix of two writes.
    auto const optMessage = store.Get();
    ASSERT_TRUE(optMessage);
    EXPECT_TRUE(*optMessage == test::First || *optMessage == test::Second);
    EXPECT_EQ(store.GetUpdateCount(), std::uint64_t{ Writers * Iterations });
}

//----------------------------------------------------------------------------------------------------------------------

Chain::Address local::CreateAddress(std::uint8_t seed)
{
    Chain::Address::Bytes bytes;
    bytes.fill(seed);
    return Chain::Address{ bytes };
}

//----------------------------------------------------------------------------------------------------------------------
