//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Event/Publisher.hpp"
#include "Utilities/LogUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
//----------------------------------------------------------------------------------------------------------------------

GTEST_API_ std::int32_t main(std::int32_t argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    LogUtils::InitializeLoggers(spdlog::level::off);
    assert(Event::Assertions::IsSubscriberThread()); // Publishers are created and subscribed to on the main thread.
    return RUN_ALL_TESTS();
}

//----------------------------------------------------------------------------------------------------------------------
