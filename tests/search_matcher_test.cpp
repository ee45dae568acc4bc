#include "ssdp/responder/search_matcher.hpp"

#include <gtest/gtest.h>

namespace ssdp
{
namespace
{

TEST(SearchMatcherTest, ExactTargetMatchesOnlyItself)
{
    EXPECT_TRUE(search_target_matches("urn:test:device:1", "urn:test:device:1"));
    EXPECT_FALSE(search_target_matches("urn:test:device:2", "urn:test:device:1"));
    EXPECT_FALSE(search_target_matches("urn:test:device", "urn:test:device:1"));
}

TEST(SearchMatcherTest, ComparisonIsCaseSensitive)
{
    EXPECT_FALSE(search_target_matches("URN:test:device:1", "urn:test:device:1"));
}

TEST(SearchMatcherTest, GenericTargetsMatchEverything)
{
    EXPECT_TRUE(search_target_matches("ssdp:all", "urn:test:device:1"));
    EXPECT_TRUE(search_target_matches("ssdp:all", "upnp:rootdevice"));
    EXPECT_TRUE(search_target_matches("ssdp:anything", "urn:test:device:1"));
}

TEST(SearchMatcherTest, EmptyTargetMatchesNothing)
{
    EXPECT_FALSE(search_target_matches("", "urn:test:device:1"));
}

} // namespace
} // namespace ssdp
