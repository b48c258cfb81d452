#include <gtest/gtest.h>

#include "rotation/coalescing_slot.h"

#include <string>

using namespace drift;

TEST(CoalescingSlot, StartsEmpty)
{
    CoalescingSlot<int> slot;
    EXPECT_FALSE(slot.HasPending());
    EXPECT_FALSE(slot.Take().has_value());
}

TEST(CoalescingSlot, FirstOfferIsNotCoalesced)
{
    CoalescingSlot<int> slot;
    EXPECT_TRUE(slot.Offer(1));
    EXPECT_TRUE(slot.HasPending());
}

TEST(CoalescingSlot, LaterOffersOverwriteInsteadOfAppending)
{
    CoalescingSlot<std::string> slot;
    EXPECT_TRUE(slot.Offer("a"));
    EXPECT_FALSE(slot.Offer("b"));
    EXPECT_FALSE(slot.Offer("c"));

    std::optional<std::string> v = slot.Take();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "c");
    EXPECT_FALSE(slot.HasPending());
    EXPECT_FALSE(slot.Take().has_value());
}

TEST(CoalescingSlot, ClearDropsPending)
{
    CoalescingSlot<int> slot;
    slot.Offer(3);
    slot.Clear();
    EXPECT_FALSE(slot.HasPending());
    EXPECT_TRUE(slot.Offer(4));
}
