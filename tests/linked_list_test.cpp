#include <gtest/gtest.h>
#include "dlist/linked_list.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <random>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>

using dlist::LinkedList;

namespace {

template<typename List>
std::vector<int> forward_values(const List& list) {
    std::vector<int> out;
    list.for_each([&](int v) { out.push_back(v); });
    return out;
}

template<typename List>
std::vector<int> backward_values(const List& list) {
    std::vector<int> out;
    list.for_each_reverse([&](int v) { out.push_back(v); });
    return out;
}

// Every allocation made on behalf of a list, keyed by address, so leaks and
// frees of an address that is not live show up in the counters.
struct AllocStats {
    std::size_t allocations = 0;
    std::size_t deallocations = 0;
    std::size_t bad_frees = 0;
    std::set<void*> live;
};

template<typename T>
struct CountingAllocator {
    using value_type = T;

    explicit CountingAllocator(AllocStats* s) noexcept : stats(s) {}

    template<typename U>
    CountingAllocator(const CountingAllocator<U>& other) noexcept : stats(other.stats) {}

    T* allocate(std::size_t n) {
        T* p = std::allocator<T>{}.allocate(n);
        ++stats->allocations;
        stats->live.insert(p);
        return p;
    }

    void deallocate(T* p, std::size_t n) noexcept {
        ++stats->deallocations;
        if (stats->live.erase(p) == 0) {
            ++stats->bad_frees; // never hand it back twice
            return;
        }
        std::allocator<T>{}.deallocate(p, n);
    }

    template<typename U>
    bool operator==(const CountingAllocator<U>& other) const noexcept { return stats == other.stats; }

    AllocStats* stats;
};

using CountedList = LinkedList<int, CountingAllocator<int>>;

// copying throws while armed; with no move constructor, moves copy too
struct Fragile {
    static inline bool armed = false;

    explicit Fragile(int v) : value(v) {}
    Fragile(const Fragile& other) : value(other.value) {
        if (armed) throw std::runtime_error("payload copy failed");
    }
    Fragile& operator=(const Fragile&) = default;

    int value;
};

} // namespace

/* ///////////////////
INSERTION AND REMOVAL
*/ ///////////////////

TEST(LinkedListTest, NewListIsEmpty) {
    LinkedList<int> list;
    EXPECT_TRUE(list.empty());
    EXPECT_EQ(list.size(), 0u);
    EXPECT_EQ(dlist::to_string(list), "[]");
    EXPECT_TRUE(list.valid());
}

TEST(LinkedListTest, PushFrontInsertsAtHead) {
    LinkedList<int> list;
    list.push_front(0);
    list.push_front(1);
    list.push_front(2);

    EXPECT_EQ(dlist::to_string(list), "[2, 1, 0]");
    EXPECT_EQ(list.size(), 3u);
    EXPECT_TRUE(list.valid());
}

TEST(LinkedListTest, PushBackInsertsAtTail) {
    LinkedList<int> list;
    list.push_back(0);
    list.push_back(1);
    list.push_back(2);

    EXPECT_EQ(dlist::to_string(list), "[0, 1, 2]");
    EXPECT_TRUE(list.valid());
}

TEST(LinkedListTest, SingleNodeIsBothTerminals) {
    LinkedList<int> list;
    list.push_back(7);

    ASSERT_NE(list.peek_front(), nullptr);
    EXPECT_EQ(list.peek_front(), list.peek_back());
    EXPECT_TRUE(list.valid());
}

TEST(LinkedListTest, PopFrontReturnsHeadValues) {
    LinkedList<int> list;
    list.push_back(0);
    list.push_back(1);
    list.push_back(2);

    EXPECT_EQ(list.pop_front(), 0);
    EXPECT_TRUE(list.valid());
    EXPECT_EQ(list.pop_front(), 1);
    EXPECT_EQ(list.pop_front(), 2);
    EXPECT_EQ(list.pop_front(), std::nullopt);
    EXPECT_TRUE(list.valid());
}

TEST(LinkedListTest, PopBackReturnsTailValues) {
    LinkedList<int> list;
    list.push_back(0);
    list.push_back(1);
    list.push_back(2);

    EXPECT_EQ(list.pop_back(), 2);
    EXPECT_TRUE(list.valid());
    EXPECT_EQ(list.pop_back(), 1);
    EXPECT_EQ(list.pop_back(), 0);
    EXPECT_EQ(list.pop_back(), std::nullopt);
}

TEST(LinkedListTest, RemovingFromEmptyListIsHarmless) {
    LinkedList<int> list;
    EXPECT_EQ(list.pop_front(), std::nullopt);
    EXPECT_EQ(list.pop_back(), std::nullopt);
    EXPECT_EQ(list.size(), 0u);
    EXPECT_TRUE(list.valid());

    list.push_front(5);
    EXPECT_EQ(list.size(), 1u);
    EXPECT_EQ(list.pop_front(), 5);
    EXPECT_EQ(list.pop_back(), std::nullopt);
}

TEST(LinkedListTest, MixedEndsKeepLinksSymmetric) {
    LinkedList<int> list;
    list.push_front(1);
    list.push_back(2);
    list.push_front(0);
    list.push_back(3);

    EXPECT_EQ(forward_values(list), (std::vector<int>{0, 1, 2, 3}));
    EXPECT_EQ(backward_values(list), (std::vector<int>{3, 2, 1, 0}));

    EXPECT_EQ(list.pop_back(), 3);
    EXPECT_EQ(list.pop_front(), 0);
    EXPECT_EQ(backward_values(list), (std::vector<int>{2, 1}));
    EXPECT_TRUE(list.valid());
}

TEST(LinkedListTest, PushThenPopRestoresPriorState) {
    for (int prior = 0; prior < 5; ++prior) {
        LinkedList<int> list;
        for (int i = 0; i < prior; ++i) list.push_back(i);
        const auto before = dlist::to_string(list);

        list.push_front(42);
        EXPECT_EQ(list.pop_front(), 42);
        EXPECT_EQ(dlist::to_string(list), before);
        EXPECT_EQ(list.size(), static_cast<std::size_t>(prior));

        list.push_back(43);
        EXPECT_EQ(list.pop_back(), 43);
        EXPECT_EQ(dlist::to_string(list), before);
        EXPECT_TRUE(list.valid());
    }
}

/* ///////////////////
PEEK AND NTH
*/ ///////////////////

TEST(LinkedListTest, PeekOnEmptyListIsAbsent) {
    LinkedList<int> list;
    EXPECT_EQ(list.peek_front(), nullptr);
    EXPECT_EQ(list.peek_back(), nullptr);
    EXPECT_EQ(list.peek_front_mut(), nullptr);
    EXPECT_EQ(list.peek_back_mut(), nullptr);
}

TEST(LinkedListTest, PeekFollowsTerminals) {
    LinkedList<int> list;
    list.push_front(0);
    EXPECT_EQ(*list.peek_front(), 0);
    list.push_front(1);
    EXPECT_EQ(*list.peek_front(), 1);
    EXPECT_EQ(*list.peek_back(), 0);
    list.push_back(2);
    EXPECT_EQ(*list.peek_back(), 2);
}

TEST(LinkedListTest, PeekMutWritesThrough) {
    LinkedList<int> list;
    list.push_back(1);
    list.push_back(2);

    *list.peek_front_mut() = 10;
    *list.peek_back_mut() += 20;

    EXPECT_EQ(dlist::to_string(list), "[10, 22]");
}

TEST(LinkedListTest, NthMatchesLinearTraversal) {
    for (int n = 0; n < 12; ++n) {
        LinkedList<int> list;
        for (int i = 0; i < n; ++i) list.push_back(i * 3);

        auto expected = forward_values(list);
        for (std::size_t i = 0; i < list.size(); ++i) {
            ASSERT_NE(list.nth(i), nullptr);
            EXPECT_EQ(*list.nth(i), expected[i]) << "n=" << n << " i=" << i;
        }
        EXPECT_EQ(list.nth(list.size()), nullptr);
        EXPECT_EQ(list.nth(list.size() + 100), nullptr);
    }
}

TEST(LinkedListTest, NthOnConstList) {
    LinkedList<int> list;
    list.push_front(0);
    list.push_front(1);
    list.push_front(2);

    const auto& view = list;
    EXPECT_EQ(*view.nth(0), 2);
    EXPECT_EQ(*view.nth(1), 1);
    EXPECT_EQ(*view.nth(2), 0);
    EXPECT_EQ(view.size(), 3u); // nth does not remove anything
}

/* ///////////////////
CLEAR, DRAIN, DISPLAY, MOVE
*/ ///////////////////

TEST(LinkedListTest, ClearReturnsToEmptyState) {
    LinkedList<int> list;
    list.push_front(0);
    list.push_front(1);
    list.push_front(2);
    EXPECT_EQ(dlist::to_string(list), "[2, 1, 0]");

    list.clear();
    EXPECT_TRUE(list.empty());
    EXPECT_EQ(list.size(), 0u);
    EXPECT_EQ(dlist::to_string(list), "[]");
    EXPECT_TRUE(list.valid());

    list.push_back(9); // still usable
    EXPECT_EQ(dlist::to_string(list), "[9]");
}

TEST(LinkedListTest, DrainConsumesFromHead) {
    LinkedList<int> list;
    for (int i = 0; i < 10; ++i) list.push_front(i);

    int sum = 0;
    std::vector<int> order;
    for (int value : list.drain()) {
        sum += value;
        order.push_back(value);
    }
    EXPECT_EQ(sum, 45);
    EXPECT_EQ(order.front(), 9);
    EXPECT_EQ(order.back(), 0);
    EXPECT_TRUE(list.empty());
}

TEST(LinkedListTest, AbandonedDrainLeavesRemainder) {
    LinkedList<int> list;
    for (int i = 0; i < 5; ++i) list.push_back(i);

    auto drain = list.drain();
    EXPECT_EQ(drain.next(), 0);
    EXPECT_EQ(drain.next(), 1);
    EXPECT_EQ(drain.remaining(), 3u);
    EXPECT_EQ(dlist::to_string(list), "[2, 3, 4]");
    EXPECT_TRUE(list.valid());
}

TEST(LinkedListTest, DisplayDoesNotConsume) {
    LinkedList<std::string> list;
    list.push_back("a");
    list.push_back("b");

    std::ostringstream oss;
    oss << list;
    EXPECT_EQ(oss.str(), "[a, b]");
    EXPECT_EQ(fmt::format("{}", list), "[a, b]");
    EXPECT_EQ(list.size(), 2u);
}

TEST(LinkedListTest, MoveLeavesSourceEmpty) {
    LinkedList<int> a;
    a.push_back(1);
    a.push_back(2);

    LinkedList<int> b(std::move(a));
    EXPECT_TRUE(a.empty());
    EXPECT_TRUE(a.valid());
    EXPECT_EQ(dlist::to_string(b), "[1, 2]");

    LinkedList<int> c;
    c.push_back(7);
    c = std::move(b);
    EXPECT_EQ(dlist::to_string(c), "[1, 2]");
    EXPECT_TRUE(b.empty());
}

TEST(LinkedListTest, MoveOnlyPayload) {
    LinkedList<std::unique_ptr<int>> list;
    list.push_back(std::make_unique<int>(1));
    list.emplace_front(new int(0));

    auto first = list.pop_front();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(**first, 0);
    EXPECT_EQ(**list.peek_back(), 1);
}

TEST(LinkedListTest, LongListTeardown) {
    LinkedList<int> list;
    for (int i = 0; i < 1'000'000; ++i) list.push_back(i);
    EXPECT_EQ(list.size(), 1'000'000u);
    // destructor frees iteratively
}

/* ///////////////////
ALLOCATION TRACKING
*/ ///////////////////

TEST(LinkedListAllocTest, OneAllocationPerNode) {
    AllocStats stats;
    {
        CountedList list{CountingAllocator<int>(&stats)};
        list.push_back(1);
        list.push_front(0);
        EXPECT_EQ(stats.allocations, 2u);
        EXPECT_EQ(stats.live.size(), 2u);

        EXPECT_EQ(list.pop_back(), 1);
        EXPECT_EQ(stats.deallocations, 1u);
        EXPECT_EQ(stats.live.size(), 1u);
    }
    EXPECT_EQ(stats.allocations, stats.deallocations);
    EXPECT_TRUE(stats.live.empty());
    EXPECT_EQ(stats.bad_frees, 0u);
}

TEST(LinkedListAllocTest, ClearFreesEveryNode) {
    AllocStats stats;
    CountedList list{CountingAllocator<int>(&stats)};
    for (int i = 0; i < 100; ++i) list.push_front(i);

    list.clear();
    EXPECT_EQ(stats.allocations, 100u);
    EXPECT_EQ(stats.deallocations, 100u);
    EXPECT_TRUE(stats.live.empty());
    EXPECT_EQ(stats.bad_frees, 0u);
}

TEST(LinkedListAllocTest, RandomizedSequencesNeverLeakOrDoubleFree) {
    std::mt19937 gen(12345);
    std::uniform_int_distribution<int> op(0, 5);

    for (int round = 0; round < 20; ++round) {
        AllocStats stats;
        {
            CountedList list{CountingAllocator<int>(&stats)};
            std::deque<int> model;
            std::size_t inserted = 0;
            std::size_t removed = 0;

            for (int step = 0; step < 500; ++step) {
                int value = static_cast<int>(gen() % 1000);
                switch (op(gen)) {
                    case 0: list.push_front(value); model.push_front(value); ++inserted; break;
                    case 1: list.push_back(value); model.push_back(value); ++inserted; break;
                    case 2: {
                        auto got = list.pop_front();
                        if (model.empty()) {
                            ASSERT_EQ(got, std::nullopt);
                        } else {
                            ASSERT_EQ(got, model.front());
                            model.pop_front();
                            ++removed;
                        }
                        break;
                    }
                    case 3: {
                        auto got = list.pop_back();
                        if (model.empty()) {
                            ASSERT_EQ(got, std::nullopt);
                        } else {
                            ASSERT_EQ(got, model.back());
                            model.pop_back();
                            ++removed;
                        }
                        break;
                    }
                    case 4: {
                        if (!model.empty()) {
                            auto i = static_cast<std::size_t>(gen() % model.size());
                            ASSERT_NE(list.nth(i), nullptr);
                            ASSERT_EQ(*list.nth(i), model[i]);
                        }
                        break;
                    }
                    default:
                        if (step % 97 == 0) {
                            removed += list.size();
                            list.clear();
                            model.clear();
                        }
                        break;
                }

                ASSERT_EQ(list.size(), inserted - removed);
                ASSERT_EQ(list.size(), model.size());
                ASSERT_EQ(stats.live.size(), list.size());
                ASSERT_EQ(forward_values(list).size(), list.size());
                ASSERT_EQ(backward_values(list).size(), list.size());
            }
            ASSERT_TRUE(list.valid());
        }
        EXPECT_EQ(stats.allocations, stats.deallocations) << "round " << round;
        EXPECT_TRUE(stats.live.empty());
        EXPECT_EQ(stats.bad_frees, 0u);
    }
}

TEST(LinkedListAllocTest, ThrowingPayloadLeavesListIntact) {
    AllocStats stats;
    {
        LinkedList<Fragile, CountingAllocator<Fragile>> list{CountingAllocator<Fragile>(&stats)};
        list.push_back(Fragile(1));
        list.push_back(Fragile(2));

        Fragile::armed = true;
        EXPECT_THROW(static_cast<void>(list.pop_front()), std::runtime_error);
        EXPECT_THROW(static_cast<void>(list.pop_back()), std::runtime_error);
        EXPECT_THROW(list.push_front(Fragile(0)), std::runtime_error);
        Fragile::armed = false;

        EXPECT_EQ(list.size(), 2u);
        EXPECT_TRUE(list.valid());
        EXPECT_EQ(stats.live.size(), 2u);
        EXPECT_EQ(list.peek_front()->value, 1);
        EXPECT_EQ(list.peek_back()->value, 2);

        EXPECT_EQ(list.pop_front()->value, 1);
        EXPECT_EQ(stats.live.size(), 1u);
    }
    EXPECT_EQ(stats.allocations, stats.deallocations);
    EXPECT_TRUE(stats.live.empty());
    EXPECT_EQ(stats.bad_frees, 0u);
}
