#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "chain/servant.h"

#include <memory>
#include <numeric>
#include <thread>
#include <vector>

using namespace Giftchain;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

class ServantTest : public ::testing::Test {
protected:
    ServantHandles MakeHandles(std::vector<Item> items, Item max_item) {
        ServantHandles handles;
        handles.pool = std::make_shared<Pool>(std::move(items), 11);
        handles.chain = std::make_shared<SortedChain>(max_item);
        handles.presents_added = std::make_shared<CompletionCounter>();
        handles.cards_written = std::make_shared<CompletionCounter>();
        handles.queries_issued = std::make_shared<CompletionCounter>();
        return handles;
    }
};

TEST_F(ServantTest, SingleServantDrainsBagIntoSortedChain) {
    ServantHandles handles = MakeHandles({3, 1, 2}, 3);
    Servant servant(0, handles);
    EXPECT_EQ(servant.GetState(), Servant::State::kRunning);

    servant.Run();

    EXPECT_EQ(servant.GetState(), Servant::State::kFinished);
    EXPECT_THAT(handles.chain->Snapshot(), ElementsAre(1, 2, 3));
    EXPECT_EQ(handles.presents_added->Value(), 3u);
    EXPECT_EQ(servant.Stats().presents_added, 3u);
    EXPECT_EQ(servant.Stats().duplicates_rejected, 0u);
    EXPECT_TRUE(handles.pool->Empty());
}

TEST_F(ServantTest, DuplicateInBagIsNotCounted) {
    ServantHandles handles = MakeHandles({1, 1, 2}, 2);
    Servant servant(0, handles);
    servant.Run();

    EXPECT_THAT(handles.chain->Snapshot(), ElementsAre(1, 2));
    EXPECT_EQ(handles.presents_added->Value(), 2u);
    EXPECT_EQ(servant.Stats().duplicates_rejected, 1u);
}

TEST_F(ServantTest, EmptyBagFinishesImmediately) {
    ServantHandles handles = MakeHandles({}, 10);
    Servant servant(3, handles);
    servant.Run();

    EXPECT_EQ(servant.GetState(), Servant::State::kFinished);
    EXPECT_EQ(servant.Id(), 3);
    EXPECT_EQ(handles.presents_added->Value(), 0u);
    EXPECT_TRUE(handles.chain->Empty());
}

TEST_F(ServantTest, ThankYouCardsEmptyTheChain) {
    ServantHandles handles = MakeHandles({5, 3, 9, 1}, 9);
    ServantOptions options;
    options.thank_you_cards = true;
    Servant servant(0, handles, options);
    servant.Run();

    EXPECT_EQ(handles.presents_added->Value(), 4u);
    EXPECT_EQ(handles.cards_written->Value(), 4u);
    EXPECT_EQ(servant.Stats().cards_written, 4u);
    EXPECT_THAT(handles.chain->Snapshot(), IsEmpty());
    EXPECT_TRUE(handles.pool->Empty());
}

TEST_F(ServantTest, ThankYouCardsWithPresentsAlreadyOnChain) {
    ServantHandles handles = MakeHandles({2}, 10);
    handles.chain->Insert(7);
    handles.chain->Insert(8);

    ServantOptions options;
    options.thank_you_cards = true;
    Servant servant(0, handles, options);
    servant.Run();

    // Cards are written for whatever is on the chain, not only what this servant added
    EXPECT_EQ(handles.presents_added->Value(), 1u);
    EXPECT_EQ(handles.cards_written->Value(), 3u);
    EXPECT_TRUE(handles.chain->Empty());
}

TEST_F(ServantTest, MembershipQueriesAreCountedAndDoNotMutate) {
    std::vector<Item> items(100);
    std::iota(items.begin(), items.end(), Item{1});
    ServantHandles handles = MakeHandles(items, 100);

    ServantOptions options;
    options.query_every = 10;
    options.query_seed = 5;
    Servant servant(0, handles, options);
    servant.Run();

    // 100 draws plus the final empty draw: iterations 1..101
    EXPECT_EQ(servant.Stats().queries_issued, 10u);
    EXPECT_EQ(handles.queries_issued->Value(), 10u);
    EXPECT_EQ(handles.chain->Size(), 100u);
    EXPECT_EQ(handles.presents_added->Value(), 100u);
}

TEST_F(ServantTest, ManyServantsShareOneBag) {
    constexpr int kServants = 6;
    std::vector<Item> items(5000);
    std::iota(items.begin(), items.end(), Item{1});
    ServantHandles handles = MakeHandles(items, 5000);

    std::vector<std::unique_ptr<Servant>> servants;
    std::vector<std::thread> threads;
    for (int i = 0; i < kServants; ++i) {
        servants.push_back(std::make_unique<Servant>(i, handles));
    }
    for (auto& servant : servants) {
        threads.emplace_back(&Servant::Run, servant.get());
    }
    for (auto& thread : threads) {
        thread.join();
    }

    uint64_t added = 0;
    for (const auto& servant : servants) {
        EXPECT_EQ(servant->GetState(), Servant::State::kFinished);
        added += servant->Stats().presents_added;
    }
    EXPECT_EQ(added, 5000u);
    EXPECT_EQ(handles.presents_added->Value(), 5000u);
    EXPECT_EQ(handles.chain->Size(), 5000u);
}

TEST(ServantStateTest, StateNames) {
    EXPECT_STREQ(StateName(Servant::State::kRunning), "Running");
    EXPECT_STREQ(StateName(Servant::State::kDraining), "Draining");
    EXPECT_STREQ(StateName(Servant::State::kFinished), "Finished");
}
