#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <variant>
#include <vector>

#include "../core/BattleResolver.hpp"
#include "../core/BattleStateMachine.hpp"
#include "../core/Messages.hpp"
#include "../core/State.hpp"
#include "../debug/Inspector.hpp"
#include "../debug/Invariants.hpp"
#include "../debug/ManualExecutor.hpp"

using namespace arena::core;
using namespace std::chrono_literals;
using arena::core::debug::ManualExecutor;

namespace
{
    auto MakeCard(CardId id, std::string name, std::int32_t atk, std::int32_t hp) -> CardInfo
    {
        CardInfo c{};
        c.id = id;
        c.name = std::move(name);
        c.attack = atk;
        c.health = hp;
        return c;
    }

    // One side of a session with the other side played by hand.
    struct Harness
    {
        ManualExecutor exec;
        SessionConfig cfg{};
        std::vector<Message> sent;
        std::vector<CardId> images_sent;
        std::size_t resets{};
        BattleStateMachine sm;

        Harness()
            : sm{exec, cfg, BattleHooks{
                [this](Message const& m) { sent.push_back(m); },
                [this](CardInfo const& c) { images_sent.push_back(c.id); },
                [] {},
                [](BattlePhase, BattlePhase) {},
                [this] { ++resets; }
            }}
        {
        }

        auto Connect(bool authoritative) -> void
        {
            ASSERT_TRUE(sm.OnDiscoveryStarted().has_value());
            ASSERT_TRUE(sm.OnConnected(authoritative).has_value());
            ASSERT_EQ(sm.Phase(), BattlePhase::CardSelection);
        }

        // what a well-behaved opponent sends when it readies `card`
        auto OpponentReadies(CardInfo const& card) -> void
        {
            BattleCard const bc = BattleCard::FromCard(card, Side::Local);
            sm.OnMessage(CardPreviewMsg{card.id, card.name, card.rarity, false});
            sm.OnMessage(CardStatsMsg{card.id, card.name, card.rarity, card.attack, card.health,
                                      bc.effective_attack, bc.effective_health});
            sm.OnMessage(ReadyMsg{});
        }

        [[nodiscard]]
        auto Snap() const -> SessionSnapshot
        {
            SessionSnapshot s{};
            s.connection_phase = ConnectionPhase::Connected;
            s.connection = Connection{};
            sm.Fill(s);
            return s;
        }

        template <typename T>
        [[nodiscard]]
        auto Count() const -> std::size_t
        {
            return static_cast<std::size_t>(std::ranges::count_if(sent, [](Message const& m)
            {
                return std::holds_alternative<T>(m);
            }));
        }
    };

    auto const Drake = MakeCard(1, "Ember Drake", 50, 100);
    auto const Golem = MakeCard(2, "Stone Golem", 30, 120);
}

TEST(BattleStateMachine, CommandsOutsideTheirPhaseAreViolations)
{
    Harness h;
    EXPECT_FALSE(h.sm.SelectCard(Drake).has_value());
    EXPECT_FALSE(h.sm.SetReady().has_value());
    EXPECT_FALSE(h.sm.Rematch().has_value());
    EXPECT_FALSE(h.sm.SkipAnimation().has_value());
    EXPECT_TRUE(h.sent.empty());

    h.Connect(true);
    auto r = h.sm.SetReady();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error::StateViolationCode::NoLocalCard);
}

TEST(BattleStateMachine, SelectCardSendsPreviewAndImage)
{
    Harness h;
    h.Connect(true);

    CardInfo withArt = Drake;
    withArt.image_path = "/cards/drake.png";
    ASSERT_TRUE(h.sm.SelectCard(withArt).has_value());
    ASSERT_EQ(h.sent.size(), 1u);
    auto const& prev = std::get<CardPreviewMsg>(h.sent[0]);
    EXPECT_EQ(prev.card_id, 1);
    EXPECT_TRUE(prev.has_image);
    ASSERT_EQ(h.images_sent.size(), 1u);

    // changing your mind before ready is fine
    ASSERT_TRUE(h.sm.SelectCard(Golem).has_value());
    EXPECT_EQ(h.Snap().local_card->card.id, 2);
    EXPECT_EQ(h.images_sent.size(), 1u);
    EXPECT_TRUE(h.Snap().can_click_ready);
}

TEST(BattleStateMachine, SetReadyIsIdempotent)
{
    Harness h;
    h.Connect(true);
    ASSERT_TRUE(h.sm.SelectCard(Drake).has_value());

    ASSERT_TRUE(h.sm.SetReady().has_value());
    ASSERT_EQ(h.sent.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<CardStatsMsg>(h.sent[1]));
    EXPECT_TRUE(std::holds_alternative<ReadyMsg>(h.sent[2]));

    auto again = h.sm.SetReady();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error::StateViolationCode::AlreadyReady);
    EXPECT_EQ(h.sent.size(), 3u);

    // locked in
    EXPECT_FALSE(h.sm.SelectCard(Golem).has_value());

    SessionSnapshot const s = h.Snap();
    EXPECT_TRUE(s.waiting_for_opponent_ready);
    EXPECT_FALSE(s.can_click_ready);
    EXPECT_EQ(s.phase, BattlePhase::CardSelection);
}

TEST(BattleStateMachine, RevealTimelineThenAuthoritativeResolve)
{
    Harness h;
    h.Connect(true);
    ASSERT_TRUE(h.sm.SelectCard(Drake).has_value());
    ASSERT_TRUE(h.sm.SetReady().has_value());
    h.OpponentReadies(Golem);

    ASSERT_EQ(h.sm.Phase(), BattlePhase::RevealSequence);
    EXPECT_EQ(h.Snap().opponent_card->effective_attack, 0);

    h.exec.AdvanceBy(499ms);
    EXPECT_FALSE(h.Snap().reveal_triggered);
    h.exec.AdvanceBy(1ms);
    EXPECT_TRUE(h.Snap().reveal_triggered);
    EXPECT_FALSE(h.Snap().stats_revealed);

    h.exec.AdvanceBy(800ms);
    SessionSnapshot const shown = h.Snap();
    EXPECT_TRUE(shown.stats_revealed);
    EXPECT_EQ(shown.opponent_card->effective_attack, 30);
    EXPECT_EQ(shown.opponent_card->effective_health, 120);
    EXPECT_TRUE(debug::CheckInvariants(shown).empty());

    h.exec.AdvanceBy(2499ms);
    EXPECT_EQ(h.sm.Phase(), BattlePhase::RevealSequence);
    h.exec.AdvanceBy(1ms);
    ASSERT_EQ(h.sm.Phase(), BattlePhase::Resolving);

    Resolution const expect = BattleResolver::Resolve(BattleCard::FromCard(Drake, Side::Local),
                                                      BattleCard::FromCard(Golem, Side::Opponent));
    EXPECT_EQ(h.Count<StorySegmentMsg>(), expect.segments.size());
    EXPECT_EQ(h.Count<BattleOutcomeMsg>(), 1u);
    EXPECT_TRUE(std::holds_alternative<BattleOutcomeMsg>(h.sent.back()));

    // result is held back until the story has played
    EXPECT_FALSE(h.Snap().result.has_value());
    EXPECT_EQ(h.Snap().story.size(), expect.segments.size());

    h.exec.RunUntilIdle();
    SessionSnapshot const done = h.Snap();
    ASSERT_EQ(done.phase, BattlePhase::Complete);
    ASSERT_TRUE(done.result.has_value());
    EXPECT_EQ(*done.result, expect.result);
    EXPECT_EQ(done.story_index, done.story.size() - 1);
    EXPECT_TRUE(debug::CheckInvariants(done).empty());
}

TEST(BattleStateMachine, OpponentReadyFirst)
{
    Harness h;
    h.Connect(true);
    h.OpponentReadies(Golem);
    EXPECT_TRUE(h.sm.OpponentReady());
    EXPECT_EQ(h.sm.Phase(), BattlePhase::CardSelection);

    ASSERT_TRUE(h.sm.SelectCard(Drake).has_value());
    ASSERT_TRUE(h.sm.SetReady().has_value());
    EXPECT_EQ(h.sm.Phase(), BattlePhase::RevealSequence);
}

TEST(BattleStateMachine, OutOfRangeStatsAreDropped)
{
    Harness h;
    h.Connect(true);
    ASSERT_TRUE(h.sm.SelectCard(Drake).has_value());
    ASSERT_TRUE(h.sm.SetReady().has_value());

    h.sm.OnMessage(CardPreviewMsg{Golem.id, Golem.name, Golem.rarity, false});
    h.sm.OnMessage(CardStatsMsg{Golem.id, Golem.name, Golem.rarity, 30, 120, 30,
                                std::numeric_limits<std::int32_t>::min()});
    h.sm.OnMessage(CardStatsMsg{Golem.id, Golem.name, Golem.rarity, -5, 120, -5, 120});
    h.sm.OnMessage(CardStatsMsg{Golem.id, Golem.name, Golem.rarity, 2'000'000'000, 120,
                                std::numeric_limits<std::int32_t>::max(), 120});
    h.sm.OnMessage(ReadyMsg{});

    auto const in = debug::Inspector::Gather(h.sm);
    EXPECT_FALSE(in.opponent_stats_known);
    ASSERT_TRUE(in.opponent_card.has_value());
    EXPECT_EQ(in.opponent_card->effective_health, 0);
    // both ready, but no reveal without usable stats
    EXPECT_EQ(h.sm.Phase(), BattlePhase::AwaitingBothReady);
    EXPECT_FALSE(in.reveal_timer_armed);

    h.sm.OnMessage(CardStatsMsg{Golem.id, Golem.name, Golem.rarity, 30, 120, 30, 120});
    EXPECT_TRUE(debug::Inspector::Gather(h.sm).opponent_stats_known);
    EXPECT_EQ(h.sm.Phase(), BattlePhase::RevealSequence);
}

TEST(BattleStateMachine, RematchDuringRevealDropsStaleSteps)
{
    Harness h;
    h.Connect(true);
    ASSERT_TRUE(h.sm.SelectCard(Drake).has_value());
    ASSERT_TRUE(h.sm.SetReady().has_value());
    h.OpponentReadies(Golem);
    h.exec.AdvanceBy(600ms);
    ASSERT_TRUE(h.Snap().reveal_triggered);

    std::uint64_t const gen = h.sm.Generation();
    h.sm.OnMessage(RematchMsg{});
    EXPECT_EQ(h.sm.Phase(), BattlePhase::CardSelection);
    EXPECT_GT(h.sm.Generation(), gen);
    EXPECT_EQ(h.resets, 2u);

    h.exec.AdvanceBy(10s);
    SessionSnapshot const s = h.Snap();
    EXPECT_EQ(s.phase, BattlePhase::CardSelection);
    EXPECT_FALSE(s.reveal_triggered);
    EXPECT_FALSE(s.stats_revealed);
    EXPECT_FALSE(s.local_card.has_value());
    EXPECT_EQ(h.Count<StorySegmentMsg>(), 0u);
}

TEST(BattleStateMachine, DisconnectCancelsReveal)
{
    Harness h;
    h.Connect(true);
    ASSERT_TRUE(h.sm.SelectCard(Drake).has_value());
    ASSERT_TRUE(h.sm.SetReady().has_value());
    h.OpponentReadies(Golem);

    h.sm.OnConnectionLost();
    EXPECT_EQ(h.sm.Phase(), BattlePhase::Disconnected);
    EXPECT_EQ(h.exec.PendingTimers(), 0u);

    h.exec.RunUntilIdle();
    EXPECT_EQ(h.sm.Phase(), BattlePhase::Disconnected);
    EXPECT_FALSE(h.Snap().reveal_triggered);
}

TEST(BattleStateMachine, DisconnectedIgnoresCommandsAndMessages)
{
    Harness h;
    h.Connect(false);
    h.sm.OnConnectionLost();
    ASSERT_EQ(h.sm.Phase(), BattlePhase::Disconnected);

    EXPECT_FALSE(h.sm.SelectCard(Drake).has_value());
    h.sm.OnMessage(ReadyMsg{});
    EXPECT_FALSE(h.sm.OpponentReady());
    EXPECT_TRUE(h.sent.empty());
    EXPECT_EQ(h.Snap().activity.front(), "Opponent disconnected");

    // a new discovery starts a fresh session
    ASSERT_TRUE(h.sm.OnDiscoveryStarted().has_value());
    EXPECT_EQ(h.sm.Phase(), BattlePhase::WaitingForOpponent);
}

TEST(BattleStateMachine, SelectCardWhileResolvingIsIgnored)
{
    Harness h;
    h.Connect(true);
    ASSERT_TRUE(h.sm.SelectCard(Drake).has_value());
    ASSERT_TRUE(h.sm.SetReady().has_value());
    h.OpponentReadies(Golem);
    h.exec.AdvanceBy(3800ms);
    ASSERT_EQ(h.sm.Phase(), BattlePhase::Resolving);

    std::size_t const before = h.sent.size();
    auto r = h.sm.SelectCard(Golem);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error::StateViolationCode::WrongPhase);
    EXPECT_EQ(h.sent.size(), before);
    EXPECT_EQ(h.Snap().local_card->card.id, 1);
}

TEST(BattleStateMachine, SkipJumpsToComplete)
{
    Harness h;
    h.Connect(true);
    ASSERT_TRUE(h.sm.SelectCard(Drake).has_value());
    ASSERT_TRUE(h.sm.SetReady().has_value());
    h.OpponentReadies(Golem);
    h.exec.AdvanceBy(3800ms);
    ASSERT_EQ(h.sm.Phase(), BattlePhase::Resolving);

    ASSERT_TRUE(h.sm.SkipAnimation().has_value());
    SessionSnapshot const s = h.Snap();
    EXPECT_EQ(s.phase, BattlePhase::Complete);
    EXPECT_EQ(s.story_index, s.story.size() - 1);
    ASSERT_TRUE(s.result.has_value());
    EXPECT_EQ(s.result->winner, Winner::Local);
    EXPECT_EQ(h.exec.PendingTimers(), 0u);

    EXPECT_FALSE(h.sm.SkipAnimation().has_value());
}

TEST(BattleStateMachine, FollowerAdoptsFlippedStory)
{
    Harness h;
    h.Connect(false);
    ASSERT_TRUE(h.sm.SelectCard(Golem).has_value());
    ASSERT_TRUE(h.sm.SetReady().has_value());
    h.OpponentReadies(Drake);
    h.exec.AdvanceBy(3800ms);
    ASSERT_EQ(h.sm.Phase(), BattlePhase::Resolving);
    EXPECT_TRUE(h.Snap().story.empty());

    // the other side resolves from its own point of view
    Resolution const theirs = BattleResolver::Resolve(BattleCard::FromCard(Drake, Side::Local),
                                                      BattleCard::FromCard(Golem, Side::Opponent));
    auto const total = static_cast<std::uint32_t>(theirs.segments.size());

    // delivered out of order; nothing shows until every piece is in
    for (std::uint32_t i = total; i-- > 0;)
    {
        StorySegment const& s = theirs.segments[i];
        h.sm.OnMessage(StorySegmentMsg{i, total, s.actor, s.text, s.damage});
    }
    EXPECT_TRUE(h.Snap().story.empty());

    h.sm.OnMessage(BattleOutcomeMsg{theirs.result.winner, theirs.result.local_final_health,
                                    theirs.result.opponent_final_health, theirs.result.rounds});

    SessionSnapshot const playing = h.Snap();
    ASSERT_EQ(playing.story.size(), theirs.segments.size());
    for (std::size_t i = 0; i < playing.story.size(); ++i)
    {
        EXPECT_EQ(playing.story[i], FlipPerspective(theirs.segments[i])) << "segment " << i;
    }

    h.exec.RunUntilIdle();
    SessionSnapshot const done = h.Snap();
    ASSERT_EQ(done.phase, BattlePhase::Complete);
    ASSERT_TRUE(done.result.has_value());
    EXPECT_EQ(done.result->winner, Winner::Opponent);
    EXPECT_EQ(done.result->local_final_health, theirs.result.opponent_final_health);
    EXPECT_EQ(done.result->transfer.kind, TransferKind::OpponentAcquires);
    EXPECT_EQ(done.result->transfer.local_card, Golem.id);
    EXPECT_EQ(done.result->transfer.opponent_card, Drake.id);
    EXPECT_EQ(h.Count<StorySegmentMsg>(), 0u);
}

TEST(BattleStateMachine, RematchFromComplete)
{
    Harness h;
    h.Connect(true);
    ASSERT_TRUE(h.sm.SelectCard(Drake).has_value());
    ASSERT_TRUE(h.sm.SetReady().has_value());
    h.OpponentReadies(Golem);
    h.exec.RunUntilIdle();
    ASSERT_EQ(h.sm.Phase(), BattlePhase::Complete);
    std::string const old_session = h.sm.SessionId();

    ASSERT_TRUE(h.sm.Rematch().has_value());
    EXPECT_TRUE(std::holds_alternative<RematchMsg>(h.sent.back()));
    EXPECT_EQ(h.sm.Phase(), BattlePhase::CardSelection);
    EXPECT_NE(h.sm.SessionId(), old_session);
    EXPECT_TRUE(h.sm.IsAuthoritative());

    SessionSnapshot const s = h.Snap();
    EXPECT_FALSE(s.local_card.has_value());
    EXPECT_FALSE(s.opponent_card.has_value());
    EXPECT_FALSE(s.result.has_value());
    EXPECT_TRUE(s.story.empty());

    // opponent's rematch arriving after ours changes nothing
    std::uint64_t const gen = h.sm.Generation();
    h.sm.OnMessage(RematchMsg{});
    EXPECT_EQ(h.sm.Generation(), gen);
}

TEST(BattleStateMachine, ActivityFeedIsCapped)
{
    Harness h;
    h.Connect(true);
    for (int i = 0; i < 50; ++i)
    {
        h.sm.AddActivity(std::to_string(i));
    }
    SessionSnapshot const s = h.Snap();
    ASSERT_EQ(s.activity.size(), constants::MaxActivityMessages);
    EXPECT_EQ(s.activity.front(), "49");
    EXPECT_EQ(s.activity.back(), "30");
}

TEST(BattleStateMachine, OpponentImageFollowsTheCard)
{
    Harness h;
    h.Connect(true);

    // art can beat the preview
    h.sm.OnOpponentImageReady(Golem.id, "/img/card_2_golem.png");
    h.sm.OnMessage(CardPreviewMsg{Golem.id, Golem.name, Golem.rarity, true});

    SessionSnapshot const s = h.Snap();
    ASSERT_TRUE(s.opponent_card.has_value());
    ASSERT_TRUE(s.opponent_card->image.has_value());
    EXPECT_EQ(*s.opponent_card->image, std::filesystem::path("/img/card_2_golem.png"));

    debug::Inspector::BattleInternals const in = debug::Inspector::Gather(h.sm);
    EXPECT_EQ(in.opponent_images, 1u);
    EXPECT_FALSE(in.opponent_stats_known);
}
