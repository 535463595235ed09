//
// ArenaPeerMain.cpp: headless peer: discovers, connects, plays a card, prints the battle
//

#include <charconv>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <exception>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

#include "core/BattleManager.hpp"
#include "core/Exception.hpp"
#include "core/Executor.hpp"
#include "core/Log.hpp"
#include "core/State.hpp"
#include "core/Types.hpp"
#include "net/WsTransport.hpp"

namespace
{
    using namespace arena::core;

    struct CmdLine
    {
        std::string name{};
        std::string id{};
        std::uint16_t port{9002};
        std::vector<arena::net::RosterEntry> peers;
        std::optional<CardInfo> card;
        std::filesystem::path image_dir{"arena_images"};
        std::filesystem::path inbox{"arena_inbox"};
        std::optional<std::string> connect_to;
        std::uint32_t rematches{0};
        bool skip{false};
        log::Level log_level{log::Level::Info};
        std::optional<std::filesystem::path> audit;
        std::chrono::seconds timeout{std::chrono::seconds(120)};
    };

    auto ParseLevel(std::string_view s) -> std::optional<log::Level>
    {
        for (log::Level l : {log::Level::Trace, log::Level::Debug, log::Level::Info,
                             log::Level::Warn, log::Level::Error, log::Level::Off})
        {
            if (log::ToString(l) == s)
            {
                return l;
            }
        }
        return std::nullopt;
    }

    auto ParseRarity(std::string_view s) -> std::optional<Rarity>
    {
        for (Rarity r : {Rarity::Common, Rarity::Rare, Rarity::Epic, Rarity::Legendary})
        {
            if (ToString(r) == s)
            {
                return r;
            }
        }
        return std::nullopt;
    }

    auto ParseInt(std::string_view s, std::int64_t& out) -> bool
    {
        auto res = std::from_chars(s.data(), s.data() + s.size(), out);
        return res.ec == std::errc{} && res.ptr == s.data() + s.size();
    }

    auto Split(std::string_view s, char sep) -> std::vector<std::string_view>
    {
        std::vector<std::string_view> parts;
        std::size_t start = 0;
        while (true)
        {
            std::size_t const at = s.find(sep, start);
            if (at == std::string_view::npos)
            {
                parts.push_back(s.substr(start));
                return parts;
            }
            parts.push_back(s.substr(start, at - start));
            start = at + 1;
        }
    }

    // id:name:attack:health:rarity[:image]
    auto ParseCard(std::string_view text) -> std::optional<CardInfo>
    {
        std::vector<std::string_view> parts = Split(text, ':');
        if (parts.size() < 5 || parts.size() > 6)
        {
            return std::nullopt;
        }
        CardInfo card{};
        std::int64_t id{}, atk{}, hp{};
        if (!ParseInt(parts[0], id) || !ParseInt(parts[2], atk) || !ParseInt(parts[3], hp))
        {
            return std::nullopt;
        }
        std::optional<Rarity> rarity = ParseRarity(parts[4]);
        if (!rarity || atk < 0 || hp <= 0)
        {
            return std::nullopt;
        }
        card.id = id;
        card.name = std::string(parts[1]);
        card.attack = static_cast<std::int32_t>(atk);
        card.health = static_cast<std::int32_t>(hp);
        card.rarity = *rarity;
        if (parts.size() == 6 && !parts[5].empty())
        {
            card.image_path = std::filesystem::path(std::string(parts[5]));
        }
        return card;
    }

    // id@ws://host:port
    auto ParsePeer(std::string_view text) -> std::optional<arena::net::RosterEntry>
    {
        std::size_t const at = text.find('@');
        if (at == std::string_view::npos || at == 0 || at + 1 >= text.size())
        {
            return std::nullopt;
        }
        arena::net::RosterEntry e{};
        e.id = std::string(text.substr(0, at));
        e.name = e.id;
        e.url = std::string(text.substr(at + 1));
        return e;
    }

    auto Usage() -> void
    {
        std::print("usage: arena_peer --card id:name:atk:hp:rarity[:image] [--name N] [--id ID] [--port P]\n"
                   "                  [--peer id@ws://host:port]... [--connect ID] [--rematches K] [--skip]\n"
                   "                  [--image-dir D] [--inbox D] [--log-level L] [--audit FILE] [--timeout S]\n");
    }

    auto ParseArgs(int argc, char** argv) -> std::optional<CmdLine>
    {
        CmdLine c{};
        for (int i = 1; i < argc; ++i)
        {
            std::string key = argv[i];
            auto next = [&]() -> std::optional<std::string_view>
            {
                if (i + 1 >= argc)
                {
                    std::print("[Peer] {} needs a value\n", key);
                    return std::nullopt;
                }
                return std::string_view(argv[++i]);
            };

            std::optional<std::string_view> v;
            std::int64_t n{};

            if (key == "--name") { if (!(v = next())) { return std::nullopt; } c.name = std::string(*v); }
            else if (key == "--id") { if (!(v = next())) { return std::nullopt; } c.id = std::string(*v); }
            else if (key == "--port")
            {
                if (!(v = next()) || !ParseInt(*v, n) || n <= 0 || n > 65535) { return std::nullopt; }
                c.port = static_cast<std::uint16_t>(n);
            }
            else if (key == "--peer")
            {
                std::optional<arena::net::RosterEntry> e;
                if (!(v = next()) || !(e = ParsePeer(*v))) { return std::nullopt; }
                c.peers.push_back(std::move(*e));
            }
            else if (key == "--card")
            {
                if (!(v = next()) || !(c.card = ParseCard(*v)))
                {
                    std::print("[Peer] bad card description\n");
                    return std::nullopt;
                }
            }
            else if (key == "--image-dir") { if (!(v = next())) { return std::nullopt; } c.image_dir = std::string(*v); }
            else if (key == "--inbox") { if (!(v = next())) { return std::nullopt; } c.inbox = std::string(*v); }
            else if (key == "--connect") { if (!(v = next())) { return std::nullopt; } c.connect_to = std::string(*v); }
            else if (key == "--rematches")
            {
                if (!(v = next()) || !ParseInt(*v, n) || n < 0) { return std::nullopt; }
                c.rematches = static_cast<std::uint32_t>(n);
            }
            else if (key == "--timeout")
            {
                if (!(v = next()) || !ParseInt(*v, n) || n <= 0) { return std::nullopt; }
                c.timeout = std::chrono::seconds(n);
            }
            else if (key == "--skip") { c.skip = true; }
            else if (key == "--log-level")
            {
                std::optional<log::Level> l;
                if (!(v = next()) || !(l = ParseLevel(*v))) { return std::nullopt; }
                c.log_level = *l;
            }
            else if (key == "--audit") { if (!(v = next())) { return std::nullopt; } c.audit = std::string(*v); }
            else
            {
                std::print("[Peer] unknown option {}\n", key);
                return std::nullopt;
            }
        }
        if (!c.card)
        {
            return std::nullopt;
        }
        if (c.id.empty())
        {
            c.id = c.name.empty() ? std::format("peer-{}", c.port) : c.name;
        }
        return c;
    }

    // Latest published snapshot, for the main thread to wait on.
    class SnapshotWaiter
    {
    public:
        auto Push(SnapshotPtr const& s) -> void
        {
            std::lock_guard<std::mutex> lock(m_);
            latest_ = s;
            cv_.notify_all();
        }

        auto WaitFor(std::function<bool(SessionSnapshot const&)> const& pred,
                     std::chrono::steady_clock::time_point deadline) -> SnapshotPtr
        {
            std::unique_lock<std::mutex> lock(m_);
            cv_.wait_until(lock, deadline, [&]()
            {
                return latest_ && (pred(*latest_) || latest_->phase == BattlePhase::Disconnected);
            });
            return latest_;
        }

    private:
        std::mutex m_;
        std::condition_variable cv_;
        SnapshotPtr latest_;
    };

    auto PrintBattle(SessionSnapshot const& s) -> void
    {
        for (StorySegment const& seg : s.story)
        {
            if (seg.damage)
            {
                std::print("[Battle] {} (-{})\n", seg.text, *seg.damage);
            }
            else
            {
                std::print("[Battle] {}\n", seg.text);
            }
        }
        if (s.result)
        {
            std::print("[Battle] Result: {} | hp {}/{} | {} strike(s)\n",
                       ToString(s.result->winner), s.result->local_final_health,
                       s.result->opponent_final_health, s.result->rounds.size());
        }
    }

    auto Run(CmdLine const& cli) -> int
    {
        SessionConfig cfg{};
        cfg.local_name = cli.name;
        cfg.image_dir = cli.image_dir;
        cfg.log_level = cli.log_level;
        cfg.audit_path = cli.audit;

        arena::net::WsOptions wopts{};
        wopts.local_id = cli.id;
        wopts.port = cli.port;
        wopts.roster = cli.peers;
        wopts.inbox = cli.inbox;

        std::print("[Peer] {} ({}) on port {} | {} known peer(s)\n",
                   cli.name.empty() ? "<auto>" : cli.name, cli.id, cli.port, cli.peers.size());

        ThreadExecutor exec;
        arena::net::WsTransport transport(wopts);
        BattleManager mgr(transport, exec, cfg);

        SnapshotWaiter waiter;
        std::uint64_t const token = mgr.Subscribe([&waiter](SnapshotPtr const& s) { waiter.Push(s); });

        auto const deadline = std::chrono::steady_clock::now() + cli.timeout;
        int rc = 0;

        auto finish = [&](int code)
        {
            mgr.Unsubscribe(token);
            mgr.StopAll();
            return code;
        };

        mgr.StartAutoDiscovery(cli.name);

        if (cli.connect_to)
        {
            SnapshotPtr s = waiter.WaitFor([&](SessionSnapshot const& snap)
            {
                for (PeerEndpoint const& ep : snap.endpoints)
                {
                    if (ep.id == *cli.connect_to)
                    {
                        return true;
                    }
                }
                return snap.connection.has_value();
            }, deadline);
            if (!s || (!s->connection && s->endpoints.empty()))
            {
                std::print("[Peer] {} never appeared\n", *cli.connect_to);
                return finish(4);
            }
            if (!s->connection)
            {
                mgr.ConnectToEndpoint(*cli.connect_to);
            }
        }

        for (std::uint32_t round = 0; round <= cli.rematches; ++round)
        {
            SnapshotPtr s = waiter.WaitFor([](SessionSnapshot const& snap)
            {
                return snap.phase == BattlePhase::CardSelection;
            }, deadline);
            if (!s || s->phase != BattlePhase::CardSelection)
            {
                std::print("[Peer] no opponent ({})\n", s ? ToString(s->phase) : "timeout");
                rc = s && s->phase == BattlePhase::Disconnected ? 3 : 4;
                break;
            }
            if (round == 0)
            {
                std::print("[Peer] Connected to {}{}\n", s->connection->peer_name,
                           s->connection->authoritative ? " (resolving side)" : "");
            }

            mgr.SelectCard(*cli.card);
            mgr.SetReady();

            if (cli.skip)
            {
                s = waiter.WaitFor([](SessionSnapshot const& snap)
                {
                    return snap.phase == BattlePhase::Resolving && !snap.story.empty();
                }, deadline);
                mgr.SkipAnimation();
            }

            s = waiter.WaitFor([](SessionSnapshot const& snap)
            {
                return snap.phase == BattlePhase::Complete;
            }, deadline);
            if (!s || s->phase != BattlePhase::Complete)
            {
                std::print("[Peer] battle did not complete ({})\n", s ? ToString(s->phase) : "timeout");
                rc = s && s->phase == BattlePhase::Disconnected ? 3 : 4;
                break;
            }

            PrintBattle(*s);

            if (round < cli.rematches)
            {
                mgr.Rematch();
            }
        }

        return finish(rc);
    }
} // anon

int main(int argc, char** argv)
{
    std::optional<CmdLine> parsed = ParseArgs(argc, argv);
    if (!parsed)
    {
        Usage();
        return 1;
    }
    log::SetLevel(parsed->log_level);

    try
    {
        return Run(*parsed);
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print(stderr, "[Peer] fatal: {}\n", e);
    }
    catch (std::exception const& e)
    {
        std::print(stderr, "[Peer] fatal: {}\n", e.what());
    }
    return 2;
}
