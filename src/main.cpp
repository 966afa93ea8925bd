//
// main.cpp
//

#include <chrono>
#include <charconv>
#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <exception>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <optional>
#include <print>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "core/AuctionSimulator.hpp"
#include "core/CombatSimulator.hpp"
#include "core/DeadlineProvider.hpp"
#include "core/Exception.hpp"
#include "core/PokerSimulator.hpp"
#include "core/RandomProvider.hpp"
#include "debug/AuditLogger.hpp"
#include "debug/Invariants.hpp"
#include "net/RemoteProvider.hpp"
#include "net/codec.hpp"

namespace
{
    using namespace arena::core;

    struct CliConfig
    {
        std::vector<GameType> games{GameType::Poker, GameType::Auction, GameType::Combat};
        std::uint32_t matches{1};
        double wager{0.01};
        std::uint64_t seed{123456789ULL};
        std::optional<std::uint32_t> turns{};
        std::optional<std::uint32_t> rounds{};
        std::string transcripts{};
        std::string export_dir{};
        std::optional<std::chrono::milliseconds> timeout{};
        bool parallel{false};
        bool wire{false};
        bool verbose{false};
    };

    auto ParseArgs(int argc, char** argv) -> CliConfig
    {
        CliConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string_view arg = argv[i];

            auto next_str = [&](std::string& out)
            {
                if (i + 1 >= argc) { return false; }
                out = argv[++i];
                return true;
            };

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            auto next_double = [&](double& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            if (arg == "--game")
            {
                std::string v;
                if (!next_str(v)) { continue; }
                if (v == "poker") { cfg.games = {GameType::Poker}; }
                else if (v == "auction") { cfg.games = {GameType::Auction}; }
                else if (v == "combat") { cfg.games = {GameType::Combat}; }
            }
            else if (arg == "--matches")
            {
                std::uint64_t v{};
                if (next_uint(v) && v > 0) { cfg.matches = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--wager")
            {
                double v{};
                if (next_double(v)) { cfg.wager = v; }
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--turns")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.turns = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--rounds")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.rounds = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--timeout_ms")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.timeout = std::chrono::milliseconds(v); }
            }
            else if (arg == "--transcripts")
            {
                next_str(cfg.transcripts);
            }
            else if (arg == "--export")
            {
                next_str(cfg.export_dir);
            }
            else if (arg == "--parallel")
            {
                cfg.parallel = true;
            }
            else if (arg == "--wire")
            {
                cfg.wire = true;
            }
            else if (arg == "--verbose")
            {
                cfg.verbose = true;
            }
        }
        return cfg;
    }

    // Seat providers for one match. --wire routes every decision through the FlatBuffers
    // codec over an in-process loopback, --timeout_ms bounds each call.
    auto MakeProviders(CliConfig const& cli, std::uint64_t seed) -> Providers
    {
        Providers out;
        for (std::uint64_t seat = 0; seat < constants::Seats; ++seat)
        {
            std::unique_ptr<DecisionProvider> p = std::make_unique<RandomProvider>(seed + seat * 1337u);

            if (cli.wire)
            {
                std::shared_ptr<DecisionProvider> local = std::move(p);
                p = std::make_unique<arena::net::RemoteProvider>(
                    [local](std::span<std::byte const> bytes)
                    {
                        return arena::net::Serve(*local, bytes);
                    });
            }
            if (cli.timeout)
            {
                p = std::make_unique<DeadlineProvider>(std::shared_ptr<DecisionProvider>{std::move(p)}, *cli.timeout);
            }
            out.push_back(std::move(p));
        }
        return out;
    }

    auto MakeSimulator(CliConfig const& cli, GameType game, std::uint64_t seed) -> std::unique_ptr<Simulator>
    {
        Providers providers = MakeProviders(cli, seed ^ 0x5EEDu);

        switch (game)
        {
        case GameType::Poker:
            return std::make_unique<PokerSimulator>(
                PokerConfig{.seed = seed, .verbose = cli.verbose}, std::move(providers));

        case GameType::Auction:
        {
            AuctionConfig cfg{.seed = seed, .verbose = cli.verbose};
            if (cli.rounds) cfg.rounds = *cli.rounds;
            return std::make_unique<AuctionSimulator>(std::move(cfg), std::move(providers));
        }

        case GameType::Combat:
        {
            CombatConfig cfg{.seed = seed, .verbose = cli.verbose};
            if (cli.turns) cfg.max_turns = *cli.turns;
            return std::make_unique<CombatSimulator>(std::move(cfg), std::move(providers));
        }
        }
        ARN_THROW(error::Code::Config, "Unknown game type");
    }

    struct MatchSlot
    {
        GameType game{};
        std::uint32_t index{};
        std::optional<GameResult> result{};
        std::string failure{};
    };

    auto RunMatch(CliConfig const& cli, MatchSlot& slot) -> void
    {
        std::uint64_t const seed = cli.seed + slot.index * 7919u + static_cast<std::uint64_t>(slot.game);
        try
        {
            std::unique_ptr<Simulator> sim = MakeSimulator(cli, slot.game, seed);
            slot.result = sim->Play(std::format("player_a{}", slot.index), std::format("player_b{}", slot.index),
                                    cli.wager);
        }
        catch (OmegaException<error::Code> const& e)
        {
            slot.failure = std::format("{}", e);
        }
        catch (std::exception const& e)
        {
            slot.failure = e.what();
        }
    }

    auto WriteOutputs(CliConfig const& cli, MatchSlot const& slot) -> void
    {
        GameResult const& r = *slot.result;
        std::string const stem = std::format("{}_{}", ToString(slot.game), slot.index);

        if (!cli.transcripts.empty())
        {
            std::filesystem::create_directories(cli.transcripts);
            debug::AuditLogger log{(std::filesystem::path{cli.transcripts} / (stem + ".log")).string()};
            log.write(r);
        }
        if (!cli.export_dir.empty())
        {
            std::filesystem::create_directories(cli.export_dir);
            auto const path = std::filesystem::path{cli.export_dir} / (stem + ".arna");
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            if (!out)
            {
                ARN_THROW(error::Code::State, std::format("Cannot open export file '{}'", path.string()));
            }
            flatbuffers::DetachedBuffer const buf = arena::net::BuildResult(r);
            out.write(reinterpret_cast<char const*>(buf.data()), static_cast<std::streamsize>(buf.size()));
        }
    }
}

int main(int argc, char** argv)
{
    CliConfig const cli = ParseArgs(argc, argv);

    std::vector<MatchSlot> slots;
    for (GameType const g : cli.games)
    {
        for (std::uint32_t i = 0; i < cli.matches; ++i)
        {
            slots.push_back(MatchSlot{.game = g, .index = i});
        }
    }

    std::print("[arena] {} match(es), wager {:.4f}, seed {}{}\n", slots.size(), cli.wager, cli.seed,
               cli.parallel ? ", parallel" : "");

    if (cli.parallel)
    {
        // one thread per match, matches share nothing
        std::vector<std::thread> workers;
        workers.reserve(slots.size());
        for (MatchSlot& s : slots)
        {
            workers.emplace_back([&cli, &s] { RunMatch(cli, s); });
        }
        for (std::thread& t : workers)
        {
            t.join();
        }
    }
    else
    {
        for (MatchSlot& s : slots)
        {
            RunMatch(cli, s);
        }
    }

    int failures = 0;
    for (MatchSlot const& s : slots)
    {
        if (!s.result)
        {
            ++failures;
            std::print(stderr, "[arena] {} #{} failed: {}\n", ToString(s.game), s.index, s.failure);
            continue;
        }

        std::print("[arena] {}\n", Summarize(*s.result));

        if (cli.verbose)
        {
            if (auto const ok = debug::CheckInvariants(*s.result); !ok)
            {
                ++failures;
                std::print(stderr, "[arena] {} #{} broke an invariant: {}\n", ToString(s.game), s.index, ok.error());
            }
        }

        try
        {
            WriteOutputs(cli, s);
        }
        catch (OmegaException<error::Code> const& e)
        {
            ++failures;
            std::print(stderr, "{}", e);
        }
        catch (std::filesystem::filesystem_error const& e)
        {
            ++failures;
            std::print(stderr, "[arena] {}\n", e.what());
        }
    }

    return failures == 0 ? 0 : 1;
}
