//
// codec.cpp
//
#include "codec.hpp"

#include <format>
#include <utility>
#include <vector>

#include "core/Exception.hpp"

namespace fb = arena::gen::net;
using flatbuffers::FlatBufferBuilder;
using flatbuffers::Offset;

namespace arena::net
{
    auto ToFbSuit(core::Suit s) noexcept -> fb::Suit
    {
        switch (s)
        {
        case core::Suit::Hearts: return fb::Suit::Hearts;
        case core::Suit::Diamonds: return fb::Suit::Diamonds;
        case core::Suit::Clubs: return fb::Suit::Clubs;
        case core::Suit::Spades: return fb::Suit::Spades;
        }
        return fb::Suit::Hearts;
    }

    auto FromFbSuit(fb::Suit s) noexcept -> core::Suit
    {
        switch (s)
        {
        case fb::Suit::Hearts: return core::Suit::Hearts;
        case fb::Suit::Diamonds: return core::Suit::Diamonds;
        case fb::Suit::Clubs: return core::Suit::Clubs;
        case fb::Suit::Spades: return core::Suit::Spades;
        }
        return core::Suit::Hearts;
    }

    auto ToFbStreet(core::Street s) noexcept -> fb::Street
    {
        switch (s)
        {
        case core::Street::PreFlop: return fb::Street::PreFlop;
        case core::Street::Flop: return fb::Street::Flop;
        case core::Street::Turn: return fb::Street::Turn;
        case core::Street::River: return fb::Street::River;
        }
        return fb::Street::PreFlop;
    }

    auto FromFbStreet(fb::Street s) noexcept -> core::Street
    {
        switch (s)
        {
        case fb::Street::PreFlop: return core::Street::PreFlop;
        case fb::Street::Flop: return core::Street::Flop;
        case fb::Street::Turn: return core::Street::Turn;
        case fb::Street::River: return core::Street::River;
        }
        return core::Street::PreFlop;
    }
}

namespace
{
    // Enum layouts must match the schema
    static_assert((int)arena::core::Suit::Hearts == (int)fb::Suit::Hearts);
    static_assert((int)arena::core::Street::River == (int)fb::Street::River);
    static_assert((int)arena::core::Position::BigBlind == (int)fb::Position::BigBlind);
    static_assert((int)arena::core::Seat::B == (int)fb::Seat::B);
    static_assert((int)arena::core::PokerAction::Raise == (int)fb::PokerAction::Raise);
    static_assert((int)arena::core::GameType::Combat == (int)fb::GameType::Combat);

    using arena::net::ParseError;

    template <class T>
    using Expected = std::expected<T, ParseError>;

    auto Str(flatbuffers::String const* s) -> std::string
    {
        return s ? s->str() : std::string{};
    }

    template <class Range>
    auto Strings(FlatBufferBuilder& fbb, Range const& r)
    {
        std::vector<std::string> v(r.begin(), r.end());
        return fbb.CreateVectorOfStrings(v);
    }

    auto CardsVec(FlatBufferBuilder& fbb, std::vector<arena::core::Card> const& cs)
    {
        std::vector<fb::Card> v;
        v.reserve(cs.size());
        for (arena::core::Card const& c : cs)
        {
            v.emplace_back(static_cast<uint8_t>(c.rank), arena::net::ToFbSuit(c.suit));
        }
        return fbb.CreateVectorOfStructs(v);
    }

    auto ReadCards(flatbuffers::Vector<fb::Card const*> const* v) -> Expected<std::vector<arena::core::Card>>
    {
        std::vector<arena::core::Card> out;
        if (!v) return out;
        out.reserve(v->size());
        for (fb::Card const* c : *v)
        {
            if (c->rank() < 2 || c->rank() > 14)
                return std::unexpected(ParseError{std::format("card rank {} out of range", c->rank())});
            if (static_cast<uint8_t>(c->suit()) > static_cast<uint8_t>(fb::Suit::Spades))
                return std::unexpected(ParseError{"card suit out of range"});
            out.push_back(arena::core::Card{static_cast<arena::core::Rank>(c->rank()), arena::net::FromFbSuit(c->suit())});
        }
        return out;
    }

    // ---------- requests ----------

    auto WriteRequest(FlatBufferBuilder& fbb, arena::core::DecisionRequest const& req)
        -> std::pair<fb::Request, Offset<void>>
    {
        using namespace arena::core;
        return std::visit(
            [&]<typename T0>(T0 const& r) -> std::pair<fb::Request, Offset<void>>
            {
                using T = std::decay_t<T0>;

                if constexpr (std::is_same_v<T, PokerRequest>)
                {
                    auto const player = fbb.CreateString(r.player);
                    auto const hole = CardsVec(fbb, r.hole_cards);
                    auto const board = CardsVec(fbb, r.community);
                    auto const opp = fbb.CreateString(r.opponent_context);
                    auto const bank = fbb.CreateString(r.bankroll_context);

                    fb::PokerRequestBuilder b(fbb);
                    b.add_player(player);
                    b.add_hole_cards(hole);
                    b.add_community(board);
                    b.add_pot(r.pot);
                    b.add_stack(r.stack);
                    b.add_opponent_stack(r.opponent_stack);
                    b.add_position(static_cast<fb::Position>(r.position));
                    b.add_to_call(r.to_call);
                    b.add_street(arena::net::ToFbStreet(r.street));
                    b.add_opponent_context(opp);
                    b.add_bankroll_context(bank);
                    return {fb::Request::PokerRequest, b.Finish().Union()};
                }
                else if constexpr (std::is_same_v<T, BidRequest>)
                {
                    std::vector<Offset<fb::BidHistoryEntry>> hist;
                    hist.reserve(r.history.size());
                    for (BidHistoryEntry const& h : r.history)
                    {
                        auto const item = fbb.CreateString(h.item);
                        fb::BidHistoryEntryBuilder hb(fbb);
                        hb.add_round(static_cast<uint32_t>(h.round));
                        hb.add_item(item);
                        hb.add_your_bid(h.your_bid);
                        hb.add_winning_bid(h.winning_bid);
                        hb.add_won(h.won);
                        hist.push_back(hb.Finish());
                    }
                    auto const history = fbb.CreateVector(hist);
                    auto const player = fbb.CreateString(r.player);
                    auto const item = fbb.CreateString(r.item);
                    auto const opp = fbb.CreateString(r.opponent_context);
                    auto const bank = fbb.CreateString(r.bankroll_context);

                    fb::BidRequestBuilder b(fbb);
                    b.add_player(player);
                    b.add_item(item);
                    b.add_estimated_value(r.estimated_value);
                    b.add_min_value(r.min_value);
                    b.add_max_value(r.max_value);
                    b.add_budget(r.budget);
                    b.add_bidders(static_cast<uint32_t>(r.bidders));
                    b.add_round(static_cast<uint32_t>(r.round));
                    b.add_total_rounds(static_cast<uint32_t>(r.total_rounds));
                    b.add_history(history);
                    b.add_opponent_context(opp);
                    b.add_bankroll_context(bank);
                    return {fb::Request::BidRequest, b.Finish().Union()};
                }
                else
                {
                    std::vector<Offset<fb::AbilityOption>> opts;
                    opts.reserve(r.available.size());
                    for (AbilityOption const& o : r.available)
                    {
                        auto const name = fbb.CreateString(o.name);
                        auto const desc = fbb.CreateString(o.description);
                        fb::AbilityOptionBuilder ob(fbb);
                        ob.add_name(name);
                        ob.add_description(desc);
                        ob.add_cost(o.cost);
                        opts.push_back(ob.Finish());
                    }
                    auto const available = fbb.CreateVector(opts);
                    auto const player = fbb.CreateString(r.player);
                    auto const self = fbb.CreateString(r.fighter_status);
                    auto const opp_status = fbb.CreateString(r.opponent_status);
                    auto const opp = fbb.CreateString(r.opponent_context);

                    fb::AbilityRequestBuilder b(fbb);
                    b.add_player(player);
                    b.add_fighter_status(self);
                    b.add_opponent_status(opp_status);
                    b.add_available(available);
                    b.add_turn(static_cast<uint32_t>(r.turn));
                    b.add_max_turns(static_cast<uint32_t>(r.max_turns));
                    b.add_opponent_context(opp);
                    return {fb::Request::AbilityRequest, b.Finish().Union()};
                }
            },
            req
        );
    }

    // Parent is any table carrying a `request:Request` union
    template <class Parent>
    auto ReadRequest(Parent const* p) -> Expected<arena::core::DecisionRequest>
    {
        using namespace arena::core;

        switch (p->request_type())
        {
        case fb::Request::PokerRequest:
        {
            auto const* r = p->request_as_PokerRequest();
            auto hole = ReadCards(r->hole_cards());
            if (!hole) return std::unexpected(hole.error());
            auto board = ReadCards(r->community());
            if (!board) return std::unexpected(board.error());
            if (static_cast<uint8_t>(r->position()) > static_cast<uint8_t>(fb::Position::BigBlind))
                return std::unexpected(ParseError{"position out of range"});
            if (static_cast<uint8_t>(r->street()) > static_cast<uint8_t>(fb::Street::River))
                return std::unexpected(ParseError{"street out of range"});

            PokerRequest out{
                .player = Str(r->player()),
                .hole_cards = std::move(*hole),
                .community = std::move(*board),
                .pot = r->pot(),
                .stack = r->stack(),
                .opponent_stack = r->opponent_stack(),
                .position = static_cast<Position>(r->position()),
                .to_call = r->to_call(),
                .street = arena::net::FromFbStreet(r->street()),
                .opponent_context = Str(r->opponent_context()),
                .bankroll_context = Str(r->bankroll_context())
            };
            return out;
        }

        case fb::Request::BidRequest:
        {
            auto const* r = p->request_as_BidRequest();
            BidRequest out{
                .player = Str(r->player()),
                .item = Str(r->item()),
                .estimated_value = r->estimated_value(),
                .min_value = r->min_value(),
                .max_value = r->max_value(),
                .budget = r->budget(),
                .bidders = r->bidders(),
                .round = r->round(),
                .total_rounds = r->total_rounds(),
                .history = {},
                .opponent_context = Str(r->opponent_context()),
                .bankroll_context = Str(r->bankroll_context())
            };
            if (auto const* v = r->history())
            {
                out.history.reserve(v->size());
                for (auto const* h : *v)
                {
                    out.history.push_back(BidHistoryEntry{h->round(), Str(h->item()), h->your_bid(), h->winning_bid(), h->won()});
                }
            }
            return out;
        }

        case fb::Request::AbilityRequest:
        {
            auto const* r = p->request_as_AbilityRequest();
            AbilityRequest out{
                .player = Str(r->player()),
                .fighter_status = Str(r->fighter_status()),
                .opponent_status = Str(r->opponent_status()),
                .available = {},
                .turn = r->turn(),
                .max_turns = r->max_turns(),
                .opponent_context = Str(r->opponent_context())
            };
            if (auto const* v = r->available())
            {
                out.available.reserve(v->size());
                for (auto const* o : *v)
                {
                    out.available.push_back(AbilityOption{Str(o->name()), Str(o->description()), o->cost()});
                }
            }
            if (out.available.empty())
                return std::unexpected(ParseError{"ability request without options"});
            return out;
        }

        default:
            return std::unexpected(ParseError{"unknown request variant"});
        }
    }

    // ---------- replies ----------

    auto WriteReply(FlatBufferBuilder& fbb, arena::core::DecisionReply const& reply)
        -> std::pair<fb::Reply, Offset<void>>
    {
        using namespace arena::core;
        return std::visit(
            [&]<typename T0>(T0 const& r) -> std::pair<fb::Reply, Offset<void>>
            {
                using T = std::decay_t<T0>;
                auto const reasoning = fbb.CreateString(r.reasoning);

                if constexpr (std::is_same_v<T, PokerReply>)
                {
                    Offset<flatbuffers::String> action{};
                    if (r.action) action = fbb.CreateString(*r.action);

                    fb::PokerReplyBuilder b(fbb);
                    b.add_action(action);
                    if (r.raise_amount) b.add_raise_amount(*r.raise_amount);
                    if (r.confidence) b.add_confidence(*r.confidence);
                    if (r.bluff_probability) b.add_bluff_probability(*r.bluff_probability);
                    if (r.estimated_win_prob) b.add_estimated_win_prob(*r.estimated_win_prob);
                    b.add_reasoning(reasoning);
                    return {fb::Reply::PokerReply, b.Finish().Union()};
                }
                else if constexpr (std::is_same_v<T, BidReply>)
                {
                    Offset<flatbuffers::String> strategy{};
                    if (r.strategy) strategy = fbb.CreateString(*r.strategy);

                    fb::BidReplyBuilder b(fbb);
                    if (r.bid_amount) b.add_bid_amount(*r.bid_amount);
                    if (r.confidence) b.add_confidence(*r.confidence);
                    b.add_strategy(strategy);
                    b.add_reasoning(reasoning);
                    return {fb::Reply::BidReply, b.Finish().Union()};
                }
                else
                {
                    Offset<flatbuffers::String> ability{};
                    if (r.ability) ability = fbb.CreateString(*r.ability);

                    fb::AbilityReplyBuilder b(fbb);
                    b.add_ability(ability);
                    if (r.confidence) b.add_confidence(*r.confidence);
                    b.add_reasoning(reasoning);
                    return {fb::Reply::AbilityReply, b.Finish().Union()};
                }
            },
            reply
        );
    }

    template <class Parent>
    auto ReadReply(Parent const* p) -> Expected<arena::core::DecisionReply>
    {
        using namespace arena::core;

        switch (p->reply_type())
        {
        case fb::Reply::PokerReply:
        {
            auto const* r = p->reply_as_PokerReply();
            PokerReply out{};
            if (r->action()) out.action = r->action()->str();
            if (auto const v = r->raise_amount(); v.has_value()) out.raise_amount = v.value();
            if (auto const v = r->confidence(); v.has_value()) out.confidence = v.value();
            if (auto const v = r->bluff_probability(); v.has_value()) out.bluff_probability = v.value();
            if (auto const v = r->estimated_win_prob(); v.has_value()) out.estimated_win_prob = v.value();
            out.reasoning = Str(r->reasoning());
            return out;
        }

        case fb::Reply::BidReply:
        {
            auto const* r = p->reply_as_BidReply();
            BidReply out{};
            if (auto const v = r->bid_amount(); v.has_value()) out.bid_amount = v.value();
            if (auto const v = r->confidence(); v.has_value()) out.confidence = v.value();
            if (r->strategy()) out.strategy = r->strategy()->str();
            out.reasoning = Str(r->reasoning());
            return out;
        }

        case fb::Reply::AbilityReply:
        {
            auto const* r = p->reply_as_AbilityReply();
            AbilityReply out{};
            if (r->ability()) out.ability = r->ability()->str();
            if (auto const v = r->confidence(); v.has_value()) out.confidence = v.value();
            out.reasoning = Str(r->reasoning());
            return out;
        }

        default:
            return std::unexpected(ParseError{"unknown reply variant"});
        }
    }

    // ---------- results ----------

    auto WriteDecision(FlatBufferBuilder& fbb, arena::core::ValidatedDecision const& d)
        -> std::pair<fb::Decision, Offset<void>>
    {
        using namespace arena::core;
        return std::visit(
            [&]<typename T0>(T0 const& v) -> std::pair<fb::Decision, Offset<void>>
            {
                using T = std::decay_t<T0>;

                if constexpr (std::is_same_v<T, PokerDecision>)
                {
                    fb::PokerDecisionBuilder b(fbb);
                    b.add_action(static_cast<fb::PokerAction>(v.action));
                    b.add_raise_amount(v.raise_amount);
                    b.add_confidence(v.confidence);
                    b.add_bluff_probability(v.bluff_probability);
                    b.add_estimated_win_prob(v.estimated_win_prob);
                    return {fb::Decision::PokerDecision, b.Finish().Union()};
                }
                else if constexpr (std::is_same_v<T, BidDecision>)
                {
                    auto const strategy = fbb.CreateString(v.strategy);
                    fb::BidDecisionBuilder b(fbb);
                    b.add_bid_amount(v.bid_amount);
                    b.add_confidence(v.confidence);
                    b.add_strategy(strategy);
                    return {fb::Decision::BidDecision, b.Finish().Union()};
                }
                else
                {
                    auto const ability = fbb.CreateString(v.ability);
                    fb::AbilityDecisionBuilder b(fbb);
                    b.add_ability(ability);
                    b.add_confidence(v.confidence);
                    return {fb::Decision::AbilityDecision, b.Finish().Union()};
                }
            },
            d
        );
    }

    auto WriteRecord(FlatBufferBuilder& fbb, arena::core::DecisionRecord const& rec) -> Offset<fb::DecisionRecord>
    {
        std::vector<Offset<fb::Coercion>> coercions;
        coercions.reserve(rec.coercions.size());
        for (arena::core::error::Coercion const& c : rec.coercions)
        {
            auto const desc = fbb.CreateString(arena::core::error::describe(c));
            Offset<flatbuffers::String> requested{};
            Offset<flatbuffers::String> applied{};
            if (c.requested) requested = fbb.CreateString(*c.requested);
            if (c.applied) applied = fbb.CreateString(*c.applied);

            fb::CoercionBuilder cb(fbb);
            cb.add_code(static_cast<uint16_t>(c.code));
            cb.add_description(desc);
            cb.add_requested(requested);
            cb.add_applied(applied);
            coercions.push_back(cb.Finish());
        }
        auto const coercion_vec = fbb.CreateVector(coercions);
        auto const [req_type, req] = WriteRequest(fbb, rec.request);
        auto const [reply_type, reply] = WriteReply(fbb, rec.reply);
        auto const [dec_type, dec] = WriteDecision(fbb, rec.decision);
        auto const player = fbb.CreateString(rec.player);
        auto const label = fbb.CreateString(rec.label);

        fb::DecisionRecordBuilder b(fbb);
        b.add_index(static_cast<uint32_t>(rec.index));
        b.add_player(player);
        b.add_label(label);
        b.add_request_type(req_type);
        b.add_request(req);
        b.add_reply_type(reply_type);
        b.add_reply(reply);
        b.add_decision_type(dec_type);
        b.add_decision(dec);
        b.add_coercions(coercion_vec);
        return b.Finish();
    }

    auto WriteDetails(FlatBufferBuilder& fbb, arena::core::GameDetails const& details)
        -> std::pair<fb::Details, Offset<void>>
    {
        using namespace arena::core;
        return std::visit(
            [&]<typename T0>(T0 const& d) -> std::pair<fb::Details, Offset<void>>
            {
                using T = std::decay_t<T0>;

                if constexpr (std::is_same_v<T, PokerDetails>)
                {
                    std::vector<Offset<fb::BettingEntry>> actions;
                    actions.reserve(d.actions.size());
                    for (BettingEntry const& e : d.actions)
                    {
                        auto const player = fbb.CreateString(e.player);
                        fb::BettingEntryBuilder eb(fbb);
                        eb.add_street(arena::net::ToFbStreet(e.street));
                        eb.add_player(player);
                        eb.add_action(static_cast<fb::PokerAction>(e.action));
                        eb.add_amount(e.amount);
                        eb.add_raise_amount(e.raise_amount);
                        eb.add_bluff_probability(e.bluff_probability);
                        actions.push_back(eb.Finish());
                    }

                    std::vector<Offset<fb::StreetRecord>> streets;
                    streets.reserve(d.streets.size());
                    for (StreetRecord const& s : d.streets)
                    {
                        auto const to_call = fbb.CreateVector(s.to_call.data(), s.to_call.size());
                        std::vector<uint8_t> const acted_raw{s.acted[0], s.acted[1]};
                        auto const acted = fbb.CreateVector(acted_raw);
                        auto const stacks = fbb.CreateVector(s.stacks.data(), s.stacks.size());

                        fb::StreetRecordBuilder sb(fbb);
                        sb.add_street(arena::net::ToFbStreet(s.street));
                        sb.add_to_call(to_call);
                        sb.add_acted(acted);
                        sb.add_stacks(stacks);
                        sb.add_pot(s.pot);
                        sb.add_passes(static_cast<uint32_t>(s.passes));
                        sb.add_folded(s.folded);
                        streets.push_back(sb.Finish());
                    }

                    auto const actions_vec = fbb.CreateVector(actions);
                    auto const streets_vec = fbb.CreateVector(streets);
                    auto const hole_a = CardsVec(fbb, d.hole_cards[0]);
                    auto const hole_b = CardsVec(fbb, d.hole_cards[1]);
                    auto const hands = Strings(fbb, d.hands);
                    auto const names = Strings(fbb, d.hand_names);
                    auto const board = CardsVec(fbb, d.board);
                    auto const community = fbb.CreateString(d.community);
                    auto const stacks = fbb.CreateVector(d.final_stacks.data(), d.final_stacks.size());
                    auto const method = fbb.CreateString(d.win_method);

                    fb::PokerDetailsBuilder b(fbb);
                    b.add_hole_a(hole_a);
                    b.add_hole_b(hole_b);
                    b.add_hands(hands);
                    b.add_hand_names(names);
                    b.add_board(board);
                    b.add_community(community);
                    b.add_pot(d.pot);
                    b.add_final_stacks(stacks);
                    b.add_small_blind(d.small_blind);
                    b.add_big_blind(d.big_blind);
                    b.add_win_method(method);
                    b.add_actions(actions_vec);
                    b.add_streets(streets_vec);
                    return {fb::Details::PokerDetails, b.Finish().Union()};
                }
                else if constexpr (std::is_same_v<T, AuctionDetails>)
                {
                    std::vector<Offset<fb::AuctionRound>> rounds;
                    rounds.reserve(d.rounds.size());
                    for (AuctionRoundRecord const& rd : d.rounds)
                    {
                        auto const item = fbb.CreateString(rd.item);
                        auto const bids = fbb.CreateVector(rd.bids.data(), rd.bids.size());

                        fb::AuctionRoundBuilder rb(fbb);
                        rb.add_round(static_cast<uint32_t>(rd.round));
                        rb.add_item(item);
                        rb.add_min_value(rd.min_value);
                        rb.add_max_value(rd.max_value);
                        rb.add_true_value(rd.true_value);
                        rb.add_bids(bids);
                        rb.add_winner(static_cast<fb::Seat>(rd.winner));
                        rb.add_winning_bid(rd.winning_bid);
                        rb.add_profit(rd.profit);
                        rb.add_tie(rd.tie);
                        rounds.push_back(rb.Finish());
                    }
                    auto const rounds_vec = fbb.CreateVector(rounds);
                    auto const profits = fbb.CreateVector(d.profits.data(), d.profits.size());
                    auto const budgets = fbb.CreateVector(d.budgets.data(), d.budgets.size());

                    fb::AuctionDetailsBuilder b(fbb);
                    b.add_rounds(rounds_vec);
                    b.add_profits(profits);
                    b.add_budgets(budgets);
                    return {fb::Details::AuctionDetails, b.Finish().Union()};
                }
                else
                {
                    std::vector<Offset<fb::CombatTurn>> log;
                    log.reserve(d.log.size());
                    for (CombatTurnRecord const& t : d.log)
                    {
                        auto const attacker = fbb.CreateString(t.attacker);
                        auto const ability = fbb.CreateString(t.ability);
                        auto const kind = fbb.CreateString(t.kind);
                        auto const effect = fbb.CreateString(t.effect);
                        auto const hp = fbb.CreateVector(t.hp.data(), t.hp.size());
                        auto const mp = fbb.CreateVector(t.mp.data(), t.mp.size());

                        fb::CombatTurnBuilder tb(fbb);
                        tb.add_turn(static_cast<uint32_t>(t.turn));
                        tb.add_actor(static_cast<fb::Seat>(t.actor));
                        tb.add_attacker(attacker);
                        tb.add_ability(ability);
                        tb.add_kind(kind);
                        tb.add_dot_taken(t.dot_taken);
                        if (t.damage) tb.add_damage(*t.damage);
                        tb.add_effect(effect);
                        tb.add_hp(hp);
                        tb.add_mp(mp);
                        log.push_back(tb.Finish());
                    }
                    auto const log_vec = fbb.CreateVector(log);
                    auto const archetypes = Strings(fbb, d.archetypes);
                    auto const final_hp = fbb.CreateVector(d.final_hp.data(), d.final_hp.size());
                    auto const max_hp = fbb.CreateVector(d.max_hp.data(), d.max_hp.size());
                    auto const final_mp = fbb.CreateVector(d.final_mp.data(), d.final_mp.size());
                    auto const max_mp = fbb.CreateVector(d.max_mp.data(), d.max_mp.size());
                    auto const method = fbb.CreateString(d.win_method);

                    fb::CombatDetailsBuilder b(fbb);
                    b.add_archetypes(archetypes);
                    b.add_final_hp(final_hp);
                    b.add_max_hp(max_hp);
                    b.add_final_mp(final_mp);
                    b.add_max_mp(max_mp);
                    b.add_turns(static_cast<uint32_t>(d.turns));
                    b.add_win_method(method);
                    b.add_log(log_vec);
                    return {fb::Details::CombatDetails, b.Finish().Union()};
                }
            },
            details
        );
    }

    auto Finish(FlatBufferBuilder& fbb, fb::Message type, Offset<void> msg) -> flatbuffers::DetachedBuffer
    {
        fb::EnvelopeBuilder eb(fbb);
        eb.add_message_type(type);
        eb.add_message(msg);
        fb::FinishEnvelopeBuffer(fbb, eb.Finish());
        return fbb.Release();
    }
} // anonymous

namespace arena::net
{
    auto BuildRequest(core::DecisionRequest const& req, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        FlatBufferBuilder fbb;
        auto const [type, body] = WriteRequest(fbb, req);

        fb::RequestMsgBuilder b(fbb);
        b.add_msg_id(msg_id);
        b.add_request_type(type);
        b.add_request(body);
        return Finish(fbb, fb::Message::RequestMsg, b.Finish().Union());
    }

    auto BuildReply(core::DecisionReply const& reply, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        FlatBufferBuilder fbb;
        auto const [type, body] = WriteReply(fbb, reply);

        fb::ReplyMsgBuilder b(fbb);
        b.add_msg_id(msg_id);
        b.add_reply_type(type);
        b.add_reply(body);
        return Finish(fbb, fb::Message::ReplyMsg, b.Finish().Union());
    }

    auto BuildResult(core::GameResult const& r)
        -> flatbuffers::DetachedBuffer
    {
        FlatBufferBuilder fbb;

        std::vector<Offset<fb::DecisionRecord>> records;
        records.reserve(r.decision_log.size());
        for (core::DecisionRecord const& rec : r.decision_log)
        {
            records.push_back(WriteRecord(fbb, rec));
        }
        auto const log = fbb.CreateVector(records);
        auto const [details_type, details] = WriteDetails(fbb, r.details);
        auto const players = Strings(fbb, r.players);
        auto const winner = fbb.CreateString(r.winner);
        auto const loser = fbb.CreateString(r.loser);

        fb::GameResultBuilder b(fbb);
        b.add_game_type(static_cast<fb::GameType>(r.game_type));
        b.add_players(players);
        b.add_winner(winner);
        b.add_loser(loser);
        b.add_wager(r.wager);
        b.add_seed(r.seed);
        b.add_rounds_played(static_cast<uint32_t>(r.rounds_played));
        b.add_details_type(details_type);
        b.add_details(details);
        b.add_decision_log(log);
        return Finish(fbb, fb::Message::GameResult, b.Finish().Union());
    }

    // ---------- Decode (inbound wire) ----------

    auto VerifyEnvelope(std::span<std::byte const> bytes)
        -> std::expected<fb::Envelope const*, ParseError>
    {
        if (bytes.size() < 2 * sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* p = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier v(p, bytes.size());
        if (!fb::VerifyEnvelopeBuffer(v))
            return std::unexpected(ParseError{"verification failed"});

        auto const* env = fb::GetEnvelope(p);
        if (!env)
            return std::unexpected(ParseError{"bad root"});
        return env;
    }

    auto DecodeRequest(std::span<std::byte const> bytes)
        -> std::expected<DecodedRequest, ParseError>
    {
        auto const env = VerifyEnvelope(bytes);
        if (!env) return std::unexpected(env.error());

        if ((*env)->message_type() != fb::Message::RequestMsg)
            return std::unexpected(ParseError{"not a RequestMsg"});

        auto const* msg = (*env)->message_as_RequestMsg();
        auto req = ReadRequest(msg);
        if (!req) return std::unexpected(req.error());
        return DecodedRequest{msg->msg_id(), std::move(*req)};
    }

    auto DecodeReply(std::span<std::byte const> bytes)
        -> std::expected<DecodedReply, ParseError>
    {
        auto const env = VerifyEnvelope(bytes);
        if (!env) return std::unexpected(env.error());

        if ((*env)->message_type() != fb::Message::ReplyMsg)
            return std::unexpected(ParseError{"not a ReplyMsg"});

        auto const* msg = (*env)->message_as_ReplyMsg();
        auto reply = ReadReply(msg);
        if (!reply) return std::unexpected(reply.error());
        return DecodedReply{msg->msg_id(), std::move(*reply)};
    }
} // namespace arena::net
