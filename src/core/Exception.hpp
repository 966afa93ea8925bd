//
// Exception.hpp
//

#ifndef ARENA_EXCEPTION_HPP
#define ARENA_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <cstdint>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace arena::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        State, // simulator misuse (bad input to an engine call, exhausted deck)
        InvalidDecision, // decision cannot be validated into anything usable
        ExternalFailure, // decision provider errored, timed out or returned undecodable data
        Timeout, // deadline exceeded waiting on a provider
        Serialization, // FlatBuffers verification/build errors
        Config, // configuration out of range
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidDecisionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    // Fatal for the match in progress; the caller decides whether to replay it.
    struct ExternalFailureError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct TimeoutError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConfigError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::InvalidDecision: throw InvalidDecisionError(std::move(msg), c, loc);
        case Code::ExternalFailure: throw ExternalFailureError(std::move(msg), c, loc);
        case Code::Timeout: throw TimeoutError(std::move(msg), c, loc);
        case Code::Serialization: throw SerializationError(std::move(msg), c, loc);
        case Code::Config: throw ConfigError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define ARN_THROW(code_enum, msg) ::arena::core::error::fail((code_enum), (msg))
#define ARN_ASSERT(cond, msg) do { if(!(cond)) ::arena::core::error::fail(::arena::core::error::Code::Assertion, (msg)); } while(0)

    // Locally recovered provider mistakes. Every one of these is written into the
    // decision log entry of the decision it modified.
    enum class CoercionCode : std::uint16_t
    {
        // Missing field -> documented default
        Missing_Action,
        Missing_RaiseAmount,
        Missing_Confidence,
        Missing_BluffProbability,
        Missing_WinProbability,
        Missing_BidAmount,
        Missing_Strategy,
        Missing_Ability,

        // Numeric bound -> clamp
        Raise_BelowBigBlind,
        Raise_AboveStack,
        Bid_BelowMinimum,
        Bid_AboveBudget,

        // Illegal choice -> safe default
        Action_Unknown,
        Fold_NothingToCall,
        Raise_PassCapReached,
        Ability_NotAvailable,

        // Legal set narrowed before asking
        Abilities_DefendOnly
    };

    enum class CoercionClass : std::uint8_t
    {
        Validation,
        OutOfRange,
        Protocol,
        ResourceExhaustion
    };

    struct Coercion
    {
        CoercionCode code{};
        std::optional<std::string> requested{};
        std::optional<std::string> applied{};

        auto with_requested(std::string v) -> Coercion&
        {
            requested = std::move(v);
            return *this;
        }

        auto with_applied(std::string v) -> Coercion&
        {
            applied = std::move(v);
            return *this;
        }
    };

    inline auto class_of(CoercionCode c) -> CoercionClass
    {
        using E = CoercionCode;
        switch (c)
        {
        case E::Missing_Action:
        case E::Missing_RaiseAmount:
        case E::Missing_Confidence:
        case E::Missing_BluffProbability:
        case E::Missing_WinProbability:
        case E::Missing_BidAmount:
        case E::Missing_Strategy:
        case E::Missing_Ability: return CoercionClass::Validation;

        case E::Raise_BelowBigBlind:
        case E::Raise_AboveStack:
        case E::Bid_BelowMinimum:
        case E::Bid_AboveBudget: return CoercionClass::OutOfRange;

        case E::Action_Unknown:
        case E::Fold_NothingToCall:
        case E::Raise_PassCapReached:
        case E::Ability_NotAvailable: return CoercionClass::Protocol;

        case E::Abilities_DefendOnly: return CoercionClass::ResourceExhaustion;
        }
        return CoercionClass::Protocol;
    }

    inline auto to_string(CoercionCode c) -> std::string_view
    {
        using E = CoercionCode;
        switch (c)
        {
        case E::Missing_Action: return "Missing action (fold assumed)";
        case E::Missing_RaiseAmount: return "Missing raise_amount (0 assumed)";
        case E::Missing_Confidence: return "Missing confidence (0.5 assumed)";
        case E::Missing_BluffProbability: return "Missing bluff_probability (0 assumed)";
        case E::Missing_WinProbability: return "Missing estimated_win_prob (0.5 assumed)";
        case E::Missing_BidAmount: return "Missing bid_amount (0 assumed)";
        case E::Missing_Strategy: return "Missing strategy (value assumed)";
        case E::Missing_Ability: return "Missing ability";

        case E::Raise_BelowBigBlind: return "Raise below big blind";
        case E::Raise_AboveStack: return "Raise exceeds remaining stack";
        case E::Bid_BelowMinimum: return "Bid below minimum";
        case E::Bid_AboveBudget: return "Bid exceeds budget";

        case E::Action_Unknown: return "Unknown action (fold assumed)";
        case E::Fold_NothingToCall: return "Fold with nothing to call (checked instead)";
        case E::Raise_PassCapReached: return "Raise after pass cap (called instead)";
        case E::Ability_NotAvailable: return "Ability not available";

        case E::Abilities_DefendOnly: return "No affordable ability besides defend";
        }
        return "Unknown";
    }

    inline auto to_string(CoercionClass c) -> std::string_view
    {
        switch (c)
        {
        case CoercionClass::Validation: return "validation";
        case CoercionClass::OutOfRange: return "out-of-range";
        case CoercionClass::Protocol: return "protocol";
        case CoercionClass::ResourceExhaustion: return "resource";
        }
        return "unknown";
    }

    inline auto describe(Coercion const& v) -> std::string
    {
        auto s = std::format("[{}] {}", to_string(class_of(v.code)), to_string(v.code));
        if (v.requested) s += std::format(" | requested={}", *v.requested);
        if (v.applied) s += std::format(" | applied={}", *v.applied);
        return s;
    }
}

#endif //ARENA_EXCEPTION_HPP
