//
// EventSink.cpp
//

#include "EventSink.hpp"

#include <cstdio>
#include <exception>

#include "Exception.hpp"

namespace arena::core
{
    namespace
    {
        // Plain C stdio, a failed write to stderr must not throw out of Emit
        auto ReportSinkFailure(char const* what) noexcept -> void
        {
            std::fputs("[arena] event sink failed: ", stderr);
            std::fputs(what, stderr);
            std::fputs("\n", stderr);
        }
    }

    auto Emit(EventSink* sink, MatchEvent const& e) noexcept -> void
    {
        if (!sink) return;
        try
        {
            sink->Notify(e);
        }
        catch (OmegaException<error::Code> const& ex)
        {
            ReportSinkFailure(ex.what().c_str());
        }
        catch (std::exception const& ex)
        {
            ReportSinkFailure(ex.what());
        }
        catch (...)
        {
            ReportSinkFailure("non-standard exception");
        }
    }
}
