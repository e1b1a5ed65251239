//
// Copyright (c) 2017, Nicolas Burrus
// This software may be modified and distributed under the terms
// of the BSD license.  See the LICENSE file for details.
//

#pragma once

#include <cstdio>
#include <string>

#define DM_MULTI_STATEMENT_MACRO(X) do { X } while(0)

// Always-on informational message, one line.
#define dm_log(...) DM_MULTI_STATEMENT_MACRO ( dm::consoleMessage (__VA_ARGS__); dm::consoleMessage ("\n"); )

#define dm_error(...) DM_MULTI_STATEMENT_MACRO ( dm::consoleMessage ("ERROR: "); dm::consoleMessage (__VA_ARGS__); dm::consoleMessage ("\n"); )

#ifndef NDEBUG
#define dm_dbg(...) DM_MULTI_STATEMENT_MACRO ( dm::consoleMessage ("DEBUG: "); dm::consoleMessage (__VA_ARGS__); dm::consoleMessage ("\n"); )
#else
#define dm_dbg(...)
#endif // !NDEBUG

#ifndef NDEBUG
#define dm_assert(cond, ...) DM_MULTI_STATEMENT_MACRO ( if (!(cond)) dm::handle_assert_failure(#cond, __FILE__, __LINE__, __VA_ARGS__); else {} )
#else
#define dm_assert(...)
#endif // !NDEBUG

namespace dm
{

    std::string formatted (const char* fmt, ...);

    [[noreturn]] void handle_assert_failure(const char* cond, const char* fileName, int line, const char* fmt, ...);

    void consoleMessage (const char* fmt, ...);

} // dm

namespace dm
{

    // Logs the time spent in a scope with dm_dbg.
    struct ScopeTimer
    {
        ScopeTimer (const char* label) : _label (label)
        {
            start ();
        }

        ~ScopeTimer () { stop (); }

        void start ();
        void stop ();

    private:
        std::string _label;
        double _startTime = -1;
    };

} // dm
