#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for weft_kernel

#include <cstdint>

namespace weft_kernel {

// Poll sources
template<typename Event>
class IPollSource;

template<typename Event>
class PollTimers;

template<typename Event>
class PollTasks;

template<typename Event>
class PollAsync;

template<typename Event>
class PollInput;

template<typename Event>
class PollRendered;

template<typename Event>
class PollQuit;

// Timers
struct TimerHandle;
struct TimerDef;
struct TimeOut;
struct TimerEvent;
class Timers;

// Tasks
class Cancellation;
class Liveness;

template<typename Event>
class WorkerPool;

template<typename Event>
class AsyncTasks;

// Terminal
class ITerminal;
class BufferTerminal;
class Frame;
struct TermInit;

// Focus
class FocusFlag;
class Focus;

// Loop
template<typename Event>
class AppContext;

template<typename Event>
class RunConfig;

template<typename Event, typename State, typename Global>
class RunLoop;

struct RunStats;

} // namespace weft_kernel
