#pragma once

/// @file poll_source.hpp
/// @brief Event source interface for the run loop

#include "fwd.hpp"
#include <weft/core/error.hpp>
#include <weft/event/control.hpp>

namespace weft_kernel {

/// How the run loop treats a source beyond poll/read
enum class SourceRole : std::uint8_t {
    /// Polled every tick
    Plain,
    /// Read after every successful render
    Rendered,
    /// Read when a Quit arrives
    Quit,
};

/// An independently timed source of events.
///
/// The run loop calls poll() on every source each tick, in registration
/// order, then read() once on each source that reported ready. Neither call
/// may block.
template<typename Event>
class IPollSource {
public:
    virtual ~IPollSource() = default;

    /// Is there something to read? Must not block.
    [[nodiscard]] virtual weft_core::Result<bool> poll() = 0;

    /// Read one item. Called only after poll() returned true.
    [[nodiscard]] virtual weft_core::Result<weft_event::Control<Event>> read() = 0;

    /// Read repeatedly in one tick until poll() reports false
    [[nodiscard]] virtual bool drain_until_idle() const noexcept { return false; }

    [[nodiscard]] virtual SourceRole role() const noexcept { return SourceRole::Plain; }

    /// Hand any facility this source owns to the application context
    virtual void attach(AppContext<Event>& ctx) { (void)ctx; }

    /// Name used in logs and error context
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

} // namespace weft_kernel
