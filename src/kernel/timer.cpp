/// @file timer.cpp
/// @brief Timer registry implementation

#include <weft/kernel/timer.hpp>
#include <weft/core/log.hpp>

#include <algorithm>

namespace weft_kernel {

Timers::Timers()
    : m_now([] { return TimerClock::now(); })
{
}

Timers::Timers(NowFn now)
    : m_now(std::move(now))
{
}

void Timers::insert(Entry entry) {
    // Equal deadlines keep registration order: the older entry stays nearer the back.
    auto it = std::find_if(m_timers.begin(), m_timers.end(),
        [&](const Entry& e) { return e.next <= entry.next; });
    m_timers.insert(it, std::move(entry));
}

TimerHandle Timers::add(const TimerDef& def) {
    TimerHandle handle{++m_last_tag};

    Entry entry;
    entry.handle = handle;
    entry.repaint = def.repaint;
    entry.repeat = def.repeat;
    entry.interval = def.interval;
    entry.next = def.next.value_or(m_now() + def.interval);
    insert(std::move(entry));

    weft_core::kernel_logger()->trace("timer {} added ({} firings)",
        handle.value, def.repeat.value_or(1));
    return handle;
}

bool Timers::remove(TimerHandle handle) {
    auto it = std::find_if(m_timers.begin(), m_timers.end(),
        [&](const Entry& e) { return e.handle == handle; });
    if (it == m_timers.end()) {
        return false;
    }
    m_timers.erase(it);
    return true;
}

TimerHandle Timers::replace(std::optional<TimerHandle> old, const TimerDef& def) {
    if (old) {
        remove(*old);
    }
    return add(def);
}

std::optional<TimerClock::duration> Timers::sleep_time() const {
    if (m_timers.empty()) {
        return std::nullopt;
    }
    auto now = m_now();
    const auto& due = m_timers.back();
    if (now >= due.next) {
        return TimerClock::duration::zero();
    }
    return due.next - now;
}

bool Timers::poll() const {
    if (m_timers.empty()) {
        return false;
    }
    return m_now() >= m_timers.back().next;
}

bool Timers::contains(TimerHandle handle) const {
    return std::any_of(m_timers.begin(), m_timers.end(),
        [&](const Entry& e) { return e.handle == handle; });
}

std::optional<TimerEvent> Timers::read() {
    if (m_timers.empty() || m_now() < m_timers.back().next) {
        return std::nullopt;
    }

    Entry entry = std::move(m_timers.back());
    m_timers.pop_back();

    TimerEvent event{
        entry.repaint ? TimerEvent::Kind::Repaint : TimerEvent::Kind::Application,
        TimeOut{entry.handle, entry.count},
    };

    if (entry.repeat) {
        entry.count += 1;
        if (entry.count < *entry.repeat) {
            entry.next += entry.interval;
            insert(std::move(entry));
        }
    }

    return event;
}

} // namespace weft_kernel
