#pragma once

#include "sim/ProductionScheduler.h"

#include <algorithm>
#include <cmath>

namespace outpost::sim {

struct ClockSettings {
    double intervalSeconds = 1.0; // one production tick per interval
    int    maxCatchUpTicks = 5;   // clamp catch-up per frame
    double maxFrameSeconds = 0.25; // clamp big pauses
};

// Drives ProductionScheduler from variable frame times: accumulates the frame delta and runs
// tick(interval) once per whole interval.
class ProductionClock {
public:
    ProductionClock(ProductionScheduler& scheduler, const ClockSettings& s) noexcept
        : m_scheduler(scheduler)
        , m_settings(s)
    {
        if (!(m_settings.intervalSeconds > 0.0) || !std::isfinite(m_settings.intervalSeconds))
            m_settings.intervalSeconds = 1.0;
        m_settings.maxCatchUpTicks = std::max(1, m_settings.maxCatchUpTicks);
        if (!(m_settings.maxFrameSeconds > 0.0))
            m_settings.maxFrameSeconds = m_settings.intervalSeconds;
    }

    // Returns the number of ticks run this frame. Whatever the catch-up clamp leaves in the
    // accumulator carries over to later frames.
    int advance(double frameSeconds, TickReport* total = nullptr)
    {
        // Guard against clocks going backwards and NaN.
        if (!(frameSeconds > 0.0))
            return 0;

        m_accumulator += std::min(frameSeconds, m_settings.maxFrameSeconds);

        int ticks = 0;
        while (m_accumulator >= m_settings.intervalSeconds && ticks < m_settings.maxCatchUpTicks)
        {
            const TickReport r = m_scheduler.tick(m_settings.intervalSeconds);
            if (total)
                Accumulate(*total, r);
            m_accumulator -= m_settings.intervalSeconds;
            ++ticks;
        }
        return ticks;
    }

    // Runs exactly n ticks, ignoring the accumulator (headless runs, tests).
    int runTicks(int n, TickReport* total = nullptr)
    {
        int ticks = 0;
        for (; ticks < n; ++ticks)
        {
            const TickReport r = m_scheduler.tick(m_settings.intervalSeconds);
            if (total)
                Accumulate(*total, r);
        }
        return ticks;
    }

    void reset() noexcept { m_accumulator = 0.0; }

    [[nodiscard]] double accumulator() const noexcept { return m_accumulator; }
    [[nodiscard]] double interval() const noexcept { return m_settings.intervalSeconds; }
    [[nodiscard]] const ClockSettings& settings() const noexcept { return m_settings; }

    static void Accumulate(TickReport& total, const TickReport& r) noexcept
    {
        total.constructionAdvanced += r.constructionAdvanced;
        total.becameOperational    += r.becameOperational;
        total.cyclesCompleted      += r.cyclesCompleted;
        total.skippedMissingInput  += r.skippedMissingInput;
        total.skippedOutputFull    += r.skippedOutputFull;
        total.overflowDiscarded    += r.overflowDiscarded;
    }

private:
    ProductionScheduler& m_scheduler;
    ClockSettings m_settings{};
    double m_accumulator = 0.0;
};

} // namespace outpost::sim
