#pragma once

#include <cstdint>

namespace outpost::sim {

class BuildingRegistry;
struct PlacedStructure;

struct TickReport {
    int constructionAdvanced = 0;
    int becameOperational    = 0;
    int cyclesCompleted      = 0;
    int skippedMissingInput  = 0;
    int skippedOutputFull    = 0;
    int overflowDiscarded    = 0; // resource units lost to the output capacity clamp
};

// One simulation step over every structure, in creation order:
//   - under construction: constructionSeconds += dt; reaching the definition's construction
//     time sets progress to 1 and makes the structure operational (it produces from the next
//     tick on)
//   - operational with production: one all-or-nothing cycle. Every input must be present
//     and every output must fit, otherwise nothing moves and the cycle waits for a later tick.
//
// Output per cycle is floor(amount * rate * efficiency), saturating at INT_MAX.
class ProductionScheduler {
public:
    explicit ProductionScheduler(BuildingRegistry& registry) noexcept
        : m_registry(registry)
    {
    }

    // Non-positive or non-finite dt does nothing.
    TickReport tick(double deltaTimeSeconds);

    [[nodiscard]] double simSeconds() const noexcept;
    [[nodiscard]] std::uint64_t tickCount() const noexcept { return m_ticks; }

    [[nodiscard]] static int ProducedAmount(int specAmount, float rate, float efficiency) noexcept;

private:
    void advanceConstruction(PlacedStructure& s, double dt, TickReport& report);
    void runCycle(PlacedStructure& s, double now, TickReport& report);

    BuildingRegistry& m_registry;
    std::uint64_t m_ticks = 0;
};

} // namespace outpost::sim
