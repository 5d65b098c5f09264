#include "sim/ProductionScheduler.h"

#include "core/Log.h"
#include "sim/BuildingRegistry.h"
#include "sim/Events.h"
#include "sim/ResourceCatalog.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace outpost::sim {

namespace {

// Relative slack when comparing accumulated construction time against the definition's time.
constexpr double kConstructionTolerance = 1e-9;

} // namespace

int ProductionScheduler::ProducedAmount(int specAmount, float rate, float efficiency) noexcept
{
    // Single precision, truncated toward zero.
    const float produced = static_cast<float>(specAmount) * rate * efficiency;
    if (!(produced > 0.0f))
        return 0;
    // 2^31 is the first float past INT_MAX.
    if (produced >= 2147483648.0f)
        return std::numeric_limits<int>::max();
    return static_cast<int>(std::floor(produced));
}

double ProductionScheduler::simSeconds() const noexcept
{
    return m_registry.simSeconds();
}

TickReport ProductionScheduler::tick(double deltaTimeSeconds)
{
    TickReport report{};

    if (!std::isfinite(deltaTimeSeconds) || deltaTimeSeconds <= 0.0)
    {
        LOG_WARN("ProductionScheduler::tick ignored dt=%f", deltaTimeSeconds);
        return report;
    }

    m_registry.advanceClock(deltaTimeSeconds);
    ++m_ticks;
    const double now = m_registry.simSeconds();

    m_registry.forEach([&](PlacedStructure& s) {
        if (!s.operational())
        {
            advanceConstruction(s, deltaTimeSeconds, report);
            return;
        }

        s.operationSeconds += deltaTimeSeconds;
        if (s.definition && s.definition->producesAnything())
            runCycle(s, now, report);
    });

    return report;
}

void ProductionScheduler::advanceConstruction(PlacedStructure& s, double dt, TickReport& report)
{
    const double duration = s.definition ? static_cast<double>(s.definition->constructionTimeSeconds) : 0.0;
    s.constructionSeconds += dt;
    ++report.constructionAdvanced;

    // Summed dt steps (0.1 x 40) land a few ulps short of the exact duration.
    const bool complete = !(duration > 0.0) || s.constructionSeconds >= duration * (1.0 - kConstructionTolerance);
    if (!complete)
    {
        const float progress = static_cast<float>(std::clamp(s.constructionSeconds / duration, 0.0, 1.0));
        s.constructionProgress = std::max(s.constructionProgress, std::min(progress, std::nextafter(1.0f, 0.0f)));
        return;
    }

    s.constructionSeconds = std::max(duration, 0.0);
    s.constructionProgress = 1.0f;
    s.state = LifecycleState::Operational;
    ++report.becameOperational;
    LOG_INFO("%s #%u is operational", s.definitionId.c_str(), s.id);

    if (IEventSink* events = m_registry.eventSink())
        events->onStructureBecameOperational(evt::StructureBecameOperational{ s.id });
}

void ProductionScheduler::runCycle(PlacedStructure& s, double now, TickReport& report)
{
    const ProductionSpec& spec = *s.definition->production;
    const ResourceCatalog* names = m_registry.resourceCatalog();

    for (const ResourceAmount& in : spec.inputs)
    {
        if (!s.inputStorage.has(in.resource, in.amount))
        {
            ++report.skippedMissingInput;
            LOG_TRACE("%s #%u: waiting for %d %s (have %d)", s.definitionId.c_str(), s.id, in.amount,
                      ResourceLabel(names, in.resource).c_str(), s.inputStorage.amount(in.resource));
            return;
        }
    }
    for (const ResourceAmount& out : spec.outputs)
    {
        if (!s.outputStorage.canAccept(out.resource, out.amount))
        {
            ++report.skippedOutputFull;
            LOG_TRACE("%s #%u: output storage full (%d/%d)", s.definitionId.c_str(), s.id,
                      s.outputStorage.usedCapacity(), s.outputStorage.capacity());
            return;
        }
    }

    evt::ProductionCycleCompleted done{ s.id, {}, {} };
    done.consumed.reserve(spec.inputs.size());
    done.produced.reserve(spec.outputs.size());

    for (const ResourceAmount& in : spec.inputs)
    {
        const int removed = s.inputStorage.remove(in.resource, in.amount);
        done.consumed.push_back(ResourceAmount{ in.resource, removed });
    }

    for (const ResourceAmount& out : spec.outputs)
    {
        const int produced = ProducedAmount(out.amount, spec.rate, spec.efficiency);
        const int added = s.outputStorage.add(out.resource, produced);
        if (added < produced)
        {
            report.overflowDiscarded += produced - added;
            if (m_registry.overflowWarnings())
            {
                LOG_WARN("%s #%u: output storage full, lost %d %s", s.definitionId.c_str(), s.id,
                         produced - added, ResourceLabel(names, out.resource).c_str());
            }
        }
        done.produced.push_back(ResourceAmount{ out.resource, added });
    }

    ++s.productionCycleCount;
    s.lastProductionTimestamp = now;
    ++report.cyclesCompleted;

    if (IEventSink* events = m_registry.eventSink())
        events->onProductionCycleCompleted(done);
}

} // namespace outpost::sim
