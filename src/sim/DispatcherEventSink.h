#pragma once

#include "sim/Events.h"

#include <entt/entt.hpp>

namespace outpost::sim {

// Broadcasts simulation events through an entt::dispatcher.
//
//   entt::dispatcher disp;
//   DispatcherEventSink sink{ disp };
//   disp.sink<evt::StructureBecameOperational>().connect<&Hud::onOperational>(hud);
//
// Events are triggered immediately (not enqueued).
class DispatcherEventSink final : public IEventSink {
public:
    explicit DispatcherEventSink(entt::dispatcher& dispatcher) noexcept
        : m_dispatcher(dispatcher)
    {
    }

    void onStructurePlaced(const evt::StructurePlaced& e) override { m_dispatcher.trigger(e); }
    void onStructureBecameOperational(const evt::StructureBecameOperational& e) override { m_dispatcher.trigger(e); }
    void onProductionCycleCompleted(const evt::ProductionCycleCompleted& e) override { m_dispatcher.trigger(e); }
    void onStructureDemolished(const evt::StructureDemolished& e) override { m_dispatcher.trigger(e); }

    [[nodiscard]] entt::dispatcher& dispatcher() noexcept { return m_dispatcher; }

private:
    entt::dispatcher& m_dispatcher;
};

} // namespace outpost::sim
