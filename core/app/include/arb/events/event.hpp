#pragma once

#include "arb/events/brokerage_events.hpp"
#include "arb/events/grid_events.hpp"
#include "arb/events/market_events.hpp"

#include <variant>

namespace arb {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Single envelope carried by every EventBus and ThreadSafeQueue in the
// engine. A closed std::variant keeps dispatch type-checked: subscribers use
// EventBus::subscribe<T> or std::get_if, never casts.
//
// Producers:
//   QuoteEvent               MarketDataGateway, tests
//   OrderStatusEvent .. OptionAssignmentEvent
//                            brokerage connections (re-emitted by
//                            MultiBrokerageManager)
//   GridSignalEvent, GridPositionUpdateEvent
//                            ArbitrageEngine, for telemetry
// -----------------------------------------------------------------------------
using Event = std::variant<
    QuoteEvent,
    OrderStatusEvent,
    AccountChangedEvent,
    BrokerageMessageEvent,
    OptionAssignmentEvent,
    GridSignalEvent,
    GridPositionUpdateEvent>;

}  // namespace arb
