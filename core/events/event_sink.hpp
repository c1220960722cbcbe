#pragma once

#include "event_types.hpp"

namespace trellico {
namespace events {

// Fire-and-forget publish channel to the presentation layer.
// Implementations must not block the caller on consumers and must not throw;
// the core never inspects delivery results.
class IEventSink {
public:
    virtual ~IEventSink() = default;

    virtual void publish(Event event) = 0;
};

}  // namespace events
}  // namespace trellico
