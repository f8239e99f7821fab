//
// EventSink.hpp
//

#ifndef GUNZI_EVENTSINK_HPP
#define GUNZI_EVENTSINK_HPP

#include "Events.hpp"

namespace gunzi::core
{
    class EventSink
    {
    public:
        virtual ~EventSink() = default;

        // Called with the room's write lock held, in state-change order.
        // Must not call back into the same room.
        virtual auto Publish(OutboundEvent const& ev) -> void = 0;
    };
}
#endif //GUNZI_EVENTSINK_HPP
