//
// RecordingSink.hpp
//

#ifndef GUNZI_RECORDINGSINK_HPP
#define GUNZI_RECORDINGSINK_HPP

#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "../core/EventSink.hpp"
#include "AuditLogger.hpp"

namespace gunzi::core::debug
{
    // Keeps every published event; optionally mirrors them into an audit transcript
    class RecordingSink final : public EventSink
    {
    public:
        RecordingSink() = default;
        explicit RecordingSink(AuditLogger* audit) : audit_{audit} {}

        auto Publish(OutboundEvent const& ev) -> void override
        {
            std::lock_guard lock{mtx_};
            events_.push_back(ev);
            if (audit_) audit_->event(ev);
        }

        auto Events() const -> std::vector<OutboundEvent>
        {
            std::lock_guard lock{mtx_};
            return events_;
        }

        auto Take() -> std::vector<OutboundEvent>
        {
            std::lock_guard lock{mtx_};
            return std::exchange(events_, {});
        }

        // Events of type T, in order
        template <typename T>
        auto OfType() const -> std::vector<std::pair<std::optional<SeatIdxT>, T>>
        {
            std::lock_guard lock{mtx_};
            std::vector<std::pair<std::optional<SeatIdxT>, T>> out;
            for (OutboundEvent const& ev : events_)
            {
                if (T const* e = std::get_if<T>(&ev.event)) out.emplace_back(ev.target, *e);
            }
            return out;
        }

    private:
        mutable std::mutex mtx_;
        std::vector<OutboundEvent> events_;
        AuditLogger* audit_{nullptr};
    };
}

#endif //GUNZI_RECORDINGSINK_HPP
