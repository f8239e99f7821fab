//
// Arbiter.cpp
//
#include "Arbiter.hpp"

#include <format>
#include <mutex>
#include "Exception.hpp"
#include "GunziRules.hpp"

namespace gunzi::core
{
    Arbiter::Arbiter(RoomConfig const& config, std::shared_ptr<EventSink> sink) :
        room_(config, std::make_unique<GunziRules>()),
        sink_(std::move(sink))
    {
    }

    auto Arbiter::Publish() -> void
    {
        std::vector<OutboundEvent> const events = room_.DrainEvents();
        if (!sink_) return;
        for (OutboundEvent const& ev : events) sink_->Publish(ev);
    }

    auto Arbiter::Note(std::optional<SeatIdxT> const actor) const -> std::string
    {
        return std::format("handling round {} in {} for {}", room_.Round(), error::to_string(room_.PhaseNow()),
                           actor ? std::format("P{}", static_cast<int>(*actor)) : "the host");
    }

    auto Arbiter::Submit(std::optional<SeatIdxT> const actor, PlayerAction const& a) -> SubmitResult
    {
        std::unique_lock lock{mtx_};
        try
        {
            SubmitResult res = room_.Submit(actor, a);
            Publish();
            return res;
        }
        catch (OmegaException<error::Code>& e)
        {
            e.annotate(Note(actor));
            throw;
        }
    }

    auto Arbiter::DealNext() -> SubmitResult
    {
        return Submit(std::nullopt, DealAction{});
    }

    auto Arbiter::DealAll() -> size_t
    {
        std::unique_lock lock{mtx_};
        size_t dealt{0};
        try
        {
            while (room_.PhaseNow() == Phase::Drawing)
            {
                SubmitResult const res = room_.Submit(std::nullopt, DealAction{});
                if (!res) break;
                ++dealt;
            }
        }
        catch (OmegaException<error::Code>& e)
        {
            e.annotate(Note(std::nullopt));
            throw;
        }
        Publish();
        return dealt;
    }

    auto Arbiter::Snapshot() const -> std::shared_ptr<RoomSnapshot const>
    {
        std::shared_lock lock{mtx_};
        return room_.Snapshot();
    }

    auto Arbiter::SnapshotFor(SeatIdxT const seat) const -> std::shared_ptr<SeatView const>
    {
        std::shared_lock lock{mtx_};
        return room_.SnapshotFor(seat);
    }
}
