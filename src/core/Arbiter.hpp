//
// Arbiter.hpp
//

#ifndef GUNZI_ARBITER_HPP
#define GUNZI_ARBITER_HPP

#include <functional>
#include <shared_mutex>
#include <string>
#include <utility>
#include "Room.hpp"
#include "EventSink.hpp"

namespace gunzi::core
{
    // Thread-safe front of one room. Every mutation runs validate-apply-advance under the
    // exclusive lock and publishes its events before releasing it.
    class Arbiter
    {
    public:
        using SubmitResult = RoomImpl::SubmitResult;

        Arbiter(RoomConfig const& config, std::shared_ptr<EventSink> sink);

        auto Submit(std::optional<SeatIdxT> actor, PlayerAction const& a) -> SubmitResult;

        // Host dealing. DealNext returns unexpected(InvalidPhase) outside Drawing.
        auto DealNext() -> SubmitResult;
        // Deals until drawing ends; returns the number of cards dealt
        auto DealAll() -> size_t;

        auto Snapshot() const -> std::shared_ptr<RoomSnapshot const>;
        auto SnapshotFor(SeatIdxT seat) const -> std::shared_ptr<SeatView const>;

        // Read access under the shared lock
        template <typename Fn>
        auto WithRoom(Fn&& fn) const -> decltype(auto)
        {
            std::shared_lock lock{mtx_};
            return std::invoke(std::forward<Fn>(fn), std::as_const(room_));
        }

    private:
        auto Publish() -> void;
        // Context left on engine exceptions passing through
        auto Note(std::optional<SeatIdxT> actor) const -> std::string;

    private:
        mutable std::shared_mutex mtx_;
        RoomImpl room_;
        std::shared_ptr<EventSink> sink_;
    };
}
#endif //GUNZI_ARBITER_HPP
