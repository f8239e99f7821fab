//
// RoomRegistry.hpp
//

#ifndef GUNZI_ROOMREGISTRY_HPP
#define GUNZI_ROOMREGISTRY_HPP

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/Arbiter.hpp"
#include "net/RoomChannel.hpp"

namespace gunzi::net
{
    struct RoomEntry
    {
        std::string name;
        std::shared_ptr<RoomChannel> channel;
        std::unique_ptr<gunzi::core::Arbiter> arbiter;
    };

    class RoomRegistry
    {
    public:
        RoomRegistry(gunzi::core::RoomConfig base, std::weak_ptr<WsServer> ep);

        // Existing room or a freshly created one, with `hdl` attached before the registry
        // lock is released. Creation failures propagate (OmegaException).
        auto Acquire(std::string const& name, Hdl const& hdl) -> std::shared_ptr<RoomEntry>;
        auto Find(std::string const& name) const -> std::shared_ptr<RoomEntry>;
        // Drops the room and all of its state
        void Drop(std::string const& name);
        // Drops the room only if no connection is attached; true when dropped
        auto DropIfEmpty(std::string const& name) -> bool;

        // Copy of the current rooms; callers work outside the registry lock
        auto All() const -> std::vector<std::shared_ptr<RoomEntry>>;

    private:
        gunzi::core::RoomConfig base_;
        std::weak_ptr<WsServer> ep_;
        mutable std::mutex mtx_;
        std::map<std::string, std::shared_ptr<RoomEntry>> rooms_;
        std::uint64_t created_{0};
    };
}

#endif // GUNZI_ROOMREGISTRY_HPP
