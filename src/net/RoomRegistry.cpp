//
// RoomRegistry.cpp
//

#include "net/RoomRegistry.hpp"

namespace gunzi::net
{
    RoomRegistry::RoomRegistry(gunzi::core::RoomConfig base, std::weak_ptr<WsServer> ep)
        : base_{base}
          , ep_{std::move(ep)}
    {
    }

    auto RoomRegistry::Acquire(std::string const& name, Hdl const& hdl) -> std::shared_ptr<RoomEntry>
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (auto const it = rooms_.find(name); it != rooms_.end())
        {
            it->second->channel->Attach(hdl);
            return it->second;
        }

        // Distinct deterministic stream per room
        gunzi::core::RoomConfig cfg = base_;
        cfg.seed = base_.seed + created_++;

        std::shared_ptr<RoomEntry> entry = std::make_shared<RoomEntry>();
        entry->name = name;
        entry->channel = std::make_shared<RoomChannel>(ep_);
        entry->arbiter = std::make_unique<gunzi::core::Arbiter>(cfg, entry->channel);
        entry->channel->Attach(hdl);
        rooms_.emplace(name, entry);
        return entry;
    }

    auto RoomRegistry::Find(std::string const& name) const -> std::shared_ptr<RoomEntry>
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto const it = rooms_.find(name);
        return it != rooms_.end() ? it->second : nullptr;
    }

    void RoomRegistry::Drop(std::string const& name)
    {
        std::lock_guard<std::mutex> lock(mtx_);
        rooms_.erase(name);
    }

    auto RoomRegistry::DropIfEmpty(std::string const& name) -> bool
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto const it = rooms_.find(name);
        if (it == rooms_.end() || it->second->channel->Connections() != 0)
        {
            return false;
        }
        rooms_.erase(it);
        return true;
    }

    auto RoomRegistry::All() const -> std::vector<std::shared_ptr<RoomEntry>>
    {
        std::lock_guard<std::mutex> lock(mtx_);
        std::vector<std::shared_ptr<RoomEntry>> out;
        out.reserve(rooms_.size());
        for (auto const& [name, entry] : rooms_)
        {
            out.push_back(entry);
        }
        return out;
    }
}
