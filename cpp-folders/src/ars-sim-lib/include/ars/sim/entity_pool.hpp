#pragma once

/*
    ARS SIM LIB

    FILE: entity_pool.hpp
    MODULE: sim
    PURPOSE: Slot pool with generation-checked ids and a free list. Destroy is idempotent:
            stale, unknown and already destroyed ids are rejected by the generation check.
*/


#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace ars
{
    struct EntityHandle
    {
        uint32_t slot = 0;
        uint32_t generation = 0; // 0 = invalid
        constexpr bool valid() const { return generation != 0; }
        bool operator==(const EntityHandle&) const = default;
    };

    // Small typed wrappers (compile-time type separation only)
    struct ObstacleId : EntityHandle {};
    struct ProjectileId : EntityHandle {};

    template <typename T, typename TId>
    class EntityPool
    {
    public:
        TId spawn(T value)
        {
            uint32_t slot = 0;
            if (!free_.empty())
            {
                slot = free_.back();
                free_.pop_back();
            }
            else
            {
                slot = (uint32_t)slots_.size();
                slots_.emplace_back();
            }

            Slot& s = slots_[slot];
            s.value.emplace(std::move(value));

            TId id{};
            id.slot = slot;
            id.generation = s.generation;
            order_.push_back(id);
            return id;
        }

        // Drops the entity (its visual bindings detach on destruction) and recycles
        // the slot. Returns false for ids that are not live.
        bool destroy(TId id)
        {
            Slot* s = live_slot(id);
            if (!s) return false;
            s->value.reset();
            bump_generation(*s);
            free_.push_back(id.slot);
            order_.erase(std::find(order_.begin(), order_.end(), id));
            return true;
        }

        T* get(TId id)
        {
            Slot* s = live_slot(id);
            return s ? &*s->value : nullptr;
        }

        const T* get(TId id) const
        {
            const Slot* s = live_slot(id);
            return s ? &*s->value : nullptr;
        }

        bool alive(TId id) const
        {
            return live_slot(id) != nullptr;
        }

        // Spawn order. fn must not spawn or destroy; iterate live_ids() for that.
        template <typename Fn>
        void for_each_live(Fn&& fn)
        {
            for (const TId& id : order_) fn(id, *slots_[id.slot].value);
        }

        template <typename Fn>
        void for_each_live(Fn&& fn) const
        {
            for (const TId& id : order_) fn(id, *slots_[id.slot].value);
        }

        const std::vector<TId>& live_ids() const { return order_; }
        std::size_t live_count() const { return order_.size(); }
        std::size_t free_count() const { return free_.size(); }
        std::size_t capacity() const { return slots_.size(); }

        void clear()
        {
            for (const TId& id : order_)
            {
                Slot& s = slots_[id.slot];
                s.value.reset();
                bump_generation(s);
                free_.push_back(id.slot);
            }
            order_.clear();
        }

    private:
        struct Slot
        {
            std::optional<T> value{};
            uint32_t generation = 1;
        };

        static void bump_generation(Slot& s)
        {
            ++s.generation;
            if (s.generation == 0) s.generation = 1;
        }

        Slot* live_slot(TId id)
        {
            if (!id.valid() || id.slot >= slots_.size()) return nullptr;
            Slot& s = slots_[id.slot];
            if (!s.value || s.generation != id.generation) return nullptr;
            return &s;
        }

        const Slot* live_slot(TId id) const
        {
            if (!id.valid() || id.slot >= slots_.size()) return nullptr;
            const Slot& s = slots_[id.slot];
            if (!s.value || s.generation != id.generation) return nullptr;
            return &s;
        }

        std::vector<Slot> slots_{};
        std::vector<uint32_t> free_{};
        std::vector<TId> order_{};
    };
}
