#pragma once

/*
    ARS SIM LIB

    FILE: visual_handle.hpp
    MODULE: sim
    PURPOSE: Boundary to the presentation layer. The core never builds geometry; it asks a
            factory for a handle per entity, pushes transforms into it and tears it down.
*/


#include <cstdint>
#include <memory>
#include <utility>

#include <glm/glm.hpp>

namespace ars
{
    enum class VisualKind : uint8_t
    {
        Player = 0,
        PlayerCockpit = 1,
        Obstacle = 2,
        Projectile = 3
    };

    inline const char* visual_kind_name(VisualKind kind)
    {
        switch (kind)
        {
            case VisualKind::Player: return "player";
            case VisualKind::PlayerCockpit: return "player_cockpit";
            case VisualKind::Obstacle: return "obstacle";
            case VisualKind::Projectile: return "projectile";
        }
        return "unknown";
    }

    struct VisualDesc
    {
        float size = 1.0f;     // obstacle radius before scaling
        float radius = 0.0f;   // projectile radius
        uint64_t seed = 0;     // for procedural surface detail
    };

    class IVisualHandle
    {
    public:
        virtual ~IVisualHandle() = default;
        virtual void update_transform(const glm::vec3& pos, const glm::vec3& rot_euler, const glm::vec3& scl) = 0;
        virtual void set_opacity(float alpha) = 0;
        virtual void detach() = 0;
    };

    class IVisualFactory
    {
    public:
        virtual ~IVisualFactory() = default;
        virtual std::unique_ptr<IVisualHandle> attach_visual(VisualKind kind, const VisualDesc& desc) = 0;
    };

    // Owns one handle. detach() runs at most once, on explicit release or destruction;
    // calls on an empty binding are no-ops.
    class VisualBinding
    {
    public:
        VisualBinding() = default;
        explicit VisualBinding(std::unique_ptr<IVisualHandle> handle) : handle_(std::move(handle)) {}

        VisualBinding(const VisualBinding&) = delete;
        VisualBinding& operator=(const VisualBinding&) = delete;

        VisualBinding(VisualBinding&& other) noexcept : handle_(std::move(other.handle_)) {}

        VisualBinding& operator=(VisualBinding&& other) noexcept
        {
            if (this != &other)
            {
                detach();
                handle_ = std::move(other.handle_);
            }
            return *this;
        }

        ~VisualBinding()
        {
            detach();
        }

        bool attached() const { return handle_ != nullptr; }

        void update_transform(const glm::vec3& pos, const glm::vec3& rot_euler, const glm::vec3& scl)
        {
            if (handle_) handle_->update_transform(pos, rot_euler, scl);
        }

        void set_opacity(float alpha)
        {
            if (handle_) handle_->set_opacity(alpha);
        }

        void detach()
        {
            if (!handle_) return;
            std::unique_ptr<IVisualHandle> h = std::move(handle_);
            h->detach();
        }

    private:
        std::unique_ptr<IVisualHandle> handle_{};
    };

    // A null factory yields an empty binding; headless sessions run without visuals.
    inline VisualBinding attach_visual(IVisualFactory* factory, VisualKind kind, const VisualDesc& desc = {})
    {
        if (!factory) return VisualBinding{};
        return VisualBinding(factory->attach_visual(kind, desc));
    }
}
