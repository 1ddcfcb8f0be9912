#pragma once

/*
    ARS SIM LIB

    FILE: view_presets.hpp
    MODULE: camera
    PURPOSE: Data-driven camera views. Each preset carries its transition target pose and
            capability flags; compute_live_pose() is the single per-tick operation
            for every view.
*/


#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include "ars/camera/camera_rig.hpp"
#include "ars/camera/follow_camera.hpp"
#include "ars/core/result.hpp"

namespace ars
{
    enum class ViewId : uint8_t
    {
        Default = 0,
        Side = 1,
        Top = 2,
        Chase = 3,
        Cinematic = 4,
        FirstPerson = 5
    };

    inline constexpr std::size_t kViewCount = 6;

    enum class TrackMode : uint8_t
    {
        None = 0,  // stays where the transition left it
        Ease = 1,  // eases toward player + offset and looks at the player
        Snap = 2   // rides on the player at a fixed offset
    };

    struct ViewPreset
    {
        ViewId id = ViewId::Default;
        const char* name = "";

        glm::vec3 position{0.0f};
        glm::vec3 rotation{0.0f};

        bool has_fixed_look_at = false;
        glm::vec3 look_at{0.0f};

        TrackMode tracking = TrackMode::None;
        glm::vec3 track_offset{0.0f};
        float track_factor = 1.0f;
        float roll_follow = 0.0f;

        bool hides_cockpit = false;

        bool tracks_player() const { return tracking != TrackMode::None; }
    };

    inline const std::array<ViewPreset, kViewCount>& view_presets()
    {
        static const std::array<ViewPreset, kViewCount> presets = [] {
            std::array<ViewPreset, kViewCount> p{};

            p[0].id = ViewId::Default;
            p[0].name = "default";
            p[0].position = glm::vec3(0.0f, 0.0f, 20.0f);
            p[0].has_fixed_look_at = true;

            p[1].id = ViewId::Side;
            p[1].name = "side";
            p[1].position = glm::vec3(20.0f, 0.0f, 0.0f);
            p[1].rotation = glm::vec3(0.0f, -glm::half_pi<float>(), 0.0f);
            p[1].has_fixed_look_at = true;

            p[2].id = ViewId::Top;
            p[2].name = "top";
            p[2].position = glm::vec3(0.0f, 20.0f, 0.0f);
            p[2].rotation = glm::vec3(-glm::half_pi<float>(), 0.0f, 0.0f);
            p[2].has_fixed_look_at = true;

            p[3].id = ViewId::Chase;
            p[3].name = "chase";
            p[3].position = glm::vec3(0.0f, 5.0f, 25.0f);
            p[3].tracking = TrackMode::Ease;
            p[3].track_offset = glm::vec3(0.0f, 5.0f, 25.0f);
            p[3].track_factor = 0.1f;

            p[4].id = ViewId::Cinematic;
            p[4].name = "cinematic";
            p[4].position = glm::vec3(15.0f, 5.0f, 15.0f);
            p[4].rotation = glm::vec3(-glm::pi<float>() / 8.0f, glm::quarter_pi<float>(), 0.0f);
            p[4].has_fixed_look_at = true;

            p[5].id = ViewId::FirstPerson;
            p[5].name = "first_person";
            p[5].position = glm::vec3(0.0f, 0.5f, 0.0f);
            p[5].tracking = TrackMode::Snap;
            p[5].track_offset = glm::vec3(0.0f, 0.8f, 0.0f);
            p[5].roll_follow = 0.5f;
            p[5].hides_cockpit = true;
            return p;
        }();
        return presets;
    }

    inline const ViewPreset& view_preset(ViewId id)
    {
        const std::size_t idx = static_cast<std::size_t>(id);
        return view_presets()[idx < kViewCount ? idx : 0];
    }

    inline const char* view_name(ViewId id)
    {
        return view_preset(id).name;
    }

    inline Result<ViewId> parse_view_id(std::string_view name)
    {
        for (const ViewPreset& p : view_presets())
        {
            if (name == p.name) return Result<ViewId>::success(p.id);
        }
        if (name == "firstPerson" || name == "first-person") return Result<ViewId>::success(ViewId::FirstPerson);
        return Result<ViewId>::failure("unknown view '" + std::string(name) + "'");
    }

    // Number keys 1..6 select views in preset order.
    inline Result<ViewId> view_from_slot(int slot)
    {
        if (slot < 1 || slot > (int)kViewCount) return Result<ViewId>::failure("view slot out of range");
        return Result<ViewId>::success(view_presets()[(std::size_t)(slot - 1)].id);
    }

    inline CameraPose transition_target_pose(const ViewPreset& preset)
    {
        return CameraPose{preset.position, preset.rotation};
    }

    // Pose a view wants this tick when no transition or death sequence owns the camera.
    inline CameraPose compute_live_pose(
        const ViewPreset& preset,
        const CameraPose& current,
        const glm::vec3& player_pos,
        const glm::vec3& player_rot
    )
    {
        CameraPose out = current;
        switch (preset.tracking)
        {
            case TrackMode::Ease:
                out.pos = follow_target(current.pos, player_pos, preset.track_offset, preset.track_factor);
                out.rot_euler = look_rotation_euler(out.pos, player_pos);
                break;
            case TrackMode::Snap:
                out.pos = player_pos + preset.track_offset;
                out.rot_euler = preset.rotation;
                out.rot_euler.z = player_rot.z * preset.roll_follow;
                break;
            case TrackMode::None:
                if (preset.has_fixed_look_at)
                {
                    out.rot_euler = look_rotation_euler(out.pos, preset.look_at);
                }
                break;
        }
        return out;
    }
}
