#pragma once

/*
    ARS SIM LIB

    FILE: view_director.hpp
    MODULE: sim
    PURPOSE: Camera view selection, smoothstep-blended transitions between presets and
            the per-tick live pose of the committed view.
*/


#include <string>

#include <glm/glm.hpp>

#include "ars/camera/camera_math.hpp"
#include "ars/camera/view_presets.hpp"
#include "ars/core/invariant.hpp"
#include "ars/core/log.hpp"
#include "ars/sim/sim_context.hpp"

namespace ars
{
    // Blend parameters accumulate a fixed step; the tolerance absorbs the
    // rounding of 50 * 0.02.
    inline constexpr double kBlendDoneEpsilon = 1e-9;

    inline bool blend_done(double progress)
    {
        return progress >= 1.0 - kBlendDoneEpsilon;
    }

    // Returns true when a transition started. Requests during a transition, for the
    // current view, or once the death sequence owns the camera are ignored.
    inline bool request_view(const SimContext& ctx, ViewId target)
    {
        GameState& s = *ctx.state;
        ViewState& v = s.view;

        if (!s.gameplay_active())
        {
            log_debug(std::string("view request '") + view_name(target) + "' ignored: camera owned by death sequence");
            return false;
        }
        if (v.transitioning)
        {
            log_debug(std::string("view request '") + view_name(target) + "' ignored: transition in flight");
            return false;
        }
        if (target == v.current) return false;

        v.transitioning = true;
        v.target = target;
        v.start_pose = s.camera.pose();
        v.target_pose = transition_target_pose(view_preset(target));
        v.progress = 0.0;
        log_info(std::string("view transition: ") + view_name(v.current) + " -> " + view_name(target));
        return true;
    }

    inline void abort_view_transition(GameState& s)
    {
        if (!s.view.transitioning) return;
        log_debug(std::string("view transition to '") + view_name(s.view.target) + "' aborted");
        s.view.transitioning = false;
        s.view.target = s.view.current;
        s.view.progress = 0.0;
    }

    inline void tick_view_transition(const SimContext& ctx)
    {
        GameState& s = *ctx.state;
        ViewState& v = s.view;
        if (!v.transitioning) return;

        const double step = ctx.config->camera.transition_step;
        ARS_INVARIANT(step > 0.0, "camera transition step must be positive");
        v.progress += step > 0.0 ? step : 1.0;

        const float t = (float)smoothstep(v.progress, 0.0, 1.0);
        CameraPose pose{};
        pose.pos = glm::mix(v.start_pose.pos, v.target_pose.pos, t);
        pose.rot_euler.x = lerp(v.start_pose.rot_euler.x, v.target_pose.rot_euler.x, t);
        pose.rot_euler.y = lerp(v.start_pose.rot_euler.y, v.target_pose.rot_euler.y, t);
        pose.rot_euler.z = lerp(v.start_pose.rot_euler.z, v.target_pose.rot_euler.z, t);
        s.camera.set_pose(pose);

        if (blend_done(v.progress))
        {
            v.transitioning = false;
            v.current = v.target;
            v.progress = 1.0;
            log_debug(std::string("view committed: ") + view_name(v.current));
            notify_view_changed(ctx.events, v.current);
        }
    }

    // Live tracking for the committed view; idle while a transition or the death
    // sequence owns the camera.
    inline void update_live_camera(const SimContext& ctx)
    {
        GameState& s = *ctx.state;
        if (!s.gameplay_active() || s.view.transitioning) return;

        const ViewPreset& preset = view_preset(s.view.current);
        s.camera.set_pose(compute_live_pose(preset, s.camera.pose(), s.player.tr.pos, s.player.tr.rot_euler));
    }

    // Puts the camera on a view immediately, without a blend. Used at session start.
    inline void snap_to_view(const SimContext& ctx, ViewId view)
    {
        GameState& s = *ctx.state;
        s.view = ViewState{};
        s.view.current = view;
        s.view.target = view;
        s.camera.set_pose(transition_target_pose(view_preset(view)));
        const ViewPreset& preset = view_preset(view);
        if (preset.has_fixed_look_at) s.camera.look_at(preset.look_at);
        if (preset.tracks_player())
        {
            s.camera.set_pose(compute_live_pose(preset, s.camera.pose(), s.player.tr.pos, s.player.tr.rot_euler));
        }
    }
}
