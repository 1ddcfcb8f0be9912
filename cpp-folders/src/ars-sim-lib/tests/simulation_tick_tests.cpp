#include <cstdio>
#include <string>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include "ars/app/game_session.hpp"
#include "ars/camera/camera_rig.hpp"
#include "ars/input/input_latch.hpp"
#include "ars/sim/player_control.hpp"

#include "test_support.hpp"

namespace
{
    using ars_test::approx_eq;

    void send(ars::Game& g, const ars::InputEvent& e)
    {
        const ars::InputEvent one[] = {e};
        g.handle_input(one);
    }

    bool test_player_step_reverts_exactly()
    {
        ars::CameraRig cam{};
        const ars::Frustum f = cam.frustum();

        ars::Player p{};
        p.tr.pos = glm::vec3(0.1f, 0.3f, 10.0f);
        p.tr.vel = glm::vec3(50.0f, 0.0f, 0.0f);
        const glm::vec3 before = p.tr.pos;

        if (ars::step_player(p, f, ars::PlayerParams{})) return false;
        if (!(p.tr.pos == before)) return false;

        p.tr.vel = glm::vec3(0.2f, 0.0f, 0.0f);
        if (!ars::step_player(p, f, ars::PlayerParams{})) return false;
        return approx_eq(p.tr.pos.x, 0.3f);
    }

    bool test_player_stays_inside_frustum()
    {
        ars::Game g(ars_test::test_config());
        ars_test::quiet_session(g);
        const float margin = g.config().player.edge_margin;

        send(g, ars::make_move_event(ars::MoveDirection::Right, true));
        send(g, ars::make_move_event(ars::MoveDirection::Up, true));

        int reverts = 0;
        for (int i = 0; i < 200; ++i)
        {
            const glm::vec3 prev = g.state().player.tr.pos;
            g.advance_frame();
            const ars::Player& p = g.state().player;

            if (!ars::player_within_frustum(p, g.state().camera.frustum(), margin)) return false;
            if (p.tr.pos == prev)
            {
                ++reverts;
                continue;
            }
            if (!approx_eq(p.tr.pos, prev + glm::vec3(0.2f, 0.2f, 0.0f))) return false;
        }
        return reverts > 0 && g.state().player.tr.pos.x > 5.0f;
    }

    bool test_input_drives_velocity()
    {
        ars::Game g(ars_test::test_config());
        ars_test::quiet_session(g);

        send(g, ars::make_move_event(ars::MoveDirection::Left, true));
        g.advance_frame();
        if (!approx_eq(g.state().player.tr.vel.x, -0.2f)) return false;
        if (!approx_eq(g.state().player.tr.pos.x, -0.2f)) return false;

        // Ending the opposite direction still releases the axis.
        send(g, ars::make_move_event(ars::MoveDirection::Right, false));
        send(g, ars::make_move_event(ars::MoveDirection::Down, true));
        g.advance_frame();
        if (!approx_eq(g.state().player.tr.vel.x, 0.0f)) return false;
        if (!approx_eq(g.state().player.tr.vel.y, -0.2f)) return false;
        return approx_eq(g.state().player.tr.pos, glm::vec3(-0.2f, -0.2f, 10.0f));
    }

    bool test_tilt_settles_nose_forward()
    {
        ars::Game g(ars_test::test_config());
        ars_test::quiet_session(g);
        ars_test::run_frames(g, 300);
        const glm::vec3 rot = g.state().player.tr.rot_euler;
        return approx_eq(rot.x, -glm::half_pi<float>(), 1e-3f) && approx_eq(rot.z, 0.0f, 1e-3f);
    }

    bool test_projectile_kill_scores_once()
    {
        ars_test::RecordingVisualFactory factory{};
        ars::Game g(ars_test::test_config(), &factory);
        ars_test::EventLog log{};
        log.bind(g.events());
        ars_test::quiet_session(g);

        ars_test::place_obstacle(g, glm::vec3(0.0f, 0.0f, -5.0f), 0.0f);
        send(g, ars::make_fire_event(true));
        send(g, ars::make_fire_event(false));
        if (g.state().projectiles.live_count() != 1) return false;

        ars_test::run_frames(g, 60);
        if (g.state().score != 1) return false;
        if (log.scores.size() != 1 || log.scores[0] != 1) return false;
        if (log.count(ars::DestroyCause::ProjectileHit) != 1) return false;
        if (g.state().projectiles.live_count() != 0 || g.state().obstacles.live_count() != 0) return false;
        if (g.state().death_animation) return false;
        return factory.attached(ars::VisualKind::Projectile) == 0 && factory.attached(ars::VisualKind::Obstacle) == 0;
    }

    bool test_missed_projectile_expires()
    {
        ars::Game g(ars_test::test_config());
        ars_test::quiet_session(g);

        send(g, ars::make_fire_event(true));
        send(g, ars::make_fire_event(false));
        // From z = 9 at 0.5 per tick it is past -50 after 119 ticks.
        ars_test::run_frames(g, 118);
        if (g.state().projectiles.live_count() != 1) return false;
        ars_test::run_frames(g, 2);
        return g.state().projectiles.live_count() == 0 && g.state().score == 0;
    }

    bool test_shield_absorbs_repeatedly()
    {
        ars::Game g(ars_test::test_config());
        ars_test::EventLog log{};
        log.bind(g.events());
        ars_test::quiet_session(g);
        send(g, ars::make_command_event(ars::InputEventType::ToggleShield));
        if (!g.state().player.shield) return false;

        for (int i = 0; i < 5; ++i)
        {
            ars_test::place_obstacle(g, g.state().player.tr.pos, 0.0f);
            g.advance_frame();
            if (g.state().obstacles.live_count() != 0) return false;
        }

        if (log.count(ars::DestroyCause::ShieldImpact) != 5) return false;
        if (!g.state().player.shield || g.state().game_over || g.state().death_animation) return false;
        return g.state().score == 0 && log.scores.empty() && g.phase() == ars::SessionPhase::Playing;
    }

    bool test_passing_obstacle_frees_slot()
    {
        ars::Game g(ars_test::test_config());
        ars_test::EventLog log{};
        log.bind(g.events());
        ars_test::quiet_session(g);
        g.state().score = 9;

        const std::size_t free_before = g.state().obstacles.free_count();
        const ars::ObstacleId id = ars_test::place_obstacle(g, glm::vec3(10.0f, 0.0f, 14.9f), 0.2f);
        g.advance_frame();

        if (g.state().obstacles.alive(id) || g.state().obstacles.live_count() != 0) return false;
        if (g.state().obstacles.free_count() != free_before) return false;
        if (log.count(ars::DestroyCause::PassedPlayer) != 1) return false;
        return g.state().score == 9 && log.scores.empty() && !g.state().game_over && !g.state().death_animation;
    }

    bool test_fatal_hit_ends_obstacle_pass()
    {
        ars::Game g(ars_test::test_config());
        ars_test::quiet_session(g);

        const glm::vec3 at = g.state().player.tr.pos;
        const ars::ObstacleId older = ars_test::place_obstacle(g, at, 0.3f);
        const ars::ObstacleId newer = ars_test::place_obstacle(g, at, 0.0f);
        g.advance_frame();

        if (!g.state().death_animation || g.state().game_over) return false;
        if (!(g.state().death.killer == newer)) return false;
        // Newest first: the older obstacle was never integrated this tick.
        const ars::Obstacle* o = g.state().obstacles.get(older);
        return o && o->tr.pos.z == at.z && g.state().obstacles.live_count() == 2;
    }

    bool test_single_shot_and_rapid_fire()
    {
        ars::Game g(ars_test::test_config());
        ars_test::quiet_session(g);

        send(g, ars::make_fire_event(true));
        ars_test::run_frames(g, 30);
        send(g, ars::make_fire_event(false));
        if (g.state().projectiles.live_count() != 1) return false;

        ars::Game r(ars_test::test_config());
        ars_test::quiet_session(r);
        send(r, ars::make_command_event(ars::InputEventType::ToggleRapidFire));
        send(r, ars::make_fire_event(true));
        if (r.state().projectiles.live_count() != 1) return false;
        ars_test::run_frames(r, 7);
        if (r.state().projectiles.live_count() != 2) return false;

        ars_test::run_frames(r, 53);
        const std::size_t held = r.state().projectiles.live_count();
        if (held < 9 || held > 11) return false;

        send(r, ars::make_fire_event(false));
        ars_test::run_frames(r, 30);
        if (r.state().projectiles.live_count() != held) return false;
        for (const std::string& name : r.tasks().pending_names())
        {
            if (name == "rapid_fire") return false;
        }
        return true;
    }

    bool test_stars_wrap_inside_band()
    {
        ars::Game g(ars_test::test_config());
        ars_test::quiet_session(g);
        ars_test::run_frames(g, 1001);

        if (g.state().stars.size() != 16) return false;
        for (const ars::Star& s : g.state().stars)
        {
            if (s.tr.pos.y < -50.0f || s.tr.pos.y > 50.0f) return false;
            if (s.tr.pos.x < -50.0f || s.tr.pos.x > 50.0f) return false;
            if (s.tr.pos.z < -25.0f || s.tr.pos.z > 25.0f) return false;
        }
        return true;
    }

    bool test_spawn_timer_cadence()
    {
        ars::Game g(ars_test::test_config());
        const ars::ObstaclePool& pool = g.state().obstacles;
        if (pool.live_count() != 1) return false;

        // Score 0: one obstacle per pass, 1000 ms apart.
        for (int tick = 1; tick < 60; ++tick)
        {
            g.advance_frame();
            if (pool.live_count() != 1) return false;
        }
        g.advance_frame();
        if (pool.live_count() != 2) return false;

        // The pending pass was timed at score 0; it spawns at the new level.
        g.state().score = 20;
        ars_test::run_frames(g, 59);
        if (pool.live_count() != 2) return false;
        g.advance_frame();
        if (pool.live_count() != 5) return false;

        // Score 20: the next pass follows 600 ms (36 ticks) later.
        ars_test::run_frames(g, 35);
        if (pool.live_count() != 5) return false;
        g.advance_frame();
        if (pool.live_count() != 8) return false;

        bool spawn_pending = false;
        for (const std::string& name : g.tasks().pending_names())
        {
            if (name == "spawn_obstacles") spawn_pending = true;
        }
        return spawn_pending && !g.state().death_animation;
    }

    bool test_first_person_pins_player()
    {
        ars::Game g(ars_test::test_config());
        ars_test::quiet_session(g);

        g.select_view(ars::ViewId::FirstPerson);
        ars_test::run_frames(g, 51);
        if (g.state().view.current != ars::ViewId::FirstPerson) return false;

        // The camera rides at the craft's depth, so every edge point sits behind the
        // near plane and each step is reverted.
        const glm::vec3 before = g.state().player.tr.pos;
        send(g, ars::make_move_event(ars::MoveDirection::Left, true));
        send(g, ars::make_move_event(ars::MoveDirection::Up, true));
        ars_test::run_frames(g, 30);

        if (!(g.state().player.tr.pos == before)) return false;
        return approx_eq(g.state().camera.pos, before + glm::vec3(0.0f, 0.8f, 0.0f));
    }

    bool test_system_order_and_snapshot()
    {
        ars_test::RecordingVisualFactory factory{};
        ars::Game g(ars_test::test_config(), &factory);
        ars_test::quiet_session(g);

        const std::vector<std::string> names = g.systems().system_names();
        if (names.size() != 4) return false;
        if (names[0] != "stars" || names[1] != "player" || names[2] != "obstacles" || names[3] != "projectiles") return false;

        ars_test::place_obstacle(g, glm::vec3(-8.0f, 3.0f, -30.0f), 0.1f);
        ars_test::place_obstacle(g, glm::vec3(8.0f, -3.0f, -30.0f), 0.1f);
        send(g, ars::make_fire_event(true));
        send(g, ars::make_fire_event(false));
        g.advance_frame();

        const ars::RenderSnapshot snap = g.snapshot();
        if (snap.count(ars::EntityKind::Star) != 16 || snap.count(ars::EntityKind::Player) != 1) return false;
        if (snap.count(ars::EntityKind::Obstacle) != 2 || snap.count(ars::EntityKind::Projectile) != 1) return false;
        if (snap.phase != ars::SessionPhase::Playing || snap.frame_index != g.state().frame_index) return false;

        const glm::mat4 vp = g.state().camera.viewproj();
        for (int c = 0; c < 4; ++c)
        {
            for (int r = 0; r < 4; ++r)
            {
                if (!approx_eq(vp[c][r], snap.viewproj[c][r])) return false;
            }
        }

        // Visuals received the post-tick transforms.
        for (const auto& rec : factory.records)
        {
            if (rec->detach_calls == 0 && rec->updates == 0) return false;
        }
        return factory.attached(ars::VisualKind::Player) == 1 && factory.attached(ars::VisualKind::PlayerCockpit) == 1;
    }
}

int main()
{
    ars_test::quiet_logs();

    const bool ok_revert = test_player_step_reverts_exactly();
    const bool ok_frustum = test_player_stays_inside_frustum();
    const bool ok_input = test_input_drives_velocity();
    const bool ok_tilt = test_tilt_settles_nose_forward();
    const bool ok_kill = test_projectile_kill_scores_once();
    const bool ok_expire = test_missed_projectile_expires();
    const bool ok_shield = test_shield_absorbs_repeatedly();
    const bool ok_pass = test_passing_obstacle_frees_slot();
    const bool ok_fatal = test_fatal_hit_ends_obstacle_pass();
    const bool ok_fire = test_single_shot_and_rapid_fire();
    const bool ok_stars = test_stars_wrap_inside_band();
    const bool ok_snap = test_system_order_and_snapshot();
    const bool ok_cadence = test_spawn_timer_cadence();
    const bool ok_fp = test_first_person_pins_player();

    if (!ok_revert) std::fprintf(stderr, "[tick-tests] exact revert failed\n");
    if (!ok_frustum) std::fprintf(stderr, "[tick-tests] frustum bound failed\n");
    if (!ok_input) std::fprintf(stderr, "[tick-tests] input -> velocity failed\n");
    if (!ok_tilt) std::fprintf(stderr, "[tick-tests] tilt smoothing failed\n");
    if (!ok_kill) std::fprintf(stderr, "[tick-tests] projectile kill scoring failed\n");
    if (!ok_expire) std::fprintf(stderr, "[tick-tests] projectile far-plane expiry failed\n");
    if (!ok_shield) std::fprintf(stderr, "[tick-tests] reusable shield failed\n");
    if (!ok_pass) std::fprintf(stderr, "[tick-tests] passing obstacle scenario failed\n");
    if (!ok_fatal) std::fprintf(stderr, "[tick-tests] fatal hit short-circuit failed\n");
    if (!ok_fire) std::fprintf(stderr, "[tick-tests] single shot / rapid fire failed\n");
    if (!ok_stars) std::fprintf(stderr, "[tick-tests] star wrap failed\n");
    if (!ok_snap) std::fprintf(stderr, "[tick-tests] system order / snapshot failed\n");
    if (!ok_cadence) std::fprintf(stderr, "[tick-tests] spawn timer cadence failed\n");
    if (!ok_fp) std::fprintf(stderr, "[tick-tests] first-person movement pin failed\n");

    if (!(ok_revert && ok_frustum && ok_input && ok_tilt && ok_kill && ok_expire && ok_shield && ok_pass &&
          ok_fatal && ok_fire && ok_stars && ok_snap && ok_cadence && ok_fp)) return 1;
    std::fprintf(stderr, "[tick-tests] all tests passed\n");
    return 0;
}
