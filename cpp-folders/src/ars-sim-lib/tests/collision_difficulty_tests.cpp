#include <cmath>
#include <cstdio>
#include <random>

#include <glm/glm.hpp>

#include "ars/config/game_config.hpp"
#include "ars/sim/collision.hpp"
#include "ars/sim/difficulty.hpp"
#include "ars/sim/game_state.hpp"
#include "ars/sim/spawn_scheduler.hpp"

#include "test_support.hpp"

namespace
{
    using ars_test::approx_eq;

    bool test_difficulty_table()
    {
        const ars::DifficultyParams p{};
        if (ars::num_obstacles(0, p) != 1 || ars::spawn_delay_ms(0, p) != 1000.0) return false;
        if (ars::num_obstacles(20, p) != 3 || ars::spawn_delay_ms(20, p) != 600.0) return false;
        // min(1 + floor(35 / 10), 5) = 4
        if (ars::num_obstacles(35, p) != 4 || ars::spawn_delay_ms(35, p) != 300.0) return false;
        if (ars::num_obstacles(1000, p) != 4 || ars::spawn_delay_ms(1000, p) != 300.0) return false;
        if (ars::num_obstacles(-3, p) != 1 || ars::spawn_delay_ms(-3, p) != 1000.0) return false;
        return ars::capped_score(99, p) == 35;
    }

    bool test_difficulty_monotonic_and_bounded()
    {
        ars::DifficultyParams p{};
        p.max_difficulty_score = 200;
        int prev_count = ars::num_obstacles(0, p);
        double prev_delay = ars::spawn_delay_ms(0, p);
        for (int score = 1; score <= 300; ++score)
        {
            const int count = ars::num_obstacles(score, p);
            const double delay = ars::spawn_delay_ms(score, p);
            if (count < prev_count || count > 5) return false;
            if (delay > prev_delay || delay < 300.0) return false;
            prev_count = count;
            prev_delay = delay;
        }
        return prev_count == 5;
    }

    bool test_difficulty_speed_and_spin()
    {
        const ars::GameConfig cfg{};
        const ars::DifficultyLevel easy = ars::difficulty_for(0, cfg);
        const ars::DifficultyLevel hard = ars::difficulty_for(80, cfg);
        if (!approx_eq(easy.obstacle_speed, 0.2f) || !approx_eq(easy.rotation_scale, 1.0f)) return false;
        return hard.capped_score == 35 && approx_eq(hard.obstacle_speed, 0.9f) && approx_eq(hard.rotation_scale, 1.7f);
    }

    bool test_intersects_symmetric()
    {
        std::mt19937 rng(1234u);
        std::uniform_real_distribution<float> pos(-4.0f, 4.0f);
        std::uniform_real_distribution<float> ext(0.0f, 2.0f);

        int hits = 0;
        for (int i = 0; i < 2000; ++i)
        {
            const ars::AABB a = ars::aabb_from_center_extent(glm::vec3(pos(rng), pos(rng), pos(rng)),
                                                             glm::vec3(ext(rng), ext(rng), ext(rng)));
            const ars::AABB b = ars::aabb_from_center_extent(glm::vec3(pos(rng), pos(rng), pos(rng)),
                                                             glm::vec3(ext(rng), ext(rng), ext(rng)));
            const bool ab = ars::intersects(a, b);
            if (ab != ars::intersects(b, a)) return false;
            if (ab) ++hits;
        }
        return hits > 0 && hits < 2000;
    }

    bool test_touching_boxes_overlap()
    {
        const ars::AABB a = ars::aabb_from_center_extent(glm::vec3(0.0f), glm::vec3(1.0f));
        const ars::AABB touching = ars::aabb_from_center_extent(glm::vec3(2.0f, 0.0f, 0.0f), glm::vec3(1.0f));
        const ars::AABB apart = ars::aabb_from_center_extent(glm::vec3(2.5f, 0.0f, 0.0f), glm::vec3(1.0f));
        if (!ars::intersects(a, touching) || !ars::intersects(touching, a)) return false;
        if (ars::intersects(a, apart) || ars::intersects(apart, a)) return false;
        return !ars::intersects(a, ars::AABB{});
    }

    ars::Obstacle make_obstacle(const glm::vec3& pos, float size, float scale)
    {
        ars::Obstacle o{};
        o.tr.pos = pos;
        o.hitbox.pos = pos;
        o.size = size;
        o.hitbox_radius = size * 0.8f;
        o.tr.scl = glm::vec3(scale);
        o.hitbox.scl = glm::vec3(scale * 0.8f);
        return o;
    }

    bool test_obstacle_uses_hitbox_not_visual()
    {
        ars::Player p{};
        p.tr.pos = glm::vec3(0.0f);
        p.half_extents = glm::vec3(2.0f, 2.0f, 1.0f);

        // Hitbox half extent = 2 * 0.8 * 0.8 = 1.28; player reaches z = -1.
        const ars::Obstacle near = make_obstacle(glm::vec3(0.0f, 0.0f, -2.2f), 2.0f, 1.0f);
        const ars::Obstacle grazing = make_obstacle(glm::vec3(0.0f, 0.0f, -2.5f), 2.0f, 1.0f);
        if (!ars::player_hits(p, near)) return false;
        if (ars::player_hits(p, grazing)) return false;

        // The visual sphere (radius 2) would have registered the graze.
        const ars::AABB visual = ars::aabb_from_sphere(ars::Sphere{grazing.tr.pos, grazing.size * grazing.tr.scl.x});
        return ars::intersects(ars::player_box(p), visual);
    }

    bool test_projectile_hits()
    {
        ars::Projectile pr{};
        pr.radius = 0.2f;
        pr.tr.pos = glm::vec3(3.0f, 1.0f, -20.0f);

        const ars::Obstacle on_path = make_obstacle(glm::vec3(3.5f, 1.0f, -20.5f), 1.0f, 0.5f);
        const ars::Obstacle off_path = make_obstacle(glm::vec3(6.0f, 1.0f, -20.0f), 1.0f, 0.5f);
        return ars::projectile_hits(pr, on_path) && !ars::projectile_hits(pr, off_path);
    }

    bool test_spawn_params_in_window()
    {
        const ars::GameConfig cfg{};
        ars::GameState s{};
        s.rng.seed(77u);

        for (int score : {0, 20, 60})
        {
            const ars::DifficultyLevel level = ars::difficulty_for(score, cfg);
            const float spin_bound = 0.01f * level.rotation_scale + 1e-6f;
            for (int i = 0; i < 200; ++i)
            {
                const ars::ObstacleSpawnParams p = ars::roll_obstacle_params(s, cfg, level);
                if (p.pos.x < -20.0f || p.pos.x > 20.0f) return false;
                if (p.pos.y < -10.0f || p.pos.y > 10.0f) return false;
                if (!approx_eq(p.pos.z, -50.0f)) return false;
                if (p.size < 1.0f || p.size > 2.0f) return false;
                if (!approx_eq(p.speed, level.obstacle_speed)) return false;
                if (std::abs(p.rotation_speed) > spin_bound) return false;
                if (!approx_eq(glm::length(p.rotation_axis), 1.0f)) return false;
            }
        }
        return true;
    }

    bool test_rescale_by_camera_distance()
    {
        const ars::ObstacleParams op{};
        ars::Obstacle o = make_obstacle(glm::vec3(0.0f, 0.0f, 17.0f), 1.5f, 1.0f);

        ars::rescale_obstacle(o, glm::vec3(0.0f, 0.0f, 20.0f), op);
        if (!approx_eq(o.tr.scl.x, 1.5f) || !approx_eq(o.hitbox.scl.x, 1.2f)) return false;

        o.tr.pos = glm::vec3(0.0f, 0.0f, -50.0f);
        ars::rescale_obstacle(o, glm::vec3(0.0f, 0.0f, 20.0f), op);
        if (!approx_eq(o.tr.scl.x, 0.5f) || !approx_eq(o.hitbox.scl.x, 0.4f)) return false;
        return approx_eq(o.hitbox.pos, o.tr.pos);
    }
}

int main()
{
    ars_test::quiet_logs();

    const bool ok_table = test_difficulty_table();
    const bool ok_mono = test_difficulty_monotonic_and_bounded();
    const bool ok_speed = test_difficulty_speed_and_spin();
    const bool ok_sym = test_intersects_symmetric();
    const bool ok_touch = test_touching_boxes_overlap();
    const bool ok_hitbox = test_obstacle_uses_hitbox_not_visual();
    const bool ok_proj = test_projectile_hits();
    const bool ok_spawn = test_spawn_params_in_window();
    const bool ok_scale = test_rescale_by_camera_distance();

    if (!ok_table) std::fprintf(stderr, "[collision-tests] difficulty table failed\n");
    if (!ok_mono) std::fprintf(stderr, "[collision-tests] difficulty monotonicity failed\n");
    if (!ok_speed) std::fprintf(stderr, "[collision-tests] difficulty speed / spin failed\n");
    if (!ok_sym) std::fprintf(stderr, "[collision-tests] intersects symmetry failed\n");
    if (!ok_touch) std::fprintf(stderr, "[collision-tests] inclusive bounds failed\n");
    if (!ok_hitbox) std::fprintf(stderr, "[collision-tests] obstacle hitbox slack failed\n");
    if (!ok_proj) std::fprintf(stderr, "[collision-tests] projectile hit test failed\n");
    if (!ok_spawn) std::fprintf(stderr, "[collision-tests] spawn parameter window failed\n");
    if (!ok_scale) std::fprintf(stderr, "[collision-tests] distance rescale failed\n");

    if (!(ok_table && ok_mono && ok_speed && ok_sym && ok_touch && ok_hitbox && ok_proj && ok_spawn && ok_scale)) return 1;
    std::fprintf(stderr, "[collision-tests] all tests passed\n");
    return 0;
}
