#include <cstdio>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include "ars/sim/entities.hpp"
#include "ars/sim/entity_pool.hpp"
#include "ars/sim/game_state.hpp"
#include "ars/sim/spatial_transform.hpp"
#include "ars/sim/visual_handle.hpp"

#include "test_support.hpp"

namespace
{
    using ars_test::approx_eq;

    bool test_spawn_destroy_generation()
    {
        ars::ProjectilePool pool{};
        const ars::ProjectileId a = pool.spawn(ars::Projectile{});
        const ars::ProjectileId b = pool.spawn(ars::Projectile{});
        if (!a.valid() || !b.valid() || a == b) return false;
        if (pool.live_count() != 2) return false;

        if (!pool.destroy(a)) return false;
        if (pool.destroy(a)) return false;
        if (pool.get(a) != nullptr || pool.alive(a)) return false;
        if (pool.free_count() != 1) return false;

        // The recycled slot gets a new generation; the stale id stays dead.
        const ars::ProjectileId c = pool.spawn(ars::Projectile{});
        if (c.slot != a.slot || c.generation == a.generation) return false;
        if (pool.alive(a) || !pool.alive(c)) return false;
        if (pool.free_count() != 0 || pool.capacity() != 2) return false;

        const std::vector<ars::ProjectileId>& order = pool.live_ids();
        return order.size() == 2 && order[0] == b && order[1] == c;
    }

    bool test_unknown_ids_are_noops()
    {
        ars::ObstaclePool pool{};
        if (pool.destroy(ars::ObstacleId{})) return false;

        ars::ObstacleId bogus{};
        bogus.slot = 12;
        bogus.generation = 1;
        if (pool.destroy(bogus) || pool.get(bogus) != nullptr) return false;

        const ars::ObstacleId id = pool.spawn(ars::Obstacle{});
        ars::ObstacleId wrong_gen = id;
        wrong_gen.generation += 5;
        if (pool.destroy(wrong_gen)) return false;
        return pool.alive(id) && pool.live_count() == 1;
    }

    bool test_destroy_detaches_visual_once()
    {
        ars_test::RecordingVisualFactory factory{};
        ars::ProjectilePool pool{};

        ars::Projectile p{};
        p.visual = ars::attach_visual(&factory, ars::VisualKind::Projectile);
        const ars::ProjectileId id = pool.spawn(std::move(p));
        if (factory.attached(ars::VisualKind::Projectile) != 1) return false;

        pool.destroy(id);
        pool.destroy(id);
        if (factory.records.size() != 1) return false;
        return factory.records[0]->detach_calls == 1 && factory.attached(ars::VisualKind::Projectile) == 0;
    }

    bool test_visual_binding_lifecycle()
    {
        ars_test::RecordingVisualFactory factory{};
        {
            ars::VisualBinding a = ars::attach_visual(&factory, ars::VisualKind::Obstacle);
            ars::VisualBinding b = std::move(a);
            if (a.attached() || !b.attached()) return false;

            b.update_transform(glm::vec3(1.0f, 2.0f, 3.0f), glm::vec3(0.0f), glm::vec3(1.0f));
            b.detach();
            b.detach();
            // Update after detach is ignored.
            b.update_transform(glm::vec3(9.0f), glm::vec3(0.0f), glm::vec3(1.0f));
        }
        const ars_test::VisualRecord& rec = *factory.records[0];
        if (rec.detach_calls != 1 || rec.updates != 1) return false;
        if (!approx_eq(rec.pos, glm::vec3(1.0f, 2.0f, 3.0f))) return false;

        // Move-assigning over a live binding releases the old handle.
        ars::VisualBinding x = ars::attach_visual(&factory, ars::VisualKind::Projectile);
        x = ars::attach_visual(&factory, ars::VisualKind::Projectile);
        if (factory.records[1]->detach_calls != 1 || factory.records[2]->detach_calls != 0) return false;

        ars::VisualBinding headless = ars::attach_visual(nullptr, ars::VisualKind::Player);
        headless.set_opacity(0.0f);
        headless.detach();
        return !headless.attached();
    }

    bool test_clear_recycles_every_slot()
    {
        ars_test::RecordingVisualFactory factory{};
        ars::ObstaclePool pool{};
        std::vector<ars::ObstacleId> ids{};
        for (int i = 0; i < 3; ++i)
        {
            ars::Obstacle o{};
            o.visual = ars::attach_visual(&factory, ars::VisualKind::Obstacle);
            ids.push_back(pool.spawn(std::move(o)));
        }

        pool.clear();
        if (pool.live_count() != 0 || pool.free_count() != 3) return false;
        for (const ars::ObstacleId& id : ids)
        {
            if (pool.alive(id)) return false;
        }
        return factory.total_detach_calls() == 3;
    }

    bool test_for_each_live_in_spawn_order()
    {
        ars::ObstaclePool pool{};
        for (int i = 0; i < 4; ++i)
        {
            ars::Obstacle o{};
            o.size = 1.0f + 0.25f * (float)i;
            pool.spawn(std::move(o));
        }
        pool.destroy(pool.live_ids()[1]);

        std::vector<float> sizes{};
        pool.for_each_live([&](const ars::ObstacleId&, const ars::Obstacle& o) { sizes.push_back(o.size); });
        return sizes.size() == 3 && approx_eq(sizes[0], 1.0f) && approx_eq(sizes[1], 1.5f) && approx_eq(sizes[2], 1.75f);
    }

    bool test_visit_live_by_kind()
    {
        ars::GameState s{};
        s.stars.resize(3);
        s.obstacles.spawn(ars::Obstacle{});
        s.projectiles.spawn(ars::Projectile{});
        s.projectiles.spawn(ars::Projectile{});

        int players = 0;
        int stars = 0;
        int obstacles = 0;
        int projectiles = 0;
        ars::visit_live(s, ars::EntityKind::Player, [&](const ars::SpatialTransform&) { ++players; });
        ars::visit_live(s, ars::EntityKind::Star, [&](const ars::SpatialTransform&) { ++stars; });
        ars::visit_live(s, ars::EntityKind::Obstacle, [&](const ars::SpatialTransform&) { ++obstacles; });
        ars::visit_live(s, ars::EntityKind::Projectile, [&](const ars::SpatialTransform&) { ++projectiles; });
        return players == 1 && stars == 3 && obstacles == 1 && projectiles == 2;
    }

    bool test_transform_integrate_and_world_box()
    {
        ars::SpatialTransform t{};
        t.vel = glm::vec3(1.0f, -2.0f, 0.5f);
        t.integrate();
        t.integrate();
        if (!approx_eq(t.pos, glm::vec3(2.0f, -4.0f, 1.0f))) return false;

        // Nose-forward pitch swaps the y and z extents.
        t.pos = glm::vec3(0.0f);
        t.rot_euler = glm::vec3(-glm::half_pi<float>(), 0.0f, 0.0f);
        const ars::AABB box = ars::world_aabb(t, glm::vec3(2.0f, 2.0f, 1.0f));
        if (!approx_eq(box.extent(), glm::vec3(2.0f, 1.0f, 2.0f))) return false;

        t.rot_euler = glm::vec3(0.0f);
        t.scl = glm::vec3(2.0f, 1.0f, 1.0f);
        const ars::AABB scaled = ars::world_aabb(t, glm::vec3(2.0f, 2.0f, 1.0f));
        return approx_eq(scaled.extent(), glm::vec3(4.0f, 2.0f, 1.0f));
    }
}

int main()
{
    ars_test::quiet_logs();

    const bool ok_gen = test_spawn_destroy_generation();
    const bool ok_unknown = test_unknown_ids_are_noops();
    const bool ok_detach = test_destroy_detaches_visual_once();
    const bool ok_binding = test_visual_binding_lifecycle();
    const bool ok_clear = test_clear_recycles_every_slot();
    const bool ok_order = test_for_each_live_in_spawn_order();
    const bool ok_visit = test_visit_live_by_kind();
    const bool ok_tr = test_transform_integrate_and_world_box();

    if (!ok_gen) std::fprintf(stderr, "[pool-tests] spawn/destroy generation check failed\n");
    if (!ok_unknown) std::fprintf(stderr, "[pool-tests] unknown id no-op failed\n");
    if (!ok_detach) std::fprintf(stderr, "[pool-tests] destroy did not detach visual exactly once\n");
    if (!ok_binding) std::fprintf(stderr, "[pool-tests] visual binding lifecycle failed\n");
    if (!ok_clear) std::fprintf(stderr, "[pool-tests] clear did not recycle slots\n");
    if (!ok_order) std::fprintf(stderr, "[pool-tests] live iteration order failed\n");
    if (!ok_visit) std::fprintf(stderr, "[pool-tests] visit_live by kind failed\n");
    if (!ok_tr) std::fprintf(stderr, "[pool-tests] transform integrate / world box failed\n");

    if (!(ok_gen && ok_unknown && ok_detach && ok_binding && ok_clear && ok_order && ok_visit && ok_tr)) return 1;
    std::fprintf(stderr, "[pool-tests] all tests passed\n");
    return 0;
}
