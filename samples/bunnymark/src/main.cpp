// Bunnymark
// Headless stress sample: bunnies bounce around an offscreen surface while a
// script cycles their hue. Runs a fixed number of ticks and logs a summary.
//
// Usage: cadence_bunnymark [settings.json] [bunny_count]

#include <cadence/core/core.hpp>
#include <cadence/ecs/ecs.hpp>
#include <cadence/render/surface.hpp>
#include <cadence/scene/query.hpp>
#include <cadence/scene/world.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <memory>
#include <random>
#include <string>

using namespace cadence::core;
using namespace cadence::ecs;
namespace scene = cadence::scene;
namespace render = cadence::render;

constexpr uint32_t SCREEN_WIDTH = 320;
constexpr uint32_t SCREEN_HEIGHT = 240;
constexpr int DEFAULT_BUNNIES = 500;
constexpr int TICKS = 300;
constexpr float GRAVITY = 0.5f;

struct Position {
    float x = 0.0f;
    float y = 0.0f;
};

struct Velocity {
    float x = 0.0f;
    float y = 0.0f;
};

// Hue of a bunny in [0, 1). Only colorful bunnies cycle.
struct Hue {
    bool colorful = false;
    double value = 0.0;
};

struct Gravity {
    float g = GRAVITY;
};

// Moves every bunny and bounces it off the screen edges
class BounceSystem : public Updater {
public:
    void update(ECS& ecs) override {
        auto view = ecs.world().view<Position, Velocity, Gravity>();
        for (auto entity : view) {
            auto& pos = view.get<Position>(entity);
            auto& vel = view.get<Velocity>(entity);

            pos.x += vel.x;
            pos.y += vel.y;
            vel.y += view.get<Gravity>(entity).g;

            if (pos.x < 0.0f) { pos.x = 0.0f; vel.x = -vel.x; }
            if (pos.x > SCREEN_WIDTH - 1) { pos.x = SCREEN_WIDTH - 1; vel.x = -vel.x; }
            if (pos.y > SCREEN_HEIGHT - 1) { pos.y = SCREEN_HEIGHT - 1; vel.y *= -0.85f; }
            if (pos.y < 0.0f) { pos.y = 0.0f; vel.y = 0.0f; }
        }
    }
};

// Clears the screen before anything else draws
class ClearSystem : public Drawer {
public:
    void draw(ECS&, render::Surface& screen) override {
        screen.clear(render::rgba(0x20, 0x20, 0x30));
    }
};

// Counts frames and ticks into a tiny HUD surface
class MetricsSystem : public Updater, public Drawer {
public:
    void update(ECS&) override { m_ticks++; }
    void draw(ECS& ecs, render::Surface& hud) override {
        m_frames++;
        hud.clear(0);
        auto bunnies = scene::Query::with<Position>().count(ecs.world());
        for (uint32_t x = 0; x < hud.width() && x < bunnies / 10; ++x) {
            hud.set_pixel(static_cast<int32_t>(x), 0, render::rgba(0xFF, 0xFF, 0xFF));
        }
    }

    int ticks() const { return m_ticks; }
    int frames() const { return m_frames; }

private:
    int m_ticks = 0;
    int m_frames = 0;
};

// Per-entity hue cycling and plotting
class HueScript : public ScriptUpdater, public ScriptDrawer {
public:
    void update(ECS& ecs, scene::Entity entity) override {
        auto& hue = ecs.world().get<Hue>(entity);
        if (!hue.colorful) return;
        hue.value = std::fmod(hue.value + ecs.time().delta() * 0.5, 1.0);
    }

    void draw(ECS& ecs, scene::Entity entity, render::Surface& screen) override {
        const auto& pos = ecs.world().get<Position>(entity);
        const auto& hue = ecs.world().get<Hue>(entity);
        screen.set_pixel(static_cast<int32_t>(pos.x), static_cast<int32_t>(pos.y), hue_to_rgba(hue.value));
    }

private:
    static uint32_t hue_to_rgba(double h) {
        double r = std::clamp(std::fabs(h * 6.0 - 3.0) - 1.0, 0.0, 1.0);
        double g = std::clamp(2.0 - std::fabs(h * 6.0 - 2.0), 0.0, 1.0);
        double b = std::clamp(2.0 - std::fabs(h * 6.0 - 4.0), 0.0, 1.0);
        return render::rgba(static_cast<uint8_t>(r * 255.0),
                            static_cast<uint8_t>(g * 255.0),
                            static_cast<uint8_t>(b * 255.0));
    }
};

// Removes bunnies that have settled on the floor
class SettleScript : public ScriptUpdater {
public:
    void update(ECS& ecs, scene::Entity entity) override {
        const auto& pos = ecs.world().get<Position>(entity);
        const auto& vel = ecs.world().get<Velocity>(entity);
        if (pos.y >= SCREEN_HEIGHT - 1 && std::fabs(vel.y) < 0.05f) {
            ecs.world().destroy(entity);
            m_settled++;
        }
    }

    int settled() const { return m_settled; }

private:
    int m_settled = 0;
};

static void spawn_bunnies(scene::World& world, int count) {
    std::mt19937 rng(1234);
    std::uniform_real_distribution<float> x_dist(0.0f, SCREEN_WIDTH - 1.0f);
    std::uniform_real_distribution<float> speed(-4.0f, 4.0f);
    std::uniform_real_distribution<double> hue(0.0, 1.0);

    for (int i = 0; i < count; ++i) {
        auto e = world.create("Bunny_" + std::to_string(i));
        world.emplace<Position>(e, x_dist(rng), 0.0f);
        world.emplace<Velocity>(e, speed(rng), speed(rng));
        world.emplace<Gravity>(e);
        world.emplace<Hue>(e, i % 2 == 0, hue(rng));
    }
}

int main(int argc, char** argv) {
    auto& settings = Settings::get();
    if (argc > 1 && !settings.load(argv[1])) {
        log(LogLevel::Warn, std::string("[Bunnymark] Using default settings, could not load ") + argv[1]);
    }
    set_log_level(settings.log.level);

    int bunny_count = DEFAULT_BUNNIES;
    if (argc > 2) {
        bunny_count = std::max(0, std::atoi(argv[2]));
    }

    log(LogLevel::Info, "[Bunnymark] Starting with " + std::to_string(bunny_count) + " bunnies");

    scene::World world;
    render::Surface screen(SCREEN_WIDTH, SCREEN_HEIGHT, "screen");
    render::Surface hud(SCREEN_WIDTH, 1, "hud");

    try {
        ECS ecs(world, settings);

        auto metrics = std::make_shared<MetricsSystem>();
        auto settle = std::make_shared<SettleScript>();

        ecs.add_system(std::make_shared<ClearSystem>(), {100});
        ecs.add_system(std::make_shared<BounceSystem>(), {10});
        ecs.add_system(metrics, {-10, &hud});

        ecs.add_script(scene::Query::with<Position, Hue>(), std::make_shared<HueScript>());
        ecs.add_script(scene::Query::with<Position, Velocity>(), settle);

        spawn_bunnies(world, bunny_count);

        for (int i = 0; i < TICKS; ++i) {
            ecs.tick();
            ecs.frame(screen);
        }

        log(LogLevel::Info,
            "[Bunnymark] " + std::to_string(metrics->ticks()) + " ticks, " +
            std::to_string(metrics->frames()) + " frames, " +
            std::to_string(settle->settled()) + " bunnies settled, " +
            std::to_string(world.size()) + " remaining, " +
            std::to_string(ecs.time().elapsed()) + "s simulated");
    } catch (const std::exception& e) {
        log(LogLevel::Fatal, std::string("[Bunnymark] ") + e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
