#include <catch2/catch_test_macros.hpp>
#include "src/tasks/KernelMath.h"
#include "src/tasks/MortonHashTask.h"
#include "tests/support/Fixtures.h"

using namespace droplet;
using droplet::math::Vec3;

TEST_CASE("Morton - negative unit cells", "[hash]") {
    REQUIRE(kernel::mortonHash(Vec3(-1.0f, 0.0f, 0.0f), 1.0f) == 0x49249249u);
    REQUIRE(kernel::mortonHash(Vec3(0.0f, -1.0f, 0.0f), 1.0f) == 0x92492492u);
    REQUIRE(kernel::mortonHash(Vec3(0.0f, 0.0f, -1.0f), 1.0f) == 0x24924924u);
}

TEST_CASE("Morton - bit interleave order", "[hash]") {
    REQUIRE(kernel::mortonEncode(0, 0, 0) == 0u);
    REQUIRE(kernel::mortonEncode(1, 0, 0) == 0x1u);
    REQUIRE(kernel::mortonEncode(0, 1, 0) == 0x2u);
    REQUIRE(kernel::mortonEncode(0, 0, 1) == 0x4u);
    REQUIRE(kernel::mortonEncode(3, 0, 0) == 0x9u);
    // x bit 10 lands on bit 30, y bit 10 on bit 31, z bit 10 falls off
    REQUIRE(kernel::mortonEncode(1u << 10, 0, 0) == (1u << 30));
    REQUIRE(kernel::mortonEncode(0, 1u << 10, 0) == (1u << 31));
    REQUIRE(kernel::mortonEncode(0, 0, 1u << 10) == 0u);
}

TEST_CASE("Morton - cell coordinates floor and clamp", "[hash]") {
    REQUIRE(kernel::cellCoord(0.05f, 0.1f) == 0u);
    REQUIRE(kernel::cellCoord(-0.05f, 0.1f) == 0xFFFFFFFFu);
    REQUIRE(kernel::cellCoord(2.5f, 1.0f) == 2u);
    REQUIRE(kernel::cellCoord(1.0e12f, 1.0f) == (uint32_t)(1 << 20));
    REQUIRE(kernel::cellCoord(-1.0e12f, 1.0f) == (uint32_t)(-(1 << 20)));
}

TEST_CASE("Morton - cell id keeps sorted order", "[hash]") {
    REQUIRE(kernel::cellId(0x0000FFFFu) == 0u);
    REQUIRE(kernel::cellId(0x00010000u) == 1u);
    REQUIRE(kernel::cellId(0xFFFFFFFFu) == 0xFFFFu);
    REQUIRE(kernel::cellId(0x12345678u) <= kernel::cellId(0x12350000u));
}

TEST_CASE("Morton - hash stage writes codes and identity index", "[hash]") {
    test::StoreFixture fx;
    REQUIRE(fx.store != nullptr);
    REQUIRE(fx.add({test::at(-1.0f, 0.0f, 0.0f), test::at(0.0f, -1.0f, 0.0f),
                    test::at(0.0f, 0.0f, -1.0f), test::at(0.5f, 0.5f, 0.5f)}) == SimError::None);

    SimulationConfig cfg;
    cfg.gridSize = 1.0f;
    cfg.smoothingRadius = 1.0f;

    MortonHashTask task = makeMortonHashTask();
    REQUIRE(task.init(fx.device) == SimError::None);
    task.setConstants(makeMortonHashConstants(cfg, fx.store->count()));
    REQUIRE(task.dispatch(*fx.store, fx.store->count()) == SimError::None);

    std::vector<uint32_t> hash = fx.readWords(fx.store->hash(), 4);
    std::vector<uint32_t> index = fx.readWords(fx.store->index(), 4);
    REQUIRE(hash[0] == 0x49249249u);
    REQUIRE(hash[1] == 0x92492492u);
    REQUIRE(hash[2] == 0x24924924u);
    REQUIRE(hash[3] == 0u);
    for (uint32_t i = 0; i < 4; i++) {
        REQUIRE(index[i] == i);
    }
}

TEST_CASE("Morton - same input gives same code", "[hash]") {
    Vec3 p(0.37f, -1.25f, 2.0f);
    REQUIRE(kernel::mortonHash(p, 0.1f) == kernel::mortonHash(p, 0.1f));
    REQUIRE(kernel::mortonHash(p, 0.1f) == kernel::mortonHash(Vec3(0.37f, -1.25f, 2.0f), 0.1f));
}
