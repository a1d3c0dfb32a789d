// ═════════════════════════════════════════════════════════════
// Category 5: MODULES: Walls, Rapid Reload, Jump, Evasive, Auto Aim
// ═════════════════════════════════════════════════════════════

static flecs::entity find_wall(flecs::world &ecs, uint32_t seq = 0) {
  flecs::entity found = flecs::entity::null();
  ecs.each([&](flecs::entity e, const DeployableWall &w) {
    if (seq == 0 || w.seq == seq)
      found = e;
  });
  return found;
}

TEST_CASE("Cat5: Number keys map to module slots") {
  ModuleKind kind;
  REQUIRE(module_for_key(6, kind));
  CHECK(kind == MODULE_DEPLOY_WALL);
  REQUIRE(module_for_key(7, kind));
  CHECK(kind == MODULE_RAPID_RELOAD);
  REQUIRE(module_for_key(8, kind));
  CHECK(kind == MODULE_AUTO_AIM);
  REQUIRE(module_for_key(9, kind));
  CHECK(kind == MODULE_EVASIVE);
  REQUIRE(module_for_key(0, kind));
  CHECK(kind == MODULE_CHARGED_JUMP);
  CHECK_FALSE(module_for_key(5, kind));
  CHECK(module_key(MODULE_EVASIVE) == 9);
  CHECK(module_key(MODULE_COUNT) == -1);
}

// ─── Deployable walls ─────────────────────────────────────

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat5: Wall deploys ahead of the barrel and rises") {
  auto tank = spawn_player();
  step(1);
  REQUIRE(activate_module(tank, MODULE_DEPLOY_WALL) == MODULE_ACTIVATED);
  CHECK(wall_count(ecs, tank.id()) == 1);

  flecs::entity wall = find_wall(ecs);
  REQUIRE(wall.is_valid());
  DeployableWall w = wall.get<DeployableWall>();
  CHECK(w.phase == WALL_RISING);
  CHECK(w.pos.z > 8.0f);
  CHECK(std::fabs(w.pos.x) < 1e-3f);
  CHECK(w.ground_y == doctest::Approx(0.0f));
  CHECK(w.pos.y == doctest::Approx(w.half_h));
  CHECK(w.owner == tank.id());

  const ModuleSlot &slot = tank.get<ModuleBank>().slots[MODULE_DEPLOY_WALL];
  CHECK(slot.phase == MODULE_COOLDOWN);
  REQUIRE_FALSE(hud_rec.cooldowns.empty());
  CHECK(hud_rec.cooldowns.back().first == 6);
  CHECK(hud_rec.cooldowns.back().second == doctest::Approx(10000.0f));

  step(30);
  float mid = wall.get<DeployableWall>().rise_t;
  CHECK(mid > 0.0f);
  CHECK(mid < 1.0f);
  CHECK(wall_center(wall.get<DeployableWall>()).y < w.pos.y);

  step(40);
  CHECK(wall.get<DeployableWall>().phase == WALL_STANDING);
  CHECK(wall.get<DeployableWall>().rise_t == 1.0f);
  CHECK(wall_center(wall.get<DeployableWall>()).y ==
        doctest::Approx(w.pos.y));
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat5: Wall breaks only when health reaches zero") {
  auto tank = spawn_player();
  step(1);
  REQUIRE(activate_module(tank, MODULE_DEPLOY_WALL) == MODULE_ACTIVATED);
  flecs::entity wall = find_wall(ecs);

  CHECK_FALSE(damage_wall(wall, 40.0f));
  CHECK_FALSE(damage_wall(wall, 40.0f));
  CHECK(wall.get<DeployableWall>().health == doctest::Approx(20.0f));
  CHECK(wall.get<DeployableWall>().phase != WALL_DEBRIS);

  CHECK(damage_wall(wall, 40.0f));
  CHECK(wall.get<DeployableWall>().phase == WALL_DEBRIS);
  CHECK(fx_rec.debris == 1);
  CHECK(wall_count(ecs, tank.id()) == 0);

  // Debris takes no further damage and clears after a second
  CHECK_FALSE(damage_wall(wall, 40.0f));
  step(61);
  CHECK_FALSE(wall.is_alive());
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat5: Exact lethal wall damage breaks on that hit") {
  auto tank = spawn_player();
  step(1);
  REQUIRE(activate_module(tank, MODULE_DEPLOY_WALL) == MODULE_ACTIVATED);
  flecs::entity wall = find_wall(ecs);
  CHECK_FALSE(damage_wall(wall, 60.0f));
  CHECK(damage_wall(wall, 40.0f));
  CHECK(wall.get<DeployableWall>().health == 0.0f);
  CHECK_FALSE(damage_wall(wall, NAN));
}

TEST_CASE_FIXTURE(EngineTestHarness, "Cat5: Wall expires after its lifetime") {
  auto tank = spawn_player();
  step(1);
  REQUIRE(activate_module(tank, MODULE_DEPLOY_WALL) == MODULE_ACTIVATED);
  flecs::entity wall = find_wall(ecs);

  step(599);
  CHECK(wall.get<DeployableWall>().phase == WALL_STANDING);
  step(2);
  CHECK(wall.get<DeployableWall>().phase == WALL_DEBRIS);
  step(61);
  CHECK_FALSE(wall.is_alive());
  CHECK(wall_count(ecs, tank.id()) == 0);
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat5: Wall cap retires the oldest wall first") {
  g_runtime.rules.max_walls = 3;
  g_runtime.rules.wall_lifetime_ms = 60000.0f;
  auto tank = spawn_player();
  tank.get_mut<ModuleBank>().slots[MODULE_DEPLOY_WALL].cooldown_ms = 0.0f;
  step(1);

  for (int i = 0; i < 4; i++) {
    CAPTURE(i);
    REQUIRE(activate_module(tank, MODULE_DEPLOY_WALL) == MODULE_ACTIVATED);
    step(1);
  }
  CHECK(wall_count(ecs, tank.id()) == 3);

  std::vector<uint32_t> seqs;
  ecs.each([&](const DeployableWall &w) { seqs.push_back(w.seq); });
  std::sort(seqs.begin(), seqs.end());
  REQUIRE(seqs.size() == 3);
  CHECK(seqs[0] == 2);
  CHECK(seqs[2] == 4);
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat5: Standing wall stops a round and takes its damage") {
  auto tank = spawn_player();
  step(1);
  REQUIRE(activate_module(tank, MODULE_DEPLOY_WALL) == MODULE_ACTIVATED);
  flecs::entity wall = find_wall(ecs);
  float wall_z = wall.get<DeployableWall>().pos.z;
  auto enemy = spawn_enemy({0.0f, 1.0f, wall_z + 10.0f});
  step(70);

  REQUIRE(fire(tank) == FIRE_OK);
  step(20);
  CHECK(wall.get<DeployableWall>().health == doctest::Approx(75.0f));
  CHECK(health(enemy) == doctest::Approx(100.0f));
  CHECK(projectile_count() == 0);
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat5: Explosive round detonates on a wall") {
  auto tank = spawn_player({0.0f, 1.0f, 0.0f}, ARCH_EXPLOSIVE);
  step(1);
  REQUIRE(activate_module(tank, MODULE_DEPLOY_WALL) == MODULE_ACTIVATED);
  flecs::entity wall = find_wall(ecs);
  float wall_z = wall.get<DeployableWall>().pos.z;
  auto enemy = spawn_enemy({0.0f, 1.0f, wall_z + 3.0f});
  step(70);

  REQUIRE(fire(tank) == FIRE_OK);
  step(20);
  CHECK(wall.get<DeployableWall>().health == doctest::Approx(55.0f));
  CHECK(fx_rec.explosions >= 1);
  CHECK(health(enemy) < 100.0f);
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat5: Failing spark effect still spends the round on a wall") {
  auto tank = spawn_player();
  step(1);
  REQUIRE(activate_module(tank, MODULE_DEPLOY_WALL) == MODULE_ACTIVATED);
  flecs::entity wall = find_wall(ecs);
  step(70);

  fx_rec.throw_on_spark = true;
  REQUIRE(fire(tank) == FIRE_OK);
  step(20);
  CHECK(fx_rec.sparks >= 2); // wall damage spark and impact spark
  CHECK(wall.get<DeployableWall>().health == doctest::Approx(75.0f));
  CHECK(projectile_count() == 0);
  CHECK(log_contains("effects pool exhausted"));
}

// ─── Rapid reload ─────────────────────────────────────────

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat5: Rapid reload halves the cooldown while active") {
  auto tank = spawn_player();
  step(1);
  REQUIRE(activate_module(tank, MODULE_RAPID_RELOAD) == MODULE_ACTIVATED);
  CHECK(tank.get<WeaponState>().cooldown_ms == doctest::Approx(1000.0f));
  REQUIRE_FALSE(hud_rec.effects_added.empty());
  CHECK(hud_rec.effects_added.back() == "Rapid Reload");

  REQUIRE(fire(tank) == FIRE_OK);
  step(61);
  CHECK(fire(tank) == FIRE_OK);

  step(601);
  CHECK(tank.get<WeaponState>().cooldown_ms == doctest::Approx(2000.0f));
  CHECK(tank.get<ModuleBank>().slots[MODULE_RAPID_RELOAD].phase ==
        MODULE_COOLDOWN);
  REQUIRE_FALSE(hud_rec.effects_removed.empty());
  CHECK(hud_rec.effects_removed.back() == "Rapid Reload");
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat5: A failing HUD does not strand an activation") {
  auto tank = spawn_player();
  step(1);
  hud_rec.throw_on_effect = true;
  CHECK(activate_module(tank, MODULE_RAPID_RELOAD) == MODULE_ACTIVATED);
  CHECK(tank.get<ModuleBank>().slots[MODULE_RAPID_RELOAD].phase ==
        MODULE_ACTIVE);
  CHECK(tank.get<WeaponState>().cooldown_ms == doctest::Approx(1000.0f));
  CHECK(g_test_errors == 1);
  CHECK(log_contains("[Module] activation: hud detached"));

  step(601);
  CHECK(tank.get<ModuleBank>().slots[MODULE_RAPID_RELOAD].phase ==
        MODULE_COOLDOWN);
  CHECK(tank.get<WeaponState>().cooldown_ms == doctest::Approx(2000.0f));
}

// ─── Charged jump ─────────────────────────────────────────

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat5: Jump impulse scales with the charge") {
  auto tank = spawn_player();
  FakeBody &b = body(tank);
  step(1);
  REQUIRE(activate_module(tank, MODULE_CHARGED_JUMP) == MODULE_ACTIVATED);
  CHECK(tank.get<ModuleBank>().jump_charging);
  // A second press while charging is refused
  CHECK(activate_module(tank, MODULE_CHARGED_JUMP) == MODULE_ALREADY_ACTIVE);

  step(300); // half of the full charge
  REQUIRE(release_jump_charge(tank));
  step(1);
  CHECK(b.impulse_calls == 1);
  CHECK(b.impulse.y == doctest::Approx(260000.0f).epsilon(0.01));
  CHECK(tank.get<ModuleBank>().slots[MODULE_CHARGED_JUMP].phase ==
        MODULE_COOLDOWN);
  REQUIRE_FALSE(chat_rec.lines.empty());
  CHECK(chat_rec.lines.back() == "Jump! (50% charge)");

  CHECK_FALSE(release_jump_charge(tank));
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat5: Jump releases itself at full charge") {
  auto tank = spawn_player();
  FakeBody &b = body(tank);
  step(1);
  REQUIRE(activate_module(tank, MODULE_CHARGED_JUMP) == MODULE_ACTIVATED);

  float peak = 0.0f;
  for (int i = 0; i < 602; i++) {
    step(1);
    peak = std::max(peak, b.impulse.y);
  }
  CHECK_FALSE(tank.get<ModuleBank>().jump_charging);
  CHECK(peak == doctest::Approx(500000.0f).epsilon(0.01));
}

TEST_CASE_FIXTURE(EngineTestHarness, "Cat5: Jump is refused while falling") {
  auto tank = spawn_player();
  FakeBody &b = body(tank);
  b.vel = {0.0f, -10.0f, 0.0f};
  step(1);
  CHECK(activate_module(tank, MODULE_CHARGED_JUMP) == MODULE_REFUSED);
  CHECK(tank.get<ModuleBank>().slots[MODULE_CHARGED_JUMP].phase ==
        MODULE_IDLE);
  CHECK_FALSE(tank.get<ModuleBank>().jump_charging);
}

// ─── Evasive maneuver ─────────────────────────────────────

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat5: Evasive maneuver dodges a nearby enemy") {
  auto tank = spawn_player();
  FakeBody &b = body(tank);
  spawn_enemy({0.0f, 1.0f, 30.0f});
  step(1);
  REQUIRE(activate_module(tank, MODULE_EVASIVE) == MODULE_ACTIVATED);

  step(1);
  CHECK(b.impulse_calls == 1);
  CHECK(b.impulse.x > 100.0f); // first dodge goes right
  CHECK(b.impulse.z < 0.0f);   // retreat
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat5: Evasive dodge flips every 1.5 s and restarts right") {
  auto tank = spawn_player();
  FakeBody &b = body(tank);
  spawn_enemy({0.0f, 1.0f, 30.0f});
  ModuleSlot &slot = tank.get_mut<ModuleBank>().slots[MODULE_EVASIVE];
  slot.duration_ms = 2000.0f;
  slot.cooldown_ms = 0.0f;
  step(1);
  REQUIRE(activate_module(tank, MODULE_EVASIVE) == MODULE_ACTIVATED);

  step(1);
  CHECK(b.impulse.x > 100.0f);
  step(88); // just short of 1.5 s
  CHECK(b.impulse.x > 100.0f);
  step(3);
  CHECK(b.impulse.x < -100.0f);
  CHECK(tank.get<ModuleBank>().evasive_dir == -1.0f);

  // The run ends while dodging left; the next run starts right again
  step(60);
  REQUIRE(tank.get<ModuleBank>().slots[MODULE_EVASIVE].phase == MODULE_IDLE);
  REQUIRE(activate_module(tank, MODULE_EVASIVE) == MODULE_ACTIVATED);
  CHECK(tank.get<ModuleBank>().evasive_dir == 1.0f);
  step(1);
  CHECK(b.impulse.x > 100.0f);
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat5: Evasive maneuver idles without an enemy in range") {
  auto tank = spawn_player();
  FakeBody &b = body(tank);
  spawn_enemy({0.0f, 1.0f, 300.0f});
  step(1);
  REQUIRE(activate_module(tank, MODULE_EVASIVE) == MODULE_ACTIVATED);
  step(10);
  CHECK(b.impulse_calls == 0);
}

// ─── Auto aim ─────────────────────────────────────────────

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat5: Auto aim slews the turret and fires") {
  auto tank = spawn_player();
  auto enemy = spawn_enemy({30.0f, 1.0f, 0.0f});
  step(1);
  REQUIRE(activate_module(tank, MODULE_AUTO_AIM) == MODULE_ACTIVATED);

  step(30);
  CHECK(tank.get<DriveState>().turret_yaw ==
        doctest::Approx(PI * 0.5f).epsilon(0.03));
  CHECK(tank.get<ModuleBank>().auto_aim_last_fire_ms > 0.0);
  CHECK(prog_rec.shots >= 1);
  CHECK(health(enemy) < 100.0f);
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat5: Auto aim ignores teammates") {
  auto tank = spawn_player();
  spawn_enemy({30.0f, 1.0f, 0.0f}, 100.0f, 0);
  step(1);
  REQUIRE(activate_module(tank, MODULE_AUTO_AIM) == MODULE_ACTIVATED);
  step(30);
  CHECK(tank.get<DriveState>().turret_yaw == doctest::Approx(0.0f));
  CHECK(prog_rec.shots == 0);
}
