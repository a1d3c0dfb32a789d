// ═════════════════════════════════════════════════════════════
// Category 3: COMBAT: Firing, Archetypes, Hit Resolution
// ═════════════════════════════════════════════════════════════

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat3: Cooldown admits exactly one shot per window") {
  auto tank = spawn_player();
  step(1);

  CHECK(fire(tank) == FIRE_OK);
  double t0 = tank.get<WeaponState>().last_shot_ms;
  CHECK(projectile_count() == 1);
  CHECK(tank.get<WeaponState>().reloading);

  CHECK(fire(tank) == FIRE_RELOADING);
  step(60);
  CHECK(fire(tank) == FIRE_RELOADING);
  CHECK(tank.get<WeaponState>().last_shot_ms == t0);
  CHECK(projectile_count() == 1);

  step(61);
  CHECK_FALSE(tank.get<WeaponState>().reloading);
  CHECK(fire(tank) == FIRE_OK);
  CHECK(projectile_count() == 2);
  CHECK(tank.get<WeaponState>().last_shot_ms - t0 >= 2000.0);

  CHECK(prog_rec.shots == 2);
  REQUIRE(shots.size() == 2);
  CHECK(shots[0].weapon_id == "standard");
  CHECK(shots[0].damage == doctest::Approx(25.0f));
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat3: Elapsed-time check holds without the reload flag") {
  auto tank = spawn_tank();
  step(1);
  REQUIRE(fire(tank) == FIRE_OK);
  // Reload timer gone (e.g. cancelled), the window still applies
  WeaponState &ws = tank.get_mut<WeaponState>();
  g_runtime.timers.cancel(ws.reload_timer);
  ws.reloading = false;
  step(30);
  CHECK(fire(tank) == FIRE_COOLDOWN);
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat3: Blocked barrel consumes no cooldown") {
  auto tank = spawn_tank();
  step(1);
  scene_fake.block_distance = 1.0f;

  CHECK(fire(tank) == FIRE_BLOCKED);
  const WeaponState &ws = tank.get<WeaponState>();
  CHECK_FALSE(ws.reloading);
  CHECK(ws.last_shot_ms < -1e9);
  CHECK(projectile_count() == 0);

  scene_fake.block_distance = 0.0f;
  CHECK(fire(tank) == FIRE_OK);
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat3: Standard round kills and credits the shooter") {
  auto tank = spawn_player();
  auto enemy = spawn_enemy({0.0f, 1.9f, 30.0f}, 20.0f);
  step(1);

  REQUIRE(fire(tank) == FIRE_OK);
  step(20);
  CHECK_FALSE(enemy.has<IsAlive>());
  CHECK(health(enemy) == 0.0f);
  CHECK(projectile_count() == 0);
  CHECK(prog_rec.kills == 1);
  CHECK(prog_rec.dealt == doctest::Approx(25.0f));
  CHECK(hud_rec.hit_markers.size() == 1);
  REQUIRE(damage_rec.deaths.size() == 1);
  CHECK(damage_rec.deaths[0] == enemy.get<ExternalId>().id);
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat3: Ground ricochet is bounded by the rule count") {
  auto round = spawn_round({0.0f, 0.7f, 0.0f}, {100.0f, -10.0f, 0.0f},
                           ARCH_STANDARD, 10.0f);
  round.get_mut<Projectile>().gravity = 30.0f;

  int max_ricochets = 0;
  for (int i = 0; i < 600 && round.is_alive(); i++) {
    step(1);
    if (round.is_alive())
      max_ricochets =
          std::max(max_ricochets, (int)round.get<Projectile>().ricochets);
  }
  CHECK(max_ricochets == 3);
  CHECK_FALSE(round.is_alive());
  CHECK(projectile_count() == 0);
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat3: Steep ground contact does not ricochet") {
  auto round = spawn_round({0.0f, 5.0f, 0.0f}, {10.0f, -60.0f, 0.0f},
                           ARCH_STANDARD, 10.0f);
  step(6);
  if (round.is_alive())
    CHECK(round.get<Projectile>().ricochets == 0);
  step(30);
  CHECK_FALSE(round.is_alive());
}

TEST_CASE_FIXTURE(EngineTestHarness, "Cat3: Map border reflects the round") {
  auto round = spawn_round({995.0f, 1.9f, 0.0f}, {100.0f, 0.0f, 0.0f},
                           ARCH_STANDARD, 10.0f);
  step(5);
  REQUIRE(round.is_alive());
  const Projectile &p = round.get<Projectile>();
  CHECK(p.ricochets == 1);
  CHECK(p.vel.x == doctest::Approx(-80.0f));
  CHECK(p.pos.x <= 1000.0f);
}

TEST_CASE_FIXTURE(EngineTestHarness, "Cat3: Round expires at its TTL") {
  auto round = spawn_round({0.0f, 30.0f, 0.0f}, {0.0f, 0.0f, 20.0f},
                           ARCH_STANDARD, 10.0f);
  round.get_mut<Projectile>().ttl_ms = 500.0f;
  step(29);
  CHECK(round.is_alive());
  step(3);
  CHECK_FALSE(round.is_alive());
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat3: Explosion damage falls off to half at the rim") {
  auto near_target = spawn_enemy({0.0f, 1.9f, 30.0f});
  auto rim_target = spawn_enemy({7.99f, 1.9f, 30.0f});
  auto outside = spawn_enemy({9.0f, 1.9f, 30.0f});
  auto friendly = spawn_enemy({2.0f, 1.9f, 30.0f}, 100.0f, 0);

  auto round = spawn_round({0.0f, 1.9f, 29.0f}, {0.0f, 0.0f, 60.0f},
                           ARCH_EXPLOSIVE, 40.0f);
  round.get_mut<Projectile>().effect_radius = 8.0f;
  step(1);

  CHECK(health(near_target) == doctest::Approx(60.0f));
  CHECK(health(rim_target) == doctest::Approx(80.0f));
  CHECK(health(outside) == doctest::Approx(100.0f));
  CHECK(health(friendly) == doctest::Approx(100.0f));
  CHECK(fx_rec.explosions == 1);
  CHECK_FALSE(round.is_alive());
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat3: Explosive round detonates on the ground") {
  auto target = spawn_enemy({6.0f, 1.0f, 50.0f});
  auto round = spawn_round({0.0f, 5.0f, 50.0f}, {0.0f, -60.0f, 0.0f},
                           ARCH_EXPLOSIVE, 40.0f);
  round.get_mut<Projectile>().effect_radius = 8.0f;
  step(10);
  CHECK_FALSE(round.is_alive());
  CHECK(fx_rec.explosions == 1);
  CHECK(health(target) < 100.0f);
  CHECK(health(target) > 60.0f);
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat3: Chain hops decay by 70% up to the target cap") {
  auto t0 = spawn_enemy({0.0f, 1.9f, 30.0f}, 1000.0f);
  auto t1 = spawn_enemy({0.0f, 1.9f, 40.0f}, 1000.0f);
  auto t2 = spawn_enemy({0.0f, 1.9f, 50.0f}, 1000.0f);
  auto t3 = spawn_enemy({0.0f, 1.9f, 60.0f}, 1000.0f);

  auto round = spawn_round({0.0f, 1.9f, 29.0f}, {0.0f, 0.0f, 60.0f},
                           ARCH_CHAIN, 100.0f);
  Projectile &p = round.get_mut<Projectile>();
  p.effect_radius = 15.0f;
  p.effect_count = 3;
  step(1);

  CHECK(health(t0) == doctest::Approx(900.0f));
  CHECK(health(t1) == doctest::Approx(930.0f));
  CHECK(health(t2) == doctest::Approx(951.0f));
  CHECK(health(t3) == doctest::Approx(1000.0f));
  CHECK(fx_rec.chain_arcs == 2);
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat3: Chain stops when no target is in range") {
  auto t0 = spawn_enemy({0.0f, 1.9f, 30.0f}, 1000.0f);
  auto t1 = spawn_enemy({0.0f, 1.9f, 40.0f}, 1000.0f);
  auto far_target = spawn_enemy({0.0f, 1.9f, 70.0f}, 1000.0f);

  auto round = spawn_round({0.0f, 1.9f, 29.0f}, {0.0f, 0.0f, 60.0f},
                           ARCH_CHAIN, 100.0f);
  Projectile &p = round.get_mut<Projectile>();
  p.effect_radius = 15.0f;
  p.effect_count = 5;
  step(1);

  CHECK(health(t0) == doctest::Approx(900.0f));
  CHECK(health(t1) == doctest::Approx(930.0f));
  CHECK(health(far_target) == doctest::Approx(1000.0f));
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat3: Piercing round loses 30% per target, floor 5") {
  auto a = spawn_enemy({0.0f, 1.9f, 30.0f}, 1000.0f);
  auto b = spawn_enemy({0.0f, 1.9f, 40.0f}, 1000.0f);
  auto c = spawn_enemy({0.0f, 1.9f, 50.0f}, 1000.0f);
  auto d = spawn_enemy({0.0f, 1.9f, 60.0f}, 1000.0f);

  spawn_round({0.0f, 1.9f, 25.0f}, {0.0f, 0.0f, 60.0f}, ARCH_PIERCING,
              10.0f);
  step(45);

  CHECK(health(a) == doctest::Approx(990.0f));
  CHECK(health(b) == doctest::Approx(993.0f));
  CHECK(health(c) == doctest::Approx(995.0f));
  CHECK(health(d) == doctest::Approx(995.0f));
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat3: Homing round steers without changing speed") {
  spawn_enemy({20.0f, 1.9f, 40.0f});
  auto round = spawn_round({0.0f, 1.9f, 0.0f}, {0.0f, 0.0f, 100.0f},
                           ARCH_HOMING, 30.0f);
  Projectile &p = round.get_mut<Projectile>();
  p.effect_radius = 50.0f;
  p.effect_strength = 0.15f;

  step(5);
  REQUIRE(round.is_alive());
  const Projectile &after = round.get<Projectile>();
  CHECK(after.vel.x > 0.0f);
  CHECK(length(after.vel) == doctest::Approx(100.0f).epsilon(1e-3));
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat3: Homing ignores targets beyond acquisition range") {
  spawn_enemy({200.0f, 1.9f, 40.0f});
  auto round = spawn_round({0.0f, 1.9f, 0.0f}, {0.0f, 0.0f, 100.0f},
                           ARCH_HOMING, 30.0f);
  Projectile &p = round.get_mut<Projectile>();
  p.effect_radius = 50.0f;
  p.effect_strength = 0.15f;
  step(5);
  CHECK(round.get<Projectile>().vel.x == 0.0f);
}

TEST_CASE_FIXTURE(EngineTestHarness, "Cat3: Multi-shot fires a pellet fan") {
  auto tank = spawn_tank({0.0f, 1.0f, 0.0f}, 0, ARCH_MULTI_SHOT);
  step(1);
  REQUIRE(fire(tank) == FIRE_OK);
  CHECK(projectile_count() == 5);

  float min_x = 1e9f, max_x = -1e9f;
  ecs.each([&](const Projectile &p) {
    CHECK(p.archetype == ARCH_MULTI_SHOT);
    CHECK(p.damage == doctest::Approx(16.0f));
    min_x = std::min(min_x, p.vel.x);
    max_x = std::max(max_x, p.vel.x);
  });
  CHECK(max_x - min_x > 10.0f);
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat3: Split round becomes standard children") {
  auto tank = spawn_tank({0.0f, 1.0f, 0.0f}, 0, ARCH_SPLIT);
  step(1);
  REQUIRE(fire(tank) == FIRE_OK);
  CHECK(projectile_count() == 1);

  step(10);
  CHECK(projectile_count() == 4);
  ecs.each([](const Projectile &p) {
    CHECK(p.archetype == ARCH_STANDARD);
    CHECK(p.damage == doctest::Approx(15.0f));
    CHECK(p.split_at_ms == 0.0);
  });
}

TEST_CASE_FIXTURE(EngineTestHarness, "Cat3: Beam hits the first enemy") {
  auto tank = spawn_tank({0.0f, 1.0f, 0.0f}, 0, ARCH_BEAM);
  auto enemy = spawn_enemy({0.0f, 1.9f, 20.0f});
  auto behind = spawn_enemy({0.0f, 1.9f, 35.0f});
  step(1);

  REQUIRE(fire(tank) == FIRE_OK);
  CHECK(projectile_count() == 0);
  CHECK(health(enemy) == doctest::Approx(70.0f));
  CHECK(health(behind) == doctest::Approx(100.0f));
  CHECK(fx_rec.beams == 1);
  CHECK_FALSE(fx_rec.last_beam_heal);
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat3: Beam on a friendly heals the firer") {
  auto tank = spawn_tank({0.0f, 1.0f, 0.0f}, 0, ARCH_BEAM);
  auto ally = spawn_enemy({0.0f, 1.9f, 20.0f}, 100.0f, 0);
  tank.get_mut<Health>().current = 50.0f;
  step(1);

  REQUIRE(fire(tank) == FIRE_OK);
  CHECK(health(tank) == doctest::Approx(65.0f));
  CHECK(health(ally) == doctest::Approx(100.0f));
  CHECK(fx_rec.last_beam_heal);

  // Heal never exceeds max
  tank.get_mut<Health>().current = 95.0f;
  step(100);
  REQUIRE(fire(tank) == FIRE_OK);
  CHECK(health(tank) == doctest::Approx(100.0f));
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat3: Turret bases use the wider hit radius") {
  auto turret = spawn_turret(ecs, {4.8f, 1.9f, 30.0f}, 1, 100.0f);
  auto proxy = spawn_enemy({-4.8f, 1.9f, 30.0f});
  spawn_round({0.0f, 1.9f, 20.0f}, {0.0f, 0.0f, 60.0f}, ARCH_STANDARD,
              25.0f);
  step(20);
  CHECK(health(turret) == doctest::Approx(75.0f));
  CHECK(health(proxy) == doctest::Approx(100.0f));
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat3: Turrets resolve before vehicles in one tick") {
  auto turret = spawn_turret(ecs, {3.0f, 1.9f, 30.0f}, 1, 100.0f);
  auto proxy = spawn_enemy({0.0f, 1.9f, 30.0f});
  spawn_round({0.0f, 1.9f, 29.0f}, {0.0f, 0.0f, 60.0f}, ARCH_STANDARD,
              25.0f);
  step(1);
  CHECK(health(turret) == doctest::Approx(75.0f));
  CHECK(health(proxy) == doctest::Approx(100.0f));
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat3: Tracer marks the target and rations ammo") {
  auto tank = spawn_player();
  auto enemy = spawn_enemy({0.0f, 1.9f, 30.0f});
  step(1);

  REQUIRE(fire_tracer(tank) == FIRE_OK);
  CHECK(tank.get<WeaponState>().tracer_count == 4);
  CHECK(fire_tracer(tank) == FIRE_COOLDOWN);
  // The main gun is independent of tracer rounds
  CHECK_FALSE(tank.get<WeaponState>().reloading);

  step(20);
  CHECK(health(enemy) == doctest::Approx(90.0f));
  REQUIRE(enemy.has<Marked>());

  step(905); // mark lasts 15 s
  CHECK_FALSE(enemy.has<Marked>());

  tank.get_mut<WeaponState>().tracer_count = 0;
  CHECK(fire_tracer(tank) == FIRE_NO_AMMO);
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat3: dispose_projectile is idempotent") {
  auto round = spawn_round({0.0f, 10.0f, 0.0f}, {0.0f, 0.0f, 10.0f},
                           ARCH_STANDARD, 10.0f);
  CHECK(dispose_projectile(round));
  CHECK_FALSE(dispose_projectile(round));
  step(1);
  CHECK(projectile_count() == 0);
}

TEST_CASE_FIXTURE(EngineTestHarness, "Cat3: Archetype names round-trip") {
  for (int i = 0; i < ARCH_COUNT; i++) {
    Archetype out;
    REQUIRE(archetype_from_name(archetype_name((Archetype)i), out));
    CHECK(out == (Archetype)i);
  }
  Archetype out;
  CHECK_FALSE(archetype_from_name("plasma", out));
  CHECK_FALSE(archetype_from_name("Standard", out));
}
