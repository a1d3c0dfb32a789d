// ═════════════════════════════════════════════════════════════
// Category 4: VITALS: Damage Model, Healing, Fuel, Respawn
// ═════════════════════════════════════════════════════════════

TEST_CASE_FIXTURE(EngineTestHarness, "Cat4: Armor bonus rounds the damage") {
  auto tank = spawn_player();
  set_armor_bonus(tank, 0.25f);
  CHECK(take_damage(tank, 25.0f) == doctest::Approx(19.0f));
  CHECK(health(tank) == doctest::Approx(81.0f));

  // Clamped to [0, 1]
  set_armor_bonus(tank, 3.0f);
  CHECK(tank.get<Armor>().armor_bonus == doctest::Approx(1.0f));
  CHECK(take_damage(tank, 25.0f) == 0.0f);
  CHECK(health(tank) == doctest::Approx(81.0f));
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat4: Shield, stealth and armor apply in order") {
  auto tank = spawn_tank();
  tank.get_mut<Armor>().shield_active = true;
  CHECK(take_damage(tank, 25.0f) == doctest::Approx(13.0f)); // 12.5 → 13

  tank.get_mut<Health>().current = 100.0f;
  tank.get_mut<Armor>() = {0.0f, false, true};
  CHECK(take_damage(tank, 25.0f) == doctest::Approx(20.0f));

  tank.get_mut<Health>().current = 100.0f;
  tank.get_mut<Armor>() = {0.25f, true, false};
  CHECK(take_damage(tank, 25.0f) == doctest::Approx(10.0f)); // 13 * 0.75
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat4: Invulnerability mutes feedback but not damage") {
  auto tank = spawn_player();
  step(1);
  Vec3 from = {10.0f, 1.0f, 0.0f};

  set_invulnerable(tank, 3000.0f);
  CHECK(is_invulnerable(tank));
  CHECK(take_damage(tank, 30.0f, &from) == doctest::Approx(30.0f));
  CHECK(health(tank) == doctest::Approx(70.0f));
  CHECK(hud_rec.damage_indicators == 0);
  CHECK(hud_rec.health_updates >= 1);

  step(181);
  CHECK_FALSE(is_invulnerable(tank));
  CHECK(tank.get<Invulnerability>().timer.id == 0);
  take_damage(tank, 10.0f, &from);
  CHECK(hud_rec.damage_indicators == 1);
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat4: Blocking rule turns invulnerability into immunity") {
  g_runtime.rules.invulnerability_blocks_damage = true;
  auto tank = spawn_tank();
  set_invulnerable(tank, 3000.0f);
  CHECK(take_damage(tank, 30.0f) == 0.0f);
  CHECK(health(tank) == doctest::Approx(100.0f));
}

TEST_CASE_FIXTURE(EngineTestHarness, "Cat4: Degenerate damage is ignored") {
  auto tank = spawn_tank();
  CHECK(take_damage(tank, 0.0f) == 0.0f);
  CHECK(take_damage(tank, -5.0f) == 0.0f);
  CHECK(take_damage(tank, NAN) == 0.0f);
  CHECK(take_damage(tank, INFINITY) == 0.0f);
  CHECK(health(tank) == doctest::Approx(100.0f));

  take_damage(tank, 1000.0f);
  CHECK(health(tank) == 0.0f);
  CHECK(take_damage(tank, 10.0f) == 0.0f);
}

TEST_CASE_FIXTURE(EngineTestHarness, "Cat4: Heal and refuel clamp to max") {
  auto tank = spawn_player();
  take_damage(tank, 40.0f);
  heal(tank, 15.0f);
  CHECK(health(tank) == doctest::Approx(75.0f));
  heal(tank, 500.0f);
  CHECK(health(tank) == doctest::Approx(100.0f));
  heal(tank, NAN);
  CHECK(health(tank) == doctest::Approx(100.0f));

  tank.get_mut<Fuel>().current = 100.0f;
  add_fuel(tank, 1000.0f);
  CHECK(tank.get<Fuel>().current == doctest::Approx(500.0f));

  take_damage(tank, 1000.0f);
  heal(tank, 50.0f);
  CHECK(health(tank) == 0.0f);
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat4: Proxy damage and death reach the damage sink") {
  auto proxy = spawn_enemy({0.0f, 1.0f, 10.0f}, 50.0f);
  uint64_t ext = proxy.get<ExternalId>().id;

  take_damage(proxy, 20.0f);
  REQUIRE(damage_rec.hits.size() == 1);
  CHECK(damage_rec.hits[0].first == ext);
  CHECK(damage_rec.hits[0].second == doctest::Approx(20.0f));

  take_damage(proxy, 40.0f);
  REQUIRE(damage_rec.deaths.size() == 1);
  CHECK(damage_rec.deaths[0] == ext);
  CHECK_FALSE(proxy.has<IsAlive>());
  CHECK_FALSE(is_live_target(proxy));
}

TEST_CASE_FIXTURE(EngineTestHarness, "Cat4: Turrets die without respawn") {
  auto turret = spawn_turret(ecs, {0.0f, 0.0f, 20.0f}, 1, 60.0f);
  take_damage(turret, 60.0f);
  CHECK_FALSE(turret.has<IsAlive>());
  CHECK(fx_rec.explosions == 1);
  step(400);
  CHECK_FALSE(turret.has<IsAlive>());
  CHECK(health(turret) == 0.0f);
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat4: Respawn uses the provider pose and counts down") {
  Collaborators c = g_runtime.io;
  c.respawn = [](Vec3 &pos, Quat &rot) {
    pos = {50.0f, 1.0f, 50.0f};
    rot = quat_from_yaw(PI * 0.5f);
    return true;
  };
  g_runtime.set_collaborators(c);

  auto tank = spawn_player();
  FakeBody &b = body(tank);
  step(1);
  take_damage(tank, 100.0f);
  CHECK(chat_rec.lines.size() == 1);

  step(60);
  CHECK(hud_rec.last_countdown == doctest::Approx(2.0f).epsilon(0.02));

  step(200);
  CHECK(tank.get<RespawnState>().phase == RESPAWN_ALIVE);
  CHECK(tank.has<IsAlive>());
  CHECK(b.pos.x == doctest::Approx(50.0f));
  CHECK(b.pos.z == doctest::Approx(50.0f));
  CHECK(local_forward(b.rot).x == doctest::Approx(1.0f).epsilon(1e-3));
  CHECK(hud_rec.last_countdown == 0.0f);
  CHECK(tank.get<Fuel>().current == doctest::Approx(500.0f));
  CHECK(tank.get<WeaponState>().tracer_count == 5);
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat4: Death clears inputs and body velocity") {
  auto tank = spawn_tank();
  FakeBody &b = body(tank);
  b.vel = {5.0f, 0.0f, 3.0f};
  tank.get_mut<DriveInput>() = {1.0f, -1.0f, 1.0f, 0.2f};
  step(5);

  take_damage(tank, 100.0f);
  const DriveInput &in = tank.get<DriveInput>();
  CHECK(in.throttle == 0.0f);
  CHECK(in.steer == 0.0f);
  CHECK(tank.get<DriveState>().smooth_throttle == 0.0f);
  CHECK(length(b.vel) == 0.0f);

  // Dead chassis gets no controller forces
  step(5);
  CHECK(b.force_calls == 0);
}
