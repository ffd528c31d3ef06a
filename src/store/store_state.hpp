#pragma once
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <utility>

#include "veritas/config.hpp"
#include "veritas/core/timestamp.hpp"
#include "veritas/shape.hpp"
#include "veritas/store/audit_log.hpp"

namespace veritas::detail {

struct stored_user {
  User user;
  std::uint64_t seq{0};   // insertion order, kept across updates
};

struct store_state {
  StoreConfig config;
  core::clock_fn clock;
  mutable std::mutex mutex;
  std::unordered_map<std::string, stored_user> users;
  std::uint64_t next_seq{0};
  store::AuditLog events;
  store::AuditLog feed;
  std::mt19937_64 rng;

  store_state(StoreConfig cfg, core::clock_fn clk)
      : config(std::move(cfg)),
        clock(clk ? std::move(clk) : core::clock_fn{&core::now}),
        events(config.event_capacity),
        feed(config.feed_capacity),
        rng(std::random_device{}()) {}
};

} // namespace veritas::detail
