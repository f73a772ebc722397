#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <utility>

namespace critpath {

class GenerationToken;

// Issues tokens for successive schedule recomputations of one project.
// Issuing a token makes every older token stale, so a write-back holding a
// stale token must be dropped.
class GenerationCounter {
public:
  GenerationCounter() : state_(std::make_shared<State>()) {
  }

  [[nodiscard]] auto next() noexcept -> GenerationToken;
  [[nodiscard]] auto current() const noexcept -> std::uint64_t {
    return state_->latest.load(std::memory_order_acquire);
  }

private:
  struct State {
    std::atomic<std::uint64_t> latest{0};
  };
  std::shared_ptr<State> state_;

  friend class GenerationToken;
};

class GenerationToken {
public:
  GenerationToken() = default;

  [[nodiscard]] auto generation() const noexcept -> std::uint64_t {
    return generation_;
  }

  // A default-constructed token is never current.
  [[nodiscard]] auto is_current() const noexcept -> bool {
    return state_ &&
           state_->latest.load(std::memory_order_acquire) == generation_;
  }

  [[nodiscard]] explicit operator bool() const noexcept {
    return is_current();
  }

private:
  GenerationToken(std::shared_ptr<GenerationCounter::State> state,
                  std::uint64_t generation)
      : state_(std::move(state)), generation_(generation) {
  }

  std::shared_ptr<GenerationCounter::State> state_;
  std::uint64_t generation_{0};

  friend class GenerationCounter;
};

inline auto GenerationCounter::next() noexcept -> GenerationToken {
  auto generation =
      state_->latest.fetch_add(1, std::memory_order_acq_rel) + 1;
  return GenerationToken{state_, generation};
}

}  // namespace critpath
