// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 ChoiceProvider - turns fuzzer bytes into bounded decisions

 Two strategies:
 - ByteStreamStrategy: consumes the fuzz input, fully reproducible. Integers
   are read from the tail of the buffer, most significant byte first, one
   byte per 8 bits of range, and reduced modulo (range + 1). This is the
   FuzzedDataProvider convention, so saved crash inputs replay identically
   under standard libFuzzer tooling.
 - RandomStrategy: ignores the input and draws from a PRNG. Used for
   exploratory runs; never runs out of input.

 The strategy is chosen per provider, so deterministic and random providers
 can coexist in one process.
*/

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <random>
#include <vector>

namespace rttfuzz {
namespace driver {

class ChoiceStrategy {
public:
  virtual ~ChoiceStrategy() = default;

  // Integer in [min, max] inclusive. min > max is a caller error.
  virtual int64_t BoundedInteger(int64_t min, int64_t max) = 0;

  virtual size_t RemainingBytes() const = 0;
  virtual bool IsDeterministic() const = 0;
};

class ByteStreamStrategy : public ChoiceStrategy {
public:
  // Copies the input; the strategy owns its buffer for the whole run
  ByteStreamStrategy(const uint8_t* data, size_t size);

  int64_t BoundedInteger(int64_t min, int64_t max) override;
  size_t RemainingBytes() const override { return remaining_; }
  bool IsDeterministic() const override { return true; }

private:
  const std::vector<uint8_t> data_;
  size_t remaining_;
};

class RandomStrategy : public ChoiceStrategy {
public:
  RandomStrategy();
  explicit RandomStrategy(uint64_t seed);

  int64_t BoundedInteger(int64_t min, int64_t max) override;
  size_t RemainingBytes() const override { return std::numeric_limits<size_t>::max(); }
  bool IsDeterministic() const override { return false; }

private:
  std::mt19937_64 gen_;
};

class ChoiceProvider {
public:
  explicit ChoiceProvider(std::unique_ptr<ChoiceStrategy> strategy);

  ChoiceProvider(const ChoiceProvider&) = delete;
  ChoiceProvider& operator=(const ChoiceProvider&) = delete;

  // Throws std::invalid_argument if min > max
  int64_t BoundedInteger(int64_t min, int64_t max);

  // 0-based index drawn as BoundedInteger(1, count) - 1. nullopt if count == 0.
  std::optional<size_t> PickIndex(size_t count);

  template <typename T>
  std::optional<T> PickOne(const std::vector<T>& items) {
    auto index = PickIndex(items.size());
    if (!index) {
      return std::nullopt;
    }
    return items[*index];
  }

  size_t RemainingBytes() const { return strategy_->RemainingBytes(); }
  bool IsDeterministic() const { return strategy_->IsDeterministic(); }

  // Always true for non-deterministic strategies
  bool HasMinimumBytes(size_t threshold) const;

  // Number of draws made so far
  size_t draws() const { return draws_; }

private:
  std::unique_ptr<ChoiceStrategy> strategy_;
  size_t draws_{0};
};

// Strategy for a run: random when requested, otherwise backed by the input bytes
std::unique_ptr<ChoiceStrategy> MakeChoiceStrategy(bool random, const uint8_t* data, size_t size);

}  // namespace driver
}  // namespace rttfuzz
