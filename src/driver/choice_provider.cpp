// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "driver/choice_provider.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace rttfuzz {
namespace driver {

namespace {

void check_range(int64_t min, int64_t max) {
  if (min > max) {
    throw std::invalid_argument("BoundedInteger: empty range [" + std::to_string(min) + ", " + std::to_string(max) +
                                "]");
  }
}

}  // anonymous namespace

ByteStreamStrategy::ByteStreamStrategy(const uint8_t* data, size_t size)
    : data_(data, data + size), remaining_(size) {}

int64_t ByteStreamStrategy::BoundedInteger(int64_t min, int64_t max) {
  check_range(min, max);

  const uint64_t range = static_cast<uint64_t>(max) - static_cast<uint64_t>(min);
  uint64_t result = 0;
  size_t offset = 0;

  // Stop as soon as the range is covered or the input runs dry
  while (offset < 64 && (range >> offset) > 0 && remaining_ != 0) {
    --remaining_;
    result = (result << 8) | data_[remaining_];
    offset += 8;
  }

  if (range != std::numeric_limits<uint64_t>::max()) {
    result = result % (range + 1);
  }

  return static_cast<int64_t>(static_cast<uint64_t>(min) + result);
}

RandomStrategy::RandomStrategy() : gen_(std::random_device{}()) {}

RandomStrategy::RandomStrategy(uint64_t seed) : gen_(seed) {}

int64_t RandomStrategy::BoundedInteger(int64_t min, int64_t max) {
  check_range(min, max);
  std::uniform_int_distribution<int64_t> dist(min, max);
  return dist(gen_);
}

ChoiceProvider::ChoiceProvider(std::unique_ptr<ChoiceStrategy> strategy) : strategy_(std::move(strategy)) {
  if (!strategy_) {
    throw std::invalid_argument("ChoiceProvider requires a strategy");
  }
}

int64_t ChoiceProvider::BoundedInteger(int64_t min, int64_t max) {
  int64_t value = strategy_->BoundedInteger(min, max);
  ++draws_;
  return value;
}

std::optional<size_t> ChoiceProvider::PickIndex(size_t count) {
  if (count == 0) {
    return std::nullopt;
  }
  int64_t pick = BoundedInteger(1, static_cast<int64_t>(count));
  return static_cast<size_t>(pick - 1);
}

bool ChoiceProvider::HasMinimumBytes(size_t threshold) const {
  if (!strategy_->IsDeterministic()) {
    return true;
  }
  return strategy_->RemainingBytes() >= threshold;
}

std::unique_ptr<ChoiceStrategy> MakeChoiceStrategy(bool random, const uint8_t* data, size_t size) {
  if (random) {
    return std::make_unique<RandomStrategy>();
  }
  return std::make_unique<ByteStreamStrategy>(data, size);
}

}  // namespace driver
}  // namespace rttfuzz
