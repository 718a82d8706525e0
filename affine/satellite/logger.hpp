#pragma once

#include <affine/result/types/unit.hpp>

#include <affine/threads/lockfree/atomic_array.hpp>

#include <fmt/core.h>

#include <wheels/core/assert.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace affine::satellite {

/////////////////////////////////////////////////////////////////////////////

// Named monotonic counters
//
// Increment is wait-free and may race with GatherMetrics, a snapshot
// taken concurrently with increments sees every counter at some value
// between its values at the start and the end of the snapshot

template <bool CollectMetrics>
class Logger {
 public:
  class Metrics;

  explicit Logger(const std::vector<std::string>&) {
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  Logger(Logger&&) = delete;
  Logger& operator=(Logger&&) = delete;

  void Increment(std::string_view, uint64_t = 1) {
  }

  Metrics GatherMetrics() const {
    return Metrics();
  }

  class Metrics {
   public:
    uint64_t Get(std::string_view) const {
      return 0;
    }

    void Print() const {
    }

    Unit Data() && {
      return {};
    }
  };
};

template <>
class Logger<true> {
 public:
  class Metrics;

  Logger() = delete;

  explicit Logger(const std::vector<std::string>& names)
      : counters_(names.size()) {
    for (size_t i = 0; i < names.size(); ++i) {
      indices_.emplace(names[i], i);
      names_.push_back(names[i]);
    }
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  Logger(Logger&&) = delete;
  Logger& operator=(Logger&&) = delete;

  void Increment(std::string_view name, uint64_t diff = 1) {
    auto pos = indices_.find(name);

    WHEELS_VERIFY(pos != indices_.end(), "You must use a valid metric name!");

    counters_.FetchAdd(pos->second, diff);
  }

  Metrics GatherMetrics() const {
    return Metrics(*this);
  }

  /////////////////////////////////////////////////////////////////////////////

  class Metrics {
    friend class Logger;

   public:
    Metrics(const Metrics&) = default;
    Metrics& operator=(const Metrics&) = default;

    Metrics(Metrics&&) = default;
    Metrics& operator=(Metrics&&) = default;

    // 0 for unknown names
    uint64_t Get(std::string_view name) const {
      for (const auto& [metric, count] : data_) {
        if (metric == name) {
          return count;
        }
      }
      return 0;
    }

    void Print() const {
      for (const auto& [name, count] : data_) {
        fmt::print("{}: {}\n", name, count);
      }
    }

    // In registration order
    auto Data() && {
      return std::move(data_);
    }

   private:
    explicit Metrics(const Logger& source) {
      for (size_t i = 0; i < source.names_.size(); ++i) {
        data_.emplace_back(source.names_[i], source.counters_.Load(i));
      }
    }

   private:
    std::vector<std::pair<std::string, uint64_t>> data_{};
  };

 private:
  // heterogenous lookup
  // https://www.cppstories.com/2021/heterogeneous-access-cpp20/

  struct StringHash {  // NOLINT
    using is_transparent = void;  // NOLINT
    [[nodiscard]] size_t operator()(std::string_view txt) const {
      return std::hash<std::string_view>{}(txt);
    }
    [[nodiscard]] size_t operator()(const std::string& txt) const {
      return std::hash<std::string>{}(txt);
    }
  };

  std::unordered_map<std::string, size_t, StringHash, std::equal_to<>>
      indices_{};
  std::vector<std::string> names_{};
  threads::lockfree::AtomicArray<uint64_t> counters_;
};

}  // namespace affine::satellite
