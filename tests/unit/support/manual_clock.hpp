#pragma once

/// @file manual_clock.hpp
/// @brief Injectable clock that only moves when a test advances it.

#include "cis/identity/identity_types.hpp"

#include <chrono>
#include <memory>

namespace cis::testing {

class ManualClock {
public:
    ManualClock()
        : now_(std::make_shared<identity::TimePoint>(
              std::chrono::time_point_cast<identity::TimePoint::duration>(
                  std::chrono::system_clock::now()))) {}

    /// Clock function sharing this instance's time; copies stay in sync.
    [[nodiscard]] identity::Clock clock() const {
        auto now = now_;
        return [now] { return *now; };
    }

    [[nodiscard]] identity::TimePoint now() const { return *now_; }

    void advance(std::chrono::system_clock::duration delta) { *now_ += delta; }

private:
    std::shared_ptr<identity::TimePoint> now_;
};

}  // namespace cis::testing
