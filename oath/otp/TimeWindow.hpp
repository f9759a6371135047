/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OATH_OTP_TIME_WINDOW_HPP
#define OATH_OTP_TIME_WINDOW_HPP

#include "../util/Status.hpp"
#include <stdint.h>
#include <memory>

namespace oath {

/**
 * Options for deriving counters from the clock.
 */
struct TimeWindowConfig
{
    uint64_t epoch = 0;
    uint32_t timeStep = 30;
};

/**
 * Maps Unix time onto the rfc6238 moving factor.
 * Instances are immutable, and can be shared between threads.
 */
class TimeWindow
{
public:
    static Status
    create(std::shared_ptr<const TimeWindow> &result,
        const TimeWindowConfig &config=TimeWindowConfig());

    uint64_t epoch() const { return epoch_; }
    uint32_t timeStep() const { return timeStep_; }

    /**
     * Computes the number of whole time steps between the epoch
     * and `timestamp` (in seconds).
     * Timestamps before the epoch are an error.
     */
    Status
    at(uint64_t &result, uint64_t timestamp) const;

    /**
     * Computes the counter for the current time.
     */
    Status
    now(uint64_t &result) const;

private:
    const uint64_t epoch_;
    const uint32_t timeStep_;

    TimeWindow(uint64_t epoch, uint32_t timeStep);
};

} // namespace oath

#endif
