/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "TimeWindow.hpp"
#include "../util/Debug.hpp"
#include <inttypes.h>
#include <time.h>

namespace oath {

Status
TimeWindow::create(std::shared_ptr<const TimeWindow> &result,
    const TimeWindowConfig &config)
{
    if (!config.timeStep)
        return OATH_ERROR(OATH_CC_InvalidConfig, "The time step must be positive");

    OATH_DebugLog("TimeWindow: epoch %" PRIu64 ", step %" PRIu32 "s",
        config.epoch, config.timeStep);
    result.reset(new TimeWindow(config.epoch, config.timeStep));
    return Status();
}

TimeWindow::TimeWindow(uint64_t epoch, uint32_t timeStep):
    epoch_(epoch),
    timeStep_(timeStep)
{}

Status
TimeWindow::at(uint64_t &result, uint64_t timestamp) const
{
    if (timestamp < epoch_)
        return OATH_ERROR(OATH_CC_BeforeEpoch,
            "Time " + std::to_string(timestamp) +
            " is before the epoch " + std::to_string(epoch_));

    result = (timestamp - epoch_) / timeStep_;
    return Status();
}

Status
TimeWindow::now(uint64_t &result) const
{
    time_t t = time(nullptr);
    if (t < 0)
        return OATH_ERROR(OATH_CC_SysError, "Cannot read the clock");

    OATH_CHECK(at(result, static_cast<uint64_t>(t)));
    return Status();
}

} // namespace oath
