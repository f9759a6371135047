/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "OtpSettings.hpp"
#include "../util/Debug.hpp"

namespace oath {

Status
OtpSettingsJson::checkTypes() const
{
    if (root_ && !json_is_object(root_))
        return OATH_ERROR(OATH_CC_JSONError, "OTP settings must be an object");

    // Present fields must have the right type, rather than silently
    // falling back to the defaults:
    if (json_object_get(root_, "digits"))
        OATH_CHECK(digitsOk());
    if (json_object_get(root_, "algorithm"))
        OATH_CHECK(algorithmOk());
    if (json_object_get(root_, "epoch"))
        OATH_CHECK(epochOk());
    if (json_object_get(root_, "timeStep"))
        OATH_CHECK(timeStepOk());

    return Status();
}

Status
OtpSettingsJson::generatorConfig(GeneratorConfig &result) const
{
    OATH_CHECK(checkTypes());

    const auto count = digits();
    if (count < 1 || generatorMaxDigits < count)
        return OATH_ERROR(OATH_CC_InvalidConfig,
            "Bad digit count " + std::to_string(count));

    HashAlgorithm hash;
    OATH_CHECK(hashAlgorithmParse(hash, algorithm()));

    GeneratorConfig out;
    out.digits = static_cast<unsigned>(count);
    out.hash = hmacFunction(hash);
    OATH_DebugLog("OTP settings: %u digits, %s",
        out.digits, hashAlgorithmName(hash));

    result = out;
    return Status();
}

Status
OtpSettingsJson::timeWindowConfig(TimeWindowConfig &result) const
{
    OATH_CHECK(checkTypes());

    const auto start = epoch();
    if (start < 0)
        return OATH_ERROR(OATH_CC_InvalidConfig,
            "Bad epoch " + std::to_string(start));

    const auto step = timeStep();
    if (step < 1 || UINT32_MAX < step)
        return OATH_ERROR(OATH_CC_InvalidConfig,
            "Bad time step " + std::to_string(step));

    TimeWindowConfig out;
    out.epoch = static_cast<uint64_t>(start);
    out.timeStep = static_cast<uint32_t>(step);

    result = out;
    return Status();
}

Status
OtpSettingsJson::fromConfig(unsigned digits, HashAlgorithm algorithm,
    const TimeWindowConfig &window)
{
    if (static_cast<uint64_t>(INT64_MAX) < window.epoch)
        return OATH_ERROR(OATH_CC_InvalidConfig, "Epoch does not fit in JSON");

    OATH_CHECK(digitsSet(digits));
    OATH_CHECK(algorithmSet(hashAlgorithmName(algorithm)));
    OATH_CHECK(epochSet(static_cast<json_int_t>(window.epoch)));
    OATH_CHECK(timeStepSet(window.timeStep));
    return Status();
}

} // namespace oath
