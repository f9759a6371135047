/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OATH_OTP_OTP_SETTINGS_HPP
#define OATH_OTP_OTP_SETTINGS_HPP

#include "Generator.hpp"
#include "TimeWindow.hpp"
#include "../json/JsonObject.hpp"

namespace oath {

/**
 * Generator and time-window options stored as JSON:
 *
 *     { "digits": 6, "algorithm": "SHA1", "epoch": 0, "timeStep": 30 }
 *
 * Every field is optional. Secrets never go in this file.
 */
struct OtpSettingsJson:
    public JsonObject
{
    OATH_JSON_CONSTRUCTORS(OtpSettingsJson, JsonObject)
    OATH_JSON_INTEGER(digits,    "digits",    6)
    OATH_JSON_STRING (algorithm, "algorithm", "SHA1")
    OATH_JSON_INTEGER(epoch,     "epoch",     0)
    OATH_JSON_INTEGER(timeStep,  "timeStep",  30)

    /**
     * Builds a generator configuration from the settings.
     */
    Status
    generatorConfig(GeneratorConfig &result) const;

    /**
     * Builds a time-window configuration from the settings.
     */
    Status
    timeWindowConfig(TimeWindowConfig &result) const;

    /**
     * Stores a configuration in the settings.
     * Only the built-in hash algorithms can be written out.
     */
    Status
    fromConfig(unsigned digits, HashAlgorithm algorithm,
        const TimeWindowConfig &window);

private:
    Status
    checkTypes() const;
};

} // namespace oath

#endif
