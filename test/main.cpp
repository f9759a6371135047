/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#define CATCH_CONFIG_MAIN
#include <catch.hpp>
