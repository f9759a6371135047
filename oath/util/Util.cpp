/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Util.hpp"

namespace oath {

void *
guaranteedMemset(void *v, int c, size_t n)
{
    if (v)
    {
        volatile char *p = (char *)v;
        while (n--)
        {
            *p++ = c;
        }
    }

    return v;
}

void
dataWipe(DataChunk &data)
{
    guaranteedMemset(data.data(), 0, data.size());
    data.clear();
}

} // namespace oath
