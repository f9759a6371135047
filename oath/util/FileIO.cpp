/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "FileIO.hpp"
#include <errno.h>
#include <stdio.h>
#include <unistd.h>

namespace oath {

std::recursive_mutex gFileMutex;

bool
fileExists(const std::string &path)
{
    AutoFileLock lock(gFileMutex);

    return 0 == access(path.c_str(), F_OK);
}

Status
fileLoad(DataChunk &result, const std::string &path)
{
    AutoFileLock lock(gFileMutex);

    FILE *fp = fopen(path.c_str(), "rb");
    if (!fp)
        return OATH_ERROR(OATH_CC_FileOpenError, "Cannot open for reading: " + path);

    fseek(fp, 0, SEEK_END);
    long size = ftell(fp);
    fseek(fp, 0, SEEK_SET);
    if (size < 0)
    {
        fclose(fp);
        return OATH_ERROR(OATH_CC_FileReadError, "Cannot size file: " + path);
    }

    DataChunk out(size);
    if (fread(out.data(), 1, out.size(), fp) != out.size())
    {
        fclose(fp);
        return OATH_ERROR(OATH_CC_FileReadError, "Cannot read file: " + path);
    }

    fclose(fp);
    result = std::move(out);
    return Status();
}

Status
fileSave(DataSlice data, const std::string &path)
{
    AutoFileLock lock(gFileMutex);

    FILE *fp = fopen(path.c_str(), "wb");
    if (!fp)
        return OATH_ERROR(OATH_CC_FileOpenError, "Cannot open for writing: " + path);

    if (data.size() && 1 != fwrite(data.data(), data.size(), 1, fp))
    {
        fclose(fp);
        return OATH_ERROR(OATH_CC_FileWriteError, "Cannot write file: " + path);
    }

    fclose(fp);
    return Status();
}

Status
fileDelete(const std::string &path)
{
    AutoFileLock lock(gFileMutex);

    if (unlink(path.c_str()) && ENOENT != errno)
        return OATH_ERROR(OATH_CC_SysError, "Cannot delete file: " + path);

    return Status();
}

} // namespace oath
