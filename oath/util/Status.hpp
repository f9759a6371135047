/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 */
#ifndef OATH_UTIL_STATUS_HPP
#define OATH_UTIL_STATUS_HPP

#include <stddef.h>
#include <ostream>
#include <string>

namespace oath {

/**
 * Result codes returned by the library.
 */
typedef enum eOATH_CC
{
    /** The function completed without an error */
    OATH_CC_Ok = 0,
    /** An error occured */
    OATH_CC_Error = 1,
    /** A generator, time-window or settings value is out of range */
    OATH_CC_InvalidConfig = 2,
    /** The keyed-hash digest is too short for dynamic truncation */
    OATH_CC_DigestTooShort = 3,
    /** The keyed-hash primitive failed */
    OATH_CC_HashError = 4,
    /** The timestamp lies before the time-window epoch */
    OATH_CC_BeforeEpoch = 5,
    /** Malformed encoded data */
    OATH_CC_ParseError = 6,
    /** JSON parsing or type error */
    OATH_CC_JSONError = 7,
    /** Failed to open a file */
    OATH_CC_FileOpenError = 8,
    /** Failed to read a file */
    OATH_CC_FileReadError = 9,
    /** Failed to write a file */
    OATH_CC_FileWriteError = 10,
    /** Unexpected system failure */
    OATH_CC_SysError = 11
} tOATH_CC;

/**
 * Describes the results of calling a core function,
 * which can be either success or failure.
 */
class Status
{
public:
    /**
     * Constructs a success status.
     */
    Status();

    /**
     * Constructs an error status.
     */
    Status(tOATH_CC value, std::string message,
        const char *file, const char *function, size_t line);

    // Read accessors:
    tOATH_CC value()            const { return value_; }
    std::string message()       const { return message_; }
    std::string file()          const { return file_; }
    std::string function()      const { return function_; }
    size_t line()               const { return line_; }

    /**
     * Returns true if the status code represents success.
     */
    explicit operator bool() const { return value_ == OATH_CC_Ok; }

    /**
     * Writes the status to the debug log if it represents an error.
     */
    const Status &
    log() const;

private:
    // Error information:
    tOATH_CC value_;
    std::string message_;

    // Error location:
    const char *file_;
    const char *function_;
    size_t line_;
};

std::ostream &operator<<(std::ostream &output, const Status &s);

/**
 * Constructs an error status using the current source location.
 */
#define OATH_ERROR(value, message) \
    oath::Status(value, message, __FILE__, __FUNCTION__, __LINE__)

/**
 * Checks a status code, and returns if it represents an error.
 */
#define OATH_CHECK(f) \
    do { \
        oath::Status s = (f); \
        if (!s) return s; \
    } while (false)

} // namespace oath

#endif
