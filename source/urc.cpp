/**
 * @file urc.cpp
 * @brief HTTP unsolicited result code parsing.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>

#include "urc.h"

/** Longest field list accepted after a URC prefix. */
static constexpr size_t kFieldMax = 64;

namespace novahttp {

/**
 * @brief Copy the text after 'prefix' into a terminated buffer.
 *
 * @return false if 'line' does not start with 'prefix' or is too long.
 */
static bool copy_fields(const char *line, size_t size, const char *prefix,
        char (&fields)[kFieldMax])
{
    const size_t skip = strlen(prefix);
    if (size < skip || memcmp(line, prefix, skip) != 0)
        return false;

    size -= skip;
    if (size >= kFieldMax)
        return false;

    memcpy(fields, line + skip, size);
    fields[size] = '\0';
    return true;
}

/**
 * @brief Parse one integer field.
 *
 * @param [in,out] cursor - start of the field, moved past it.
 * @param [out] value - parsed integer.
 * @return false if the field is not an integer or does not fit an int.
 */
static bool parse_field(const char *&cursor, long &value)
{
    char *end = nullptr;
    errno = 0;
    value = strtol(cursor, &end, 10);
    if (end == cursor || errno == ERANGE)
        return false;

    if (value < INT_MIN || value > INT_MAX)
        return false;

    // Allow trailing spaces before the delimiter
    while (*end == ' ')
        ++end;

    if (*end != ',' && *end != '\0')
        return false;

    cursor = end;
    return true;
}

const char *method_name(Method method)
{
    switch (method) {
    case Method::get:
        return "GET";
    case Method::post:
        return "POST";
    case Method::put:
        return "PUT";
    }
    return "?";
}

bool parse_action(const char *line, size_t size, ActionResult &result)
{
    // +HTTPACTION: %d,%d,%d
    // │           │
    // │           └ fields
    // └ line

    char fields[kFieldMax];
    if (!copy_fields(line, size, "+HTTPACTION:", fields))
        return false;

    long values[3];
    const char *cursor = fields;

    for (size_t i = 0; i < 3; ++i) {
        if (i > 0) {
            if (*cursor != ',')
                return false;
            ++cursor;
        }

        if (!parse_field(cursor, values[i]))
            return false;
    }

    if (values[1] < 0 || values[2] < 0)
        return false;

    result.method = static_cast<int>(values[0]);
    result.status = static_cast<int>(values[1]);
    result.length = static_cast<size_t>(values[2]);
    return true;
}

bool parse_read_header(const char *line, size_t size, size_t &count)
{
    // +HTTPREAD: [DATA,]%d
    // │          │
    // │          └ fields
    // └ line

    char fields[kFieldMax];
    if (!copy_fields(line, size, "+HTTPREAD:", fields))
        return false;

    const char *cursor = fields;
    while (*cursor == ' ')
        ++cursor;

    if (strncmp(cursor, "DATA,", 5) == 0)
        cursor += 5;

    long value = 0;
    if (!parse_field(cursor, value) || *cursor != '\0' || value < 0)
        return false;

    count = static_cast<size_t>(value);
    return true;
}

} // namespace novahttp
