/**
 * @file debug.cpp
 * @brief Debug printing macros.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#include <cstdint>
#include <cstdio>
#include <stdarg.h>
#include "debug.h"

#if (NOVAHTTP_DEBUG && NOVAHTTP_DEBUG > 0)

/** Size of one formatted log message. */
static constexpr size_t kMessageSize = 256;

/**
 * @brief User defined function to print debug strings.
 * @param [in] level the log level of the message.
 * @param [in] str message c-string.
 */
extern void novahttp_debug(int level, const char *str);

/**
 * @brief Handles debug formatting and passes string to user defined function.
 *
 * Messages that do not fit are cut short and end with "...".
 *
 * @param [in] level the log level of the message.
 * @param [in] format standard c formatting string.
 * @see novahttp_debug
 * @private
 */
void novahttp_debug_print(int level, const char *format, ...)
{
    va_list argp;
    char buffer[kMessageSize];

    va_start(argp, format);
    const int size = vsnprintf(buffer, sizeof(buffer), format, argp);
    va_end(argp);

    if (size >= static_cast<int>(sizeof(buffer)))
        snprintf(buffer + sizeof(buffer) - 5, 5, "...\n");

    novahttp_debug(level, buffer);
}

/**
 * @brief Print modem traffic with control characters escaped.
 *
 * CR and LF are shown as \r and \n, other control bytes such as the
 * Ctrl-Z upload terminator as \x1A.
 *
 * @param [in] level the log level of the message.
 * @param [in] tag short prefix, e.g. "TX".
 * @param [in] data bytes to print.
 * @param [in] size number of bytes.
 * @private
 */
void novahttp_debug_dump(
        int level, const char *tag, const void *data, size_t size)
{
    const uint8_t *bytes = static_cast<const uint8_t*>(data);
    char buffer[kMessageSize];

    int count = snprintf(buffer, sizeof(buffer), "%s: ", tag);
    if (count < 0)
        return;

    // Leave room for an escape sequence, "..." and the newline
    const size_t limit = sizeof(buffer) - 9;

    size_t used = static_cast<size_t>(count);
    size_t i = 0;
    for (; i < size && used < limit; ++i) {
        const uint8_t c = bytes[i];
        if (c == '\r') {
            used += snprintf(buffer + used, sizeof(buffer) - used, "\\r");
        }
        else if (c == '\n') {
            used += snprintf(buffer + used, sizeof(buffer) - used, "\\n");
        }
        else if (c < 0x20 || c >= 0x7F) {
            used += snprintf(buffer + used, sizeof(buffer) - used, "\\x%02X", c);
        }
        else {
            buffer[used++] = static_cast<char>(c);
        }
    }

    snprintf(buffer + used, sizeof(buffer) - used,
            (i < size) ? "...\n" : "\n");

    novahttp_debug(level, buffer);
}

#endif // (NOVAHTTP_DEBUG && NOVAHTTP_DEBUG > 0)
