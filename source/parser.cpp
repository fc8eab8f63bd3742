/**
 * @file parser.cpp
 * @brief AT response line framer.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#include <algorithm>
#include <cstring>

#include "debug.h"
#include "parser.h"

namespace novahttp {

void Parser::set_line_callback(parse_cb_t func, void *user)
{
    line_cb = func;
    line_cb_user = user;
}

void Parser::set_raw_callback(parse_cb_t func, void *user)
{
    raw_cb = func;
    raw_cb_user = user;
}

void Parser::load(const uint8_t *data, size_t size)
{
    size_t i = 0;
    while (i < size) {
        if (raw_count > 0) {
            // Pass through without looking for terminators
            const size_t chunk = std::min(raw_count, size - i);
            raw_count -= chunk;
            emit_raw(data + i, chunk);
            i += chunk;
            continue;
        }

        const uint8_t c = data[i++];

        if (count == 0 && c == '>') {
            // Data prompt is not followed by a newline
            emit_line(&c, 1);
            continue;
        }

        buffer[count++] = c;

        if (c == '\n') {
            complete_line();
        }
        else if (count >= kBufferSize) {
            LOG_WARN("Line exceeds %u bytes\n",
                    static_cast<unsigned>(kBufferSize));
            complete_line();
        }
    }
}

void Parser::expect_raw(size_t n)
{
    count = 0;
    raw_count = n;
}

void Parser::stop_raw()
{
    raw_count = 0;
}

void Parser::reset()
{
    count = 0;
    raw_count = 0;
}

void Parser::complete_line()
{
    size_t size = count;

    // Strip the terminator
    while (size > 0 && (buffer[size - 1] == '\n' || buffer[size - 1] == '\r'))
        size -= 1;

    // Skip leading whitespace left over from a prompt
    size_t start = 0;
    while (start < size && buffer[start] == ' ')
        start += 1;

    // Prepare for the next line before the callback can call expect_raw()
    count = 0;

    if (start < size)
        emit_line(buffer + start, size - start);
}

} // namespace novahttp
