/**
 * @file parser.h
 * @brief AT response line framer.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#ifndef NOVAHTTP_PARSER_H_
#define NOVAHTTP_PARSER_H_

/**@{*/
/** Allows user to specify buffer size with -DNOVAHTTP_BUFFER_SIZE. */
#ifndef NOVAHTTP_BUFFER_SIZE
#define NOVAHTTP_BUFFER_SIZE 556
#endif
/**@}*/

#if NOVAHTTP_BUFFER_SIZE < 256
#warning NOVAHTTP_BUFFER_SIZE must be at least 256
#endif

#include <cstddef>
#include <cstdint>

namespace novahttp {

/**
 * @brief Maximum size of an AT command and response line.
 *
 * This can be set with -DNOVAHTTP_BUFFER_SIZE (default 556).
 */
constexpr size_t kBufferSize = (NOVAHTTP_BUFFER_SIZE);

typedef void (*parse_cb_t)(const uint8_t *data, size_t size, void *user);

/**
 * @brief Splits the modem byte stream into lines.
 *
 * Lines are emitted without their CR/LF terminator and blank lines are
 * dropped. Partial lines are kept across calls to load(). In raw mode a fixed
 * number of bytes bypass line splitting and go to the raw callback instead.
 */
class Parser {
public:
    /**
     * @brief Register a function to be called for each complete line.
     *
     * @param [in] func - line callback.
     * @param [in] user - private data.
     */
    void set_line_callback(parse_cb_t func, void *user=nullptr);

    /**
     * @brief Register a function to be called with raw mode bytes.
     *
     * @param [in] func - raw data callback.
     * @param [in] user - private data.
     */
    void set_raw_callback(parse_cb_t func, void *user=nullptr);

    /**
     * @brief Load incoming data.
     *
     * Callbacks may call expect_raw() and the remaining bytes of 'data' are
     * handled in the new mode.
     *
     * @param [in] data - buffer.
     * @param [in] size - length of buffer.
     */
    void load(const uint8_t *data, size_t size);

    /**
     * @brief Pass the next 'count' bytes to the raw callback.
     *
     * Any partial line already buffered is discarded.
     *
     * @param [in] count - number of bytes to read unsplit.
     */
    void expect_raw(size_t count);

    /** Cancel raw mode and return to line splitting. */
    void stop_raw();

    /** Discard buffered data and leave raw mode. */
    void reset();

    /**
     * @brief Bytes still expected in raw mode.
     */
    inline size_t raw_remaining() const
    {
        return raw_count;
    }

    /**
     * @brief Number of bytes of the current partial line.
     */
    inline size_t pending() const
    {
        return count;
    }

private:
    /** Emit the buffered line and prepare for the next one. */
    void complete_line();

    inline void emit_line(const uint8_t *data, size_t size)
    {
        if (line_cb)
            line_cb(data, size, line_cb_user);
    }

    inline void emit_raw(const uint8_t *data, size_t size)
    {
        if (raw_cb)
            raw_cb(data, size, raw_cb_user);
    }

    /** Function called for each line. */
    parse_cb_t line_cb = nullptr;

    /** User data passed to the line callback. */
    void *line_cb_user = nullptr;

    /** Function called with raw mode data. */
    parse_cb_t raw_cb = nullptr;

    /** User data passed to the raw callback. */
    void *raw_cb_user = nullptr;

    uint8_t buffer[kBufferSize];    /**< Line buffer. */
    size_t count = 0;               /**< The number of bytes in the buffer. */
    size_t raw_count = 0;           /**< Raw bytes left to pass through. */
};

} // namespace novahttp

#endif // NOVAHTTP_PARSER_H_
