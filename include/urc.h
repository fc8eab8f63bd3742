/**
 * @file urc.h
 * @brief HTTP unsolicited result code parsing.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#ifndef NOVAHTTP_URC_H_
#define NOVAHTTP_URC_H_

#include <cstddef>
#include <cstdint>

namespace novahttp {

/**
 * @brief HTTP method codes used by AT+HTTPACTION.
 */
enum class Method : uint8_t {
    get = 0,  /**< 0x0 - GET. */
    post = 1, /**< 0x1 - POST. */
    put = 4,  /**< 0x4 - PUT. */
};

/** Result reported by '+HTTPACTION: <method>,<status>,<length>'. */
struct ActionResult {
    int method = -1;    /**< Method code echoed by the modem. */
    int status = -1;    /**< HTTP status code. */
    size_t length = 0;  /**< Response body length in bytes. */
};

/**
 * @brief Returns the method name, e.g. "GET".
 */
const char *method_name(Method method);

/**
 * @brief Parse a '+HTTPACTION: <method>,<status>,<length>' line.
 *
 * @param [in] line - received line without terminator.
 * @param [in] size - line length.
 * @param [out] result - parsed values, only written on success.
 * @return false if the line is not a well-formed +HTTPACTION result.
 */
bool parse_action(const char *line, size_t size, ActionResult &result);

/**
 * @brief Parse a '+HTTPREAD: <len>' or '+HTTPREAD: DATA,<len>' header.
 *
 * '+HTTPREAD: 0' marks the end of the body.
 *
 * @param [in] line - received line without terminator.
 * @param [in] size - line length.
 * @param [out] count - number of body bytes that follow the header.
 * @return false if the line is not a +HTTPREAD header.
 */
bool parse_read_header(const char *line, size_t size, size_t &count);

} // namespace novahttp

#endif // NOVAHTTP_URC_H_
