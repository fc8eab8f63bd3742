/**
 * @file debug.h
 * @brief Debug printing macros.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#ifndef NOVAHTTP_DEBUG_H_
#define NOVAHTTP_DEBUG_H_

#define NOVAHTTP_DEBUG_ERROR (1)
#define NOVAHTTP_DEBUG_WARN (2)
#define NOVAHTTP_DEBUG_INFO (3)
#define NOVAHTTP_DEBUG_VERBOSE (4)
#define NOVAHTTP_DEBUG_TRACE (5)

#ifndef NOVAHTTP_DEBUG
#define NOVAHTTP_DEBUG (0)
#endif

#if (NOVAHTTP_DEBUG > 0)
#include <cstddef>

void novahttp_debug_print(int level, const char *format, ...);
void novahttp_debug_dump(
        int level, const char *tag, const void *data, size_t size);
#endif

/**@{*/
/** Log problems that need to be resolved manually. */
#if (NOVAHTTP_DEBUG >= NOVAHTTP_DEBUG_ERROR)
#define LOG_ERROR(...) novahttp_debug_print(NOVAHTTP_DEBUG_ERROR, __VA_ARGS__)
#else
#define LOG_ERROR(...) do {} while(0)
#endif
/**@}*/

/**@{*/
/** Log problems that will be resolved automatically. */
#if (NOVAHTTP_DEBUG >= NOVAHTTP_DEBUG_WARN)
#define LOG_WARN(...) novahttp_debug_print(NOVAHTTP_DEBUG_WARN, __VA_ARGS__)
#else
#define LOG_WARN(...) do {} while(0)
#endif
/**@}*/

/**@{*/
/** Log one-shot informational messages. */
#if (NOVAHTTP_DEBUG >= NOVAHTTP_DEBUG_INFO)
#define LOG_INFO(...) novahttp_debug_print(NOVAHTTP_DEBUG_INFO, __VA_ARGS__)
#else
#define LOG_INFO(...) do {} while(0)
#endif
/**@}*/

/**@{*/
/** Log verbose informational messages about internal operation. */
#if (NOVAHTTP_DEBUG >= NOVAHTTP_DEBUG_VERBOSE)
#define LOG_VERBOSE(...) novahttp_debug_print(NOVAHTTP_DEBUG_VERBOSE, __VA_ARGS__)
#else
#define LOG_VERBOSE(...) do{} while(0)
#endif
/**@}*/

/**@{*/
/** Log every line exchanged with the modem. */
#if (NOVAHTTP_DEBUG >= NOVAHTTP_DEBUG_TRACE)
#define LOG_TRACE(...) novahttp_debug_print(NOVAHTTP_DEBUG_TRACE, __VA_ARGS__)
#define LOG_DUMP(tag, data, size) \
        novahttp_debug_dump(NOVAHTTP_DEBUG_TRACE, tag, data, size)
#else
#define LOG_TRACE(...) do{} while(0)
#define LOG_DUMP(tag, data, size) do{} while(0)
#endif
/**@}*/

#endif // NOVAHTTP_DEBUG_H_
