/**
 * @file command.h
 * @brief AT command and response buffers.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#ifndef NOVAHTTP_COMMAND_H_
#define NOVAHTTP_COMMAND_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace novahttp {

/** How long to wait for a command response. */
constexpr uint32_t kDefaultTimeout = 1000;

/** Ends the data-upload sub-mode (Ctrl-Z). */
constexpr uint8_t kUploadTerminator = 0x1A;

/** Modem command object. */
class Command
{
public:
    /**
     * @brief Constructor.
     *
     * Builds 'AT[data]\r\n' and expects an 'OK' response.
     *
     * @param [in] timeout - maximum time to wait for a response (ms).
     * @param [in] data - command suffix, e.g. "+HTTPINIT".
     */
    Command(uint32_t timeout = kDefaultTimeout, const char *data = nullptr);

    /**
     * @brief Create a command from an opaque text line.
     *
     * @param [in] timeout - maximum time to wait for a response (ms).
     * @param [in] text - complete line without terminator, e.g. "AT+CSQ".
     */
    static Command raw(uint32_t timeout, const char *text);

    /**
     * @brief Add a response prefix that completes the command.
     *
     * The first call replaces the default 'OK'.
     *
     * @param [in] prefix - start of the expected line.
     * @return reference to this command.
     */
    Command& expect(const char *prefix);

    /**
     * @brief Returns true if 'line' completes the command.
     *
     * @param [in] line - received line without terminator.
     * @param [in] size - line length.
     */
    bool expected(const char *line, size_t size) const;

    /**
     * @brief Return the data pointer.
     */
    inline const uint8_t* data() const
    {
        return payload.data();
    }

    /**
     * @brief Return the payload size in bytes.
     */
    inline size_t size() const
    {
        return payload.size();
    }

    /**
     * @brief Return the command timeout in milliseconds.
     */
    inline uint32_t timeout() const
    {
        return timeout_ms;
    }

private:
    uint32_t timeout_ms; /**< Response timeout (ms). */
    std::vector<uint8_t> payload; /**< Command line including CRLF. */
    std::vector<std::string> prefixes; /**< Lines that complete the command. */
    bool custom = false; /**< True once expect() has been called. */
};

/** Lines received in response to a command. */
class Response
{
public:
    /** Discard all lines. */
    inline void clear()
    {
        lines.clear();
    }

    /**
     * @brief Append a received line.
     *
     * @param [in] data - line without terminator.
     * @param [in] size - line length.
     */
    inline void add(const char *data, size_t size)
    {
        lines.emplace_back(data, size);
    }

    /**
     * @brief Returns true if nothing arrived before the timeout.
     */
    inline bool empty() const
    {
        return lines.empty();
    }

    /**
     * @brief Returns the first line beginning with 'prefix'.
     *
     * @param [in] prefix - line prefix to search for.
     * @return nullptr if there is no such line.
     */
    const std::string *find(const char *prefix) const;

    /** Received lines in arrival order. */
    std::vector<std::string> lines;
};

/** Payload written during the data-upload sub-mode. */
class UploadRequest
{
public:
    /**
     * @brief Constructor.
     *
     * @param [in] data - body bytes.
     * @param [in] size - number of body bytes.
     * @param [in] timeout - time to wait for the acknowledgement (ms).
     */
    UploadRequest(const void *data, size_t size,
            uint32_t timeout = kDefaultTimeout);

    /**
     * @brief Return the payload pointer.
     */
    inline const uint8_t* data() const
    {
        return payload.data();
    }

    /**
     * @brief Declared length, always the payload size.
     */
    inline size_t length() const
    {
        return payload.size();
    }

    /**
     * @brief Return the acknowledgement timeout in milliseconds.
     */
    inline uint32_t timeout() const
    {
        return timeout_ms;
    }

private:
    uint32_t timeout_ms; /**< Acknowledgement timeout (ms). */
    std::vector<uint8_t> payload; /**< Body bytes. */
};

} // namespace novahttp

#endif // NOVAHTTP_COMMAND_H_
