/**
 * @file session.h
 * @brief AT command session engine.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#ifndef NOVAHTTP_SESSION_H_
#define NOVAHTTP_SESSION_H_

#include <cstdint>
#include <vector>

#include "command.h"
#include "parser.h"
#include "urc.h"

/** Drives the HTTP client of a cellular modem over AT commands. */
namespace novahttp {

static_assert(kBufferSize > 64);

/** How often to poll the transport while waiting (ms). */
constexpr uint32_t kPollInterval = 5;

/**
 * @brief Defines resources and callbacks used by the driver.
 *
 * The API expects a *non-blocking* buffered
 * implementation, e.g. unistd or Arduino.
 *
 *   https://linux.die.net/man/2/read
 *   https://linux.die.net/man/2/write
 */
typedef struct {
    /**
     * @brief Read up to 'size' bytes into 'data' from stream.
     *
     * @param [out] data - buffer to read into.
     * @param [in] size - number of bytes to read.
     * @return number of bytes read.
     */
    int (*read)(void *data, size_t size);

    /**
     * @brief Write 'size' bytes from 'data' to stream.
     *
     * @param [in] data - buffer to write.
     * @param [in] size - number of bytes to write.
     * @return number of bytes written.
     */
    int (*write)(const void *data, size_t size);

    /**
     * @brief Discard any unread input.
     */
    void (*flush)();

    /**
     * @brief Returns number of milliseconds elapsed since program start.
     */
    uint32_t (*millis)();

    /**
     * @brief Sleep while waiting for input (optional).
     *
     * If null the driver polls continuously.
     */
    void (*delay)(uint32_t ms);
} context_t;

/**
 * @brief Session events.
 * @see set_event_callback().
 */
enum class Event {
    timeout, /**< A command timed out. */
    upload_timeout, /**< Uploaded data was not acknowledged. */
    urc_timeout, /**< No +HTTPACTION result before the deadline. */
    peer_closed, /**< The server closed the connection. */
    no_network, /**< The modem reported the network is unavailable. */
};

/**
 * @brief Exchanges AT commands with the modem, one at a time.
 *
 * Every wait is bounded by a timeout. Unsolicited result codes received
 * while a command is collecting its response are handled separately and
 * never stored in the Response.
 */
class Session {
public:
    /**
     * @brief Constructor.
     *
     * @param [in] context - hardware specific callbacks for the driver.
     */
    Session(context_t &context);

    /**
     * @brief Set a function to be called on a session event.
     *
     * @param [in] func - function to be called.
     * @param [in] user - pointer to be passed when 'func' is called.
     */
    void set_event_callback(
            void (*func)(Event event, void *user), void *user = nullptr);

    /**
     * @brief Set a function to be called on a modem error (+CME ERROR).
     *
     * @param [in] func - function to be called.
     * @param [in] user - pointer to be passed when 'func' is called.
     */
    void set_error_callback(
            void (*func)(int error, void *user), void *user = nullptr);

    /**
     * @brief Send a command and collect its response.
     *
     * Stale input is discarded before the command is written. Lines are
     * collected until one matches the command's expected prefixes, an error
     * is reported, or the timeout elapses.
     *
     * @param [in] cmd - command to send.
     * @param [out] response - lines received for the command.
     * @return 0 if an expected line was received.
     * @return -EIO if the modem returned ERROR.
     * @return -ETIMEDOUT if the timeout elapsed, 'response' may be partial.
     * @return -EINVAL if the command is empty.
     * @return -EMSGSIZE if buffer size exceeded.
     * @return -EBUSY if another operation is in progress.
     */
    int execute(const Command &cmd, Response &response);

    /**
     * @brief Send an opaque command line and collect its response.
     *
     * @param [in] text - command line without terminator, e.g. "AT+CSQ".
     * @param [in] timeout - maximum time to wait for 'OK' (ms).
     * @param [out] response - lines received for the command.
     * @return same as execute().
     */
    int raw_command(const char *text, uint32_t timeout, Response &response);

    /**
     * @brief Send a command without waiting for a response.
     *
     * @param [in] cmd - command to send.
     * @return -EIO if the write failed.
     * @return -ETIMEDOUT if the transport did not accept the data.
     * @return -EINVAL if the command is empty.
     * @return -EMSGSIZE if buffer size exceeded.
     * @return -EBUSY if another operation is in progress.
     */
    int transmit(const Command &cmd);

    /**
     * @brief Write data during the data-upload sub-mode.
     *
     * Must follow a command that announced the upload (e.g. AT+HTTPDATA).
     * Writes the payload and the terminator byte, then waits for 'OK'.
     *
     * @param [in] request - payload and acknowledgement timeout.
     * @param [out] ack - lines received after the upload.
     * @return 0 if the upload was acknowledged.
     * @return -EIO if the modem returned ERROR or the write failed.
     * @return -ETIMEDOUT if no acknowledgement was received.
     * @return -EBUSY if another operation is in progress.
     */
    int upload(const UploadRequest &request, Response &ack);

    /**
     * @brief Start an HTTP request (AT+HTTPACTION).
     *
     * Discards any earlier +HTTPACTION result. The response is not awaited,
     * call await_action() for the result.
     *
     * @param [in] method - HTTP method.
     * @return same as transmit().
     */
    int request_action(Method method);

    /**
     * @brief Wait for the +HTTPACTION result of 'method'.
     *
     * Malformed lines and results for other methods are ignored.
     *
     * @param [in] method - HTTP method that was requested.
     * @param [in] timeout - maximum time to wait (ms).
     * @param [out] result - parsed result.
     * @return -ETIMEDOUT if no result arrived before the timeout.
     * @return -EBUSY if another operation is in progress.
     */
    int await_action(Method method, uint32_t timeout, ActionResult &result);

    /**
     * @brief Read the response body (AT+HTTPREAD=0,<length>).
     *
     * @param [in] length - number of bytes to request.
     * @param [in] timeout - maximum time to wait for the body (ms).
     * @param [out] body - received bytes.
     * @return 0 if exactly 'length' bytes were received.
     * @return -EIO if the modem returned ERROR or ended the body early.
     * @return -ETIMEDOUT if the body was incomplete at the timeout.
     * @return -EBUSY if another operation is in progress.
     */
    int read_body(size_t length, uint32_t timeout, std::vector<uint8_t> &body);

    /**
     * @brief Returns true if a +HTTPACTION result is waiting.
     */
    inline bool action_pending() const
    {
        return action_ready;
    }

    /**
     * @brief Returns true while an operation is in progress.
     */
    inline bool busy() const
    {
        return active;
    }

private:
    /** What received lines are collected for. */
    enum class Mode {
        idle, /**< Nothing in progress. */
        command, /**< Collecting a command response. */
        action, /**< Waiting for +HTTPACTION. */
        body, /**< Receiving an HTTP body. */
    };

    /** Marks the session busy for the lifetime of the object. */
    class Guard {
    public:
        Guard(bool &flag) : flag(flag) { flag = true; }
        ~Guard() { flag = false; }
    private:
        bool &flag;
    };

    /** Process a completed line. */
    static void line_callback(const uint8_t *data, size_t size, void *user);

    /** Process raw body bytes. */
    static void raw_callback(const uint8_t *data, size_t size, void *user);

    /** Discard stale input and write 'cmd'. */
    int send_command(const Command &cmd);

    /** Collect lines for 'cmd' until complete or timeout. */
    int collect(const Command &cmd, Response &response);

    /** Poll until the current operation completes or 'timeout' elapses. */
    int wait(uint32_t timeout);

    /** Read and parse available input, returns false if there was none. */
    bool poll();

    /** Write all of 'data' or fail after 'timeout'. */
    int write_all(const uint8_t *data, size_t size, uint32_t timeout);

    /** Finish the current operation with 'result'. */
    void finish(int result);

    /** Handle unsolicited result codes. */
    bool parse_urc(const char *line, size_t size);

    /** Handle a +HTTPACTION line. */
    void parse_action_urc(const char *line, size_t size);

    /** Handle a command response line. */
    void parse_command(const char *line, size_t size);

    /** Handle a line received during read_body(). */
    void parse_body(const char *line, size_t size);

    /** Complete read_body() once the body and its trailer arrived. */
    void check_body();

    /** Wait for the poll interval. */
    void idle();

    /** Invoke the event callback. */
    inline void emit_event(Event event)
    {
        if (event_cb)
            event_cb(event, event_cb_user);
    }

    /** Invoke the error callback. */
    inline void emit_error(int code)
    {
        if (error_cb)
            error_cb(code, error_cb_user);
    }

    inline uint32_t millis() const
    {
        return ctx.millis();
    }

    inline int read(void *data, size_t size) const
    {
        return ctx.read(data, size);
    }

    inline int write(const void *data, size_t size) const
    {
        return ctx.write(data, size);
    }

    /** Driver operating context. */
    const context_t &ctx;

    /** User function to call on event. */
    void (*event_cb)(Event event, void *user) = nullptr;

    /** User private data for event callback. */
    void *event_cb_user = nullptr;

    /** User function to call on +CME ERROR. */
    void (*error_cb)(int error, void *user) = nullptr;

    /** User private data for error callback. */
    void *error_cb_user = nullptr;

    /** Receive buffer. */
    uint8_t buffer[kBufferSize];

    /** Line framer. */
    Parser parser;

    /** True while a public operation is running. */
    bool active = false;

    /** Current collection mode. */
    Mode mode = Mode::idle;

    /** Set when the current operation has finished. */
    bool complete = false;

    /** Result of the current operation. */
    int status = 0;

    /** Command awaiting a response. */
    const Command *pending = nullptr;

    /** Response being collected. */
    Response *frame = nullptr;

    /** Method code passed to await_action(). */
    int awaited_method = -1;

    /** Most recent +HTTPACTION result. */
    ActionResult action;

    /** True if 'action' has not been consumed. */
    bool action_ready = false;

    /** Body being received. */
    std::vector<uint8_t> *body_buffer = nullptr;

    /** Number of body bytes requested. */
    size_t body_length = 0;

    /** 'OK' was received for AT+HTTPREAD. */
    bool body_ok = false;

    /** '+HTTPREAD: 0' was received. */
    bool body_end = false;
};

} // namespace novahttp

#endif // NOVAHTTP_SESSION_H_
