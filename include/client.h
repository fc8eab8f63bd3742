/**
 * @file client.h
 * @brief HTTP requests through the modem's HTTP service.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#ifndef NOVAHTTP_CLIENT_H_
#define NOVAHTTP_CLIENT_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "session.h"

namespace novahttp {

/**
 * @brief Stage of the current request.
 * @see set_state_callback().
 */
enum class State {
    idle, /**< 0x0 - No request in progress. */
    init, /**< 0x1 - Starting the HTTP service. */
    configured, /**< 0x2 - Setting request parameters. */
    uploading, /**< 0x3 - Sending the request body. */
    action_sent, /**< 0x4 - AT+HTTPACTION sent. */
    awaiting_urc, /**< 0x5 - Waiting for the +HTTPACTION result. */
    reading_body, /**< 0x6 - Reading the response body. */
    terminated, /**< 0x7 - Stopping the HTTP service. */
};

/** Reason a request failed. */
enum class Error {
    none, /**< Request succeeded. */
    busy, /**< Another request is in progress. */
    invalid, /**< The URL is missing or too long. */
    transport, /**< A command could not be written. */
    upload_rejected, /**< The modem refused the upload. */
    upload_timeout, /**< The uploaded body was not acknowledged. */
    urc_timeout, /**< No +HTTPACTION result before the deadline. */
    http_status, /**< The server returned a status other than 200. */
    read_timeout, /**< The response body was incomplete. */
    body_too_large, /**< The reported body length exceeds Config::max_body. */
};

/** Request settings. */
struct Config {
    /** Enable TLS with AT+HTTPSSL=1. */
    bool ssl = false;

    /** Set AT+HTTPPARA="READMODE",1. */
    bool read_mode = false;

    /** Content type of POST and PUT bodies. */
    const char *content_type = "application/json";

    /** Extra request header (USERDATA), or null. */
    const char *header = nullptr;

    /** Do not upload unless AT+HTTPDATA answers with a prompt. */
    bool strict_upload = false;

    /** Timeout for configuration commands (ms). */
    uint32_t command_timeout = 500;

    /** Time the modem waits for the body after AT+HTTPDATA (ms). */
    uint32_t upload_timeout = 30000;

    /** Time to wait for the +HTTPACTION result (ms). */
    uint32_t action_timeout = 10000;

    /** Time to wait for the response body (ms). */
    uint32_t read_timeout = 10000;

    /** Largest response body that will be read (bytes). */
    size_t max_body = 65536;
};

/** Result of one HTTP request. */
struct Outcome {
    bool ok = false; /**< True if the server returned 200 and the body was read. */
    int status = -1; /**< HTTP status code, -1 if none was received. */
    std::vector<uint8_t> body; /**< Response body. */
    Error error = Error::none; /**< Failure reason. */
};

/**
 * @brief Returns a short description of 'error'.
 */
const char *error_name(Error error);

/** HTTP client running on top of a Session. */
class Client {
public:
    /**
     * @brief Constructor.
     *
     * @param [in] session - command session with exclusive use of the link.
     * @param [in] config - request settings.
     */
    Client(Session &session, const Config &config = Config());

    /**
     * @brief Set a function to be called on state changes.
     *
     * @param [in] func - function to be called.
     * @param [in] user - pointer to be passed when 'func' is called.
     */
    void set_state_callback(
            void (*func)(State state, void *user), void *user = nullptr);

    /**
     * @brief HTTP GET.
     *
     * @param [in] url - request URL.
     */
    Outcome get(const char *url);

    /**
     * @brief HTTP POST.
     *
     * @param [in] url - request URL.
     * @param [in] data - request body.
     * @param [in] size - body size in bytes.
     */
    Outcome post(const char *url, const void *data, size_t size);

    /**
     * @brief HTTP PUT.
     *
     * @param [in] url - request URL.
     * @param [in] data - request body.
     * @param [in] size - body size in bytes.
     */
    Outcome put(const char *url, const void *data, size_t size);

    /**
     * @brief Run one request.
     *
     * The HTTP service is always terminated before returning.
     *
     * @param [in] method - HTTP method.
     * @param [in] url - request URL.
     * @param [in] data - request body (POST/PUT).
     * @param [in] size - body size in bytes.
     */
    Outcome request(Method method, const char *url,
            const void *data = nullptr, size_t size = 0);

    /**
     * @brief Send an opaque command, e.g. for registration checks.
     *
     * @param [in] text - command line without terminator.
     * @param [in] timeout - maximum time to wait for a response (ms).
     * @param [out] response - lines received for the command.
     * @return see Session::execute().
     */
    int raw_command(const char *text, uint32_t timeout, Response &response);

    /**
     * @brief Configure and activate the PDP context.
     *
     * Every step is attempted even if an earlier one failed.
     *
     * @param [in] apn - access point name.
     * @param [in] user - access point user name.
     * @param [in] pwd - access point password.
     * @return number of steps that failed.
     * @return -EINVAL if 'apn' is null or larger than 63 bytes.
     * @return -EBUSY if a request is in progress.
     */
    int attach(
            const char *apn,
            const char *user = nullptr,
            const char *pwd = nullptr);

    /**
     * @brief Close the data connection (AT+NETCLOSE).
     *
     * @return see Session::execute().
     */
    int detach();

    /**
     * @brief Stop the HTTP service (AT+HTTPTERM).
     *
     * Safe to call when the service is not running.
     *
     * @return see Session::execute().
     */
    int terminate();

    /**
     * @brief Return the request state.
     */
    inline State status() const
    {
        return state;
    }

    /**
     * @brief Return the request settings.
     */
    inline const Config &config() const
    {
        return cfg;
    }

private:
    /** Update the state and call the user function. */
    void set_state(State state);

    /**
     * @brief Send a command, logging any failure.
     *
     * @param [in] data - command suffix.
     * @param [in] timeout - response timeout (ms).
     * @param [in] expect - expected response prefix, or null for 'OK'.
     */
    int send(const char *data, uint32_t timeout, const char *expect = nullptr);

    /** AT+HTTPTERM, AT+HTTPINIT, AT+HTTPSSL. */
    void start_service();

    /** AT+HTTPTERM, then AT+HTTPSSL=0 if TLS was enabled. */
    void stop_service();

    /** AT+HTTPPARA for the URL, read mode, content type and header. */
    void configure(Method method, const char *url);

    /** AT+HTTPDATA and the body. */
    Error upload(const void *data, size_t size);

    /** AT+HTTPACTION and AT+HTTPREAD. */
    Error perform(Method method, Outcome &outcome);

    /** Invoke the state callback. */
    inline void emit_state(State state)
    {
        if (state_cb)
            state_cb(state, state_cb_user);
    }

    /** Command session. */
    Session &session;

    /** Request settings. */
    Config cfg;

    /** User function to call on state change event. */
    void (*state_cb)(State state, void *user) = nullptr;

    /** User private data for state change callback. */
    void *state_cb_user = nullptr;

    /** Request state. */
    State state = State::idle;

    /** True while request() or attach() is running. */
    bool running = false;
};

} // namespace novahttp

#endif // NOVAHTTP_CLIENT_H_
