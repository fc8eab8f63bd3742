/**
 * @file client.cpp
 * @brief HTTP requests through the modem's HTTP service.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#include <cstdio>
#include <cstring>
#include <errno.h>

#include "client.h"
#include "debug.h"

/** How long to wait for PDP context activation steps (ms). */
static constexpr uint32_t kAttachTimeout = 10000;

/** Space taken by 'AT+HTTPPARA="URL",""\r\n' around the URL. */
static constexpr size_t kUrlOverhead = 24;

namespace novahttp {

const char *error_name(Error error)
{
    switch (error) {
    case Error::none:
        return "none";
    case Error::busy:
        return "busy";
    case Error::invalid:
        return "invalid request";
    case Error::transport:
        return "transport error";
    case Error::upload_rejected:
        return "upload rejected";
    case Error::upload_timeout:
        return "upload timeout";
    case Error::urc_timeout:
        return "no response";
    case Error::http_status:
        return "http status";
    case Error::read_timeout:
        return "read timeout";
    case Error::body_too_large:
        return "body too large";
    }
    return "unknown";
}

Client::Client(Session &session, const Config &config) :
        session(session), cfg(config)
{
}

void Client::set_state_callback(
        void (*func)(State state, void *user), void *user)
{
    state_cb = func;
    state_cb_user = user;
}

Outcome Client::get(const char *url)
{
    return request(Method::get, url);
}

Outcome Client::post(const char *url, const void *data, size_t size)
{
    return request(Method::post, url, data, size);
}

Outcome Client::put(const char *url, const void *data, size_t size)
{
    return request(Method::put, url, data, size);
}

Outcome Client::request(
        Method method, const char *url, const void *data, size_t size)
{
    Outcome outcome;

    if (running || session.busy()) {
        LOG_WARN("Request already in progress\n");
        outcome.error = Error::busy;
        return outcome;
    }

    if (url == nullptr || *url == '\0'
            || strlen(url) + kUrlOverhead > kBufferSize) {
        LOG_ERROR("Invalid URL\n");
        outcome.error = Error::invalid;
        return outcome;
    }

    running = true;
    LOG_INFO("%s %s\n", method_name(method), url);

    set_state(State::init);
    start_service();

    set_state(State::configured);
    configure(method, url);

    if (method != Method::get) {
        set_state(State::uploading);
        outcome.error = upload(data, size);
    }

    if (outcome.error == Error::none)
        outcome.error = perform(method, outcome);

    // The HTTP service is stopped on every path
    set_state(State::terminated);
    stop_service();

    outcome.ok = (outcome.error == Error::none);
    if (outcome.ok) {
        LOG_INFO("%s complete, %zu bytes\n",
                method_name(method), outcome.body.size());
    }
    else {
        LOG_WARN("%s failed: %s (%d)\n", method_name(method),
                error_name(outcome.error), outcome.status);
    }

    set_state(State::idle);
    running = false;
    return outcome;
}

int Client::raw_command(const char *text, uint32_t timeout, Response &response)
{
    return session.raw_command(text, timeout, response);
}

int Client::attach(const char *apn, const char *user, const char *pwd)
{
    if (apn == nullptr || strlen(apn) > 63)
        return -EINVAL;

    if (running || session.busy())
        return -EBUSY;

    running = true;

    char buffer[160];
    int failed = 0;

    // AT+CGDCONT=1,"IP",[apn] - define PDP context
    snprintf(buffer, sizeof(buffer), "+CGDCONT=1,\"IP\",\"%s\"", apn);
    if (send(buffer, cfg.command_timeout))
        failed += 1;

    if (user != nullptr) {
        // AT+CGAUTH=1,1,[user],[pwd] - PAP authentication
        const int size = snprintf(buffer, sizeof(buffer),
                "+CGAUTH=1,1,\"%s\",\"%s\"", user, (pwd) ? pwd : "");

        if (size < 0 || static_cast<size_t>(size) >= sizeof(buffer)) {
            LOG_ERROR("Credentials too long\n");
            failed += 1;
        }
        else if (send(buffer, cfg.command_timeout)) {
            failed += 1;
        }
    }

    // AT+CGATT=1 - attach to packet domain service
    if (send("+CGATT=1", kAttachTimeout))
        failed += 1;

    // AT+CGACT=1,1 - activate PDP context
    if (send("+CGACT=1,1", kAttachTimeout))
        failed += 1;

    // AT+NETOPEN - open the data connection
    if (send("+NETOPEN", kAttachTimeout))
        failed += 1;

    // AT+CGPADDR=1 - report the assigned address
    Response response;
    if (session.execute(Command(cfg.command_timeout, "+CGPADDR=1"), response) == 0) {
        const std::string *address = response.find("+CGPADDR:");
        if (address != nullptr)
            LOG_INFO("%s\n", address->c_str());
    }

    if (failed > 0)
        LOG_WARN("PDP activation: %d steps failed\n", failed);
    else
        LOG_INFO("PDP context active\n");

    running = false;
    return failed;
}

int Client::detach()
{
    // AT+NETCLOSE - close the data connection
    return send("+NETCLOSE", kAttachTimeout);
}

int Client::terminate()
{
    // AT+HTTPTERM - stop HTTP service
    return send("+HTTPTERM", cfg.command_timeout);
}

void Client::set_state(State next)
{
    if (next == state)
        return;

    state = next;
    LOG_VERBOSE("State set to %d\n", static_cast<int>(state));
    emit_state(state);
}

int Client::send(const char *data, uint32_t timeout, const char *expect)
{
    Command cmd(timeout, data);
    if (expect != nullptr)
        cmd.expect(expect);

    Response response;
    const int result = session.execute(cmd, response);
    if (result)
        LOG_WARN("AT%s failed (%d)\n", data, result);

    return result;
}

void Client::start_service()
{
    // Stop a session left over from an earlier run, failure is expected
    terminate();

    // AT+HTTPINIT - start HTTP service
    send("+HTTPINIT", cfg.command_timeout);

    if (cfg.ssl) {
        // AT+HTTPSSL=1 - enable TLS
        send("+HTTPSSL=1", cfg.command_timeout);
    }
}

void Client::stop_service()
{
    terminate();

    if (cfg.ssl) {
        // AT+HTTPSSL=0 - disable TLS
        send("+HTTPSSL=0", cfg.command_timeout);
    }
}

void Client::configure(Method method, const char *url)
{
    char buffer[kBufferSize];

    // AT+HTTPPARA="URL",[url] - request URL
    snprintf(buffer, sizeof(buffer), "+HTTPPARA=\"URL\",\"%s\"", url);
    send(buffer, cfg.command_timeout);

    if (cfg.read_mode) {
        // AT+HTTPPARA="READMODE",1 - allow the body to be read repeatedly
        send("+HTTPPARA=\"READMODE\",1", cfg.command_timeout);
    }

    if (method != Method::get && cfg.content_type != nullptr) {
        // AT+HTTPPARA="CONTENT",[type] - body content type
        const int size = snprintf(buffer, sizeof(buffer),
                "+HTTPPARA=\"CONTENT\",\"%s\"", cfg.content_type);

        if (size > 0 && static_cast<size_t>(size) < sizeof(buffer))
            send(buffer, cfg.command_timeout);
        else
            LOG_WARN("Content type too long\n");
    }

    if (cfg.header != nullptr && *cfg.header != '\0') {
        // AT+HTTPPARA="USERDATA",[header] - extra request header
        const int size = snprintf(buffer, sizeof(buffer),
                "+HTTPPARA=\"USERDATA\",\"%s\"", cfg.header);

        if (size > 0 && static_cast<size_t>(size) < sizeof(buffer))
            send(buffer, cfg.command_timeout);
        else
            LOG_WARN("Header too long\n");
    }
}

Error Client::upload(const void *data, size_t size)
{
    if (data == nullptr || size == 0) {
        LOG_VERBOSE("No request body\n");
        return Error::none;
    }

    char buffer[48];
    snprintf(buffer, sizeof(buffer), "+HTTPDATA=%zu,%u", size, cfg.upload_timeout);

    // AT+HTTPDATA=[size],[timeout] - modem answers DOWNLOAD when ready
    Command cmd(cfg.command_timeout, buffer);
    cmd.expect("DOWNLOAD").expect(">");

    Response response;
    int result = session.execute(cmd, response);
    if (result == -ETIMEDOUT) {
        if (cfg.strict_upload) {
            LOG_ERROR("No upload prompt\n");
            return Error::upload_rejected;
        }
        LOG_WARN("No upload prompt, sending anyway\n");
    }
    else if (result == -EIO) {
        LOG_ERROR("Upload rejected\n");
        return Error::upload_rejected;
    }
    else if (result) {
        return Error::transport;
    }

    Response ack;
    result = session.upload(UploadRequest(data, size, cfg.upload_timeout), ack);
    switch (result) {
    case 0:
        return Error::none;
    case -ETIMEDOUT:
        return Error::upload_timeout;
    case -EIO:
        return Error::upload_rejected;
    default:
        return Error::transport;
    }
}

Error Client::perform(Method method, Outcome &outcome)
{
    set_state(State::action_sent);
    if (session.request_action(method))
        return Error::transport;

    set_state(State::awaiting_urc);

    ActionResult result;
    if (session.await_action(method, cfg.action_timeout, result))
        return Error::urc_timeout;

    outcome.status = result.status;
    if (result.status != 200) {
        LOG_WARN("HTTP status %d\n", result.status);
        return Error::http_status;
    }

    if (result.length == 0)
        return Error::none;

    if (result.length > cfg.max_body) {
        LOG_ERROR("Body of %zu bytes exceeds %zu\n", result.length, cfg.max_body);
        return Error::body_too_large;
    }

    set_state(State::reading_body);
    if (session.read_body(result.length, cfg.read_timeout, outcome.body))
        return Error::read_timeout;

    return Error::none;
}

} // namespace novahttp
