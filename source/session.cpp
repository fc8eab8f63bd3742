/**
 * @file session.cpp
 * @brief AT command session engine.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <errno.h>

#include "debug.h"
#include "session.h"

namespace novahttp {

/**
 * @brief Returns true if 'line' starts with 'prefix'.
 */
static bool starts_with(const char *line, size_t size, const char *prefix)
{
    const size_t length = strlen(prefix);
    return size >= length && memcmp(line, prefix, length) == 0;
}

Session::Session(context_t &context) :
        ctx(context)
{
    parser.set_line_callback(line_callback, this);
    parser.set_raw_callback(raw_callback, this);
}

void Session::set_event_callback(
        void (*func)(Event event, void *user), void *user)
{
    event_cb = func;
    event_cb_user = user;
}

void Session::set_error_callback(
        void (*func)(int error, void *user), void *user)
{
    error_cb = func;
    error_cb_user = user;
}

int Session::execute(const Command &cmd, Response &response)
{
    if (active)
        return -EBUSY;

    Guard guard(active);

    response.clear();

    int result = send_command(cmd);
    if (result)
        return result;

    result = collect(cmd, response);
    if (result == -ETIMEDOUT) {
        LOG_WARN("Command timeout (%u ms)\n", cmd.timeout());
        emit_event(Event::timeout);
    }

    return result;
}

int Session::raw_command(const char *text, uint32_t timeout, Response &response)
{
    return execute(Command::raw(timeout, text), response);
}

int Session::transmit(const Command &cmd)
{
    if (active)
        return -EBUSY;

    Guard guard(active);
    return send_command(cmd);
}

int Session::upload(const UploadRequest &request, Response &ack)
{
    if (active)
        return -EBUSY;

    Guard guard(active);

    ack.clear();

    LOG_VERBOSE("Uploading %zu bytes\n", request.length());

    // Input is not flushed, the upload prompt may still be arriving
    LOG_DUMP("TX", request.data(), request.length());

    int result = write_all(request.data(), request.length(), request.timeout());
    if (result == 0)
        result = write_all(&kUploadTerminator, 1, request.timeout());

    if (result)
        return result;

    // 'OK' acknowledges the upload
    const Command done(request.timeout());
    result = collect(done, ack);

    if (result == -ETIMEDOUT) {
        LOG_WARN("Upload not acknowledged\n");
        emit_event(Event::upload_timeout);
    }
    else if (result == 0) {
        LOG_INFO("Uploaded %zu bytes\n", request.length());
    }

    return result;
}

int Session::request_action(Method method)
{
    if (active)
        return -EBUSY;

    Guard guard(active);

    // Results from earlier requests are stale
    action_ready = false;

    char buffer[32];
    snprintf(buffer, sizeof(buffer),
            "+HTTPACTION=%d", static_cast<int>(method));

    LOG_INFO("HTTP %s\n", method_name(method));

    // AT+HTTPACTION=[method] - the result arrives as a URC
    return send_command(Command(kDefaultTimeout, buffer));
}

int Session::await_action(Method method, uint32_t timeout, ActionResult &result)
{
    if (active)
        return -EBUSY;

    Guard guard(active);

    awaited_method = static_cast<int>(method);

    if (action_ready && action.method != awaited_method) {
        LOG_WARN("Discarding +HTTPACTION for method %d\n", action.method);
        action_ready = false;
    }

    mode = Mode::action;
    complete = action_ready;
    status = 0;

    int ret = wait(timeout);

    mode = Mode::idle;
    awaited_method = -1;

    if (ret == 0) {
        result = action;
        action_ready = false;
        LOG_INFO("HTTP status %d, %zu bytes\n", result.status, result.length);
    }
    else if (ret == -ETIMEDOUT) {
        LOG_WARN("No +HTTPACTION after %u ms\n", timeout);
        emit_event(Event::urc_timeout);
    }

    return ret;
}

int Session::read_body(size_t length, uint32_t timeout, std::vector<uint8_t> &body)
{
    if (active)
        return -EBUSY;

    Guard guard(active);

    body.clear();
    if (length == 0)
        return 0;

    char buffer[32];
    snprintf(buffer, sizeof(buffer), "+HTTPREAD=0,%zu", length);

    // AT+HTTPREAD=0,[length] - read the whole body from offset 0
    int result = send_command(Command(timeout, buffer));
    if (result)
        return result;

    body_buffer = &body;
    body_length = length;
    body_ok = false;
    body_end = false;

    mode = Mode::body;
    complete = false;
    status = 0;

    result = wait(timeout);

    parser.stop_raw();
    mode = Mode::idle;
    body_buffer = nullptr;

    if (result == 0) {
        LOG_INFO("Received %zu bytes\n", body.size());
    }
    else {
        LOG_WARN("Body incomplete (%zu of %zu bytes)\n", body.size(), length);
        if (result == -ETIMEDOUT)
            emit_event(Event::timeout);
    }

    return result;
}

int Session::send_command(const Command &cmd)
{
    if (cmd.size() == 0)
        return -EINVAL;

    if (cmd.size() > kBufferSize)
        return -EMSGSIZE;

    // Drop late bytes from the previous transaction
    if (ctx.flush)
        ctx.flush();

    parser.reset();

    LOG_DUMP("TX", cmd.data(), cmd.size());

    return write_all(cmd.data(), cmd.size(), cmd.timeout());
}

int Session::collect(const Command &cmd, Response &response)
{
    pending = &cmd;
    frame = &response;

    mode = Mode::command;
    complete = false;
    status = 0;

    const int result = wait(cmd.timeout());

    mode = Mode::idle;
    pending = nullptr;
    frame = nullptr;

    return result;
}

int Session::wait(uint32_t timeout)
{
    const uint32_t deadline = millis() + timeout;

    while (!complete) {
        const bool received = poll();
        if (complete)
            break;

        // Deadline holds even while unrelated lines keep arriving
        if ((int32_t) (millis() - deadline) >= 0)
            return -ETIMEDOUT;

        if (!received)
            idle();
    }

    return status;
}

bool Session::poll()
{
    const int count = read(buffer, kBufferSize);
    if (count <= 0)
        return false;

    parser.load(buffer, count);
    return true;
}

int Session::write_all(const uint8_t *data, size_t size, uint32_t timeout)
{
    const uint32_t deadline = millis() + timeout;
    size_t sent = 0;

    while (sent < size) {
        const int count = write(data + sent, size - sent);
        if (count > 0) {
            sent += count;
        }
        else if (count < 0) {
            LOG_ERROR("Write failed\n");
            return -EIO;
        }
        else if ((int32_t) (millis() - deadline) >= 0) {
            LOG_ERROR("Write timeout (%zu of %zu bytes)\n", sent, size);
            return -ETIMEDOUT;
        }
        else {
            idle();
        }
    }

    return 0;
}

void Session::finish(int result)
{
    status = result;
    complete = true;
}

void Session::idle()
{
    if (ctx.delay)
        ctx.delay(kPollInterval);
}

bool Session::parse_urc(const char *line, size_t size)
{
    if (starts_with(line, size, "+HTTPACTION:")) {
        parse_action_urc(line, size);
        return true;
    }
    else if (starts_with(line, size, "+HTTP_PEER_CLOSED")) {
        LOG_WARN("Server closed the connection\n");
        emit_event(Event::peer_closed);
        return true;
    }
    else if (starts_with(line, size, "+HTTP_NONET_EVENT")) {
        LOG_WARN("Network unavailable\n");
        emit_event(Event::no_network);
        return true;
    }
    else if (starts_with(line, size, "RDY")
            || starts_with(line, size, "SMS DONE")
            || starts_with(line, size, "PB DONE")
            || starts_with(line, size, "+CGEV:")) {
        LOG_VERBOSE("URC: %.*s\n", static_cast<int>(size), line);
        return true;
    }

    return false;
}

void Session::parse_action_urc(const char *line, size_t size)
{
    ActionResult result;
    if (!parse_action(line, size, result)) {
        LOG_WARN("Malformed URC: %.*s\n", static_cast<int>(size), line);
        return;
    }

    if (mode == Mode::action && result.method != awaited_method) {
        LOG_WARN("Ignoring +HTTPACTION for method %d\n", result.method);
        return;
    }

    action = result;
    action_ready = true;

    if (mode == Mode::action)
        finish(0);
}

void Session::parse_command(const char *line, size_t size)
{
    frame->add(line, size);

    if (pending->expected(line, size)) {
        finish(0);
    }
    else if (starts_with(line, size, "+CME ERROR:")
            || starts_with(line, size, "+CMS ERROR:")) {
        // +CME ERROR: %d
        // │           │
        // │           └ line + 11
        // └ line

        char code[16];
        const size_t count = std::min(size - 11, sizeof(code) - 1);
        memcpy(code, line + 11, count);
        code[count] = '\0';

        const int error = strtol(code, nullptr, 10);

        LOG_ERROR("%.*s\n", static_cast<int>(size), line);
        emit_error(error);
        finish(-EIO);
    }
    else if (starts_with(line, size, "ERROR")) {
        finish(-EIO);
    }
}

void Session::parse_body(const char *line, size_t size)
{
    size_t count = 0;
    if (parse_read_header(line, size, count)) {
        if (count == 0) {
            // +HTTPREAD: 0 - no more data
            body_end = true;
        }
        else {
            const size_t missing = body_length - body_buffer->size();
            parser.expect_raw(std::min(count, missing));
        }
    }
    else if (starts_with(line, size, "OK")) {
        body_ok = true;
    }
    else if (starts_with(line, size, "ERROR")
            || starts_with(line, size, "+CME ERROR:")) {
        LOG_ERROR("%.*s\n", static_cast<int>(size), line);
        finish(-EIO);
        return;
    }

    check_body();
}

void Session::check_body()
{
    if (body_buffer->size() >= body_length) {
        if (body_ok || body_end)
            finish(0);
    }
    else if (body_end && parser.raw_remaining() == 0) {
        LOG_WARN("Body ended early\n");
        finish(-EIO);
    }
}

void Session::line_callback(const uint8_t *data, size_t size, void *user)
{
    Session *ctx = static_cast<Session*>(user);
    const char *line = reinterpret_cast<const char*>(data);

    LOG_TRACE("RX: %.*s\n", static_cast<int>(size), line);

    // Discard echo
    if (starts_with(line, size, "AT"))
        return;

    // Unsolicited Result Codes
    if (ctx->parse_urc(line, size))
        return;

    // A late line after the operation finished belongs to nobody
    if (ctx->complete)
        return;

    switch (ctx->mode) {
    case Mode::command:
        ctx->parse_command(line, size);
        break;
    case Mode::body:
        ctx->parse_body(line, size);
        break;
    case Mode::action:
    case Mode::idle:
        LOG_VERBOSE("Ignored: %.*s\n", static_cast<int>(size), line);
        break;
    }
}

void Session::raw_callback(const uint8_t *data, size_t size, void *user)
{
    Session *ctx = static_cast<Session*>(user);

    LOG_DUMP("RX", data, size);

    if (ctx->mode != Mode::body || ctx->body_buffer == nullptr) {
        LOG_WARN("Discarded %zu bytes\n", size);
        return;
    }

    ctx->body_buffer->insert(ctx->body_buffer->end(), data, data + size);
    ctx->check_body();
}

} // namespace novahttp
