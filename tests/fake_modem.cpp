/**
 * @file fake_modem.cpp
 * @brief Scripted modem with a virtual clock for driving the session.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#include <algorithm>
#include <cstdlib>
#include <cstring>

#include "fake_modem.h"

static int fake_read(void *data, size_t size)
{
    return FakeModem::instance().read(data, size);
}

static int fake_write(const void *data, size_t size)
{
    return FakeModem::instance().write(data, size);
}

static void fake_flush()
{
    FakeModem::instance().flush();
}

static uint32_t fake_millis()
{
    return FakeModem::instance().now;
}

static void fake_delay(uint32_t ms)
{
    FakeModem::instance().delay(ms);
}

FakeModem &FakeModem::instance()
{
    static FakeModem modem;
    return modem;
}

void FakeModem::reset()
{
    commands.clear();
    upload.clear();
    logs.clear();
    rules.clear();
    deliveries.clear();
    rx.clear();
    line.clear();

    now = 1000;
    echo = false;
    ack_upload = true;
    read_limit = 0;
    write_limit = 0;
    flushes = 0;
    noise.clear();
    upload_remaining = 0;

    reply("AT+HTTPDATA=", "\r\nDOWNLOAD\r\n");
}

novahttp::context_t FakeModem::context() const
{
    novahttp::context_t ctx;
    ctx.read = fake_read;
    ctx.write = fake_write;
    ctx.flush = fake_flush;
    ctx.millis = fake_millis;
    ctx.delay = fake_delay;
    return ctx;
}

void FakeModem::reply(const std::string &prefix, const std::string &data,
        uint32_t delay)
{
    rules.push_back({prefix, data, delay});
}

void FakeModem::silence(const std::string &prefix)
{
    rules.push_back({prefix, std::string(), 0});
}

void FakeModem::inject(const std::string &data, uint32_t delay)
{
    schedule(data, delay);
}

size_t FakeModem::count(const std::string &prefix) const
{
    return std::count_if(commands.begin(), commands.end(),
            [&prefix](const std::string &cmd) {
                return cmd.compare(0, prefix.size(), prefix) == 0;
            });
}

int FakeModem::find(const std::string &prefix) const
{
    for (size_t i = 0; i < commands.size(); ++i) {
        if (commands[i].compare(0, prefix.size(), prefix) == 0)
            return static_cast<int>(i);
    }
    return -1;
}

bool FakeModem::logged(const std::string &text) const
{
    for (const auto &entry : logs) {
        if (entry.second.find(text) != std::string::npos)
            return true;
    }
    return false;
}

int FakeModem::read(void *data, size_t size)
{
    now += 1;
    release();
    rx += noise;

    size_t count = std::min(size, rx.size());
    if (read_limit > 0)
        count = std::min(count, read_limit);

    memcpy(data, rx.data(), count);
    rx.erase(0, count);
    return static_cast<int>(count);
}

int FakeModem::write(const void *data, size_t size)
{
    if (write_limit > 0)
        size = std::min(size, write_limit);

    const char *bytes = static_cast<const char*>(data);
    for (size_t i = 0; i < size; ++i) {
        const char c = bytes[i];

        if (upload_remaining > 0) {
            upload.push_back(c);
            upload_remaining -= 1;
            if (upload_remaining == 0 && ack_upload)
                schedule("\r\nOK\r\n", 1);
            continue;
        }

        line.push_back(c);
        if (c == '\n') {
            std::string cmd = line;
            while (!cmd.empty() && (cmd.back() == '\n' || cmd.back() == '\r'))
                cmd.pop_back();

            line.clear();
            handle_command(cmd);
        }
    }

    return static_cast<int>(size);
}

void FakeModem::flush()
{
    flushes += 1;
    release();
    rx.clear();
}

void FakeModem::delay(uint32_t ms)
{
    now += ms;
}

void FakeModem::handle_command(const std::string &cmd)
{
    commands.push_back(cmd);

    if (echo)
        schedule(cmd + "\r\n", 0);

    std::string answer = "\r\nOK\r\n";
    uint32_t delay = 1;

    for (auto rule = rules.rbegin(); rule != rules.rend(); ++rule) {
        if (cmd.compare(0, rule->prefix.size(), rule->prefix) == 0) {
            answer = rule->data;
            delay = rule->delay;
            break;
        }
    }

    // A rejected announce leaves the modem in command mode
    if (cmd.compare(0, 12, "AT+HTTPDATA=") == 0
            && answer.find("ERROR") == std::string::npos) {
        // Payload plus terminator
        upload_remaining = strtoul(cmd.c_str() + 12, nullptr, 10) + 1;
    }

    if (!answer.empty())
        schedule(answer, delay);
}

void FakeModem::release()
{
    auto due = std::stable_partition(deliveries.begin(), deliveries.end(),
            [this](const Delivery &delivery) {
                return delivery.time <= now;
            });

    for (auto it = deliveries.begin(); it != due; ++it)
        rx += it->data;

    deliveries.erase(deliveries.begin(), due);
}

void FakeModem::schedule(const std::string &data, uint32_t delay)
{
    deliveries.push_back({now + delay, data});
}

/** Collects driver log messages. */
void novahttp_debug(int level, const char *str)
{
    FakeModem::instance().logs.emplace_back(level, str);
}
