/**
 * @file command.cpp
 * @brief AT command and response buffers.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#include <cstring>

#include "command.h"

namespace novahttp {

Command::Command(uint32_t timeout, const char *data) :
        timeout_ms(timeout)
{
    const size_t size = (data != nullptr) ? strlen(data) : 0;
    payload.reserve(size + 4);

    payload.push_back('A');
    payload.push_back('T');
    for (size_t i = 0; i < size; ++i)
        payload.push_back(data[i]);

    payload.push_back('\r');
    payload.push_back('\n');

    prefixes.push_back("OK");
}

Command Command::raw(uint32_t timeout, const char *text)
{
    Command cmd(timeout);
    cmd.payload.clear();

    // Empty commands are rejected by Session::execute()
    if (text == nullptr || *text == '\0')
        return cmd;

    cmd.payload.assign(text, text + strlen(text));
    cmd.payload.push_back('\r');
    cmd.payload.push_back('\n');
    return cmd;
}

Command& Command::expect(const char *prefix)
{
    if (!custom) {
        prefixes.clear();
        custom = true;
    }

    prefixes.push_back(prefix);
    return *this;
}

bool Command::expected(const char *line, size_t size) const
{
    for (const std::string &prefix : prefixes) {
        if (size >= prefix.size()
                && memcmp(line, prefix.data(), prefix.size()) == 0) {
            return true;
        }
    }
    return false;
}

const std::string *Response::find(const char *prefix) const
{
    const size_t size = strlen(prefix);
    for (const std::string &line : lines) {
        if (line.compare(0, size, prefix) == 0)
            return &line;
    }
    return nullptr;
}

UploadRequest::UploadRequest(const void *data, size_t size, uint32_t timeout) :
        timeout_ms(timeout)
{
    const uint8_t *bytes = static_cast<const uint8_t*>(data);
    if (bytes != nullptr)
        payload.assign(bytes, bytes + size);
}

} // namespace novahttp
