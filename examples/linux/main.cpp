#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <time.h>
#include <termios.h>

#include "client.h"
#include "debug.h"
#include "version.h"

// Default settings, override with: main [port] [apn] [user] [pwd]
constexpr char const *PORT = "/dev/ttyUSB2";
constexpr char const *APN = "everywhere";
constexpr char const *GET_URL = "https://httpbin.org/get";
constexpr char const *POST_URL = "https://httpbin.org/post";
constexpr char const *PUT_URL = "https://httpbin.org/put";
constexpr char const *HEADER = "Accept: application/json";

// File descriptor for the serial port.
int fd = -1;

/**
 * @brief Read from the serial port.
 *
 * @param [in] data buffer to read into.
 * @param [in] size number of bytes to read.
 * @return number of bytes read.
 */
static int serial_read(void *data, size_t size)
{
    const int count = ::read(fd, data, size);
    if (count < 0 && errno == EAGAIN)
        return 0;

    return count;
}

/**
 * @brief Write to the serial port.
 *
 * @param [in] data buffer to write.
 * @param [in] size number of bytes to write.
 * @return number of bytes written.
 */
static int serial_write(const void *data, size_t size)
{
    const int count = ::write(fd, data, size);
    if (count < 0 && errno == EAGAIN)
        return 0;

    return count;
}

/** Discard unread input. */
static void serial_flush()
{
    tcflush(fd, TCIFLUSH);
}

/** Returns time since an arbitrary point. */
static uint32_t serial_millis()
{
    struct timespec now;
    clock_gettime(CLOCK_MONOTONIC, &now);
    return (now.tv_sec * 1000) + (now.tv_nsec / 1000000);
}

/** Sleep while waiting for data. */
static void serial_delay(uint32_t ms)
{
    usleep(ms * 1000);
}

/** Print the outcome of a request. */
static bool report(const char *name, const novahttp::Outcome &outcome)
{
    printf("%s: %s (status %d, %zu bytes)\n", name,
            (outcome.ok) ? "OK" : novahttp::error_name(outcome.error),
            outcome.status, outcome.body.size());

    if (!outcome.body.empty()) {
        fwrite(outcome.body.data(), outcome.body.size(), 1, stdout);
        fputc('\n', stdout);
    }

    fflush(stdout);
    return outcome.ok;
}

/** Application entry point. */
int main(int argc, char *argv[])
{
    const char *port = (argc > 1) ? argv[1] : PORT;
    const char *apn = (argc > 2) ? argv[2] : APN;
    const char *user = (argc > 3) ? argv[3] : nullptr;
    const char *pwd = (argc > 4) ? argv[4] : nullptr;

    printf("NovaHTTP %d.%d.%d\n", novahttp::kVersionMajor,
            novahttp::kVersionMinor, novahttp::kVersionTrivial);

    // Open serial port
    fd = open(port, O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {
        perror("Failed to open serial port");
        exit(1);
    }

    // Configure port - 115200 8N1, no flow control
    struct termios settings;
    tcgetattr(fd, &settings);
    cfsetispeed(&settings, B115200);
    cfsetospeed(&settings, B115200);
    cfmakeraw(&settings);
    settings.c_cflag &= ~(CSTOPB | CRTSCTS);
    settings.c_cflag |= (CLOCAL | CREAD);
    tcsetattr(fd, TCSANOW, &settings);
    tcflush(fd, TCIOFLUSH);

    // Initialize the driver
    novahttp::context_t ctx = {
        .read = serial_read,
        .write = serial_write,
        .flush = serial_flush,
        .millis = serial_millis,
        .delay = serial_delay,
    };

    novahttp::Session session(ctx);

    novahttp::Config config;
    config.ssl = true;
    config.header = HEADER;

    novahttp::Client client(session, config);

    // Registration check, the result is only printed
    novahttp::Response response;
    if (client.raw_command("AT+CGATT?", 500, response) == 0) {
        for (const std::string &line : response.lines)
            printf("%s\n", line.c_str());
    }
    else {
        printf("Modem not responding\n");
    }

    // Establish the data link
    const int failed = client.attach(apn, user, pwd);
    if (failed < 0) {
        printf("Invalid APN\n");
        close(fd);
        exit(1);
    }
    else if (failed > 0) {
        printf("PDP activation: %d steps failed\n", failed);
    }

    const char *post_body = "{\"msg\":\"Hello POST\"}";
    const char *put_body = "{\"msg\":\"Hello PUT\"}";

    const bool get_ok = report("GET", client.get(GET_URL));
    const bool post_ok = report("POST",
            client.post(POST_URL, post_body, strlen(post_body)));
    const bool put_ok = report("PUT",
            client.put(PUT_URL, put_body, strlen(put_body)));

    printf("\n=== SUMMARY ===\n");
    printf("GET  [%s] : %s\n", GET_URL, (get_ok) ? "OK" : "FAIL");
    printf("POST [%s] : %s\n", POST_URL, (post_ok) ? "OK" : "FAIL");
    printf("PUT  [%s] : %s\n", PUT_URL, (put_ok) ? "OK" : "FAIL");

    if (client.detach())
        printf("Failed to close the data connection\n");

    close(fd);
    return (get_ok && post_ok && put_ok) ? 0 : 1;
}

/**
 * @brief Debug print function.
 *
 * Only required when the library is compiled with -DNOVAHTTP_DEBUG
 *
 * @param [in] level the log level of the message.
 * @param [in] str message c-string
 */
void novahttp_debug(int level, const char *str)
{
    fprintf(stdout, "|%d| %s", level, str);
    fflush(stdout);
}
