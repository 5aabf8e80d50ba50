#include "scanner_backend.h"
#include "config_manager.h"
#include "logger.h"
#include "upload_errors.h"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <netdb.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace chunkflow {

namespace {

std::string errno_string(int err) {
    return std::to_string(err) + " (" + std::strerror(err) + ")";
}

bool connect_with_timeout(int fd, const sockaddr* sa, socklen_t salen, int timeout_ms, std::string* out_err) {
    const int old_flags = fcntl(fd, F_GETFL, 0);
    if (old_flags < 0 || fcntl(fd, F_SETFL, old_flags | O_NONBLOCK) < 0) {
        if (out_err) *out_err = "fcntl failed: " + errno_string(errno);
        return false;
    }

    const int res = ::connect(fd, sa, salen);
    if (res == 0) {
        (void)fcntl(fd, F_SETFL, old_flags);
        return true;
    }
    if (errno != EINPROGRESS) {
        if (out_err) *out_err = "connect() failed: " + errno_string(errno);
        (void)fcntl(fd, F_SETFL, old_flags);
        return false;
    }

    fd_set wfds;
    FD_ZERO(&wfds);
    FD_SET(fd, &wfds);
    timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;

    int sel;
    do {
        sel = ::select(fd + 1, nullptr, &wfds, nullptr, &tv);
    } while (sel < 0 && errno == EINTR);

    if (sel <= 0) {
        if (out_err) *out_err = sel == 0 ? "connect() timed out" : "select() failed: " + errno_string(errno);
        (void)fcntl(fd, F_SETFL, old_flags);
        return false;
    }

    int so_error = 0;
    socklen_t slen = sizeof(so_error);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &slen) != 0 || so_error != 0) {
        if (out_err) *out_err = "connect() failed after select: " + errno_string(so_error != 0 ? so_error : errno);
        (void)fcntl(fd, F_SETFL, old_flags);
        return false;
    }
    (void)fcntl(fd, F_SETFL, old_flags);
    return true;
}

std::string shell_quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

// Exit status 124 is what coreutils timeout(1) reports
constexpr int kTimeoutExit = 124;
// sh: command not found
constexpr int kNotFoundExit = 127;

} // namespace

ClamAvScanner::Options ClamAvScanner::Options::fromConfig() {
    auto& cfg = ConfigManager::getInstance();
    Options o;
    o.clamd_host = cfg.getClamdHost();
    o.clamd_port = cfg.getClamdPort();
    o.timeout_sec = cfg.getScanTimeoutSec();
    return o;
}

ClamAvScanner::ClamAvScanner() : ClamAvScanner(Options{}) {}

ClamAvScanner::ClamAvScanner(Options options) : m_options(std::move(options)) {}

bool ClamAvScanner::ping_daemon() const {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* results = nullptr;
    const std::string port_str = std::to_string(m_options.clamd_port);
    const int gai_rc = ::getaddrinfo(m_options.clamd_host.c_str(), port_str.c_str(), &hints, &results);
    if (gai_rc != 0 || !results) {
        LOG_DEBUG(std::string("SCAN: getaddrinfo failed for ") + m_options.clamd_host + ":" + port_str +
                  " err=" + (gai_rc != 0 ? gai_strerror(gai_rc) : "no results"));
        return false;
    }

    bool pong = false;
    for (addrinfo* ai = results; ai && !pong; ai = ai->ai_next) {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;

        std::string err;
        if (!connect_with_timeout(fd, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen),
                                  m_options.ping_timeout_ms, &err)) {
            LOG_DEBUG("SCAN: clamd ping " + err);
            ::close(fd);
            continue;
        }

        timeval tv;
        tv.tv_sec = m_options.ping_timeout_ms / 1000;
        tv.tv_usec = (m_options.ping_timeout_ms % 1000) * 1000;
        (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        static const char kPing[] = "PING\n";
        if (::send(fd, kPing, sizeof(kPing) - 1, MSG_NOSIGNAL) == static_cast<ssize_t>(sizeof(kPing) - 1)) {
            char buf[16] = {0};
            const ssize_t n = ::recv(fd, buf, sizeof(buf) - 1, 0);
            pong = n > 0 && std::string(buf, static_cast<size_t>(n)).find("PONG") != std::string::npos;
        }
        ::close(fd);
    }
    freeaddrinfo(results);
    return pong;
}

bool ClamAvScanner::clamscan_on_path() {
    FILE* pipe = ::popen("which clamscan 2>/dev/null", "r");
    if (!pipe) return false;
    char buf[256];
    std::string out;
    while (fgets(buf, sizeof(buf), pipe)) out += buf;
    const int status = ::pclose(pipe);
    return status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0 && !out.empty();
}

bool ClamAvScanner::available() {
    if (ping_daemon()) return true;
    const bool cli = clamscan_on_path();
    if (!cli) {
        LOG_WARN("SCAN: ClamAV not reachable at " + m_options.clamd_host + ":" +
                 std::to_string(m_options.clamd_port) + " and clamscan not on PATH");
    }
    return cli;
}

std::string ClamAvScanner::parse_signature(const std::string& output) {
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        const size_t found = line.rfind(" FOUND");
        if (found == std::string::npos) continue;
        const size_t colon = line.rfind(": ", found);
        if (colon == std::string::npos) continue;
        return line.substr(colon + 2, found - colon - 2);
    }
    return "";
}

ScanVerdict ClamAvScanner::scan(const std::string& file_path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        throw ScanFailedError("Cannot scan " + file_path + ": " + ec.message());
    }

    const std::string cmd = "timeout " + std::to_string(m_options.timeout_sec) +
                            " clamscan --stdout --no-summary " + shell_quote(file_path) + " 2>&1";
    const auto start = std::chrono::steady_clock::now();
    FILE* pipe = ::popen(cmd.c_str(), "r");
    if (!pipe) {
        throw ScannerUnavailableError("Failed to start clamscan: " + errno_string(errno));
    }

    std::string output;
    std::array<char, 512> buf{};
    while (fgets(buf.data(), static_cast<int>(buf.size()), pipe)) {
        output += buf.data();
    }
    const int status = ::pclose(pipe);

    ScanVerdict verdict;
    verdict.scanner = name();
    verdict.file_size = static_cast<int64_t>(size);
    verdict.duration_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (status == -1 || !WIFEXITED(status)) {
        throw ScanFailedError("clamscan terminated abnormally");
    }
    switch (WEXITSTATUS(status)) {
        case 0:
            verdict.clean = true;
            return verdict;
        case 1:
            verdict.clean = false;
            verdict.signature = parse_signature(output);
            if (verdict.signature.empty()) verdict.signature = "Unknown threat";
            return verdict;
        case kTimeoutExit:
            throw ScanFailedError("clamscan timed out after " + std::to_string(m_options.timeout_sec) + "s");
        case kNotFoundExit:
            throw ScannerUnavailableError("clamscan could not be started: " + output);
        default:
            throw ScanFailedError("clamscan error (exit " + std::to_string(WEXITSTATUS(status)) + "): " + output);
    }
}

} // namespace chunkflow
