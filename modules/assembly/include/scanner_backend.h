#ifndef CHUNKFLOW_SCANNER_BACKEND_H
#define CHUNKFLOW_SCANNER_BACKEND_H

#include <cstdint>
#include <string>

namespace chunkflow {

struct ScanVerdict {
    bool clean = false;
    std::string signature;        // Threat name when infected
    std::string scanner;
    double duration_seconds = 0.0;
    int64_t file_size = 0;
};

// Boundary to an external malware scanner.
class ScannerBackend {
public:
    virtual ~ScannerBackend() = default;

    virtual std::string name() const = 0;
    virtual bool available() = 0;

    // @throws ScannerUnavailableError when the scanner cannot be reached
    // @throws ScanFailedError when it ran but gave no verdict
    virtual ScanVerdict scan(const std::string& file_path) = 0;
};

/**
 * ClamAV through the clamscan CLI.
 *
 * Availability: PING/PONG against clamd over TCP, falling back to clamscan on
 * PATH. Verdict: exit 0 clean, exit 1 infected ("<file>: <sig> FOUND"),
 * 127 unavailable, anything else (timeout included) a failed scan.
 */
class ClamAvScanner : public ScannerBackend {
public:
    struct Options {
        std::string clamd_host = "127.0.0.1";
        int clamd_port = 3310;
        int timeout_sec = 30;
        int ping_timeout_ms = 2000;

        static Options fromConfig();
    };

    ClamAvScanner();
    explicit ClamAvScanner(Options options);

    std::string name() const override { return "ClamAV"; }
    bool available() override;
    ScanVerdict scan(const std::string& file_path) override;

    // Signature name from clamscan output, empty when none is reported
    static std::string parse_signature(const std::string& output);

private:
    bool ping_daemon() const;
    static bool clamscan_on_path();

    Options m_options;
};

} // namespace chunkflow

#endif // CHUNKFLOW_SCANNER_BACKEND_H
