#ifndef TLS_STREAM_HPP
#define TLS_STREAM_HPP

#include <cstdint>
#include <esp_tls.h>
#include <main/network/smtp_stream.hpp>

// esp-tls backed SmtpStream. Opens either straight into TLS or as a plain
// TCP socket that startTls() later hands to esp-tls for the handshake.
// Server certificates are checked against the ESP-IDF certificate bundle.
class TlsStream : public SmtpStream {
public:
    TlsStream(const char* host, int port, uint32_t timeout_ms);
    ~TlsStream() override;

    bool open(bool encrypted);
    void close();

    bool write(const char* data, std::size_t len) override;
    int read(char* buf, std::size_t size) override;
    bool startTls() override;

private:
    void fillConfig(esp_tls_cfg_t& cfg) const;

    const char* host;
    int port;
    uint32_t timeout_ms;

    esp_tls_t* tls;     // set once the connection is encrypted
    int plain_fd;       // plain socket before STARTTLS, else -1
};

#endif // TLS_STREAM_HPP
