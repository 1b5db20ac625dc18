#ifndef SMTP_STREAM_HPP
#define SMTP_STREAM_HPP

#include <cstddef>

// Byte stream under an SMTP dialog. Starts plain or already encrypted,
// depending on how the owner opened it.
class SmtpStream {
public:
    virtual ~SmtpStream() = default;

    // Send all len bytes; false on a transport error
    virtual bool write(const char* data, std::size_t len) = 0;

    // Receive up to size bytes. Returns the count, or <= 0 on error or close.
    virtual int read(char* buf, std::size_t size) = 0;

    // Run the TLS handshake over the open plain connection (STARTTLS)
    virtual bool startTls() = 0;
};

#endif // SMTP_STREAM_HPP
