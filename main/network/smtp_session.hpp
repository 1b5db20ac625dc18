#ifndef SMTP_SESSION_HPP
#define SMTP_SESSION_HPP

#include <cstddef>
#include <main/models/mail_message.hpp>
#include <main/models/mail_settings.hpp>
#include <main/network/smtp_stream.hpp>
#include <main/utils/mail_format.hpp>

// Client side of one SMTP conversation over an already connected stream:
// greeting, EHLO, optional STARTTLS, AUTH LOGIN, MAIL/RCPT/DATA, QUIT.
class SmtpSession {
public:
    // Base64-encodes text into out (NUL-terminated); false if out is too small
    using Base64Encoder = bool (*)(const char* text, char* out, std::size_t out_size);

    SmtpSession(SmtpStream& stream, const MailSettings& settings, Base64Encoder encode);

    // Deliver one message. date_header may be nullptr. With use_starttls the
    // stream is upgraded after the first EHLO and credentials only travel
    // encrypted.
    bool deliver(const MailMessage& message, const char* date_header, bool use_starttls);

private:
    bool greet(bool use_starttls);
    bool authenticate();
    bool transfer(const MailMessage& message, const char* date_header);

    // Read a full (possibly multi-line) reply; true if its code == expected
    bool expectReply(int expected);
    // Format a command line (CRLF appended), send it, then expectReply()
    bool command(int expected, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    bool sendBase64(int expected, const char* text);
    bool readLine(char* out, std::size_t out_size);

    SmtpStream& stream;
    MailSettings settings;
    Base64Encoder encode;

    char rx_buf[256];
    std::size_t rx_len;
    std::size_t rx_pos;

    char line_buf[256];
    char tx_buf[256];
    char payload_buf[MailFormat::MAX_PAYLOAD_LEN];
};

#endif // SMTP_SESSION_HPP
