#ifndef SMTP_CLIENT_HPP
#define SMTP_CLIENT_HPP

#include <main/core/mail_transport.hpp>
#include <main/models/mail_settings.hpp>
#include <main/network/smtp_session.hpp>
#include <main/network/tls_stream.hpp>

// MailTransport over SMTP. Opens one connection per send, secured by
// STARTTLS or implicit TLS according to MailSettings::security.
class SmtpClient : public MailTransport {
public:
    explicit SmtpClient(const MailSettings& settings);

    bool send(const MailMessage& message) override;

private:
    MailSettings settings;
    TlsStream stream;
    SmtpSession session;
};

#endif // SMTP_CLIENT_HPP
