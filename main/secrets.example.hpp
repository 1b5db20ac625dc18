// Copy to main/secrets.hpp (git-ignored) and fill in.
#ifndef SECRETS_HPP
#define SECRETS_HPP

namespace Secrets {
    static constexpr const char* WIFI_SSID = "my-network";
    static constexpr const char* WIFI_PASSWORD = "my-password";

    static constexpr const char* DEVICE_ID = "plantbot";

    // e.g. email-smtp.us-east-1.amazonaws.com for SES.
    // Port 587 uses STARTTLS, port 465 implicit TLS.
    static constexpr const char* SMTP_HOST = "email-smtp.us-east-1.amazonaws.com";
    static constexpr int SMTP_PORT = 587;
    static constexpr const char* SMTP_USER = "";
    static constexpr const char* SMTP_PASS = "";

    // SES free tier only delivers between verified addresses
    static constexpr const char* MAIL_FROM = "plantbot@example.com";
    static constexpr const char* MAIL_TO = "me@example.com";
}

#endif // SECRETS_HPP
