#ifndef MAIL_SETTINGS_HPP
#define MAIL_SETTINGS_HPP

#include <cstdint>

// How the SMTP connection is secured
enum class SmtpSecurity : uint8_t {
    STARTTLS = 0,       // plain connect, upgraded after EHLO (submission, 587)
    IMPLICIT_TLS = 1    // TLS from the first byte (SMTPS, 465)
};

inline const char* smtpSecurityName(SmtpSecurity security) {
    return security == SmtpSecurity::IMPLICIT_TLS ? "implicit TLS" : "STARTTLS";
}

// Outbound mail configuration. Strings are borrowed and must outlive users.
struct MailSettings {
    const char*  host;
    int          port;
    SmtpSecurity security;
    const char*  username;
    const char*  password;
    const char*  from;
    const char*  to;
    const char*  subject_template;   // {{ placeholder }} syntax
    const char*  body_template;      // HTML, {{ placeholder }} syntax
    const char*  device_id;
    uint32_t     timeout_ms;
};

#endif // MAIL_SETTINGS_HPP
