#include <main/network/smtp_client.hpp>
#include <main/utils/logger.hpp>
#include <main/utils/time_sync.hpp>
#include <mbedtls/base64.h>
#include <cstring>

static const char* TAG = "SmtpClient";

namespace {
    static bool encodeBase64(const char* text, char* out, std::size_t out_size) {
        if (out_size == 0) {
            return false;
        }
        size_t written = 0;
        int rc = mbedtls_base64_encode(reinterpret_cast<unsigned char*>(out), out_size - 1, &written,
                                       reinterpret_cast<const unsigned char*>(text), std::strlen(text));
        if (rc != 0) {
            return false;
        }
        out[written] = '\0';
        return true;
    }
}

SmtpClient::SmtpClient(const MailSettings& settings_in)
    : settings(settings_in),
      stream(settings_in.host, settings_in.port, settings_in.timeout_ms),
      session(stream, settings_in, &encodeBase64) {}

bool SmtpClient::send(const MailMessage& message) {
    const bool use_starttls = settings.security == SmtpSecurity::STARTTLS;
    LOG_INFO(TAG, "Connecting to %s:%d (%s)", settings.host, settings.port, smtpSecurityName(settings.security));
    if (!stream.open(!use_starttls)) {
        return false;
    }

    char date[40];
    const bool have_date = TimeSync::formatRfc2822Date(date, sizeof(date));
    const bool ok = session.deliver(message, have_date ? date : nullptr, use_starttls);
    stream.close();
    return ok;
}
