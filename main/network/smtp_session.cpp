#include <main/network/smtp_session.hpp>
#include <main/utils/logger.hpp>
#include <cstdarg>
#include <cstdio>

static const char* TAG = "SmtpSession";

SmtpSession::SmtpSession(SmtpStream& stream_in, const MailSettings& settings_in, Base64Encoder encode_in)
    : stream(stream_in),
      settings(settings_in),
      encode(encode_in),
      rx_buf{},
      rx_len(0),
      rx_pos(0),
      line_buf{},
      tx_buf{},
      payload_buf{} {}

bool SmtpSession::deliver(const MailMessage& message, const char* date_header, bool use_starttls) {
    rx_len = 0;
    rx_pos = 0;
    if (!greet(use_starttls) || !authenticate() || !transfer(message, date_header)) {
        return false;
    }
    // The message is accepted at this point; a failed QUIT is not an error
    if (!command(221, "%s", "QUIT")) {
        LOG_WARN(TAG, "%s", "QUIT not acknowledged");
    }
    return true;
}

bool SmtpSession::greet(bool use_starttls) {
    const char* helo_name = settings.device_id ? settings.device_id : "localhost";
    if (!expectReply(220) || !command(250, "EHLO %s", helo_name)) {
        return false;
    }
    if (!use_starttls) {
        return true;
    }
    if (!command(220, "%s", "STARTTLS")) {
        LOG_ERROR(TAG, "%s", "Server refused STARTTLS");
        return false;
    }
    // Anything read ahead before the handshake is plaintext and must not be trusted
    rx_len = 0;
    rx_pos = 0;
    if (!stream.startTls()) {
        LOG_ERROR(TAG, "%s", "TLS upgrade failed");
        return false;
    }
    return command(250, "EHLO %s", helo_name);
}

bool SmtpSession::authenticate() {
    if (!command(334, "%s", "AUTH LOGIN") || !sendBase64(334, settings.username)) {
        return false;
    }
    if (!sendBase64(235, settings.password)) {
        LOG_ERROR(TAG, "%s", "Authentication rejected");
        return false;
    }
    return true;
}

bool SmtpSession::transfer(const MailMessage& message, const char* date_header) {
    if (!command(250, "MAIL FROM:<%s>", message.from) ||
        !command(250, "RCPT TO:<%s>", message.to) ||
        !command(354, "%s", "DATA")) {
        return false;
    }
    std::size_t payload_len = 0;
    if (!MailFormat::buildDataPayload(message, date_header, payload_buf, sizeof(payload_buf), payload_len)) {
        LOG_ERROR(TAG, "Message exceeds %u bytes", static_cast<unsigned>(sizeof(payload_buf)));
        return false;
    }
    if (!stream.write(payload_buf, payload_len)) {
        LOG_ERROR(TAG, "%s", "Write failed during DATA");
        return false;
    }
    return expectReply(250);
}

bool SmtpSession::sendBase64(int expected, const char* text) {
    char encoded[200];
    if (text == nullptr || !encode(text, encoded, sizeof(encoded))) {
        LOG_ERROR(TAG, "%s", "Credential too long to encode");
        return false;
    }
    return command(expected, "%s", encoded);
}

bool SmtpSession::command(int expected, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    int n = vsnprintf(tx_buf, sizeof(tx_buf) - 2, fmt, args);
    va_end(args);
    if (n < 0 || static_cast<std::size_t>(n) >= sizeof(tx_buf) - 2) {
        LOG_ERROR(TAG, "%s", "Command too long");
        return false;
    }
    tx_buf[n] = '\r';
    tx_buf[n + 1] = '\n';
    if (!stream.write(tx_buf, static_cast<std::size_t>(n) + 2)) {
        LOG_ERROR(TAG, "%s", "Write failed");
        return false;
    }
    return expectReply(expected);
}

bool SmtpSession::readLine(char* out, std::size_t out_size) {
    std::size_t len = 0;
    for (;;) {
        if (rx_pos >= rx_len) {
            int n = stream.read(rx_buf, sizeof(rx_buf));
            if (n <= 0) {
                LOG_ERROR(TAG, "Connection lost while reading reply (%d)", n);
                return false;
            }
            rx_len = static_cast<std::size_t>(n);
            rx_pos = 0;
        }
        char c = rx_buf[rx_pos++];
        if (c == '\n') {
            if (len > 0 && out[len - 1] == '\r') {
                --len;
            }
            out[len] = '\0';
            return true;
        }
        // Overlong lines are truncated; only the reply code matters
        if (len + 1 < out_size) {
            out[len++] = c;
        }
    }
}

bool SmtpSession::expectReply(int expected) {
    for (;;) {
        if (!readLine(line_buf, sizeof(line_buf))) {
            return false;
        }
        int code = 0;
        bool is_last = false;
        if (!MailFormat::parseReplyLine(line_buf, code, is_last)) {
            LOG_ERROR(TAG, "Malformed reply: %s", line_buf);
            return false;
        }
        LOG_DEBUG(TAG, "S: %s", line_buf);
        if (!is_last) {
            continue;
        }
        if (code != expected) {
            LOG_ERROR(TAG, "Expected %d, got: %s", expected, line_buf);
            return false;
        }
        return true;
    }
}
