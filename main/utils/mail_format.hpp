// SMTP wire helpers: DATA payload construction and reply parsing.
#ifndef MAIL_FORMAT_HPP
#define MAIL_FORMAT_HPP

#include <cstddef>
#include <main/models/mail_message.hpp>

namespace MailFormat {
    // MIME boundary used for the multipart/alternative wrapper
    static constexpr const char* BOUNDARY = "==moisture-notifier-part==";

    // Longest encoded line of the quoted-printable body, excluding CRLF
    static constexpr std::size_t QP_LINE_LIMIT = 76;

    // Room for any MailMessage: every body byte may become "=XX" plus soft
    // breaks, and the header block stays well under 1 KiB
    static constexpr std::size_t MAX_PAYLOAD_LEN = 4 * MailMessage::BODY_LEN + 1024;

    // Build the DATA section for msg: RFC 5322 headers, a multipart/alternative
    // body with one quoted-printable text/html UTF-8 part, CRLF line endings,
    // dot-stuffed lines and the terminating ".\r\n". date_header may be
    // nullptr to let the server stamp the message. Returns false if out is
    // too small.
    bool buildDataPayload(const MailMessage& msg, const char* date_header,
                          char* out, std::size_t out_size, std::size_t& out_len);

    // Parse one reply line ("250-..." or "250 ..."). is_last is true on the
    // final line of a (possibly multi-line) reply. Returns false if the line
    // does not start with a three-digit code.
    bool parseReplyLine(const char* line, int& code, bool& is_last);
}

#endif // MAIL_FORMAT_HPP
