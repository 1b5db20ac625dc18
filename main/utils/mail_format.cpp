#include <main/utils/mail_format.hpp>
#include <cstdio>
#include <cstring>

namespace {
    struct Writer {
        char* out;
        std::size_t size;
        std::size_t len;
        bool ok;

        void put(const char* s, std::size_t n) {
            if (!ok) {
                return;
            }
            if (len + n >= size) {
                ok = false;
                return;
            }
            std::memcpy(out + len, s, n);
            len += n;
            out[len] = '\0';
        }

        void put(const char* s) {
            put(s, std::strlen(s));
        }

        void header(const char* name, const char* value) {
            put(name);
            put(": ");
            put(value);
            put("\r\n");
        }
    };

    // True if only CRs remain before the next LF or the end of text
    static bool atLineEnd(const char* p) {
        while (*p == '\r') {
            ++p;
        }
        return *p == '\n' || *p == '\0';
    }

    // Quoted-printable (RFC 2045) body: bare LF / CRLF become CRLF, lines are
    // soft-broken before QP_LINE_LIMIT, and a leading dot is doubled for DATA
    static void putQuotedPrintable(Writer& w, const char* body) {
        static const char HEX[] = "0123456789ABCDEF";
        std::size_t column = 0;
        for (const char* p = body; *p != '\0'; ++p) {
            const unsigned char c = static_cast<unsigned char>(*p);
            if (c == '\r') {
                continue;
            }
            if (c == '\n') {
                w.put("\r\n", 2);
                column = 0;
                continue;
            }

            char token[3] = { *p, 0, 0 };
            std::size_t token_len = 1;
            const bool printable = c >= 33 && c <= 126 && c != '=';
            const bool inner_blank = (c == ' ' || c == '\t') && !atLineEnd(p + 1);
            if (!printable && !inner_blank) {
                token[0] = '=';
                token[1] = HEX[c >> 4];
                token[2] = HEX[c & 0x0F];
                token_len = 3;
            }

            // Leave a column for the '=' of the soft break
            if (column + token_len > MailFormat::QP_LINE_LIMIT - 1) {
                w.put("=\r\n", 3);
                column = 0;
            }
            if (column == 0 && token[0] == '.') {
                w.put(".", 1);
            }
            w.put(token, token_len);
            column += token_len;
        }
        if (column > 0) {
            w.put("\r\n", 2);
        }
    }
}

namespace MailFormat {
    bool buildDataPayload(const MailMessage& msg, const char* date_header,
                          char* out, std::size_t out_size, std::size_t& out_len) {
        out_len = 0;
        if (out == nullptr || out_size == 0) {
            return false;
        }
        out[0] = '\0';
        Writer w{ out, out_size, 0, true };

        if (date_header != nullptr && date_header[0] != '\0') {
            w.header("Date", date_header);
        }
        w.header("From", msg.from);
        w.header("To", msg.to);
        w.header("Subject", msg.subject);
        w.header("MIME-Version", "1.0");

        char content_type[96];
        snprintf(content_type, sizeof(content_type), "multipart/alternative; boundary=\"%s\"", BOUNDARY);
        w.header("Content-Type", content_type);
        w.put("\r\n");

        w.put("--");
        w.put(BOUNDARY);
        w.put("\r\n");
        w.header("Content-Type", "text/html; charset=\"utf-8\"");
        w.header("Content-Transfer-Encoding", "quoted-printable");
        w.put("\r\n");
        putQuotedPrintable(w, msg.body);

        w.put("--");
        w.put(BOUNDARY);
        w.put("--\r\n");
        w.put(".\r\n");

        if (!w.ok) {
            return false;
        }
        out_len = w.len;
        return true;
    }

    bool parseReplyLine(const char* line, int& code, bool& is_last) {
        if (line == nullptr) {
            return false;
        }
        for (int i = 0; i < 3; ++i) {
            if (line[i] < '0' || line[i] > '9') {
                return false;
            }
        }
        code = (line[0] - '0') * 100 + (line[1] - '0') * 10 + (line[2] - '0');
        is_last = (line[3] != '-');
        return true;
    }
}
