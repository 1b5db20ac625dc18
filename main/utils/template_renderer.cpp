#include <main/utils/template_renderer.hpp>
#include <cstring>

namespace {
    static const char* lookup(const char* name, std::size_t name_len,
                              const TemplateVar* vars, std::size_t var_count) {
        for (std::size_t i = 0; i < var_count; ++i) {
            if (std::strlen(vars[i].name) == name_len &&
                std::strncmp(vars[i].name, name, name_len) == 0) {
                return vars[i].value ? vars[i].value : "";
            }
        }
        return "";
    }

    static bool isSpace(char c) {
        return c == ' ' || c == '\t';
    }

    // Appends [src, src+len) and keeps out null-terminated; false on overflow
    static bool append(char* out, std::size_t out_size, std::size_t& pos, const char* src, std::size_t len) {
        bool fits = true;
        if (pos + len >= out_size) {
            len = out_size - 1 - pos;
            fits = false;
        }
        std::memcpy(out + pos, src, len);
        pos += len;
        out[pos] = '\0';
        return fits;
    }
}

namespace TemplateRenderer {
    bool render(const char* tmpl,
                const TemplateVar* vars, std::size_t var_count,
                char* out, std::size_t out_size) {
        if (out == nullptr || out_size == 0) {
            return false;
        }
        out[0] = '\0';
        if (tmpl == nullptr) {
            return true;
        }

        std::size_t pos = 0;
        const char* cursor = tmpl;
        while (*cursor != '\0') {
            const char* open = std::strstr(cursor, "{{");
            if (open == nullptr) {
                return append(out, out_size, pos, cursor, std::strlen(cursor));
            }
            const char* close = std::strstr(open + 2, "}}");
            if (close == nullptr) {
                // Unterminated placeholder: rest is literal text
                return append(out, out_size, pos, cursor, std::strlen(cursor));
            }
            if (!append(out, out_size, pos, cursor, static_cast<std::size_t>(open - cursor))) {
                return false;
            }

            const char* name = open + 2;
            const char* name_end = close;
            while (name < name_end && isSpace(*name)) ++name;
            while (name_end > name && isSpace(*(name_end - 1))) --name_end;

            const char* value = lookup(name, static_cast<std::size_t>(name_end - name), vars, var_count);
            if (!append(out, out_size, pos, value, std::strlen(value))) {
                return false;
            }
            cursor = close + 2;
        }
        return true;
    }
}
