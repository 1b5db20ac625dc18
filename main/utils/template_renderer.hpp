// Minimal {{ name }} placeholder expansion into caller-provided buffers.
#ifndef TEMPLATE_RENDERER_HPP
#define TEMPLATE_RENDERER_HPP

#include <cstddef>

struct TemplateVar {
    const char* name;
    const char* value;
};

namespace TemplateRenderer {
    // Expand every "{{ name }}" in tmpl (whitespace inside the braces is
    // optional). Unknown names expand to nothing; an unterminated "{{" is
    // copied literally. Returns false if the result does not fit in out,
    // in which case out holds the truncated, null-terminated prefix.
    bool render(const char* tmpl,
                const TemplateVar* vars, std::size_t var_count,
                char* out, std::size_t out_size);
}

#endif // TEMPLATE_RENDERER_HPP
