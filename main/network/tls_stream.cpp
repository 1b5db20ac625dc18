#include <main/network/tls_stream.hpp>
#include <main/utils/logger.hpp>
#include <esp_crt_bundle.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cstring>

static const char* TAG = "TlsStream";

TlsStream::TlsStream(const char* host_in, int port_in, uint32_t timeout_ms_in)
    : host(host_in),
      port(port_in),
      timeout_ms(timeout_ms_in),
      tls(nullptr),
      plain_fd(-1) {}

TlsStream::~TlsStream() {
    close();
}

void TlsStream::fillConfig(esp_tls_cfg_t& cfg) const {
    cfg = {};
    cfg.crt_bundle_attach = esp_crt_bundle_attach;
    cfg.timeout_ms = static_cast<int>(timeout_ms);
}

bool TlsStream::open(bool encrypted) {
    close();
    esp_tls_cfg_t cfg;
    fillConfig(cfg);
    const int host_len = static_cast<int>(std::strlen(host));

    if (!encrypted) {
        esp_tls_last_error_t last_error = {};
        esp_err_t err = esp_tls_plain_tcp_connect(host, host_len, port, &cfg, &last_error, &plain_fd);
        if (err != ESP_OK) {
            LOG_ERROR(TAG, "TCP connect to %s:%d failed: %s", host, port, esp_err_to_name(err));
            plain_fd = -1;
            return false;
        }
        return true;
    }

    tls = esp_tls_init();
    if (tls == nullptr) {
        LOG_ERROR(TAG, "%s", "esp_tls_init failed");
        return false;
    }
    if (esp_tls_conn_new_sync(host, host_len, port, &cfg, tls) != 1) {
        LOG_ERROR(TAG, "TLS connect to %s:%d failed", host, port);
        close();
        return false;
    }
    return true;
}

bool TlsStream::startTls() {
    if (tls != nullptr || plain_fd < 0) {
        LOG_ERROR(TAG, "%s", "No plain connection to upgrade");
        return false;
    }
    tls = esp_tls_init();
    if (tls == nullptr) {
        LOG_ERROR(TAG, "%s", "esp_tls_init failed");
        return false;
    }
    // esp-tls takes over the socket and closes it on destroy
    esp_err_t err = esp_tls_set_conn_sockfd(tls, plain_fd);
    if (err == ESP_OK) {
        plain_fd = -1;
        err = esp_tls_set_conn_state(tls, ESP_TLS_CONNECTING);
    }
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "Socket hand-over failed: %s", esp_err_to_name(err));
        close();
        return false;
    }

    esp_tls_cfg_t cfg;
    fillConfig(cfg);
    if (esp_tls_conn_new_sync(host, static_cast<int>(std::strlen(host)), port, &cfg, tls) != 1) {
        LOG_ERROR(TAG, "TLS handshake with %s failed", host);
        close();
        return false;
    }
    return true;
}

void TlsStream::close() {
    if (tls != nullptr) {
        if (esp_tls_conn_destroy(tls) != 0) {
            LOG_WARN(TAG, "%s", "esp_tls_conn_destroy failed");
        }
        tls = nullptr;
    }
    if (plain_fd >= 0) {
        if (::close(plain_fd) != 0) {
            LOG_WARN(TAG, "%s", "Socket close failed");
        }
        plain_fd = -1;
    }
}

bool TlsStream::write(const char* data, std::size_t len) {
    std::size_t written = 0;
    while (written < len) {
        ssize_t n = 0;
        if (tls != nullptr) {
            n = esp_tls_conn_write(tls, data + written, len - written);
            if (n == ESP_TLS_ERR_SSL_WANT_READ || n == ESP_TLS_ERR_SSL_WANT_WRITE) {
                continue;
            }
        } else if (plain_fd >= 0) {
            n = ::send(plain_fd, data + written, len - written, 0);
        }
        if (n <= 0) {
            LOG_ERROR(TAG, "Write failed: %d", static_cast<int>(n));
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

int TlsStream::read(char* buf, std::size_t size) {
    if (tls != nullptr) {
        for (;;) {
            ssize_t n = esp_tls_conn_read(tls, buf, size);
            if (n != ESP_TLS_ERR_SSL_WANT_READ && n != ESP_TLS_ERR_SSL_WANT_WRITE) {
                return static_cast<int>(n);
            }
        }
    }
    if (plain_fd >= 0) {
        return static_cast<int>(::recv(plain_fd, buf, size, 0));
    }
    return -1;
}
