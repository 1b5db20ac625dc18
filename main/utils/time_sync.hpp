// SNTP clock setup and the wall-clock strings used in notification mails.
#ifndef TIME_SYNC_HPP
#define TIME_SYNC_HPP

#include <cstddef>

namespace TimeSync {
    // Start SNTP polling; later calls do nothing
    void init();

    // True once SNTP reported a sync or the clock already holds a plausible date
    bool isSynced();

    // Starts SNTP if needed and waits up to timeout_ms for a valid clock
    bool waitForSync(unsigned int timeout_ms);

    // "YYYY-MM-DD HH:MM:SS UTC". Before sync writes "uptime <s>s" and returns false.
    bool formatTimestamp(char* out, std::size_t out_size);

    // RFC 2822 date for the Date: header, e.g. "Mon, 19 Oct 2026 08:30:00 +0000".
    // Leaves out empty and returns false before sync.
    bool formatRfc2822Date(char* out, std::size_t out_size);
}

#endif // TIME_SYNC_HPP
