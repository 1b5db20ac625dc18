#ifndef MAIL_MESSAGE_HPP
#define MAIL_MESSAGE_HPP

#include <cstddef>

// Fixed-size outbound e-mail, built per notification and discarded after send
struct MailMessage {
    static constexpr std::size_t ADDRESS_LEN = 96;
    static constexpr std::size_t SUBJECT_LEN = 128;
    static constexpr std::size_t BODY_LEN    = 1024;

    char from[ADDRESS_LEN];
    char to[ADDRESS_LEN];
    char subject[SUBJECT_LEN];
    char body[BODY_LEN];      // HTML
};

#endif // MAIL_MESSAGE_HPP
