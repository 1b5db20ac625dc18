#ifndef MAIL_TRANSPORT_HPP
#define MAIL_TRANSPORT_HPP

#include <main/models/mail_message.hpp>

// Outbound mail delivery. One connection per send; no receipt tracking.
class MailTransport {
public:
    virtual ~MailTransport() = default;

    // Returns false if the server cannot be reached or rejects the message.
    virtual bool send(const MailMessage& message) = 0;
};

#endif // MAIL_TRANSPORT_HPP
