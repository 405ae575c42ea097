#ifndef MFA_DELIVERY_HPP
#define MFA_DELIVERY_HPP

#include <string_view>

namespace mfa {

/// @brief Out-of-band transport for challenge codes (SMS gateway, mailer).
class delivery_channel {
public:
    virtual ~delivery_channel() = default;

    virtual void send_sms(std::string_view phone_number, std::string_view code) = 0;
    virtual void send_email(std::string_view address, std::string_view code) = 0;
};

/**
 * @brief Development transport: logs the masked destination, and the code
 * itself only in builds with debug logging compiled in.
 */
class log_delivery_channel : public delivery_channel {
public:
    void send_sms(std::string_view phone_number, std::string_view code) override;
    void send_email(std::string_view address, std::string_view code) override;
};

} // namespace mfa

#endif // MFA_DELIVERY_HPP
