#include "delivery.hpp"
#include "logger.hpp"
#include "util.hpp"

namespace mfa {

void log_delivery_channel::send_sms(std::string_view phone_number, std::string_view code) {
    log::info("SMS challenge queued for {}", util::mask_phone(phone_number));
    log::debug("SMS challenge code for {}: {}", util::mask_phone(phone_number), code);
}

void log_delivery_channel::send_email(std::string_view address, std::string_view code) {
    log::info("Email challenge queued for {}", util::mask_email(address));
    log::debug("Email challenge code for {}: {}", util::mask_email(address), code);
}

} // namespace mfa
