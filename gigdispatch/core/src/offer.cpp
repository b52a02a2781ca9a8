#include <gigdispatch/core/offer.hpp>

#include <array>
#include <utility>

namespace gigdispatch::core {

namespace {

constexpr std::array<std::pair<OfferStatus, std::string_view>, 5> OFFER_STATUS_NAMES{{
    {OfferStatus::Pending, "pending"},
    {OfferStatus::Accepted, "accepted"},
    {OfferStatus::Declined, "declined"},
    {OfferStatus::Expired, "expired"},
    {OfferStatus::Cancelled, "cancelled"},
}};

} // anonymous namespace

std::string_view to_string(OfferStatus status) noexcept {
    for (const auto& [key, name] : OFFER_STATUS_NAMES) {
        if (key == status) {
            return name;
        }
    }
    return "unknown";
}

std::optional<OfferStatus> parse_offer_status(std::string_view name) {
    for (const auto& [key, entry] : OFFER_STATUS_NAMES) {
        if (entry == name) {
            return key;
        }
    }
    return std::nullopt;
}

} // namespace gigdispatch::core
