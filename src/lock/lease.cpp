#include "lock/lease.hpp"

#include <nlohmann/json.hpp>

namespace pkgrepo {

using json = nlohmann::json;

std::string EncodeLease(const Lease& lease) {
    json j;
    j["repository_prefix"] = lease.repository_prefix;
    j["holder_id"] = lease.holder_id;
    j["acquired_at"] = ToUnixMillis(lease.acquired_at);
    j["expires_at"] = ToUnixMillis(lease.expires_at);
    return j.dump();
}

std::expected<Lease, std::string> DecodeLease(std::string_view text) {
    try {
        auto j = json::parse(text);
        if (!j.is_object()) return std::unexpected("lease must be a JSON object");

        const auto holder = j.find("holder_id");
        const auto expires = j.find("expires_at");
        if (holder == j.end() || !holder->is_string() || holder->get<std::string>().empty())
            return std::unexpected("lease has no holder_id");
        if (expires == j.end() || !expires->is_number_integer())
            return std::unexpected("lease has no expires_at");

        Lease lease;
        lease.holder_id = holder->get<std::string>();
        lease.repository_prefix = j.value("repository_prefix", "");
        lease.acquired_at = FromUnixMillis(j.value("acquired_at", std::int64_t{0}));
        lease.expires_at = FromUnixMillis(expires->get<std::int64_t>());
        return lease;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("invalid lease JSON: ") + e.what());
    }
}

} // namespace pkgrepo
