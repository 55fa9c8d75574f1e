#include "firewall.hpp"
#include "util_log.hpp"

bool RecordingFirewall::block(const std::string &id, const std::string &reason) {
    if (id.empty()) return false;
    if (blocked.insert(id).second) safe_log("Firewall: blocked " + id + " (" + reason + ")");
    return true;
}

bool RecordingFirewall::unblock(const std::string &id) {
    if (blocked.erase(id) > 0) safe_log("Firewall: unblocked " + id);
    return true;
}

std::vector<std::string> RecordingFirewall::list() const {
    return std::vector<std::string>(blocked.begin(), blocked.end());
}
