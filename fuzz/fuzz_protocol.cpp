#include "protocol/WizMessage.h"
#include "net/Subnet.h"
#include "core/Errors.h"
#include "core/Utils.h"
#include <string>

// Feeds arbitrary bytes through the reply decoder, the CIDR parser and the
// MAC normalizer. Only WizError is an acceptable failure mode.
extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string input(reinterpret_cast<const char*>(data), size);

    try {
        auto response = wiz_scan::protocol::decode_response(input);
        if (response.has_result()) {
            (void)response.pilot();
        }
    } catch (const wiz_scan::WizError&) {
    }

    try {
        auto info = wiz_scan::net::parse_cidr(input);
        if (info.total_hosts <= 1024) {
            (void)wiz_scan::net::enumerate_hosts(input);
        }
    } catch (const wiz_scan::WizError&) {
    }

    (void)wiz_scan::utils::normalize_mac(input);
    return 0;
}
