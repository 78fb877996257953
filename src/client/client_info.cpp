#include "client/client_info.hpp"

#ifndef _WIN32
#include <sys/utsname.h>
#endif

namespace livelink::client {

namespace {

std::string get_os_name() {
#ifdef _WIN32
    return "windows";
#elif defined(__APPLE__)
    return "macos";
#elif defined(__linux__)
    return "linux";
#else
    return "unknown";
#endif
}

std::string get_arch() {
#if defined(__x86_64__) || defined(_M_X64)
    return "amd64";
#elif defined(__i386__) || defined(_M_IX86)
    return "386";
#elif defined(__aarch64__) || defined(_M_ARM64)
    return "arm64";
#elif defined(__arm__) || defined(_M_ARM)
    return "arm";
#else
    return "unknown";
#endif
}

}  // anonymous namespace

ClientInfo ClientInfo::current() {
    ClientInfo info;
    info.os = get_os_name();
    info.device_model = get_arch();

#ifndef _WIN32
    struct utsname uts {};
    if (uname(&uts) == 0) {
        info.os_version = uts.release;
        if (uts.machine[0] != '\0') {
            info.device_model = uts.machine;
        }
    }
#endif

    return info;
}

QueryParams make_connection_params(const std::string& token, const ClientInfo& info,
                                   const ConnectionParams& params) {
    QueryParams query;
    query.emplace_back("access_token", token);

    if (params.reconnect) {
        query.emplace_back("reconnect", "1");
        if (params.sid && !params.sid->empty()) {
            query.emplace_back("sid", *params.sid);
        }
    }

    query.emplace_back("auto_subscribe", params.auto_subscribe ? "1" : "0");

    query.emplace_back("sdk", info.sdk);
    query.emplace_back("version", info.version);
    query.emplace_back("protocol", std::to_string(info.protocol));
    if (!info.device_model.empty()) {
        query.emplace_back("device_model", info.device_model);
    }
    if (!info.os.empty()) {
        query.emplace_back("os", info.os);
    }
    if (!info.os_version.empty()) {
        query.emplace_back("os_version", info.os_version);
    }

    if (params.adaptive_stream) {
        query.emplace_back("adaptive_stream", "1");
    }
    // RR_UNKNOWN (0) is not sent
    if (params.reconnect_reason && *params.reconnect_reason != 0) {
        query.emplace_back("reconnect_reason", std::to_string(*params.reconnect_reason));
    }
    if (params.network && !params.network->empty()) {
        query.emplace_back("network", *params.network);
    }

    return query;
}

} // namespace livelink::client
