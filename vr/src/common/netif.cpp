/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#include "vr/internal/netif.hpp"

#include <algorithm>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>

namespace vr::internal {

static bool is_link_local_v4(const in_addr& a) {
    // 169.254.0.0/16
    return (ntohl(a.s_addr) & 0xFFFF0000u) == 0xA9FE0000u;
}

std::vector<std::string> outbound_addresses() {
    std::vector<std::string> v4, v6;

    ifaddrs* ifs = nullptr;
    if (::getifaddrs(&ifs) != 0) {
        return {"127.0.0.1"};
    }
    for (ifaddrs* p = ifs; p; p = p->ifa_next) {
        if (!p->ifa_addr) continue;
        if (p->ifa_flags & IFF_LOOPBACK) continue;
        if (!(p->ifa_flags & IFF_UP)) continue;

        char buf[INET6_ADDRSTRLEN] = {0};
        if (p->ifa_addr->sa_family == AF_INET) {
            const auto* a = reinterpret_cast<const sockaddr_in*>(p->ifa_addr);
            if (is_link_local_v4(a->sin_addr)) continue;
            if (inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf))) v4.emplace_back(buf);
        } else if (p->ifa_addr->sa_family == AF_INET6) {
            const auto* a = reinterpret_cast<const sockaddr_in6*>(p->ifa_addr);
            if (IN6_IS_ADDR_LINKLOCAL(&a->sin6_addr) || IN6_IS_ADDR_MC_LINKLOCAL(&a->sin6_addr) ||
                IN6_IS_ADDR_LOOPBACK(&a->sin6_addr)) {
                continue;
            }
            if (inet_ntop(AF_INET6, &a->sin6_addr, buf, sizeof(buf))) v6.emplace_back(buf);
        }
    }
    ::freeifaddrs(ifs);

    std::vector<std::string> out = v4;
    out.insert(out.end(), v6.begin(), v6.end());
    if (out.empty()) out.emplace_back("127.0.0.1");
    return out;
}

std::vector<std::string> serving_urls(uint16_t port) {
    std::vector<std::string> urls;
    const std::vector<std::string> ips = outbound_addresses();
    const std::string p = std::to_string(port);
    for (const auto& ip : ips) {
        if (ip.find(':') != std::string::npos) {
            urls.push_back("http://[" + ip + "]:" + p + "/");
        } else {
            urls.push_back("http://" + ip + ":" + p + "/");
        }
    }
    if (std::find(ips.begin(), ips.end(), "127.0.0.1") == ips.end()) {
        urls.push_back("http://127.0.0.1:" + p + "/");
    }
    return urls;
}

} // namespace vr::internal
