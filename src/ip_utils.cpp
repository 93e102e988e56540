// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <array>
#include <cstdint>
#include <cstring>
#include <netinet/in.h>
#include <string_view>

#include "ip_utils.hpp"

#if defined(_WIN32) || defined(__MINGW32__)

#  if defined(__MINGW32__) || defined(_WIN32_WINNT)
// Mingw is messing with the NT version
// https://github.com/msys2/MINGW-packages/issues/6191
#    undef _WIN32_WINNT
#    define _WIN32_WINNT 0x600
#  endif

#  include <ws2tcpip.h>
#else
#  include <arpa/inet.h>
#endif

namespace urlscrub {

bool is_ipv6_address(std::string_view ip)
{
    if (ip.size() >= INET6_ADDRSTRLEN) {
        return false;
    }

    // inet_pton requires a NUL-terminated string
    std::array<char, INET6_ADDRSTRLEN> ip_cstr{0};
    memcpy(ip_cstr.data(), ip.data(), ip.size());

    std::array<uint8_t, sizeof(in6_addr)> address{};
    return inet_pton(AF_INET6, ip_cstr.data(), address.data()) == 1;
}

} // namespace urlscrub
