// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string_view>

namespace urlscrub {

// Only accepts the textual form of an IPv6 address, as found between the
// brackets of a URI IP-literal.
bool is_ipv6_address(std::string_view ip);

} // namespace urlscrub
