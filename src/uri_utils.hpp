// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace urlscrub {

// https://datatracker.ietf.org/doc/html/rfc3986#section-3
//
// Every component is a view into the parsed URI. The *_index members are
// set whenever the component delimiter was present, even if the component
// itself is empty, so that uri_compose can rebuild the exact input.
struct uri_decomposed {
    std::string_view scheme;
    struct {
        std::size_t index{std::string_view::npos};
        std::size_t host_index{std::string_view::npos};
        std::string_view userinfo{};
        std::string_view host{};
        std::string_view port{};
        std::string_view raw;
    } authority;
    std::size_t path_index{std::string_view::npos};
    std::string_view path;
    // Parameters of the last path segment, e.g. "/a/b;type=x"
    std::size_t params_index{std::string_view::npos};
    std::string_view params;
    std::size_t query_index{std::string_view::npos};
    std::string_view query;
    std::size_t fragment_index{std::string_view::npos};
    std::string_view fragment;
    std::string_view raw;
};

std::optional<uri_decomposed> uri_parse(std::string_view uri);

// Reassemble a decomposed URI, replacing its query with the one provided.
// The query delimiter is only emitted if the parsed URI had one or if the
// new query is not empty.
std::string uri_compose(const uri_decomposed &uri, std::string_view query);
} // namespace urlscrub
