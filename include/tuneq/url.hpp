/*
 * tuneq - Download Queue Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <vector>

namespace tuneq {

// Accepts http(s) links to a recognized service host that name a resource
// (watch, playlist, browse, channel or a short link id).
class UrlValidator final {
public:
    UrlValidator();
    explicit UrlValidator(std::vector<std::string> hosts);

    [[nodiscard]] bool isValid(const std::string& url) const;
    void addHost(const std::string& host);
    [[nodiscard]] const std::vector<std::string>& hosts() const noexcept { return hosts_; }

    // Default hosts plus TUNEQ_ACCEPTED_HOSTS (comma separated).
    [[nodiscard]] static UrlValidator fromEnv();
    [[nodiscard]] static std::vector<std::string> defaultHosts();

private:
    [[nodiscard]] bool isAcceptedHost(const std::string& host) const;

    std::vector<std::string> hosts_;
};

} // namespace tuneq
