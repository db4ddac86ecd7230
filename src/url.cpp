/*
 * tuneq - Download Queue Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "tuneq/url.hpp"
#include "tuneq/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>
#include <sstream>
#include <utility>

namespace tuneq {

namespace {

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool hasQueryParam(const std::string& query, const std::string& name) {
    std::istringstream stream(query);
    std::string pair;
    while (std::getline(stream, pair, '&')) {
        auto eq = pair.find('=');
        if (eq != std::string::npos && pair.substr(0, eq) == name && eq + 1 < pair.size()) {
            return true;
        }
    }
    return false;
}

}

UrlValidator::UrlValidator() : hosts_(defaultHosts()) {
}

UrlValidator::UrlValidator(std::vector<std::string> hosts) : hosts_(std::move(hosts)) {
    for (auto& host : hosts_) {
        host = toLowerCopy(host);
    }
}

std::vector<std::string> UrlValidator::defaultHosts() {
    return {"music.youtube.com", "www.youtube.com", "youtube.com", "m.youtube.com", "youtu.be",
            "music.example"};
}

UrlValidator UrlValidator::fromEnv() {
    UrlValidator validator;
    const char* extra = std::getenv("TUNEQ_ACCEPTED_HOSTS");
    if (extra && *extra) {
        std::istringstream stream(extra);
        std::string host;
        while (std::getline(stream, host, ',')) {
            host.erase(std::remove_if(host.begin(), host.end(),
                [](unsigned char c) { return std::isspace(c); }), host.end());
            if (!host.empty()) {
                validator.addHost(host);
            }
        }
    }
    return validator;
}

void UrlValidator::addHost(const std::string& host) {
    std::string lower = toLowerCopy(host);
    if (std::find(hosts_.begin(), hosts_.end(), lower) == hosts_.end()) {
        hosts_.push_back(lower);
        LOG_DEBUG("Accepting host: " + lower);
    }
}

bool UrlValidator::isAcceptedHost(const std::string& host) const {
    return std::find(hosts_.begin(), hosts_.end(), host) != hosts_.end();
}

bool UrlValidator::isValid(const std::string& url) const {
    // scheme, host, optional port, path, optional query, optional fragment
    static const std::regex urlRegex(R"(^(https?)://([A-Za-z0-9.\-]+)(?::\d{1,5})?(/[^\s?#]*)?(?:\?([^\s#]*))?(?:#\S*)?$)",
                                     std::regex::icase);
    std::smatch match;
    if (!std::regex_match(url, match, urlRegex)) {
        return false;
    }

    const std::string host = toLowerCopy(match[2].str());
    if (!isAcceptedHost(host)) {
        return false;
    }

    const std::string path = match[3].matched ? match[3].str() : "";
    const std::string query = match[4].matched ? match[4].str() : "";

    if (host == "youtu.be") {
        return path.size() > 1 && path.find('/', 1) == std::string::npos;
    }
    if (path == "/watch") {
        return hasQueryParam(query, "v");
    }
    if (path == "/playlist") {
        return hasQueryParam(query, "list");
    }
    static const std::regex resourceRegex(R"(^/(browse|channel)/[A-Za-z0-9_\-]+/?$)");
    return std::regex_match(path, resourceRegex);
}

} // namespace tuneq
