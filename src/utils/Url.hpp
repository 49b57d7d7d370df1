#pragma once

#include <string>
#include <string_view>

namespace tr::net
{

struct Url
{
    std::string scheme;
    std::string host;
    std::string port;
    // Path plus query and fragment, exactly as given ("/" when empty).
    std::string path;
};

// Splits an announce or RPC URL. A missing scheme means "http"; scheme and
// host are lower-cased, everything after the authority is kept verbatim.
Url parse_url(std::string_view text);

// "host:port" as sent in a Host header; IPv6 literals get brackets and an
// empty port is left out.
std::string authority(std::string_view host, std::string_view port);

// Canonical text form: default ports (http 80, https 443) are dropped.
std::string normalize_url(std::string_view text);

bool urls_equal(std::string_view a, std::string_view b);

// Registered domain of the URL's host ("tracker.example.org" ->
// "example.org"); IP literals are returned unchanged.
std::string url_domain(std::string_view text);

} // namespace tr::net
