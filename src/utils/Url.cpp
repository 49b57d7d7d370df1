#include "utils/Url.hpp"

#include "utils/Text.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace tr::net
{

namespace
{

std::string_view default_port(std::string_view scheme)
{
    if (scheme == "http")
    {
        return "80";
    }
    if (scheme == "https")
    {
        return "443";
    }
    return {};
}

bool is_ip_literal(std::string_view host)
{
    if (host.find(':') != std::string_view::npos)
    {
        return true;
    }
    return !host.empty() &&
           std::all_of(host.begin(), host.end(), [](unsigned char ch)
                       { return std::isdigit(ch) || ch == '.'; });
}

// Fills url.host and url.port from "host", "host:port", "[v6]:port" or a
// bare IPv6 literal.
void split_authority(std::string_view text, Url &url)
{
    if (auto at = text.rfind('@'); at != std::string_view::npos)
    {
        text.remove_prefix(at + 1);
    }
    std::string_view host = text;
    std::string_view port;
    if (text.starts_with('['))
    {
        auto close = text.find(']');
        if (close != std::string_view::npos)
        {
            host = text.substr(1, close - 1);
            if (text.substr(close + 1).starts_with(':'))
            {
                port = text.substr(close + 2);
            }
        }
    }
    else if (auto colon = text.find(':');
             colon != std::string_view::npos && text.rfind(':') == colon)
    {
        host = text.substr(0, colon);
        port = text.substr(colon + 1);
    }
    url.host = utils::to_lower(host);
    url.port = std::string(port);
}

} // namespace

Url parse_url(std::string_view text)
{
    Url url;
    auto rest = utils::trim(text);
    if (auto scheme_end = rest.find("://"); scheme_end != std::string_view::npos)
    {
        url.scheme = utils::to_lower(rest.substr(0, scheme_end));
        rest.remove_prefix(scheme_end + 3);
    }
    else
    {
        url.scheme = "http";
    }
    auto authority_end = rest.find_first_of("/?#");
    split_authority(rest.substr(0, authority_end), url);
    if (authority_end == std::string_view::npos)
    {
        url.path = "/";
        return url;
    }
    url.path = std::string(rest.substr(authority_end));
    if (url.path.front() != '/')
    {
        url.path.insert(url.path.begin(), '/');
    }
    return url;
}

std::string authority(std::string_view host, std::string_view port)
{
    std::string result;
    if (host.find(':') != std::string_view::npos)
    {
        result.append("[").append(host).append("]");
    }
    else
    {
        result.append(host);
    }
    if (!port.empty())
    {
        result.append(":").append(port);
    }
    return result;
}

std::string normalize_url(std::string_view text)
{
    auto url = parse_url(text);
    std::string_view port = url.port;
    if (port == default_port(url.scheme))
    {
        port = {};
    }
    return url.scheme + "://" + authority(url.host, port) + url.path;
}

bool urls_equal(std::string_view a, std::string_view b)
{
    return normalize_url(a) == normalize_url(b);
}

std::string url_domain(std::string_view text)
{
    auto host = parse_url(text).host;
    if (is_ip_literal(host))
    {
        return host;
    }
    auto last_dot = host.rfind('.');
    if (last_dot == std::string::npos || last_dot == 0)
    {
        return host;
    }
    auto second_dot = host.rfind('.', last_dot - 1);
    if (second_dot == std::string::npos)
    {
        return host;
    }
    return host.substr(second_dot + 1);
}

} // namespace tr::net
