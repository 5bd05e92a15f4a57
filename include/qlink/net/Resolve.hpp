#pragma once
#include "qlink/net/NetConfig.hpp"
#include "qlink/net/Deadline.hpp"

#include <memory>
#include <string>

namespace qlink::net {

/**
 * resolve
 *
 * DNS lookup bounded by @p timeout. Given `host` and `service` (e.g.
 * "vantage.local" and "10001") it fills @p out with the candidate endpoints.
 * Numeric addresses resolve without touching the network.
 */
inline error_code resolve(
    tcp::resolver& resolver,
    const std::string& host,
    const std::string& service,
    duration timeout,
    tcp::resolver::results_type& out)
{
    auto results = std::make_shared<tcp::resolver::results_type>();
    auto ec = with_deadline(resolver.get_executor(), timeout,
        [&](auto completion){
            resolver.async_resolve(host, service,
                [results, completion](const error_code& op_ec,
                                      tcp::resolver::results_type found){
                    *results = std::move(found);
                    completion(op_ec);
                });
        },
        [&]{ resolver.cancel(); });
    if (!ec) {
        out = *results;
    }
    return ec;
}

} // namespace qlink::net
