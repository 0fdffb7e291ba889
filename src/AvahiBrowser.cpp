#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/error.h>
#include <avahi-common/simple-watch.h>

#include <boost/system/error_code.hpp>

#include <iostream>
#include <memory>

#include "castd/Discovery.hpp"
#include "castd/Errors.hpp"

namespace castd {

namespace {

struct PollDeleter {
    void operator()(AvahiSimplePoll* p) const { avahi_simple_poll_free(p); }
};
struct ClientDeleter {
    void operator()(AvahiClient* c) const { avahi_client_free(c); }
};
struct BrowserDeleter {
    void operator()(AvahiServiceBrowser* b) const { avahi_service_browser_free(b); }
};

struct BrowseContext {
    AvahiSimplePoll* poll = nullptr;
    std::vector<boost::asio::ip::address> addresses;
    std::string failure;
};

// resolve_callback: record the address of each resolved service
void resolve_callback(AvahiServiceResolver* r, AvahiIfIndex, AvahiProtocol,
                      AvahiResolverEvent event, const char* name, const char*, const char*,
                      const char*, const AvahiAddress* address, uint16_t, AvahiStringList*,
                      AvahiLookupResultFlags, void* userdata) {
    auto* ctx = static_cast<BrowseContext*>(userdata);
    if (event == AVAHI_RESOLVER_FOUND && address) {
        char addr[AVAHI_ADDRESS_STR_MAX];
        avahi_address_snprint(addr, sizeof(addr), address);

        boost::system::error_code ec;
        auto parsed = boost::asio::ip::make_address(addr, ec);
        if (ec) {
            std::cout << "[Discover] Ignoring unparseable address " << addr << " for " << name
                      << "\n";
        } else {
            ctx->addresses.push_back(parsed);
        }
    }
    avahi_service_resolver_free(r);
}

// browse_callback: request resolution whenever a service appears
void browse_callback(AvahiServiceBrowser* b, AvahiIfIndex interface, AvahiProtocol protocol,
                     AvahiBrowserEvent event, const char* name, const char* type,
                     const char* domain, AvahiLookupResultFlags, void* userdata) {
    auto* ctx = static_cast<BrowseContext*>(userdata);
    AvahiClient* client = avahi_service_browser_get_client(b);

    switch (event) {
        case AVAHI_BROWSER_NEW:
            if (!avahi_service_resolver_new(client, interface, protocol, name, type, domain,
                                            AVAHI_PROTO_UNSPEC, static_cast<AvahiLookupFlags>(0),
                                            resolve_callback, ctx)) {
                std::cout << "[Discover] Failed to resolve " << name << ": "
                          << avahi_strerror(avahi_client_errno(client)) << "\n";
            }
            break;
        case AVAHI_BROWSER_FAILURE:
            ctx->failure = avahi_strerror(avahi_client_errno(client));
            avahi_simple_poll_quit(ctx->poll);
            break;
        default:
            break;
    }
}

}  // namespace

AvahiBrowser::AvahiBrowser(std::string service_type)
    : service_type_(std::move(service_type)) {}

std::vector<boost::asio::ip::address> AvahiBrowser::browse(
    std::chrono::milliseconds timeout) {
    BrowseContext ctx;

    std::unique_ptr<AvahiSimplePoll, PollDeleter> poll(avahi_simple_poll_new());
    if (!poll) {
        throw DiscoveryError("Failed to create Avahi poll object");
    }
    ctx.poll = poll.get();

    int error = 0;
    std::unique_ptr<AvahiClient, ClientDeleter> client(
        avahi_client_new(avahi_simple_poll_get(poll.get()), static_cast<AvahiClientFlags>(0),
                         nullptr, nullptr, &error));
    if (!client) {
        throw DiscoveryError(std::string("Avahi client error: ") + avahi_strerror(error));
    }

    std::unique_ptr<AvahiServiceBrowser, BrowserDeleter> browser(avahi_service_browser_new(
        client.get(), AVAHI_IF_UNSPEC, AVAHI_PROTO_UNSPEC, service_type_.c_str(), nullptr,
        static_cast<AvahiLookupFlags>(0), browse_callback, &ctx));
    if (!browser) {
        throw DiscoveryError(std::string("Avahi browser error: ") +
                             avahi_strerror(avahi_client_errno(client.get())));
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) break;

        const int r = avahi_simple_poll_iterate(poll.get(), static_cast<int>(remaining.count()));
        if (r < 0) {
            throw DiscoveryError("Avahi poll failed");
        }
        if (r > 0) break;  // quit requested
    }

    if (!ctx.failure.empty()) {
        throw DiscoveryError("Avahi browse failed: " + ctx.failure);
    }
    return ctx.addresses;
}

}  // namespace castd
