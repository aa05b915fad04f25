#pragma once
// =============================================================================
// Tether - DNS-SD Service Browser
// =============================================================================
// ServiceBrowser over the dns_sd.h API (Bonjour / avahi-compat-libdns_sd).
// One DNSServiceBrowse per service type, DNSServiceResolve per added
// instance, getaddrinfo(AF_INET) on the resolved host. All refs are driven
// by a single select() thread that checks the stop flag every 250ms.
// A resolve is abandoned after PendingResolves' deadline, and a repeated Add
// for the same instance cancels the resolve already in flight.
// =============================================================================

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <dns_sd.h>

#include "pending_resolves.hpp"
#include "service_browser.hpp"

namespace tether {

class MdnsServiceBrowser : public ServiceBrowser {
public:
    MdnsServiceBrowser() = default;
    ~MdnsServiceBrowser() override;

    MdnsServiceBrowser(const MdnsServiceBrowser&) = delete;
    MdnsServiceBrowser& operator=(const MdnsServiceBrowser&) = delete;

    Result<void> start(Handler handler) override;
    void stop() override;
    bool running() const override { return running_; }

private:
    struct BrowseContext {
        MdnsServiceBrowser* self = nullptr;
        ServiceKind kind = ServiceKind::Connect;
        DNSServiceRef ref = nullptr;
    };

    struct ResolveContext {
        MdnsServiceBrowser* self = nullptr;
        ServiceKind kind = ServiceKind::Connect;
        std::string instance;
        std::string key;
        DNSServiceRef ref = nullptr;
        bool done = false;        // answered, cancelled or expired
    };

    void eventLoop();
    void releaseAll();
    void reapResolves();
    bool resolveCancelled(DNSServiceRef ref) const;

    void onBrowse(BrowseContext* ctx, DNSServiceFlags flags, uint32_t if_index,
                  DNSServiceErrorType error, const char* name, const char* type,
                  const char* domain);
    void onResolve(ResolveContext* ctx, DNSServiceErrorType error,
                   const char* host_target, uint16_t port_be);

    static void DNSSD_API browseCallback(DNSServiceRef ref, DNSServiceFlags flags,
                                         uint32_t if_index, DNSServiceErrorType error,
                                         const char* name, const char* type,
                                         const char* domain, void* context);
    static void DNSSD_API resolveCallback(DNSServiceRef ref, DNSServiceFlags flags,
                                          uint32_t if_index, DNSServiceErrorType error,
                                          const char* full_name, const char* host_target,
                                          uint16_t port, uint16_t txt_len,
                                          const unsigned char* txt, void* context);

    Handler handler_;
    std::vector<std::unique_ptr<BrowseContext>> browses_;
    std::vector<std::unique_ptr<ResolveContext>> resolves_;
    PendingResolves pending_;

    // "<kind>/<instance>" -> address, so removals can name the address
    std::map<std::string, std::string> instance_addresses_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace tether
