#include "mdns_browser.hpp"
#include "tether_log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/select.h>

namespace tether {

namespace {

std::string instanceKey(ServiceKind kind, const std::string& instance) {
    return std::string(serviceKindStr(kind)) + "/" + instance;
}

// First IPv4 address of a resolved host name
std::string lookupIpv4(const char* host) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    int rc = ::getaddrinfo(host, nullptr, &hints, &res);
    if (rc != 0 || !res) {
        TLOG_WARN("discovery", "getaddrinfo(%s): %s", host, gai_strerror(rc));
        return "";
    }
    char buf[INET_ADDRSTRLEN] = {0};
    auto* sin = reinterpret_cast<sockaddr_in*>(res->ai_addr);
    ::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
    ::freeaddrinfo(res);
    return buf;
}

} // anonymous namespace

MdnsServiceBrowser::~MdnsServiceBrowser() {
    stop();
}

Result<void> MdnsServiceBrowser::start(Handler handler) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_) return Result<void>();

    handler_ = std::move(handler);

    const std::pair<ServiceKind, const char*> types[] = {
        {ServiceKind::Pairing, kPairingServiceType},
        {ServiceKind::Connect, kConnectServiceType},
    };
    for (const auto& [kind, type] : types) {
        auto ctx = std::make_unique<BrowseContext>();
        ctx->self = this;
        ctx->kind = kind;
        DNSServiceErrorType err = DNSServiceBrowse(&ctx->ref, 0, kDNSServiceInterfaceIndexAny,
                                                   type, nullptr, browseCallback, ctx.get());
        if (err != kDNSServiceErr_NoError) {
            releaseAll();
            return Error(std::string("DNSServiceBrowse(") + type + ") failed", static_cast<int>(err));
        }
        browses_.push_back(std::move(ctx));
    }

    running_ = true;
    thread_ = std::thread(&MdnsServiceBrowser::eventLoop, this);
    return Result<void>();
}

void MdnsServiceBrowser::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_ && !thread_.joinable()) return;
    running_ = false;
    if (thread_.joinable()) thread_.join();
    releaseAll();
}

void MdnsServiceBrowser::releaseAll() {
    for (auto& r : resolves_) {
        if (r->ref) DNSServiceRefDeallocate(r->ref);
    }
    resolves_.clear();
    pending_ = PendingResolves();
    for (auto& b : browses_) {
        if (b->ref) DNSServiceRefDeallocate(b->ref);
    }
    browses_.clear();
    instance_addresses_.clear();
}

void MdnsServiceBrowser::reapResolves() {
    for (const auto& key : pending_.expire(PendingResolves::Clock::now())) {
        for (auto& r : resolves_) {
            if (r->done || r->key != key) continue;
            TLOG_WARN("discovery", "Resolve of %s timed out", r->instance.c_str());
            r->done = true;
        }
    }
    auto it = std::remove_if(resolves_.begin(), resolves_.end(),
        [](const std::unique_ptr<ResolveContext>& r) {
            if (!r->done) return false;
            if (r->ref) DNSServiceRefDeallocate(r->ref);
            return true;
        });
    resolves_.erase(it, resolves_.end());
}

bool MdnsServiceBrowser::resolveCancelled(DNSServiceRef ref) const {
    for (const auto& r : resolves_) {
        if (r->ref == ref) return r->done;
    }
    return false;
}

void MdnsServiceBrowser::eventLoop() {
    TLOG_DEBUG("discovery", "DNS-SD event loop started");
    while (running_) {
        fd_set readfds;
        FD_ZERO(&readfds);
        int max_fd = -1;
        std::vector<std::pair<int, DNSServiceRef>> fds;

        auto add = [&](DNSServiceRef ref) {
            int fd = DNSServiceRefSockFD(ref);
            if (fd < 0) return;
            FD_SET(fd, &readfds);
            max_fd = std::max(max_fd, fd);
            fds.emplace_back(fd, ref);
        };
        for (auto& b : browses_) add(b->ref);
        for (auto& r : resolves_) add(r->ref);
        if (max_fd < 0) break;

        timeval tv{};
        tv.tv_sec = 0;
        tv.tv_usec = 250 * 1000;
        int rc = ::select(max_fd + 1, &readfds, nullptr, nullptr, &tv);
        if (rc < 0) {
            if (errno == EINTR) continue;
            TLOG_ERROR("discovery", "select failed: %s", std::strerror(errno));
            break;
        }
        if (rc == 0) continue;

        for (const auto& [fd, ref] : fds) {
            if (!FD_ISSET(fd, &readfds)) continue;
            if (resolveCancelled(ref)) continue;
            DNSServiceErrorType err = DNSServiceProcessResult(ref);
            if (err != kDNSServiceErr_NoError) {
                TLOG_WARN("discovery", "DNSServiceProcessResult: %d", static_cast<int>(err));
            }
        }
        // Callbacks above may have started new resolves or finished old ones
        reapResolves();
    }
    TLOG_DEBUG("discovery", "DNS-SD event loop exited");
}

void DNSSD_API MdnsServiceBrowser::browseCallback(DNSServiceRef, DNSServiceFlags flags,
                                                  uint32_t if_index, DNSServiceErrorType error,
                                                  const char* name, const char* type,
                                                  const char* domain, void* context) {
    auto* ctx = static_cast<BrowseContext*>(context);
    ctx->self->onBrowse(ctx, flags, if_index, error, name, type, domain);
}

void DNSSD_API MdnsServiceBrowser::resolveCallback(DNSServiceRef, DNSServiceFlags,
                                                   uint32_t, DNSServiceErrorType error,
                                                   const char*, const char* host_target,
                                                   uint16_t port, uint16_t,
                                                   const unsigned char*, void* context) {
    auto* ctx = static_cast<ResolveContext*>(context);
    ctx->self->onResolve(ctx, error, host_target, port);
}

void MdnsServiceBrowser::onBrowse(BrowseContext* ctx, DNSServiceFlags flags, uint32_t if_index,
                                  DNSServiceErrorType error, const char* name,
                                  const char* type, const char* domain) {
    if (error != kDNSServiceErr_NoError) {
        TLOG_WARN("discovery", "Browse error %d", static_cast<int>(error));
        return;
    }
    const std::string instance = name ? name : "";

    if (flags & kDNSServiceFlagsAdd) {
        auto rctx = std::make_unique<ResolveContext>();
        rctx->self = this;
        rctx->kind = ctx->kind;
        rctx->instance = instance;
        rctx->key = instanceKey(ctx->kind, instance);
        DNSServiceErrorType err = DNSServiceResolve(&rctx->ref, 0, if_index, name, type, domain,
                                                    resolveCallback, rctx.get());
        if (err != kDNSServiceErr_NoError) {
            TLOG_WARN("discovery", "DNSServiceResolve(%s) failed: %d", instance.c_str(),
                      static_cast<int>(err));
            return;
        }
        if (pending_.begin(rctx->key, PendingResolves::Clock::now())) {
            // Refs are only deallocated in reapResolves, after this select() round
            for (auto& r : resolves_) {
                if (!r->done && r->key == rctx->key) r->done = true;
            }
            TLOG_DEBUG("discovery", "Re-announce of %s replaces pending resolve", instance.c_str());
        }
        resolves_.push_back(std::move(rctx));
        return;
    }

    // Removal
    auto it = instance_addresses_.find(instanceKey(ctx->kind, instance));
    if (it == instance_addresses_.end()) {
        TLOG_DEBUG("discovery", "Removal of unresolved instance %s", instance.c_str());
        return;
    }
    const std::string address = it->second;
    instance_addresses_.erase(it);
    if (handler_.on_removed) handler_.on_removed(ctx->kind, address);
}

void MdnsServiceBrowser::onResolve(ResolveContext* ctx, DNSServiceErrorType error,
                                   const char* host_target, uint16_t port_be) {
    if (ctx->done) return;
    ctx->done = true;
    pending_.finish(ctx->key);
    if (error != kDNSServiceErr_NoError || !host_target) {
        TLOG_WARN("discovery", "Resolve of %s failed: %d", ctx->instance.c_str(),
                  static_cast<int>(error));
        return;
    }

    const int port = ntohs(port_be);
    const std::string address = lookupIpv4(host_target);
    if (address.empty()) return;

    instance_addresses_[instanceKey(ctx->kind, ctx->instance)] = address;
    if (handler_.on_added) handler_.on_added(ctx->kind, address, port);
}

} // namespace tether
