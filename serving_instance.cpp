#include "serving_instance.hpp"

#include "mediavisor_errors.hpp"
#include "str.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

bound_listener::bound_listener(std::string const &address) {
    add_thread_context _("bound_listener", address);
    auto colon = address.rfind(':');
    if (colon == std::string::npos) { throw server_init_error(str("bind address needs host:port, got ", address)); }
    auto host = address.substr(0, colon);
    auto port = address.substr(colon + 1);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') { host = host.substr(1, host.size() - 2); }

    addrinfo hints = {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;
    addrinfo *found = nullptr;
    if (auto err = getaddrinfo(host.empty() ? nullptr : host.c_str(), port.c_str(), &hints, &found)) {
        throw server_init_error(str("getaddrinfo ", address, ": ", gai_strerror(err)));
    }
    auto found_holder = make_unique_ptr_closer(found, [](addrinfo *a) {
        if (a) { freeaddrinfo(a); }
    });

    try {
        listener_fd.reset(CALL_ERRNO_MINUS_1(socket, found->ai_family, found->ai_socktype | SOCK_CLOEXEC, found->ai_protocol));
        int one = 1;
        CALL_ERRNO_MINUS_1(setsockopt, listener_fd.get(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        CALL_ERRNO_MINUS_1(bind, listener_fd.get(), found->ai_addr, found->ai_addrlen);
        CALL_ERRNO_MINUS_1(listen, listener_fd.get(), SOMAXCONN);
    } catch (errno_exception const &e) {
        throw server_init_error(e.what());
    }
}

uint16_t bound_listener::listener_port() const {
    sockaddr_storage addr = {};
    socklen_t len = sizeof(addr);
    CALL_ERRNO_MINUS_1(getsockname, listener_fd.get(), reinterpret_cast<sockaddr *>(&addr), &len);
    if (addr.ss_family == AF_INET6) { return ntohs(reinterpret_cast<sockaddr_in6 *>(&addr)->sin6_port); }
    return ntohs(reinterpret_cast<sockaddr_in *>(&addr)->sin_port);
}
