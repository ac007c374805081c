#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>
#include "selector.hpp"

namespace {

uint32_t toEpollEvents(Interest interest) {
    uint32_t events = 0;
    if (hasInterest(interest, Interest::Read)) {
        events |= EPOLLIN | EPOLLRDHUP;
    }
    if (hasInterest(interest, Interest::Write) || hasInterest(interest, Interest::Connect)) {
        events |= EPOLLOUT;
    }
    return events;
}

std::system_error epollError(const std::string& what, int fd) {
    return std::system_error(errno, std::generic_category(),
                             what + " fd " + std::to_string(fd) + ": " + std::strerror(errno));
}

}

Selector::Selector(SelectorConfig config) : m_epollFd(-1), m_wakeupFd(-1), m_config(config) {
    if (m_config.maxEventsPerWait == 0) {
        throw std::invalid_argument("SelectorConfig::maxEventsPerWait must be positive");
    }

    m_epollFd = epoll_create1(EPOLL_CLOEXEC);
    if (m_epollFd == -1) {
        throw std::runtime_error("Failed to create epoll instance");
    }

    m_wakeupFd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (m_wakeupFd == -1) {
        ::close(m_epollFd);
        throw std::runtime_error("Failed to create wakeup eventfd");
    }

    struct epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = m_wakeupFd;
    if (epoll_ctl(m_epollFd, EPOLL_CTL_ADD, m_wakeupFd, &ev) == -1) {
        ::close(m_wakeupFd);
        ::close(m_epollFd);
        throw std::runtime_error("Failed to register wakeup fd with epoll");
    }
}

Selector::~Selector() {
    close();
    if (m_wakeupFd != -1) {
        ::close(m_wakeupFd);
    }
}

void Selector::registerFd(int fd, Interest interest, std::any attachment) {
    if (m_registrations.find(fd) != m_registrations.end()) {
        throw std::runtime_error("Selectable already registered for fd " + std::to_string(fd));
    }
    struct epoll_event ev{};
    ev.events = toEpollEvents(interest);
    ev.data.fd = fd;
    if (epoll_ctl(m_epollFd, EPOLL_CTL_ADD, fd, &ev) == -1) {
        throw epollError("Failed to register", fd);
    }
    m_registrations[fd] = Registration{interest, std::move(attachment)};
}

void Selector::deregisterFd(int fd) {
    // The bookkeeping entry goes first: a closed fd has already left the epoll
    // set, and must not linger here either.
    if (m_registrations.erase(fd) == 0) {
        throw std::runtime_error("Selectable not registered for fd " + std::to_string(fd));
    }
    if (epoll_ctl(m_epollFd, EPOLL_CTL_DEL, fd, nullptr) == -1) {
        throw epollError("Failed to deregister", fd);
    }
}

void Selector::reregisterFd(int fd, Interest interest) {
    auto it = m_registrations.find(fd);
    if (it == m_registrations.end()) {
        throw std::runtime_error("Selectable not registered for fd " + std::to_string(fd));
    }
    struct epoll_event ev{};
    ev.events = toEpollEvents(interest);
    ev.data.fd = fd;
    if (epoll_ctl(m_epollFd, EPOLL_CTL_MOD, fd, &ev) == -1) {
        throw epollError("Failed to modify", fd);
    }
    it->second.interest = interest;
}

std::vector<SelectorEvent> Selector::awaitReady(int timeoutMs) {
    if (m_epollFd == -1) {
        throw std::logic_error("awaitReady called on a closed selector");
    }

    std::vector<struct epoll_event> ready(m_config.maxEventsPerWait);
    int nfds;
    while (true) {
        nfds = epoll_wait(m_epollFd, ready.data(), static_cast<int>(ready.size()), timeoutMs);
        if (nfds == -1) {
            if (errno == EINTR) {
                continue; // Interrupted by signal, retry
            }
            throw std::system_error(errno, std::generic_category(),
                                    std::string("epoll_wait failed: ") + std::strerror(errno));
        }
        break;
    }

    std::vector<SelectorEvent> events;
    events.reserve(static_cast<std::size_t>(nfds));
    for (int i = 0; i < nfds; ++i) {
        int fd = ready[i].data.fd;
        uint32_t flags = ready[i].events;

        if (fd == m_wakeupFd) {
            uint64_t val;
            ssize_t drained = ::read(m_wakeupFd, &val, sizeof(val));
            (void)drained; // EAGAIN just means another wakeup already drained it
            continue;
        }

        auto it = m_registrations.find(fd);
        if (it == m_registrations.end()) {
            continue;
        }

        SelectorEvent event;
        event.attachment = it->second.attachment;
        event.readable = (flags & (EPOLLIN | EPOLLRDHUP | EPOLLHUP | EPOLLERR)) != 0;
        event.writable = (flags & EPOLLOUT) != 0;
        events.push_back(std::move(event));
    }
    return events;
}

void Selector::wakeup() const {
    if (m_wakeupFd == -1) {
        return;
    }
    uint64_t val = 1;
    ssize_t written = ::write(m_wakeupFd, &val, sizeof(val));
    (void)written; // EAGAIN means the counter is saturated and a wakeup is already pending
}

void Selector::close() {
    m_registrations.clear();
    if (m_epollFd != -1) {
        ::close(m_epollFd);
        m_epollFd = -1;
    }
}

bool Selector::isRegistered(int fd) const {
    return m_registrations.find(fd) != m_registrations.end();
}

const std::any* Selector::attachmentFor(int fd) const {
    auto it = m_registrations.find(fd);
    if (it == m_registrations.end()) {
        return nullptr;
    }
    return &it->second.attachment;
}
