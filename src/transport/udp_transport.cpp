#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

#include "transport/udp_transport.hpp"
#include "util/log.hpp"

namespace transport
{

namespace
{
// a camera burst at 30 fps is a few MB; the default rmem drops most of it
constexpr int RCVBUF_BYTES = 4 * 1024 * 1024;
constexpr int POLL_MS      = 100;

bool fill_addr(const std::string &host, std::uint16_t port, sockaddr_in &out)
{
    std::memset(&out, 0, sizeof(out));
    out.sin_family = AF_INET;
    out.sin_port   = htons(port);
    return inet_pton(AF_INET, host.c_str(), &out.sin_addr) == 1;
}
}  // namespace

UdpTransport::~UdpTransport()
{
    stop();
}

bool UdpTransport::start(const Settings &s, OnFrame on_rx)
{
    if (running_.load())
    {
        LOG_WARN("[UDP] already started");
        return false;
    }
    // rx loop died on a socket error: reap it before rebinding
    if (loop_.joinable())
        stop();
    settings_ = s;
    on_rx_    = std::move(on_rx);

    sockaddr_in local{};
    if (!fill_addr(s.bind_addr, s.port, local))
    {
        LOG_ERROR("[UDP] invalid bind address: %s", s.bind_addr.c_str());
        return false;
    }
    have_peer_ = false;
    if (!s.peer_addr.empty())
    {
        if (!fill_addr(s.peer_addr, s.peer_port, peer_) || s.peer_port == 0)
        {
            LOG_ERROR("[UDP] invalid peer address: %s:%u", s.peer_addr.c_str(),
                      static_cast<unsigned>(s.peer_port));
            return false;
        }
        have_peer_ = true;
    }

    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("[UDP] socket() failed: %s", std::strerror(errno));
        return false;
    }
    int fd_flags = fcntl(fd, F_GETFD, 0);
    if (fd_flags != -1)
        fcntl(fd, F_SETFD, fd_flags | FD_CLOEXEC);

    int one = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) == -1)
        LOG_WARN("[UDP] SO_REUSEADDR failed: %s", std::strerror(errno));
    int rcvbuf = RCVBUF_BYTES;
    if (setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &rcvbuf, sizeof(rcvbuf)) == -1)
        LOG_WARN("[UDP] SO_RCVBUF(%d) failed: %s", rcvbuf, std::strerror(errno));

    if (bind(fd, reinterpret_cast<sockaddr *>(&local), sizeof(local)) == -1)
    {
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_ERROR("[UDP] bind(%s:%u) failed: %s", s.bind_addr.c_str(),
                  static_cast<unsigned>(s.port), std::strerror(errno));
        return false;
    }

    sockaddr_in bound{};
    socklen_t   blen = sizeof(bound);
    if (getsockname(fd, reinterpret_cast<sockaddr *>(&bound), &blen) == 0)
        local_port_ = ntohs(bound.sin_port);
    else
        local_port_ = s.port;

    fd_ = fd;
    running_.store(true, std::memory_order_relaxed);
    loop_ = std::thread([this] { rx_loop(); });

    LOG_INFO("[UDP] listening on %s:%u", s.bind_addr.c_str(), static_cast<unsigned>(local_port_));
    return true;
}

void UdpTransport::rx_loop()
{
    std::vector<std::uint8_t> buf(settings_.max_datagram ? settings_.max_datagram
                                                         : constants::MAX_DATAGRAM);
    while (running_.load(std::memory_order_relaxed))
    {
        pollfd pfd{};
        pfd.fd     = fd_;
        pfd.events = POLLIN;
        int pr     = poll(&pfd, 1, POLL_MS);
        if (pr == 0)
            continue;
        if (pr == -1)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("[UDP] poll() failed: %s", std::strerror(errno));
            break;
        }

        ssize_t n = recvfrom(fd_, buf.data(), buf.size(), MSG_TRUNC, nullptr, nullptr);
        if (n == -1)
        {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
                continue;
            LOG_ERROR("[UDP] recvfrom() failed: %s", std::strerror(errno));
            break;
        }
        if (static_cast<std::size_t>(n) > buf.size())
        {
            LOG_WARN("[UDP] dropping oversized datagram (%zd > %zu)", n, buf.size());
            continue;
        }
        rx_count_.fetch_add(1, std::memory_order_relaxed);
        if (on_rx_)
            on_rx_(Frame(buf.begin(), buf.begin() + n));
    }
    running_.store(false, std::memory_order_relaxed);
}

bool UdpTransport::send(const Frame &datagram)
{
    if (!running_.load(std::memory_order_relaxed) || !have_peer_)
        return false;
    if (settings_.max_datagram != 0 && datagram.size() > settings_.max_datagram)
    {
        LOG_WARN("[UDP] send: datagram too large (%zu > %zu)", datagram.size(),
                 settings_.max_datagram);
        return false;
    }

    std::lock_guard<std::mutex> lk(tx_mu_);
    while (1)
    {
        ssize_t n = sendto(fd_, datagram.data(), datagram.size(), MSG_NOSIGNAL,
                           reinterpret_cast<const sockaddr *>(&peer_), sizeof(peer_));
        if (n >= 0)
            return static_cast<std::size_t>(n) == datagram.size();
        if (errno == EINTR)
            continue;
        LOG_ERROR("[UDP] sendto() failed: %s", std::strerror(errno));
        return false;
    }
}

void UdpTransport::stop()
{
    running_.store(false, std::memory_order_relaxed);
    // loop wakes up within POLL_MS
    if (loop_.joinable())
        loop_.join();
    if (fd_ != -1)
    {
        close(fd_);
        fd_ = -1;
    }
    on_rx_ = nullptr;
}

bool UdpTransport::link_ready() const
{
    return running_.load(std::memory_order_relaxed);
}

}  // namespace transport
