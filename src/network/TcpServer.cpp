#include "fwdgate/network/TcpServer.h"
#include "fwdgate/network/EventLoop.h"
#include "fwdgate/network/Acceptor.h"
#include "fwdgate/network/Timer.h"
#include "fwdgate/common/Logger.h"

#include <functional>
#include <vector>
#include <unistd.h>

namespace fwdgate {
namespace network {

TcpServer::TcpServer(EventLoop* loop,
                     const InetAddress& listenAddr,
                     const std::string& nameArg,
                     Option option)
    : loop_(loop),
      hostport_(listenAddr.toIpPort()),
      name_(nameArg),
      acceptor_(new Acceptor(loop, listenAddr, option == kReusePort)),
      threadPool_(new EventLoopThreadPool(loop, nameArg)),
      deadlineCheckSec_(0.25),
      started_(false),
      stopped_(false),
      draining_(false),
      next_conn_id_(1) {
    acceptor_->SetNewConnectionCallback(
        std::bind(&TcpServer::NewConnection, this, std::placeholders::_1, std::placeholders::_2));
}

TcpServer::~TcpServer() {
    Stop();
}

void TcpServer::SetThreadNum(int numThreads) {
    threadPool_->SetThreadNum(numThreads);
}

bool TcpServer::EnableTls(const std::string& certPemPath, const std::string& keyPemPath, std::string* err) {
    auto ctx = std::make_shared<TlsContext>();
    if (!ctx->InitServer(certPemPath, keyPemPath, err)) return false;
    tlsCtx_ = std::move(ctx);
    return true;
}

bool TcpServer::Start(std::string* err) {
    if (started_) {
        if (err) *err = "already started";
        return false;
    }
    started_ = true;

    if (!acceptor_->Bind(err)) {
        return false;
    }
    if (!threadPool_->Start()) {
        if (err) *err = "failed to start I/O threads";
        acceptor_->Close();
        return false;
    }
    if (!acceptor_->Listen(err)) {
        acceptor_->Close();
        return false;
    }

    deadlineTimer_.reset(new Timer(loop_, std::bind(&TcpServer::CheckDeadlines, this)));
    deadlineTimer_->Start(deadlineCheckSec_, deadlineCheckSec_);

    LOG_INFO << "TcpServer [" << name_ << "] listening on "
             << acceptor_->localAddress().toIpPort();
    return true;
}

void TcpServer::Stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    deadlineTimer_.reset();
    acceptor_->Close();

    for (auto& item : connections_) {
        TcpConnectionPtr conn(item.second);
        item.second.reset();
        conn->getLoop()->RunInLoop([conn]() {
            conn->SetConnectionCallback(ConnectionCallback());
            conn->ConnectDestroyed();
        });
    }
    connections_.clear();
    threadPool_->Stop();
}

void TcpServer::StopAccepting() {
    if (acceptor_->state() != Acceptor::State::kClosed) {
        acceptor_->Close();
        LOG_INFO << "TcpServer [" << name_ << "] stopped accepting";
    }
}

void TcpServer::BeginDrain(std::function<void()> drainedCb) {
    StopAccepting();
    draining_ = true;
    drainedCallback_ = std::move(drainedCb);
    MaybeFinishDrain();
}

void TcpServer::MaybeFinishDrain() {
    if (draining_ && connections_.empty() && drainedCallback_) {
        std::function<void()> cb;
        cb.swap(drainedCallback_);
        loop_->QueueInLoop(std::move(cb));
    }
}

void TcpServer::ForceCloseAll() {
    for (auto const& item : connections_) {
        item.second->ForceClose();
    }
}

void TcpServer::ForEachConnection(const std::function<void(const TcpConnectionPtr&)>& cb) const {
    for (auto const& item : connections_) {
        cb(item.second);
    }
}

void TcpServer::CheckDeadlines() {
    const auto now = std::chrono::steady_clock::now();
    std::vector<TcpConnectionPtr> expired;

    for (auto const& [connName, conn] : connections_) {
        if (conn->HasDeadline() && conn->Deadline() <= now) {
            LOG_WARN << "TcpServer [" << name_ << "] deadline passed, closing " << connName
                     << " peer=" << conn->peerAddress().toIpPort();
            expired.push_back(conn);
        }
    }

    for (auto& conn : expired) {
        conn->ClearDeadline();
        conn->ForceClose();
    }
}

void TcpServer::NewConnection(int sockfd, const InetAddress& peerAddr) {
    if (draining_ || stopped_) {
        ::close(sockfd);
        return;
    }

    std::string connName = name_ + "-" + hostport_ + "#" + std::to_string(next_conn_id_);
    ++next_conn_id_;

    LOG_DEBUG << "TcpServer::NewConnection [" << name_ << "] - new connection [" << connName
              << "] from " << peerAddr.toIpPort();

    InetAddress localAddr;
    if (!InetAddress::FromLocalSocket(sockfd, &localAddr)) {
        localAddr = acceptor_->localAddress();
    }

    EventLoop* ioLoop = threadPool_->GetNextLoop();
    TcpConnectionPtr conn(new TcpConnection(ioLoop,
                                            connName,
                                            sockfd,
                                            localAddr,
                                            peerAddr,
                                            tlsCtx_));
    connections_[connName] = conn;
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetCloseCallback(
        std::bind(&TcpServer::RemoveConnection, this, std::placeholders::_1));

    ioLoop->RunInLoop(std::bind(&TcpConnection::ConnectEstablished, conn));
}

void TcpServer::RemoveConnection(const TcpConnectionPtr& conn) {
    // Deferred so the connection is never erased from inside its own event callback.
    loop_->QueueInLoop(std::bind(&TcpServer::RemoveConnectionInLoop, this, conn));
}

void TcpServer::RemoveConnectionInLoop(const TcpConnectionPtr& conn) {
    if (stopped_) {
        return; // Stop() already released every connection
    }
    LOG_DEBUG << "TcpServer::RemoveConnectionInLoop [" << name_ << "] - connection " << conn->name();
    connections_.erase(conn->name());

    EventLoop* ioLoop = conn->getLoop();
    ioLoop->QueueInLoop(std::bind(&TcpConnection::ConnectDestroyed, conn));

    MaybeFinishDrain();
}

} // namespace network
} // namespace fwdgate
