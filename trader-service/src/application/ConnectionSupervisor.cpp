#include "application/ConnectionSupervisor.hpp"
#include "domain/Errors.hpp"
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <iostream>
#include <string>

namespace trader::application {

ConnectionSupervisor::ConnectionSupervisor(
    boost::asio::io_context& ioContext,
    std::shared_ptr<ports::output::IGatewayLink> link,
    std::shared_ptr<SubscriptionReconciler> reconciler,
    std::shared_ptr<settings::IGatewaySettings> gatewaySettings,
    std::shared_ptr<settings::BackoffSettings> backoffSettings)
    : ioContext_(ioContext)
    , link_(std::move(link))
    , reconciler_(std::move(reconciler))
    , gatewaySettings_(std::move(gatewaySettings))
    , backoffSettings_(std::move(backoffSettings))
    , backoff_(*backoffSettings_)
    , timer_(ioContext)
{}

void ConnectionSupervisor::connect(CompletionHandler handler) {
    std::exception_ptr rejected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != domain::ConnectionState::DISCONNECTED) {
            rejected = std::make_exception_ptr(domain::ConnectionError(
                "connect() called while " + domain::toString(state_)));
        } else {
            state_ = domain::ConnectionState::CONNECTING;
        }
    }
    if (rejected) {
        handler(rejected);
        return;
    }

    shuttingDown_ = false;
    registerLifecycleHandlers();

    std::cout << "[ConnectionSupervisor] Connecting to " << gatewaySettings_->getHost() << ":"
              << gatewaySettings_->getPort() << " (clientId=" << gatewaySettings_->getClientId()
              << ")" << std::endl;

    attempt(1, std::chrono::steady_clock::now(), std::move(handler));
}

void ConnectionSupervisor::attempt(
    int attempt, std::chrono::steady_clock::time_point started, CompletionHandler handler)
{
    if (shuttingDown_) {
        setState(domain::ConnectionState::DISCONNECTED);
        handler(std::make_exception_ptr(domain::ConnectionAbortedError("connect aborted by shutdown")));
        return;
    }

    ++totalAttempts_;
    try {
        link_->connect(gatewaySettings_->getHost(), gatewaySettings_->getPort(),
                       gatewaySettings_->getClientId());
    } catch (const domain::ConnectionRefusedError& e) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        if (!backoff_.canRetry(attempt, elapsed)) {
            std::cerr << "[ConnectionSupervisor] Giving up after " << attempt << " attempts ("
                      << elapsed.count() << "ms): " << e.what() << std::endl;
            setState(domain::ConnectionState::DISCONNECTED);
            handler(std::make_exception_ptr(domain::ConnectionError(
                "gateway unreachable after " + std::to_string(attempt) + " attempts: " + e.what())));
            return;
        }

        auto delay = backoff_.clampToBudget(backoff_.delayFor(attempt), elapsed);
        std::cerr << "[ConnectionSupervisor] Connection refused (attempt " << attempt
                  << "), retrying in " << delay.count() << "ms" << std::endl;

        std::weak_ptr<ConnectionSupervisor> weak = weak_from_this();
        timer_.expires_after(delay);
        timer_.async_wait([weak, attempt, started, handler](const boost::system::error_code& ec) {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            if (ec == boost::asio::error::operation_aborted || self->shuttingDown_) {
                self->setState(domain::ConnectionState::DISCONNECTED);
                handler(std::make_exception_ptr(domain::ConnectionAbortedError(
                    "connect aborted by shutdown")));
                return;
            }
            if (ec) {
                self->setState(domain::ConnectionState::DISCONNECTED);
                handler(std::make_exception_ptr(domain::ConnectionError(
                    "connect wait failed: " + ec.message())));
                return;
            }
            self->attempt(attempt + 1, started, handler);
        });
        return;
    } catch (const std::exception& e) {
        std::cerr << "[ConnectionSupervisor] Fatal connect error: " << e.what() << std::endl;
        setState(domain::ConnectionState::DISCONNECTED);
        handler(std::current_exception());
        return;
    }

    setState(domain::ConnectionState::CONNECTED);
    std::cout << "[ConnectionSupervisor] Connected after " << attempt << " attempt(s)" << std::endl;
    handler(nullptr);
}

void ConnectionSupervisor::registerLifecycleHandlers() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (handlersRegistered_) {
            return;
        }
        handlersRegistered_ = true;
    }

    std::weak_ptr<ConnectionSupervisor> weak = weak_from_this();
    boost::asio::io_context& ioContext = ioContext_;

    link_->onConnected([weak, &ioContext]() {
        boost::asio::post(ioContext, [weak]() {
            if (auto self = weak.lock()) {
                self->handleConnected();
            }
        });
    });

    link_->onDisconnected([weak, &ioContext]() {
        boost::asio::post(ioContext, [weak]() {
            if (auto self = weak.lock()) {
                self->handleDisconnected();
            }
        });
    });
}

void ConnectionSupervisor::handleConnected() {
    if (shuttingDown_) {
        return;
    }

    try {
        reconciler_->reestablish();
    } catch (const std::exception& e) {
        std::cerr << "[ConnectionSupervisor] Failed to re-establish subscriptions: "
                  << e.what() << std::endl;
        return;
    }

    ready_ = true;
    std::cout << "[ConnectionSupervisor] Session ready" << std::endl;

    ReadyHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = readyHandler_;
    }
    if (handler) {
        handler();
    }
}

void ConnectionSupervisor::handleDisconnected() {
    if (state() == domain::ConnectionState::CONNECTING) {
        // попытка подключения уже идёт
        return;
    }

    ready_ = false;
    setState(domain::ConnectionState::DISCONNECTED);
    reconciler_->dropStreams();

    if (shuttingDown_) {
        std::cout << "[ConnectionSupervisor] Disconnected (shutdown)" << std::endl;
        return;
    }

    std::cerr << "[ConnectionSupervisor] Gateway disconnected, reconnecting" << std::endl;

    std::weak_ptr<ConnectionSupervisor> weak = weak_from_this();
    connect([weak](std::exception_ptr error) {
        if (!error) {
            return;
        }
        auto self = weak.lock();
        if (!self) {
            return;
        }
        if (self->shuttingDown_ || domain::isConnectionAborted(error)) {
            std::cout << "[ConnectionSupervisor] Reconnect stopped by shutdown" << std::endl;
            return;
        }
        self->raiseFatal(error);
    });
}

void ConnectionSupervisor::reconnect() {
    std::cout << "[ConnectionSupervisor] Forcing reconnect" << std::endl;
    link_->disconnect();
}

void ConnectionSupervisor::shutdown() {
    shuttingDown_ = true;
    ready_ = false;
    timer_.cancel();
    if (link_->isConnected()) {
        link_->disconnect();
    }
    setState(domain::ConnectionState::DISCONNECTED);
    std::cout << "[ConnectionSupervisor] Shut down" << std::endl;
}

void ConnectionSupervisor::onFatal(FatalHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    fatalHandler_ = std::move(handler);
}

void ConnectionSupervisor::onReady(ReadyHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    readyHandler_ = std::move(handler);
}

domain::ConnectionState ConnectionSupervisor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void ConnectionSupervisor::setState(domain::ConnectionState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
}

void ConnectionSupervisor::raiseFatal(std::exception_ptr error) {
    FatalHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = fatalHandler_;
    }
    if (handler) {
        handler(error);
        return;
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        std::cerr << "[ConnectionSupervisor] Reconnect failed, no fatal handler: " << e.what() << std::endl;
    }
}

} // namespace trader::application
