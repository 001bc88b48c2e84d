// include/TraderApp.hpp
#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/di.hpp>
#include <nlohmann/json.hpp>

// Settings
#include "settings/BackoffSettings.hpp"
#include "settings/DbSettings.hpp"
#include "settings/GatewaySettings.hpp"
#include "settings/MarketDataSettings.hpp"

// Ports
#include "ports/output/IBarStore.hpp"
#include "ports/output/IGatewayLink.hpp"
#include "ports/output/IUniverseStore.hpp"

// Application
#include "application/TraderSession.hpp"

// Secondary Adapters
#include "adapters/secondary/InMemoryBarStore.hpp"
#include "adapters/secondary/InMemoryUniverseStore.hpp"
#include "adapters/secondary/PostgresUniverseStore.hpp"
#include "adapters/secondary/SimulatedGatewayLink.hpp"

#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace di = boost::di;

namespace trader
{

    /**
     * @brief Trader Session Application
     *
     * Один io_context: цикл событий сессии.
     * Завершение: SIGINT/SIGTERM (штатно) или фатальная ошибка подключения
     * (run() пробрасывает её наружу).
     */
    class TraderApp
    {
    public:
        TraderApp()
            : signals_(ioContext_, SIGINT, SIGTERM)
        {
            std::cout << "[TraderApp] Initializing..." << std::endl;
        }

        ~TraderApp() { std::cout << "[TraderApp] Shutting down..." << std::endl; }

        /**
         * @brief Собрать зависимости, запустить сессию и цикл событий
         * @throws domain::ConnectionError если шлюз так и не стал доступен
         */
        void run()
        {
            configureInjection();

            signals_.async_wait([this](const boost::system::error_code &ec, int signal)
                                {
                if (ec) {
                    return;
                }
                std::cout << "[TraderApp] Received signal " << signal << ", shutting down..." << std::endl;
                stop(); });

            session_->onReady([this]()
                              { std::cout << "[TraderApp] Session ready, status "
                                          << nlohmann::json(session_->status()).dump() << std::endl; });

            session_->start([this](std::exception_ptr error)
                            {
                fatal_ = error;
                signals_.cancel();
                ioContext_.stop(); });

            ioContext_.run();

            if (fatal_)
            {
                std::rethrow_exception(fatal_);
            }
        }

        void stop()
        {
            if (session_)
            {
                session_->shutdown();
            }
            signals_.cancel();
            ioContext_.stop();
        }

    private:
        boost::asio::io_context ioContext_;
        boost::asio::signal_set signals_;
        std::shared_ptr<application::TraderSession> session_;
        std::exception_ptr fatal_;

        void configureInjection()
        {
            std::cout << "[TraderApp] Configuring DI..." << std::endl;

            // Шаг 1: настройки (читают окружение)
            auto gatewaySettings = std::make_shared<settings::GatewaySettings>();
            auto backoffSettings = std::make_shared<settings::BackoffSettings>();
            auto marketDataSettings = std::make_shared<settings::MarketDataSettings>();
            auto dbSettings = std::make_shared<settings::DbSettings>();

            // Шаг 2: адаптеры, выбор зависит от окружения
            if (!gatewaySettings->isSimulation())
            {
                throw std::runtime_error("no live gateway adapter in this build, set TRADER_SIMULATION=true");
            }
            auto link = std::make_shared<adapters::secondary::SimulatedGatewayLink>();
            seedSimulation(*link);

            std::shared_ptr<ports::output::IUniverseStore> universeStore;
            if (dbSettings->usePostgres())
            {
                universeStore = std::make_shared<adapters::secondary::PostgresUniverseStore>(dbSettings);
            }
            else
            {
                universeStore = std::make_shared<adapters::secondary::InMemoryUniverseStore>();
            }

            // Шаг 3: сессия через DI
            auto injector = di::make_injector(
                di::bind<boost::asio::io_context>().to(ioContext_),
                di::bind<settings::IGatewaySettings>().to(gatewaySettings),
                di::bind<settings::BackoffSettings>().to(backoffSettings),
                di::bind<settings::MarketDataSettings>().to(marketDataSettings),
                di::bind<ports::output::IGatewayLink>().to(link),
                di::bind<ports::output::IUniverseStore>().to(universeStore),
                di::bind<ports::output::IBarStore>().to<adapters::secondary::InMemoryBarStore>().in(di::singleton));

            session_ = injector.create<std::shared_ptr<application::TraderSession>>();

            std::cout << "[TraderApp] Ready (gateway " << gatewaySettings->getHost() << ":"
                      << gatewaySettings->getPort() << ", universe store "
                      << (dbSettings->usePostgres() ? "postgres" : "memory") << ")" << std::endl;
        }

        /**
         * @brief Стартовые позиции бумажного счёта
         */
        static void seedSimulation(adapters::secondary::SimulatedGatewayLink &link)
        {
            link.seedPosition(265598, 10, 182.50);
            link.seedPosition(272093, 5, 398.75);
        }
    };

} // namespace trader
