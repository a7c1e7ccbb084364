// include/BankApp.hpp
#pragma once

#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/TransactionSettings.hpp"

// Ports
#include "ports/input/ITransferService.hpp"
#include "ports/input/IAccountService.hpp"
#include "ports/output/IStore.hpp"

// Application
#include "application/TransactionExecutor.hpp"
#include "application/TransferService.hpp"
#include "application/AccountService.hpp"

// Adapters
#include "adapters/secondary/PostgresStore.hpp"
#include "adapters/primary/TransferCommandHandler.hpp"

#include <iostream>
#include <iterator>
#include <memory>
#include <string>

namespace di = boost::di;

namespace bank
{

    /**
     * @brief Приложение simple_bank: одна JSON-команда на запуск
     *
     * Порядок:
     * 1. configureInjection() - настройки из ENV, PostgresStore, сервисы
     * 2. команда из argv[1] или stdin → TransferCommandHandler
     * 3. JSON-ответ в stdout, код возврата 0/1
     */
    class BankApp
    {
    public:
        BankApp() { std::cout << "[BankApp] Initializing..." << std::endl; }
        ~BankApp() { std::cout << "[BankApp] Shutting down..." << std::endl; }

        int run(int argc, char *argv[])
        {
            configureInjection();

            std::string body = readCommand(argc, argv);
            auto response = handler_->handle(body);

            std::cout << response.body << std::endl;
            if (!response.ok())
            {
                std::cerr << "[BankApp] Command failed with status " << response.status << std::endl;
                return 1;
            }
            return 0;
        }

    protected:
        void configureInjection()
        {
            std::cout << "[BankApp] Configuring DI..." << std::endl;

            auto dbSettings = std::make_shared<settings::DbSettings>();
            auto txSettings = std::make_shared<settings::TransactionSettings>();

            // Строка подключения - не тип, поэтому хранилище собираем вручную
            auto store = std::make_shared<adapters::secondary::PostgresStore>(
                dbSettings->getConnectionString(), txSettings);

            auto injector = di::make_injector(
                di::bind<settings::ITransactionSettings>().to(txSettings),
                di::bind<ports::output::IStore>().to(store),
                di::bind<application::TransactionExecutor>().in(di::singleton),
                di::bind<ports::input::ITransferService>().to<application::TransferService>().in(di::singleton),
                di::bind<ports::input::IAccountService>().to<application::AccountService>().in(di::singleton));

            handler_ = injector.create<std::shared_ptr<adapters::primary::TransferCommandHandler>>();

            std::cout << "[BankApp] Ready" << std::endl;
        }

    private:
        std::shared_ptr<adapters::primary::TransferCommandHandler> handler_;

        static std::string readCommand(int argc, char *argv[])
        {
            if (argc > 1)
            {
                return argv[1];
            }
            return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        }
    };

} // namespace bank
