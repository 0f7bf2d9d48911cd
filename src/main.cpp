#include <drogon/drogon.h>
#include <libvirt/libvirt.h>
#include <iostream>
#include <memory>
#include "API/controllers/DomainController.hpp"
#include "API/handlers/DomainHandlers.hpp"
#include "Core/concurrency/EventDispatcher.hpp"
#include "Core/config/ServiceConfig.hpp"
#include "Virtualization/vm/DomainStateTable.hpp"
#include "Virtualization/Utils/LibvirtError.hpp"
#include "Utils/Logger.hpp"

int main(int argc, char* argv[]) {
    ServiceConfig config;
    if (argc > 1) {
        try {
            config = ServiceConfig::fromFile(argv[1]);
        } catch (const std::exception& e) {
            std::cerr << e.what() << std::endl;
            return 1;
        }
    }
    if (!config.validate()) {
        std::cerr << "config: invalid settings" << std::endl;
        return 1;
    }

    BoostLogger::Init(config.logging);

    if (virInitialize() < 0) {
        BoostLogger::Critical("libvirt: initialization failed");
        return 1;
    }
    installLibvirtErrorLogger();
    (void)DomainStateTable::instance();

    auto workers = std::make_shared<CONCURRENCY::EventDispatcher>(config.workerThreads);
    auto handlers = std::make_shared<DomainHandlers>(config.hypervisorUri);

    drogon::app().registerController(std::make_shared<DomainController>(handlers, workers));
    drogon::app().registerPostHandlingAdvice(
        [](const drogon::HttpRequestPtr& req, const drogon::HttpResponsePtr& resp) {
            BoostLogger::Info("{} {} -> {}", req->getMethodString(), req->getPath(),
                              static_cast<int>(resp->getStatusCode()));
        });

    BoostLogger::Info("virtgate listening on {}:{} (hypervisor {}, {} workers)",
                      config.listenAddress, config.port, config.hypervisorUri, config.workerThreads);

    // finish queued requests while drogon's IO loops can still send replies
    auto gracefulQuit = [workers]() {
        BoostLogger::Info("virtgate: shutdown requested, finishing queued requests");
        workers->shutdown();
        drogon::app().quit();
    };

    drogon::app()
        .addListener(config.listenAddress, config.port)
        .setThreadNum(config.ioThreads)
        .setTermSignalHandler(gracefulQuit)
        .setIntSignalHandler(gracefulQuit)
        .run();

    workers->shutdown();
    auto stats = handlers->stats();
    BoostLogger::Info("virtgate stopped: {} requests, {} handles registered, {} released, {} release failures",
                      stats.requests, stats.handlesRegistered, stats.handlesReleased, stats.releaseFailures);
    return 0;
}
