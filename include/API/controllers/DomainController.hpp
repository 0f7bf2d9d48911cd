#pragma once
#include <drogon/HttpController.h>
#include <functional>
#include <memory>
#include <string>
#include "API/handlers/DomainHandlers.hpp"
#include "Core/concurrency/EventDispatcher.hpp"

/**
 * Routes /domains requests to DomainHandlers.
 *
 * Handlers block on libvirt, so each request runs on the worker pool rather
 * than on drogon's IO loop; the response callback is invoked from the worker.
 */
class DomainController : public drogon::HttpController<DomainController, false> {
public:
    METHOD_LIST_BEGIN
    ADD_METHOD_TO(DomainController::listDomains, "/domains", drogon::Get);
    ADD_METHOD_TO(DomainController::getDomain, "/domains/{1}", drogon::Get);
    ADD_METHOD_TO(DomainController::performAction, "/domains/{1}/{2}", drogon::Post);
    METHOD_LIST_END

    DomainController(std::shared_ptr<DomainHandlers> handlers,
                     std::shared_ptr<CONCURRENCY::EventDispatcher> workers);

    void listDomains(const drogon::HttpRequestPtr& req,
                     std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    void getDomain(const drogon::HttpRequestPtr& req,
                   std::function<void(const drogon::HttpResponsePtr&)>&& callback,
                   std::string name);

    void performAction(const drogon::HttpRequestPtr& req,
                       std::function<void(const drogon::HttpResponsePtr&)>&& callback,
                       std::string name,
                       std::string action);

private:
    std::shared_ptr<DomainHandlers> handlers;
    std::shared_ptr<CONCURRENCY::EventDispatcher> workers;

    void runOnWorker(std::function<ApiResponse()> work,
                     std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    static drogon::HttpResponsePtr toHttpResponse(const ApiResponse& response);
};
