#include "API/controllers/DomainController.hpp"
#include "API/serializers/DomainJson.hpp"
#include "Utils/Logger.hpp"
#include <utility>

DomainController::DomainController(std::shared_ptr<DomainHandlers> handlers,
                                   std::shared_ptr<CONCURRENCY::EventDispatcher> workers)
    : handlers(std::move(handlers)), workers(std::move(workers)) {}

void DomainController::listDomains(const drogon::HttpRequestPtr& /*req*/,
                                   std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    runOnWorker([h = handlers]() { return h->list(); }, std::move(callback));
}

void DomainController::getDomain(const drogon::HttpRequestPtr& /*req*/,
                                 std::function<void(const drogon::HttpResponsePtr&)>&& callback,
                                 std::string name) {
    runOnWorker([h = handlers, name = std::move(name)]() { return h->get(name); }, std::move(callback));
}

void DomainController::performAction(const drogon::HttpRequestPtr& /*req*/,
                                     std::function<void(const drogon::HttpResponsePtr&)>&& callback,
                                     std::string name,
                                     std::string action) {
    runOnWorker([h = handlers, name = std::move(name), action = std::move(action)]() {
        return h->performAction(name, std::string_view(action));
    }, std::move(callback));
}

void DomainController::runOnWorker(std::function<ApiResponse()> work,
                                   std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    // the callback stays here until the pool has accepted the task
    auto pending = std::make_shared<std::function<void(const drogon::HttpResponsePtr&)>>(std::move(callback));
    bool accepted = workers->dispatch([work = std::move(work), pending]() {
        ApiResponse response;
        try {
            response = work();
        } catch (const std::exception& e) {
            BoostLogger::Error("Request failed outside handler: {}", e.what());
            response = ApiResponse{500, errorBody(e.what())};
        }
        (*pending)(toHttpResponse(response));
    });
    if (!accepted) {
        (*pending)(toHttpResponse(ApiResponse{503, errorBody("service is shutting down")}));
    }
}

drogon::HttpResponsePtr DomainController::toHttpResponse(const ApiResponse& response) {
    auto resp = drogon::HttpResponse::newHttpJsonResponse(response.body);
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(response.status));
    return resp;
}
