#pragma once
#include <drogon/HttpController.h>
#include <functional>

// Liveness probe; never touches the hypervisor.
class PingController : public drogon::HttpController<PingController> {
public:
    METHOD_LIST_BEGIN
    ADD_METHOD_TO(PingController::ping, "/ping", drogon::Get);
    METHOD_LIST_END

    void ping(const drogon::HttpRequestPtr& req,
              std::function<void(const drogon::HttpResponsePtr&)>&& callback);
};
