#include "core/cors_helper.h"
#include <atomic>
#include <drogon/HttpResponse.h>

namespace {
std::atomic<bool> g_cors_enabled{true};
}

namespace CorsHelper {
    void setEnabled(bool enabled) { g_cors_enabled.store(enabled); }

    bool isEnabled() { return g_cors_enabled.load(); }

    void addAllowAllHeaders(const drogon::HttpResponsePtr& resp) {
        if (!isEnabled()) {
            return;
        }
        resp->addHeader("Access-Control-Allow-Origin", "*");
        resp->addHeader("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        resp->addHeader("Access-Control-Allow-Headers", "Content-Type, Authorization");
    }

    drogon::HttpResponsePtr createOptionsResponse() {
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setStatusCode(drogon::k200OK);
        addAllowAllHeaders(resp);
        if (isEnabled()) {
            resp->addHeader("Access-Control-Max-Age", "3600");
        }
        return resp;
    }
}
