#pragma once

#include <drogon/HttpResponse.h>

/**
 * @brief CORS Helper
 *
 * Adds the CORS headers shared by every attendance endpoint. Headers are
 * only added while CORS is enabled (system.web_server.cors.enabled).
 */
namespace CorsHelper {
    /**
     * @brief Enable or disable CORS headers process wide
     */
    void setEnabled(bool enabled);

    bool isEnabled();

    /**
     * @brief Add "allow all" CORS headers to a response
     */
    void addAllowAllHeaders(const drogon::HttpResponsePtr& resp);

    /**
     * @brief Create OPTIONS preflight response
     */
    drogon::HttpResponsePtr createOptionsResponse();
}
